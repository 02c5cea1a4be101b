#include "boxrun/result.hpp"

#include <stdexcept>

namespace boxrun {

namespace {

class boxrun_error_category : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "boxrun"; }

  [[nodiscard]] std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
      case errc::ok:
        return "ok";
      case errc::empty_argv:
        return "empty argv";
      case errc::invalid_request:
        return "invalid launch request";
      case errc::invalid_config:
        return "invalid sandbox configuration";
      case errc::spawn_failed:
        return "spawn failed";
      case errc::wait_failed:
        return "wait failed";
      case errc::read_failed:
        return "read failed";
      case errc::kill_failed:
        return "kill failed";
    }
    return "unknown error";
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static boxrun_error_category category;
  return category;
}

std::error_code make_error_code(errc value) noexcept {
  return {static_cast<int>(value), error_category()};
}

namespace internal {

[[noreturn]] void throw_error(const Error& error) {
  if (error.code.category() == std::system_category()) {
    throw std::system_error(error.code, error.context);
  }
  throw std::runtime_error(error.context.empty() ? error.code.message()
                                                 : error.context + ": " + error.code.message());
}

}  // namespace internal

}  // namespace boxrun
