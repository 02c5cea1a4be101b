#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace boxrun {

template <typename E>
class unexpected {
 public:
  explicit unexpected(const E& error) : error_(error) {}
  explicit unexpected(E&& error) : error_(std::move(error)) {}

  [[nodiscard]] const E& error() const& noexcept { return error_; }
  [[nodiscard]] E& error() & noexcept { return error_; }
  [[nodiscard]] E&& error() && noexcept { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
unexpected(E) -> unexpected<E>;

// Minimal stand-in for std::expected on standard libraries that predate it.
// Only the members boxrun itself relies on are provided.
template <typename T, typename E>
class expected {
  static constexpr std::size_t kValue = 0;
  static constexpr std::size_t kError = 1;

 public:
  using value_type = T;
  using error_type = E;

  expected(const T& value) : state_(std::in_place_index<kValue>, value) {}
  expected(T&& value) : state_(std::in_place_index<kValue>, std::move(value)) {}
  expected(const E& err) : state_(std::in_place_index<kError>, err) {}
  expected(E&& err) : state_(std::in_place_index<kError>, std::move(err)) {}
  expected(const unexpected<E>& err) : state_(std::in_place_index<kError>, err.error()) {}
  expected(unexpected<E>&& err) : state_(std::in_place_index<kError>, std::move(err).error()) {}

  [[nodiscard]] bool has_value() const noexcept { return state_.index() == kValue; }
  explicit operator bool() const noexcept { return has_value(); }

  [[nodiscard]] T& value() & { return std::get<kValue>(state_); }
  [[nodiscard]] const T& value() const& { return std::get<kValue>(state_); }
  [[nodiscard]] T&& value() && { return std::get<kValue>(std::move(state_)); }

  [[nodiscard]] T& operator*() & noexcept { return *std::get_if<kValue>(&state_); }
  [[nodiscard]] const T& operator*() const& noexcept { return *std::get_if<kValue>(&state_); }
  [[nodiscard]] T* operator->() noexcept { return std::get_if<kValue>(&state_); }
  [[nodiscard]] const T* operator->() const noexcept { return std::get_if<kValue>(&state_); }

  [[nodiscard]] E& error() & { return std::get<kError>(state_); }
  [[nodiscard]] const E& error() const& { return std::get<kError>(state_); }
  [[nodiscard]] E&& error() && { return std::get<kError>(std::move(state_)); }

  template <typename U>
  T value_or(U&& fallback) const& {
    return has_value() ? value() : static_cast<T>(std::forward<U>(fallback));
  }

 private:
  std::variant<T, E> state_;
};

template <typename E>
class expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  expected() = default;
  expected(const E& err) : error_(err), has_value_(false) {}
  expected(E&& err) : error_(std::move(err)), has_value_(false) {}
  expected(const unexpected<E>& err) : error_(err.error()), has_value_(false) {}
  expected(unexpected<E>&& err) : error_(std::move(err).error()), has_value_(false) {}

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  void value() const {}

  [[nodiscard]] E& error() & { return error_; }
  [[nodiscard]] const E& error() const& { return error_; }
  [[nodiscard]] E&& error() && { return std::move(error_); }

 private:
  E error_{};
  bool has_value_{true};
};

}  // namespace boxrun
