#pragma once

#include <cstdint>
#include <optional>

namespace boxrun {

/// @brief Exit status observed for a sandboxed process.
class ExitStatus {
 public:
  /// @brief How the process ended.
  enum class Kind : std::uint8_t {
    /// @brief Process exited normally with an exit code.
    exited,
    /// @brief Process was terminated by a signal.
    signaled,
  };

  /// @brief Construct a normal exit status with an exit code.
  static ExitStatus exited(int code, std::uint32_t native = 0) noexcept;
  /// @brief Construct a status for a process killed by a signal.
  static ExitStatus signaled(int signo, std::uint32_t native = 0) noexcept;
  /// @brief Decode a raw POSIX wait status.
  static ExitStatus from_wait_status(int status) noexcept;

  /// @brief Kind discriminator.
  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  /// @brief True if exited with code 0.
  [[nodiscard]] bool success() const noexcept { return kind_ == Kind::exited && value_ == 0; }
  /// @brief Exit code if the process exited normally.
  [[nodiscard]] std::optional<int> code() const noexcept;
  /// @brief Terminating signal if the process was signaled.
  [[nodiscard]] std::optional<int> signal() const noexcept;
  /// @brief Single integer form: the exit code, or the negated signal number.
  [[nodiscard]] int reported_code() const noexcept;
  /// @brief Native OS wait status.
  [[nodiscard]] std::uint32_t native() const noexcept { return native_; }

 private:
  Kind kind_{Kind::exited};
  int value_{0};
  std::uint32_t native_{0};
};

}  // namespace boxrun
