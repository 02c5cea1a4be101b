#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

#include "boxrun/platform.hpp"

#if defined(__cpp_lib_expected) && (__cpp_lib_expected >= 202202L)
#include <expected>
#define BOXRUN_HAS_STD_EXPECTED 1
#else
#define BOXRUN_HAS_STD_EXPECTED 0
#endif

#if !BOXRUN_HAS_STD_EXPECTED
#include "boxrun/internal/expected.hpp"
#endif

namespace boxrun {

/// @brief Error codes for boxrun operations.
enum class errc : std::uint8_t {
  /// @brief No error.
  ok = 0,

  // Request / configuration validation
  /// @brief Launch request has no argv entries.
  empty_argv,
  /// @brief Launch request violates a constraint (timeout, output cap).
  invalid_request,
  /// @brief Sandbox configuration value could not be parsed.
  invalid_config,

  // Process lifecycle failures (OS errors use std::system_category instead)
  /// @brief Process creation failed.
  spawn_failed,
  /// @brief Wait operation failed.
  wait_failed,
  /// @brief Read operation failed.
  read_failed,
  /// @brief Termination/kill operation failed.
  kill_failed,
};

/// @brief Error payload returned by boxrun APIs.
struct Error {
  /// @brief Error code in the boxrun or system category.
  std::error_code code;
  /// @brief Human-readable context for the failure.
  std::string context;
};

/// @brief boxrun error category for std::error_code.
const std::error_category& error_category() noexcept;
/// @brief Create an error_code in the boxrun category.
std::error_code make_error_code(errc value) noexcept;

/// @brief Result type used by boxrun APIs (std::expected-compatible).
#if BOXRUN_HAS_STD_EXPECTED
template <typename T>
using Result = std::expected<T, Error>;
#else
template <typename T>
using Result = expected<T, Error>;
#endif

namespace internal {
/// @brief Throw an error as an exception (used by *_or_throw helpers).
[[noreturn]] void throw_error(const Error& error);
}  // namespace internal

}  // namespace boxrun

namespace std {

/// @brief Enable implicit conversion from boxrun::errc to std::error_code.
template <>
struct is_error_code_enum<boxrun::errc> : true_type {};

}  // namespace std
