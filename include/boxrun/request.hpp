#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace boxrun {

/// @brief Environment mapping handed to a sandboxed process.
using Environment = std::map<std::string, std::string, std::less<>>;

/// @brief Everything needed to launch one sandboxed command.
struct LaunchRequest {
  /// @brief Default hard timeout in seconds.
  static constexpr int kDefaultTimeoutSeconds = 15;
  /// @brief Default per-stream capture cap in bytes.
  static constexpr std::int64_t kDefaultMaxOutputSize = 2048;

  /// @brief Argument vector; args[0] is the program.
  std::vector<std::string> args;
  /// @brief Hard wall-clock timeout; must be positive.
  int timeout_seconds = kDefaultTimeoutSeconds;
  /// @brief Capture cap applied to stdout and stderr separately; must not be negative.
  std::int64_t max_output_size = kDefaultMaxOutputSize;
  /// @brief Child environment. When unset the sandbox default environment is used.
  std::optional<Environment> env;
  /// @brief Join args with spaces and run them through /bin/sh -c.
  bool shell = false;
  /// @brief Working directory for the child.
  std::optional<std::filesystem::path> cwd;
};

}  // namespace boxrun
