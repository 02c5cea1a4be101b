#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace boxrun {

/// @brief Verdict of one sandboxed run.
///
/// Seconds and utilization are rounded to two decimals so results compare reproducibly.
struct RunResult {
  /// @brief Sentinel stored in exit_code when no status was observed.
  static constexpr int kNoExitCode = -1;

  /// @brief The command line as requested.
  std::vector<std::string> cmd;
  /// @brief True when the process did not exit within the timeout.
  bool timeout = false;
  /// @brief Exit code, the negated signal number for signal deaths, or kNoExitCode.
  int exit_code = kNoExitCode;
  /// @brief Captured stdout, UTF-8 decoded with invalid sequences replaced.
  std::string stdout_data;
  /// @brief Captured stderr, UTF-8 decoded with invalid sequences replaced.
  std::string stderr_data;
  /// @brief Average CPU utilization of the process tree in percent, normalized by core count.
  double process_cpu_util = 0.0;
  /// @brief CPU time consumed by the process tree in seconds.
  double process_cpu_time = 0.0;
  /// @brief Wall-clock time from launch to teardown in seconds.
  double process_exec_time = 0.0;
  /// @brief Peak memory of the process tree in kilobytes.
  std::int64_t process_peak_memory = 0;
};

}  // namespace boxrun
