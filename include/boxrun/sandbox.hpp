#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "boxrun/config.hpp"
#include "boxrun/request.hpp"
#include "boxrun/result.hpp"
#include "boxrun/run_result.hpp"

namespace boxrun {

namespace internal {
class Backend;
class Clock;
class ResourceProbe;
}  // namespace internal

/// @brief Runs commands under a hard timeout and reports output, status and resource usage.
///
/// A Sandbox holds no per-run state; run() may be called concurrently from several threads.
/// Every run kills the launched process group before returning, whether it exited or timed out.
class Sandbox {
 public:
  /// @brief Use the POSIX backend, the steady clock and procfs under config.proc_root.
  explicit Sandbox(SandboxConfig config = {});
  /// @brief Use caller-provided collaborators. They must outlive the Sandbox.
  Sandbox(SandboxConfig config, internal::Backend& backend, internal::Clock& clock,
          internal::ResourceProbe& probe);
  ~Sandbox();

  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;

  /// @brief Launch, supervise and tear down one command.
  ///
  /// Launch failures and invalid requests are errors. A timeout is a normal result with
  /// timeout=true and exit_code=-1.
  [[nodiscard]] Result<RunResult> run(const LaunchRequest& request) const;
  /// @brief Convenience overload building the LaunchRequest in place.
  [[nodiscard]] Result<RunResult> run(
      std::vector<std::string> args, int timeout_seconds = LaunchRequest::kDefaultTimeoutSeconds,
      std::int64_t max_output_size = LaunchRequest::kDefaultMaxOutputSize,
      std::optional<Environment> env = std::nullopt, bool shell = false,
      std::optional<std::filesystem::path> cwd = std::nullopt) const;

  /// @brief Like run(), but throws on failure.
  RunResult run_or_throw(const LaunchRequest& request) const;

  /// @brief The effective configuration (logger always set).
  [[nodiscard]] const SandboxConfig& config() const noexcept { return config_; }

 private:
  SandboxConfig config_;
  std::unique_ptr<internal::ResourceProbe> owned_probe_;
  internal::Backend& backend_;
  internal::Clock& clock_;
  internal::ResourceProbe& probe_;
};

}  // namespace boxrun
