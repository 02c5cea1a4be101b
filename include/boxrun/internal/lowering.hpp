#pragma once

#include <string>
#include <vector>

#include "boxrun/config.hpp"
#include "boxrun/internal/backend.hpp"
#include "boxrun/request.hpp"
#include "boxrun/result.hpp"

namespace boxrun::internal {

inline constexpr const char* kShellPath = "/bin/sh";

Result<void> validate_request(const LaunchRequest& request);

// argv as it will be executed: unchanged, or ["/bin/sh", "-c", "<args joined by spaces>"].
std::vector<std::string> effective_argv(const LaunchRequest& request);

// KEY=VALUE entries in key order.
std::vector<std::string> to_envp(const Environment& env);

Result<SpawnSpec> lower_request(const LaunchRequest& request, const SandboxConfig& config);

}  // namespace boxrun::internal
