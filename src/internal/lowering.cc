#include "boxrun/internal/lowering.hpp"

#include <utility>

namespace boxrun::internal {

Result<void> validate_request(const LaunchRequest& request) {
  if (request.args.empty()) {
    return Error{.code = make_error_code(errc::empty_argv), .context = "args"};
  }
  if (request.timeout_seconds <= 0) {
    return Error{.code = make_error_code(errc::invalid_request), .context = "timeout_seconds"};
  }
  if (request.max_output_size < 0) {
    return Error{.code = make_error_code(errc::invalid_request), .context = "max_output_size"};
  }
  return {};
}

std::vector<std::string> effective_argv(const LaunchRequest& request) {
  if (!request.shell) {
    return request.args;
  }
  std::string script;
  for (const auto& arg : request.args) {
    if (!script.empty()) {
      script.push_back(' ');
    }
    script.append(arg);
  }
  return {kShellPath, "-c", std::move(script)};
}

std::vector<std::string> to_envp(const Environment& env) {
  std::vector<std::string> envp;
  envp.reserve(env.size());
  for (const auto& [key, value] : env) {
    std::string entry;
    entry.reserve(key.size() + 1 + value.size());
    entry.append(key);
    entry.push_back('=');
    entry.append(value);
    envp.push_back(std::move(entry));
  }
  return envp;
}

Result<SpawnSpec> lower_request(const LaunchRequest& request, const SandboxConfig& config) {
  auto valid = validate_request(request);
  if (!valid) {
    return valid.error();
  }

  SpawnSpec spec;
  spec.argv = effective_argv(request);
  spec.cwd = request.cwd;
  // The parent environment is never merged in.
  spec.envp = to_envp(request.env ? *request.env : config.default_env);
  spec.identity = config.identity;
  spec.new_process_group = config.isolate_process_group;
  return spec;
}

}  // namespace boxrun::internal
