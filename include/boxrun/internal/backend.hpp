#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "boxrun/config.hpp"
#include "boxrun/pipe.hpp"
#include "boxrun/result.hpp"
#include "boxrun/status.hpp"

namespace boxrun::internal {

struct SpawnSpec {
  std::vector<std::string> argv;
  std::optional<std::filesystem::path> cwd;
  std::vector<std::string> envp;
  std::optional<SandboxIdentity> identity;
  // Ignored when identity is set: the new session already roots a process group.
  bool new_process_group = false;
};

struct RunningProcess {
  int pid = -1;
  std::optional<int> pgid;
  PipeReader stdout_pipe;
  PipeReader stderr_pipe;
  std::chrono::steady_clock::time_point launched_at;
  bool reaped = false;
};

class Backend {
 public:
  virtual ~Backend() = default;
  virtual Result<RunningProcess> spawn(const SpawnSpec& spec) = 0;
  // Non-blocking; marks the process reaped once a status has been collected.
  virtual Result<std::optional<ExitStatus>> try_wait(RunningProcess& process) = 0;
  // SIGKILL to the group, or the pid when no group exists. "No such process" is success.
  virtual Result<void> terminate(RunningProcess& process) = 0;
  // Hands an unreaped child to an asynchronous reaper. Never blocks.
  virtual void release(RunningProcess& process) = 0;
};

Backend& posix_backend();

}  // namespace boxrun::internal
