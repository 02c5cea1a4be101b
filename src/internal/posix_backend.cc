#include <grp.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <string_view>
#include <thread>

#include "boxrun/internal/backend.hpp"
#include "boxrun/internal/fd.hpp"

namespace boxrun::internal {

namespace {

constexpr long kFallbackMaxFd = 256;
constexpr int kExecFailureExitCode = 127;

// Steps the forked child performs before execve; reported back on failure.
enum class ChildStage : std::uint8_t {
  setsid,
  setgroups,
  setgid,
  setuid,
  setpgid,
  chdir,
  dup2,
  execve,
};

constexpr std::array<const char*, 8> kStageNames = {
    "setsid", "setgroups", "setgid", "setuid", "setpgid", "chdir", "dup2", "execve",
};

struct ChildFailure {
  ChildStage stage;
  int error;
};

std::optional<std::string> find_env_value(const std::vector<std::string>& envp,
                                          std::string_view key) {
  for (const auto& entry : envp) {
    if (entry.size() > key.size() && entry.compare(0, key.size(), key) == 0 &&
        entry[key.size()] == '=') {
      return entry.substr(key.size() + 1);
    }
  }
  return std::nullopt;
}

std::filesystem::path resolve_search_dir(std::string_view raw_dir,
                                         const std::optional<std::filesystem::path>& cwd) {
  std::filesystem::path dir =
      raw_dir.empty() ? std::filesystem::path(".") : std::filesystem::path(raw_dir);
  if (cwd && dir.is_relative()) {
    return *cwd / dir;
  }
  return dir;
}

// Resolve argv[0] against the child's PATH before fork so the child only needs
// async-signal-safe syscalls.
std::string resolve_exec_path(const std::string& argv0, const std::vector<std::string>& envp,
                              const std::optional<std::filesystem::path>& cwd) {
  if (argv0.find('/') != std::string::npos) {
    return argv0;
  }
  std::string path_value = find_env_value(envp, "PATH").value_or("/usr/bin:/bin");
  std::size_t start = 0;
  while (start <= path_value.size()) {
    std::size_t end = path_value.find(':', start);
    if (end == std::string::npos) {
      end = path_value.size();
    }
    std::string_view dir = std::string_view(path_value).substr(start, end - start);
    std::filesystem::path candidate = resolve_search_dir(dir, cwd) / argv0;
    if (::access(candidate.c_str(), X_OK) == 0) {
      return candidate.string();
    }
    start = end + 1;
  }
  return argv0;
}

long max_open_fd_limit() {
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  return max_fd < 0 ? kFallbackMaxFd : max_fd;
}

void close_inherited_fds_after_fork(int keep_fd, long max_fd) {
  for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
    if (fd != keep_fd) {
      ::close(fd);
    }
  }
}

[[noreturn]] void fail_in_child(int report_fd, ChildStage stage) {
  ChildFailure failure{stage, errno};
  (void)!::write(report_fd, &failure, sizeof(failure));
  _exit(kExecFailureExitCode);
}

void reap_blocking(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      break;
    }
  }
}

std::vector<char*> to_c_strings(std::vector<std::string>& values) {
  std::vector<char*> pointers;
  pointers.reserve(values.size() + 1);
  for (auto& value : values) {
    pointers.push_back(value.data());
  }
  pointers.push_back(nullptr);
  return pointers;
}

class PosixBackend final : public Backend {
 public:
  Result<RunningProcess> spawn(const SpawnSpec& spec) override {
    if (spec.argv.empty()) {
      return Error{.code = make_error_code(errc::empty_argv), .context = "argv"};
    }

    auto null_in = open_null_for_reading();
    if (!null_in) {
      return null_in.error();
    }
    auto out_pipe = create_pipe();
    if (!out_pipe) {
      return out_pipe.error();
    }
    auto err_pipe = create_pipe();
    if (!err_pipe) {
      return err_pipe.error();
    }
    // Reports setup/exec failures; closed by a successful exec through O_CLOEXEC.
    auto report_pipe = create_pipe();
    if (!report_pipe) {
      return report_pipe.error();
    }

    std::vector<std::string> argv_copy = spec.argv;
    std::vector<std::string> envp_copy = spec.envp;
    std::vector<char*> argv_c = to_c_strings(argv_copy);
    std::vector<char*> envp_c = to_c_strings(envp_copy);
    std::string exec_path = resolve_exec_path(argv_copy.front(), envp_copy, spec.cwd);
    const long max_fd = max_open_fd_limit();
    const bool drop_groups = spec.identity.has_value() && ::geteuid() == 0;

    const int child_stdin = null_in->get();
    const int child_stdout = out_pipe->write_end.get();
    const int child_stderr = err_pipe->write_end.get();
    const int report_fd = report_pipe->write_end.get();

    pid_t pid = ::fork();
    if (pid == -1) {
      return make_errno_error("fork");
    }

    if (pid == 0) {
      if (spec.identity) {
        if (::setsid() == -1) {
          fail_in_child(report_fd, ChildStage::setsid);
        }
        if (drop_groups && ::setgroups(0, nullptr) == -1) {
          fail_in_child(report_fd, ChildStage::setgroups);
        }
        if (::setgid(spec.identity->gid) == -1) {
          fail_in_child(report_fd, ChildStage::setgid);
        }
        if (::setuid(spec.identity->uid) == -1) {
          fail_in_child(report_fd, ChildStage::setuid);
        }
      } else if (spec.new_process_group) {
        if (::setpgid(0, 0) == -1) {
          fail_in_child(report_fd, ChildStage::setpgid);
        }
      }

      if (spec.cwd && ::chdir(spec.cwd->c_str()) == -1) {
        fail_in_child(report_fd, ChildStage::chdir);
      }

      if (::dup2(child_stdin, STDIN_FILENO) == -1 || ::dup2(child_stdout, STDOUT_FILENO) == -1 ||
          ::dup2(child_stderr, STDERR_FILENO) == -1) {
        fail_in_child(report_fd, ChildStage::dup2);
      }

      close_inherited_fds_after_fork(report_fd, max_fd);

      ::execve(exec_path.c_str(), argv_c.data(), envp_c.data());
      fail_in_child(report_fd, ChildStage::execve);
    }

    // Parent keeps only the read ends of the output pipes.
    null_in->reset(-1);
    out_pipe->write_end.reset(-1);
    err_pipe->write_end.reset(-1);
    report_pipe->write_end.reset(-1);

    ChildFailure failure{};
    ssize_t read_result = -1;
    do {
      read_result = ::read(report_pipe->read_end.get(), &failure, sizeof(failure));
    } while (read_result == -1 && errno == EINTR);

    if (read_result == -1) {
      Error error = make_errno_error("read(spawn report)");
      ::kill(pid, SIGKILL);
      reap_blocking(pid);
      return error;
    }
    if (read_result > 0) {
      reap_blocking(pid);
      if (read_result != static_cast<ssize_t>(sizeof(failure))) {
        return Error{.code = make_error_code(errc::spawn_failed), .context = "spawn report"};
      }
      return make_errno_error(kStageNames[static_cast<std::size_t>(failure.stage)],
                              failure.error);
    }

    RunningProcess process;
    process.pid = pid;
    if (spec.identity || spec.new_process_group) {
      process.pgid = pid;
    }
    process.stdout_pipe = PipeReader(out_pipe->read_end.release());
    process.stderr_pipe = PipeReader(err_pipe->read_end.release());
    return process;
  }

  Result<std::optional<ExitStatus>> try_wait(RunningProcess& process) override {
    if (process.pid <= 0 || process.reaped) {
      return Error{.code = make_error_code(errc::wait_failed), .context = "try_wait"};
    }
    int status = 0;
    while (true) {
      pid_t rv = ::waitpid(process.pid, &status, WNOHANG);
      if (rv == process.pid) {
        process.reaped = true;
        return std::optional<ExitStatus>(ExitStatus::from_wait_status(status));
      }
      if (rv == 0) {
        return std::optional<ExitStatus>();
      }
      if (errno == EINTR) {
        continue;
      }
      return make_errno_error("waitpid");
    }
  }

  Result<void> terminate(RunningProcess& process) override {
    if (process.pid <= 0) {
      return Error{.code = make_error_code(errc::kill_failed), .context = "terminate"};
    }
    if (!process.pgid && process.reaped) {
      // The pid may already belong to an unrelated process.
      return {};
    }
    pid_t target = process.pgid ? -*process.pgid : process.pid;
    if (::kill(target, SIGKILL) == -1 && errno != ESRCH) {
      return make_errno_error(process.pgid ? "killpg" : "kill");
    }
    return {};
  }

  void release(RunningProcess& process) override {
    if (process.pid <= 0 || process.reaped) {
      return;
    }
    int status = 0;
    pid_t rv = -1;
    do {
      rv = ::waitpid(process.pid, &status, WNOHANG);
    } while (rv == -1 && errno == EINTR);
    process.reaped = true;
    if (rv == 0) {
      std::thread([pid = process.pid] { reap_blocking(pid); }).detach();
    }
  }
};

}  // namespace

Backend& posix_backend() {
  static PosixBackend backend;
  return backend;
}

}  // namespace boxrun::internal
