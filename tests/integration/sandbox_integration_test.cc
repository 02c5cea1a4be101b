#include <gtest/gtest.h>

#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

#include "boxrun/internal/sampler.hpp"
#include "boxrun/sandbox.hpp"
#include "helpers/helper_path.hpp"

namespace boxrun {
namespace {

constexpr std::chrono::milliseconds kProcessExitWaitTimeout{2000};

std::string helper_path() {
  auto path = support::helper_path();
  if (path.empty()) {
    ADD_FAILURE() << "helper path not found";
  }
  return path;
}

SandboxConfig quiet_config() {
  SandboxConfig config;
  config.logger = std::make_shared<spdlog::logger>("integration");
  return config;
}

std::filesystem::path unique_temp_path(const std::string& stem) {
  static int counter = 0;
  return std::filesystem::temp_directory_path() /
         (stem + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
}

std::optional<pid_t> read_pid_file(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return std::nullopt;
  }
  long long value = 0;
  file >> value;
  if (!file) {
    return std::nullopt;
  }
  return static_cast<pid_t>(value);
}

// A killed grandchild may linger as a zombie when nothing reaps orphans, so zombie counts as gone.
bool process_gone(pid_t pid) {
  if (::kill(pid, 0) == -1 && errno == ESRCH) {
    return true;
  }
  std::ifstream file("/proc/" + std::to_string(pid) + "/stat");
  if (!file.is_open()) {
    return true;
  }
  std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  auto stat = internal::parse_proc_stat(content);
  return !stat || stat->state == 'Z' || stat->state == 'X';
}

bool wait_for_process_exit(pid_t pid, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (process_gone(pid)) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

std::vector<int> read_fd_list(const std::filesystem::path& path) {
  std::ifstream file(path);
  std::vector<int> fds;
  int fd = -1;
  while (file >> fd) {
    fds.push_back(fd);
  }
  return fds;
}

std::string trim_newline(std::string text) {
  while (!text.empty() && text.back() == '\n') {
    text.pop_back();
  }
  return text;
}

}  // namespace

TEST(SandboxIntegrationTest, EchoCompletes) {
  Sandbox sandbox(quiet_config());
  auto result = sandbox.run({"echo", "hello"}, 5, 1024);
  ASSERT_TRUE(result.has_value()) << result.error().context << " "
                                  << result.error().code.message();
  EXPECT_EQ(result->cmd, (std::vector<std::string>{"echo", "hello"}));
  EXPECT_FALSE(result->timeout);
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_EQ(result->stdout_data, "hello\n");
  EXPECT_EQ(result->stderr_data, "");
  EXPECT_GE(result->process_exec_time, 0.0);
  EXPECT_LT(result->process_exec_time, 5.0);
  EXPECT_GE(result->process_peak_memory, 0);
}

TEST(SandboxIntegrationTest, SleepBeyondTimeoutIsKilled) {
  Sandbox sandbox(quiet_config());
  const auto started = std::chrono::steady_clock::now();
  auto result = sandbox.run({"sleep", "5"}, 1, 1024);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->timeout);
  EXPECT_EQ(result->exit_code, RunResult::kNoExitCode);
  EXPECT_GE(result->process_exec_time, 1.0);
  EXPECT_LT(result->process_exec_time, 3.0);
  EXPECT_LT(elapsed, std::chrono::seconds(4));
}

TEST(SandboxIntegrationTest, OutputIsCappedPerStream) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  Sandbox sandbox(quiet_config());

  auto result = sandbox.run({helper, "--stdout-bytes", "100000", "--stderr-bytes", "50"}, 5, 2048);
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->timeout);
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_GE(result->stdout_data.size(), 2048u);
  EXPECT_LE(result->stdout_data.size(), 2048u + 1024u);
  EXPECT_EQ(result->stderr_data, std::string(50, 'b'));
}

TEST(SandboxIntegrationTest, MissingExecutableIsLaunchError) {
  Sandbox sandbox(quiet_config());
  auto result = sandbox.run({"/nonexistent/binary"});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, std::errc::no_such_file_or_directory);
  EXPECT_EQ(result.error().context, "execve");
  EXPECT_THROW(sandbox.run_or_throw(LaunchRequest{.args = {"/nonexistent/binary"}}),
               std::system_error);
}

TEST(SandboxIntegrationTest, MissingWorkingDirectoryIsLaunchError) {
  Sandbox sandbox(quiet_config());
  auto result = sandbox.run({"echo"}, 5, 1024, std::nullopt, false,
                            std::filesystem::path("/nonexistent/dir"));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().context, "chdir");
}

TEST(SandboxIntegrationTest, ExitCodeIsReported) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  Sandbox sandbox(quiet_config());

  auto result = sandbox.run({helper, "--exit-code", "3"});
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->timeout);
  EXPECT_EQ(result->exit_code, 3);
}

TEST(SandboxIntegrationTest, SignalDeathIsNegated) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  Sandbox sandbox(quiet_config());

  auto result = sandbox.run({helper, "--raise-signal", std::to_string(SIGTERM)});
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->timeout);
  EXPECT_EQ(result->exit_code, -SIGTERM);
}

TEST(SandboxIntegrationTest, RequestEnvironmentReplacesParent) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  Sandbox sandbox(quiet_config());

  auto with_env = sandbox.run({helper, "--print-env", "BOXRUN_TEST_VALUE"}, 5, 1024,
                              Environment{{"BOXRUN_TEST_VALUE", "from-request"}});
  ASSERT_TRUE(with_env.has_value());
  EXPECT_EQ(with_env->stdout_data, "from-request");

  ::setenv("BOXRUN_PARENT_ONLY", "leaked", 1);
  auto without_env = sandbox.run({helper, "--print-env", "BOXRUN_PARENT_ONLY"});
  ::unsetenv("BOXRUN_PARENT_ONLY");
  ASSERT_TRUE(without_env.has_value());
  EXPECT_EQ(without_env->stdout_data, "");
}

TEST(SandboxIntegrationTest, DefaultEnvironmentIsApplied) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  auto config = quiet_config();
  config.default_env["BOXRUN_DEFAULT"] = "configured";
  Sandbox sandbox(std::move(config));

  auto result = sandbox.run({helper, "--print-env", "BOXRUN_DEFAULT"});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->stdout_data, "configured");
}

TEST(SandboxIntegrationTest, WorkingDirectoryOverride) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  Sandbox sandbox(quiet_config());
  auto dir = std::filesystem::temp_directory_path();

  auto result = sandbox.run({helper, "--print-cwd"}, 5, 4096, std::nullopt, false, dir);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(std::filesystem::weakly_canonical(result->stdout_data),
            std::filesystem::weakly_canonical(dir));
}

TEST(SandboxIntegrationTest, StdinIsEmpty) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  Sandbox sandbox(quiet_config());

  auto result = sandbox.run({helper, "--report-stdin"});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->stdout_data, "eof");
}

TEST(SandboxIntegrationTest, ShellFlagRunsThroughShell) {
  Sandbox sandbox(quiet_config());
  auto result = sandbox.run({"printf", "'%s-%s'", "a", "b;", "exit", "4"}, 5, 1024, std::nullopt,
                            true);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->stdout_data, "a-b");
  EXPECT_EQ(result->exit_code, 4);
}

TEST(SandboxIntegrationTest, InvalidUtf8IsReplaced) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  Sandbox sandbox(quiet_config());

  auto result = sandbox.run({helper, "--invalid-utf8"});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->stdout_data, "ok\xEF\xBF\xBD\xEF\xBF\xBD" "end");
}

TEST(SandboxIntegrationTest, BinaryOutputStaysWithinCapPlusOneChunk) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  Sandbox sandbox(quiet_config());

  auto result = sandbox.run({helper, "--binary-bytes", "5000"}, 5, 100);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_FALSE(result->stdout_data.empty());
  EXPECT_LE(result->stdout_data.size(), 100U + SandboxConfig::kDefaultReadChunkSize);
}

TEST(SandboxIntegrationTest, ThreadedStreamModeCapsOutput) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  auto config = quiet_config();
  config.stream_mode = StreamMode::threaded;
  Sandbox sandbox(std::move(config));

  auto result =
      sandbox.run({helper, "--stdout-bytes", "300000", "--stderr-bytes", "10", "--exit-code", "1"},
                  5, 4096);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->exit_code, 1);
  EXPECT_GE(result->stdout_data.size(), 4096u);
  EXPECT_LE(result->stdout_data.size(), 4096u + 1024u);
  EXPECT_EQ(result->stderr_data, std::string(10, 'b'));
}

TEST(SandboxIntegrationTest, OutputBeforeTimeoutIsKept) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  Sandbox sandbox(quiet_config());

  auto result = sandbox.run({helper, "--stdout-bytes", "10", "--sleep-ms", "10000"}, 1, 1024);
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->timeout);
  EXPECT_EQ(result->stdout_data, std::string(10, 'a'));
}

TEST(SandboxIntegrationTest, TimeoutKillsGrandchildren) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  auto pid_path = unique_temp_path("boxrun_grandchild");
  std::error_code remove_ec;
  std::filesystem::remove(pid_path, remove_ec);
  Sandbox sandbox(quiet_config());

  auto result = sandbox.run({helper, "--spawn-grandchild", "--grandchild-sleep-ms", "20000",
                             "--grandchild-pid-file", pid_path.string(), "--sleep-ms", "20000"},
                            1, 1024);
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->timeout);

  auto grandchild = read_pid_file(pid_path);
  ASSERT_TRUE(grandchild.has_value());
  bool exited = wait_for_process_exit(*grandchild, kProcessExitWaitTimeout);
  if (!exited) {
    ::kill(*grandchild, SIGKILL);
  }
  EXPECT_TRUE(exited);
  std::filesystem::remove(pid_path, remove_ec);
}

TEST(SandboxIntegrationTest, CompletionKillsLeftoverGrandchildren) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  auto pid_path = unique_temp_path("boxrun_orphan");
  std::error_code remove_ec;
  std::filesystem::remove(pid_path, remove_ec);
  Sandbox sandbox(quiet_config());

  auto result = sandbox.run({helper, "--spawn-grandchild", "--grandchild-sleep-ms", "20000",
                             "--grandchild-pid-file", pid_path.string()},
                            5, 1024);
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->timeout);
  EXPECT_EQ(result->exit_code, 0);

  auto grandchild = read_pid_file(pid_path);
  ASSERT_TRUE(grandchild.has_value());
  bool exited = wait_for_process_exit(*grandchild, kProcessExitWaitTimeout);
  if (!exited) {
    ::kill(*grandchild, SIGKILL);
  }
  EXPECT_TRUE(exited);
  std::filesystem::remove(pid_path, remove_ec);
}

TEST(SandboxIntegrationTest, PeakMemoryCoversAllocation) {
  if (!std::filesystem::exists("/proc/self/status")) {
    GTEST_SKIP() << "procfs not mounted";
  }
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  Sandbox sandbox(quiet_config());

  auto result = sandbox.run({helper, "--alloc-mb", "64", "--sleep-ms", "600"}, 5, 1024);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_GE(result->process_peak_memory, 64 * 1024);
}

TEST(SandboxIntegrationTest, CpuTimeIsAccounted) {
  if (!std::filesystem::exists("/proc/stat")) {
    GTEST_SKIP() << "procfs not mounted";
  }
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  Sandbox sandbox(quiet_config());

  auto result = sandbox.run({helper, "--burn-cpu-ms", "800"}, 5, 1024);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_GT(result->process_cpu_time, 0.1);
  EXPECT_GT(result->process_cpu_util, 0.0);
}

TEST(SandboxIntegrationTest, OnlyStdioIsInherited) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  auto fd_path = unique_temp_path("boxrun_fds");
  std::error_code remove_ec;
  std::filesystem::remove(fd_path, remove_ec);
  Sandbox sandbox(quiet_config());

  auto result = sandbox.run({helper, "--write-open-fds", fd_path.string()});
  ASSERT_TRUE(result.has_value());
  auto fds = read_fd_list(fd_path);
  ASSERT_FALSE(fds.empty());
  for (int fd : fds) {
    EXPECT_LE(fd, STDERR_FILENO) << "inherited fd " << fd;
  }
  std::filesystem::remove(fd_path, remove_ec);
}

TEST(SandboxIntegrationTest, DeterministicCommandIsRepeatable) {
  Sandbox sandbox(quiet_config());
  auto first = sandbox.run({"echo", "same"});
  auto second = sandbox.run({"echo", "same"});
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->stdout_data, second->stdout_data);
  EXPECT_EQ(first->exit_code, second->exit_code);
  EXPECT_EQ(first->timeout, second->timeout);
}

TEST(SandboxIntegrationTest, ConcurrentRunsShareOneSandbox) {
  std::string helper = helper_path();
  ASSERT_FALSE(helper.empty());
  Sandbox sandbox(quiet_config());

  constexpr int kThreads = 6;
  std::vector<std::thread> threads;
  std::vector<std::optional<RunResult>> results(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      auto result = sandbox.run(
          {helper, "--stdout-bytes", std::to_string(100 * (i + 1)), "--exit-code", std::to_string(i)},
          5, 4096);
      if (result) {
        results[static_cast<std::size_t>(i)] = std::move(result.value());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (int i = 0; i < kThreads; ++i) {
    const auto& result = results[static_cast<std::size_t>(i)];
    ASSERT_TRUE(result.has_value()) << "run " << i << " failed";
    EXPECT_EQ(result->exit_code, i);
    EXPECT_EQ(result->stdout_data.size(), static_cast<std::size_t>(100 * (i + 1)));
  }
}

TEST(SandboxIntegrationTest, SandboxIdentityIsApplied) {
  if (::geteuid() != 0) {
    GTEST_SKIP() << "switching identity needs root";
  }
  auto config = quiet_config();
  config.identity = SandboxIdentity{.uid = 65534, .gid = 65534};
  Sandbox sandbox(std::move(config));

  auto result = sandbox.run({"id", "-u"}, 5, 1024, std::nullopt, false,
                            std::filesystem::path("/"));
  ASSERT_TRUE(result.has_value()) << result.error().context << " "
                                  << result.error().code.message();
  EXPECT_EQ(trim_newline(result->stdout_data), "65534");
}

}  // namespace boxrun
