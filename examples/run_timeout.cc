#include <iostream>

#include "boxrun/sandbox.hpp"

int main() {
  boxrun::Sandbox sandbox;
  boxrun::LaunchRequest request{.args = {"/bin/sleep", "5"}, .timeout_seconds = 1};

  auto run = sandbox.run(request);
  if (!run) {
    std::cerr << "run failed: " << run.error().code.message() << "\n";
    return 1;
  }
  if (!run->timeout || run->exit_code != boxrun::RunResult::kNoExitCode) {
    std::cerr << "expected timeout, got exit_code=" << run->exit_code << "\n";
    return 1;
  }

  std::cout << "timed out after " << run->process_exec_time << "s\n";
  return 0;
}
