#include <iostream>

#include "boxrun/sandbox.hpp"

int main() {
  boxrun::Sandbox sandbox;
  boxrun::LaunchRequest request{
      .args = {"/bin/sh", "-c", "printf '%s' \"$BOXRUN_EXAMPLE\""},
      .env = boxrun::Environment{{"BOXRUN_EXAMPLE", "hello"}},
  };

  auto run = sandbox.run(request);
  if (!run) {
    std::cerr << "run failed: " << run.error().code.message() << "\n";
    return 1;
  }
  if (run->stdout_data != "hello") {
    std::cerr << "unexpected stdout: " << run->stdout_data << "\n";
    return 1;
  }
  return 0;
}
