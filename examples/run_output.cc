#include <iostream>

#include "boxrun/sandbox.hpp"

int main() {
  boxrun::Sandbox sandbox;
  auto run = sandbox.run({"/bin/sh", "-c", "printf 'out'; printf 'err' 1>&2"});
  if (!run) {
    std::cerr << "run failed: " << run.error().context << " " << run.error().code.message()
              << "\n";
    return 1;
  }

  const auto& result = run.value();
  if (result.stdout_data != "out" || result.stderr_data != "err" || result.exit_code != 0) {
    std::cerr << "unexpected result: stdout='" << result.stdout_data << "' stderr='"
              << result.stderr_data << "' exit_code=" << result.exit_code << "\n";
    return 1;
  }

  std::cout << "cpu " << result.process_cpu_time << "s, wall " << result.process_exec_time
            << "s, peak " << result.process_peak_memory << " kB\n";
  return 0;
}
