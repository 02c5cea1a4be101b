#include <filesystem>
#include <iostream>

#include "boxrun/sandbox.hpp"

int main() {
  auto dir = std::filesystem::temp_directory_path();
  boxrun::Sandbox sandbox;

  auto run = sandbox.run({"/bin/pwd"}, 5, 4096, std::nullopt, false, dir);
  if (!run) {
    std::cerr << "run failed: " << run.error().code.message() << "\n";
    return 1;
  }

  auto printed = run->stdout_data;
  if (!printed.empty() && printed.back() == '\n') {
    printed.pop_back();
  }
  if (std::filesystem::weakly_canonical(printed) != std::filesystem::weakly_canonical(dir)) {
    std::cerr << "unexpected cwd: " << printed << "\n";
    return 1;
  }
  return 0;
}
