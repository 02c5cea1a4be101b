#include <exception>
#include <iostream>

#include "boxrun/sandbox.hpp"

int main() {
  boxrun::Sandbox sandbox;
  boxrun::LaunchRequest request{.args = {"exit", "3"}, .shell = true};

  try {
    auto result = sandbox.run_or_throw(request);
    if (result.exit_code != 3) {
      std::cerr << "unexpected exit code: " << result.exit_code << "\n";
      return 1;
    }
  } catch (const std::exception& ex) {
    std::cerr << "run failed: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
