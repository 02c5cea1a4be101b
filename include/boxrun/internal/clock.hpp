#pragma once

#include <chrono>

namespace boxrun::internal {

class Clock {
 public:
  virtual ~Clock() = default;
  virtual std::chrono::steady_clock::time_point now() = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

// Stateless monotonic clock shared by every Sandbox that is not given its own.
Clock& steady_clock();

}  // namespace boxrun::internal
