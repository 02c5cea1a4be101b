#include "boxrun/internal/deadline.hpp"

#include <algorithm>

namespace boxrun::internal {

std::size_t tick_budget(int timeout_seconds, std::chrono::milliseconds interval) {
  if (timeout_seconds <= 0) {
    return 1;
  }
  const auto step = std::max<std::chrono::milliseconds::rep>(interval.count(), 1);
  const auto total = std::chrono::milliseconds(std::chrono::seconds(timeout_seconds)).count();
  return std::max<std::size_t>(static_cast<std::size_t>(total / step), 1);
}

Result<DeadlineOutcome> run_until_deadline(TickOps& ops, Clock& clock, std::size_t max_ticks,
                                           std::chrono::milliseconds interval) {
  DeadlineOutcome outcome;
  while (outcome.ticks < max_ticks) {
    ++outcome.ticks;
    ops.sample();
    ops.drain();

    auto polled = ops.poll();
    if (!polled) {
      return polled.error();
    }
    if (polled->has_value()) {
      outcome.state = RunState::completed;
      outcome.status = **polled;
      return outcome;
    }
    clock.sleep_for(interval);
  }

  outcome.state = RunState::timed_out;
  return outcome;
}

}  // namespace boxrun::internal
