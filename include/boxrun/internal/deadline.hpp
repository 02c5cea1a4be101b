#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

#include "boxrun/internal/clock.hpp"
#include "boxrun/result.hpp"
#include "boxrun/status.hpp"

namespace boxrun::internal {

enum class RunState : std::uint8_t { running, completed, timed_out };

struct TickOps {
  std::function<void()> sample;
  std::function<void()> drain;
  std::function<Result<std::optional<ExitStatus>>()> poll;
};

struct DeadlineOutcome {
  RunState state = RunState::running;
  std::optional<ExitStatus> status;
  std::size_t ticks = 0;
};

// Number of ticks that fit in the timeout, at least one.
std::size_t tick_budget(int timeout_seconds, std::chrono::milliseconds interval);

// Runs sample -> drain -> poll per tick, sleeping one interval between ticks. The deadline is
// the tick budget itself; there is no grace period after it is spent.
Result<DeadlineOutcome> run_until_deadline(TickOps& ops, Clock& clock, std::size_t max_ticks,
                                           std::chrono::milliseconds interval);

}  // namespace boxrun::internal
