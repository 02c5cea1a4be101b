#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "boxrun/internal/sampler.hpp"
#include "boxrun/internal/stream_reader.hpp"
#include "boxrun/run_result.hpp"
#include "boxrun/status.hpp"

namespace boxrun::internal {

// Decimal places kept for seconds and utilization.
inline constexpr int kResultPrecision = 2;

// Valid UTF-8 is copied through; each maximal invalid subsequence becomes U+FFFD.
// Decoding stops at the last code point that fits in max_bytes.
std::string decode_utf8_lossy(std::string_view bytes,
                              std::size_t max_bytes = std::string::npos);

double round_to(double value, int decimals);

// tree_ticks / system_delta * 100 * cpu_count, or 0 when the system counter did not move.
double cpu_utilization_percent(std::uint64_t tree_ticks, std::uint64_t system_delta,
                               unsigned cpu_count);

struct AssemblyInput {
  std::vector<std::string> cmd;
  std::optional<ExitStatus> status;
  CapturedOutput output;
  // Upper bound on each decoded stream: capture cap plus one read chunk.
  std::size_t output_limit = std::string::npos;
  UsageSummary usage;
  long ticks_per_second = 0;
  unsigned cpu_count = 1;
  std::chrono::steady_clock::duration wall_time{};
};

RunResult assemble_result(AssemblyInput input);

}  // namespace boxrun::internal
