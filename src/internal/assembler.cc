#include "boxrun/internal/assembler.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace boxrun::internal {

namespace {

constexpr std::string_view kReplacementCharacter = "\xEF\xBF\xBD";
constexpr double kPercent = 100.0;

bool is_continuation(unsigned char byte) { return (byte & 0xC0U) == 0x80U; }

struct SequenceCheck {
  // Bytes that belong to the sequence starting at the probed position.
  std::size_t consumed = 1;
  bool valid = false;
};

// Follows the well-formed byte table of the Unicode standard. A malformed sequence consumes its
// maximal valid prefix, so each one turns into exactly one replacement character.
SequenceCheck check_sequence(std::string_view bytes, std::size_t pos) {
  const auto lead = static_cast<unsigned char>(bytes[pos]);
  if (lead < 0x80U) {
    return {.consumed = 1, .valid = true};
  }
  std::size_t length = 0;
  unsigned char min_second = 0x80;
  unsigned char max_second = 0xBF;
  if (lead >= 0xC2U && lead <= 0xDFU) {
    length = 2;
  } else if (lead >= 0xE0U && lead <= 0xEFU) {
    length = 3;
    if (lead == 0xE0U) {
      min_second = 0xA0;  // overlong
    } else if (lead == 0xEDU) {
      max_second = 0x9F;  // surrogates
    }
  } else if (lead >= 0xF0U && lead <= 0xF4U) {
    length = 4;
    if (lead == 0xF0U) {
      min_second = 0x90;  // overlong
    } else if (lead == 0xF4U) {
      max_second = 0x8F;  // above U+10FFFF
    }
  } else {
    return {};
  }

  std::size_t consumed = 1;
  while (consumed < length && pos + consumed < bytes.size()) {
    const auto next = static_cast<unsigned char>(bytes[pos + consumed]);
    const bool fits = consumed == 1 ? (next >= min_second && next <= max_second)
                                    : is_continuation(next);
    if (!fits) {
      break;
    }
    ++consumed;
  }
  return {.consumed = consumed, .valid = consumed == length};
}

}  // namespace

std::string decode_utf8_lossy(std::string_view bytes, std::size_t max_bytes) {
  std::string text;
  text.reserve(std::min(bytes.size(), max_bytes));
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    auto sequence = check_sequence(bytes, pos);
    auto piece = sequence.valid ? bytes.substr(pos, sequence.consumed) : kReplacementCharacter;
    if (piece.size() > max_bytes - text.size()) {
      break;
    }
    text.append(piece);
    pos += sequence.consumed;
  }
  return text;
}

double round_to(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

double cpu_utilization_percent(std::uint64_t tree_ticks, std::uint64_t system_delta,
                               unsigned cpu_count) {
  if (system_delta == 0) {
    return 0.0;
  }
  return static_cast<double>(tree_ticks) / static_cast<double>(system_delta) * kPercent *
         static_cast<double>(cpu_count);
}

RunResult assemble_result(AssemblyInput input) {
  RunResult result;
  result.cmd = std::move(input.cmd);
  result.timeout = !input.status.has_value();
  result.exit_code = input.status ? input.status->reported_code() : RunResult::kNoExitCode;
  result.stdout_data = decode_utf8_lossy(input.output.stdout_bytes, input.output_limit);
  result.stderr_data = decode_utf8_lossy(input.output.stderr_bytes, input.output_limit);

  result.process_cpu_util = round_to(
      cpu_utilization_percent(input.usage.cpu_ticks, input.usage.system_cpu_delta, input.cpu_count),
      kResultPrecision);
  const double ticks_per_second =
      input.ticks_per_second > 0 ? static_cast<double>(input.ticks_per_second) : 1.0;
  result.process_cpu_time =
      round_to(static_cast<double>(input.usage.cpu_ticks) / ticks_per_second, kResultPrecision);
  result.process_exec_time = round_to(
      std::chrono::duration<double>(input.wall_time).count(), kResultPrecision);
  result.process_peak_memory = static_cast<std::int64_t>(input.usage.peak_memory_kb);
  return result;
}

}  // namespace boxrun::internal
