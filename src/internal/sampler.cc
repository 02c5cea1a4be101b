#include "boxrun/internal/sampler.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace boxrun::internal {

namespace {

constexpr long kFallbackTicksPerSecond = 100;
constexpr std::uint64_t kKilo = 1024;

// Field positions counted from the first token after the closing ')' of comm.
constexpr std::size_t kStateField = 0;
constexpr std::size_t kPpidField = 1;
constexpr std::size_t kUtimeField = 11;
constexpr std::size_t kCstimeField = 14;

std::optional<std::string> read_file(const std::filesystem::path& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    return std::nullopt;
  }
  std::ostringstream content;
  content << input.rdbuf();
  if (input.bad()) {
    return std::nullopt;
  }
  return content.str();
}

template <typename Int>
std::optional<Int> parse_int(std::string_view text) {
  Int value{};
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string_view> split_whitespace(std::string_view text) {
  std::vector<std::string_view> tokens;
  std::size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
      ++pos;
    }
    std::size_t start = pos;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) == 0) {
      ++pos;
    }
    if (pos > start) {
      tokens.push_back(text.substr(start, pos - start));
    }
  }
  return tokens;
}

std::uint64_t unit_multiplier(std::string_view unit) {
  if (unit.empty()) {
    return 1;
  }
  switch (std::tolower(static_cast<unsigned char>(unit.front()))) {
    case 'm':
      return kKilo;
    case 'g':
      return kKilo * kKilo;
    default:
      return 1;
  }
}

std::optional<ProcStat> read_proc_stat(const std::filesystem::path& dir) {
  auto content = read_file(dir / "stat");
  if (!content) {
    return std::nullopt;
  }
  return parse_proc_stat(*content);
}

std::optional<int> pid_from_dirname(const std::filesystem::path& path) {
  return parse_int<int>(path.filename().native());
}

}  // namespace

std::optional<ProcStat> parse_proc_stat(std::string_view content) {
  // comm may itself contain spaces and parentheses; it always ends at the last ')'.
  std::size_t open = content.find('(');
  std::size_t close = content.rfind(')');
  if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
    return std::nullopt;
  }
  auto head = split_whitespace(content.substr(0, open));
  auto fields = split_whitespace(content.substr(close + 1));
  if (head.size() != 1 || fields.size() <= kCstimeField) {
    return std::nullopt;
  }

  ProcStat stat;
  auto pid = parse_int<int>(head.front());
  auto ppid = parse_int<int>(fields[kPpidField]);
  if (!pid || !ppid || fields[kStateField].size() != 1) {
    return std::nullopt;
  }
  stat.pid = *pid;
  stat.ppid = *ppid;
  stat.state = fields[kStateField].front();
  for (std::size_t i = kUtimeField; i <= kCstimeField; ++i) {
    // cutime/cstime are signed in the kernel ABI.
    auto ticks = parse_int<std::int64_t>(fields[i]);
    if (!ticks) {
      return std::nullopt;
    }
    stat.cpu_ticks += static_cast<std::uint64_t>(std::max<std::int64_t>(*ticks, 0));
  }
  return stat;
}

std::optional<std::uint64_t> parse_status_kb(std::string_view content, std::string_view key) {
  std::size_t pos = 0;
  while (pos < content.size()) {
    std::size_t end = content.find('\n', pos);
    if (end == std::string_view::npos) {
      end = content.size();
    }
    std::string_view line = content.substr(pos, end - pos);
    pos = end + 1;
    if (line.size() <= key.size() || line.compare(0, key.size(), key) != 0 ||
        line[key.size()] != ':') {
      continue;
    }
    auto tokens = split_whitespace(line.substr(key.size() + 1));
    if (tokens.empty()) {
      return std::nullopt;
    }
    auto value = parse_int<std::uint64_t>(tokens[0]);
    if (!value) {
      return std::nullopt;
    }
    return *value * unit_multiplier(tokens.size() > 1 ? tokens[1] : std::string_view{});
  }
  return std::nullopt;
}

std::optional<std::uint64_t> parse_system_cpu_ticks(std::string_view content) {
  std::string_view line = content.substr(0, content.find('\n'));
  auto tokens = split_whitespace(line);
  if (tokens.size() < 2 || tokens.front() != "cpu") {
    return std::nullopt;
  }
  std::uint64_t total = 0;
  for (std::size_t i = 1; i < tokens.size(); ++i) {
    auto value = parse_int<std::uint64_t>(tokens[i]);
    if (!value) {
      return std::nullopt;
    }
    total += *value;
  }
  return total;
}

ProcfsProbe::ProcfsProbe(std::filesystem::path proc_root) : root_(std::move(proc_root)) {}

std::optional<Sample> ProcfsProbe::sample_tree(int root_pid) {
  auto root_stat = read_proc_stat(root_ / std::to_string(root_pid));
  if (!root_stat) {
    return std::nullopt;
  }

  // Descendants are found from parent links; anything that forks and exits between two samples
  // is never seen.
  std::unordered_multimap<int, ProcStat> children;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
    auto pid = pid_from_dirname(entry.path());
    if (!pid || *pid == root_pid) {
      continue;
    }
    if (auto stat = read_proc_stat(entry.path())) {
      children.emplace(stat->ppid, *stat);
    }
  }
  if (ec) {
    return std::nullopt;
  }

  // The directory scan is not atomic, so a recycled pid could close a parent-link cycle.
  std::vector<ProcStat> tree{*root_stat};
  std::unordered_set<int> seen{root_pid};
  for (std::size_t i = 0; i < tree.size(); ++i) {
    auto [begin, end] = children.equal_range(tree[i].pid);
    for (auto it = begin; it != end; ++it) {
      if (seen.insert(it->second.pid).second) {
        tree.push_back(it->second);
      }
    }
  }

  Sample sample;
  for (const auto& process : tree) {
    sample.cpu_ticks += process.cpu_ticks;
  }

  // tree[0] is the root, so the fallback decision is made before any descendant is counted.
  for (const auto& process : tree) {
    auto status = read_file(root_ / std::to_string(process.pid) / "status");
    if (!status) {
      continue;
    }
    auto peak = parse_status_kb(*status, "VmPeak");
    if (!peak && process.pid == root_pid) {
      // No high-water mark on this host: resident size of the primary process only.
      sample.memory_kb = parse_status_kb(*status, "VmRSS").value_or(0);
      break;
    }
    sample.memory_kb += peak.value_or(0);
  }
  return sample;
}

std::optional<std::uint64_t> ProcfsProbe::system_cpu_ticks() {
  auto content = read_file(root_ / "stat");
  if (!content) {
    return std::nullopt;
  }
  return parse_system_cpu_ticks(*content);
}

long ProcfsProbe::ticks_per_second() {
  long ticks = ::sysconf(_SC_CLK_TCK);
  return ticks > 0 ? ticks : kFallbackTicksPerSecond;
}

unsigned ProcfsProbe::cpu_count() {
  long online = ::sysconf(_SC_NPROCESSORS_ONLN);
  if (online > 0) {
    return static_cast<unsigned>(online);
  }
  return std::max(std::thread::hardware_concurrency(), 1U);
}

ResourceSampler::ResourceSampler(ResourceProbe& probe, Clock& clock, int root_pid)
    : probe_(probe), clock_(clock), root_pid_(root_pid) {}

void ResourceSampler::begin() { system_start_ = probe_.system_cpu_ticks(); }

void ResourceSampler::tick() {
  auto sample = probe_.sample_tree(root_pid_);
  if (!sample) {
    ++summary_.samples_skipped;
    return;
  }
  sample->taken_at = clock_.now();
  summary_.cpu_ticks = std::max(summary_.cpu_ticks, sample->cpu_ticks);
  summary_.peak_memory_kb = std::max(summary_.peak_memory_kb, sample->memory_kb);
  ++summary_.samples_taken;
  last_ = sample;
}

void ResourceSampler::end() {
  auto system_end = probe_.system_cpu_ticks();
  if (system_start_ && system_end && *system_end > *system_start_) {
    summary_.system_cpu_delta = *system_end - *system_start_;
  } else {
    summary_.system_cpu_delta = 0;
  }
}

}  // namespace boxrun::internal
