#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include "boxrun/internal/clock.hpp"

namespace boxrun::internal {

// One observation of the process tree rooted at the tracked pid.
struct Sample {
  std::uint64_t cpu_ticks = 0;
  std::uint64_t memory_kb = 0;
  std::chrono::steady_clock::time_point taken_at;
};

// Host facility for process-tree and system CPU introspection. Every query may come back empty;
// callers treat absence as "skip this observation".
class ResourceProbe {
 public:
  virtual ~ResourceProbe() = default;
  virtual std::optional<Sample> sample_tree(int root_pid) = 0;
  virtual std::optional<std::uint64_t> system_cpu_ticks() = 0;
  virtual long ticks_per_second() = 0;
  virtual unsigned cpu_count() = 0;
};

// Reads /proc/<pid>/stat, /proc/<pid>/status and /proc/stat under a configurable root.
class ProcfsProbe final : public ResourceProbe {
 public:
  explicit ProcfsProbe(std::filesystem::path proc_root);

  std::optional<Sample> sample_tree(int root_pid) override;
  std::optional<std::uint64_t> system_cpu_ticks() override;
  long ticks_per_second() override;
  unsigned cpu_count() override;

 private:
  std::filesystem::path root_;
};

struct ProcStat {
  int pid = 0;
  int ppid = 0;
  char state = '?';
  // utime + stime + cutime + cstime
  std::uint64_t cpu_ticks = 0;
};

std::optional<ProcStat> parse_proc_stat(std::string_view content);
// Value of a "Key:   123 kB" line in /proc/<pid>/status, normalized to kB.
std::optional<std::uint64_t> parse_status_kb(std::string_view content, std::string_view key);
// Sum of the aggregate "cpu" line of /proc/stat.
std::optional<std::uint64_t> parse_system_cpu_ticks(std::string_view content);

struct UsageSummary {
  std::uint64_t cpu_ticks = 0;
  std::uint64_t peak_memory_kb = 0;
  std::uint64_t system_cpu_delta = 0;
  std::size_t samples_taken = 0;
  std::size_t samples_skipped = 0;
};

// Accumulates samples for one run: CPU and memory are running maxima, the system CPU reading
// brackets the run.
class ResourceSampler {
 public:
  ResourceSampler(ResourceProbe& probe, Clock& clock, int root_pid);

  void begin();
  void tick();
  void end();

  [[nodiscard]] const UsageSummary& summary() const noexcept { return summary_; }
  [[nodiscard]] const std::optional<Sample>& last_sample() const noexcept { return last_; }

 private:
  ResourceProbe& probe_;
  Clock& clock_;
  int root_pid_;
  std::optional<std::uint64_t> system_start_;
  std::optional<Sample> last_;
  UsageSummary summary_;
};

}  // namespace boxrun::internal
