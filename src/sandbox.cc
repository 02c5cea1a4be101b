#include "boxrun/sandbox.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/fmt/ranges.h>
#include <spdlog/logger.h>

#include "boxrun/internal/assembler.hpp"
#include "boxrun/internal/backend.hpp"
#include "boxrun/internal/clock.hpp"
#include "boxrun/internal/deadline.hpp"
#include "boxrun/internal/lowering.hpp"
#include "boxrun/internal/sampler.hpp"
#include "boxrun/internal/stream_reader.hpp"

namespace boxrun {

namespace {

SandboxConfig normalize(SandboxConfig config) {
  if (!config.logger) {
    config.logger = make_logger("boxrun");
  }
  config.read_chunk_size = std::max<std::size_t>(config.read_chunk_size, 1);
  if (config.sample_interval <= std::chrono::milliseconds::zero()) {
    config.sample_interval = SandboxConfig::kDefaultSampleInterval;
  }
  return config;
}

std::string describe_cwd(const std::optional<std::filesystem::path>& cwd) {
  return cwd ? cwd->string() : std::string("<inherited>");
}

}  // namespace

Sandbox::Sandbox(SandboxConfig config)
    : config_(normalize(std::move(config))),
      owned_probe_(std::make_unique<internal::ProcfsProbe>(config_.proc_root)),
      backend_(internal::posix_backend()),
      clock_(internal::steady_clock()),
      probe_(*owned_probe_) {}

Sandbox::Sandbox(SandboxConfig config, internal::Backend& backend, internal::Clock& clock,
                 internal::ResourceProbe& probe)
    : config_(normalize(std::move(config))), backend_(backend), clock_(clock), probe_(probe) {}

Sandbox::~Sandbox() = default;

Result<RunResult> Sandbox::run(const LaunchRequest& request) const {
  auto& log = *config_.logger;
  auto spec = internal::lower_request(request, config_);
  if (!spec) {
    log.warn("rejected request {}: {}", request.args, spec.error().context);
    return spec.error();
  }

  log.info("launching {} (cwd: {})", spec->argv, describe_cwd(spec->cwd));
  const auto started = clock_.now();
  auto spawned = backend_.spawn(*spec);
  if (!spawned) {
    log.warn("launch of {} failed: {}: {}", spec->argv, spawned.error().context,
             spawned.error().code.message());
    return spawned.error();
  }
  internal::RunningProcess process = std::move(spawned.value());
  process.launched_at = started;

  auto reader = internal::make_stream_reader(
      config_.stream_mode,
      internal::StreamLimits{.max_bytes = static_cast<std::size_t>(request.max_output_size),
                             .chunk_size = config_.read_chunk_size,
                             .join_timeout = config_.reader_join_timeout},
      config_.logger);
  reader->start(std::move(process.stdout_pipe), std::move(process.stderr_pipe));

  internal::ResourceSampler sampler(probe_, clock_, process.pid);
  sampler.begin();

  internal::TickOps ops{
      .sample =
          [&] {
            const auto skipped = sampler.summary().samples_skipped;
            sampler.tick();
            if (sampler.summary().samples_skipped != skipped) {
              log.trace("pid {}: no sample this tick", process.pid);
            }
          },
      .drain = [&] { reader->poll(); },
      .poll = [&] { return backend_.try_wait(process); },
  };
  auto outcome = internal::run_until_deadline(
      ops, clock_, internal::tick_budget(request.timeout_seconds, config_.sample_interval),
      config_.sample_interval);

  // Teardown runs on every path, including a failed poll.
  auto killed = backend_.terminate(process);
  if (!killed) {
    log.warn("pid {}: {} failed: {}", process.pid, killed.error().context,
             killed.error().code.message());
  }
  backend_.release(process);
  internal::CapturedOutput output = reader->finish();
  sampler.end();
  const auto finished = clock_.now();

  if (!outcome) {
    log.warn("pid {}: supervision failed: {}: {}", process.pid, outcome.error().context,
             outcome.error().code.message());
    return outcome.error();
  }
  if (outcome->state == internal::RunState::timed_out) {
    log.info("pid {}: timed out after {}s", process.pid, request.timeout_seconds);
  }

  RunResult result = internal::assemble_result(internal::AssemblyInput{
      .cmd = request.args,
      .status = outcome->status,
      .output = std::move(output),
      .output_limit = static_cast<std::size_t>(request.max_output_size) + config_.read_chunk_size,
      .usage = sampler.summary(),
      .ticks_per_second = probe_.ticks_per_second(),
      .cpu_count = probe_.cpu_count(),
      .wall_time = finished - process.launched_at,
  });
  log.debug("pid {}: exit_code={} timeout={} cpu={}s wall={}s util={}% peak={}kB samples={}/{}",
            process.pid, result.exit_code, result.timeout, result.process_cpu_time,
            result.process_exec_time, result.process_cpu_util, result.process_peak_memory,
            sampler.summary().samples_taken,
            sampler.summary().samples_taken + sampler.summary().samples_skipped);
  return result;
}

Result<RunResult> Sandbox::run(std::vector<std::string> args, int timeout_seconds,
                               std::int64_t max_output_size, std::optional<Environment> env,
                               bool shell, std::optional<std::filesystem::path> cwd) const {
  return run(LaunchRequest{.args = std::move(args),
                           .timeout_seconds = timeout_seconds,
                           .max_output_size = max_output_size,
                           .env = std::move(env),
                           .shell = shell,
                           .cwd = std::move(cwd)});
}

RunResult Sandbox::run_or_throw(const LaunchRequest& request) const {
  auto result = run(request);
  if (!result) {
    internal::throw_error(result.error());
  }
  return std::move(result.value());
}

}  // namespace boxrun
