#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/common.h>

#include "boxrun/request.hpp"
#include "boxrun/result.hpp"

namespace spdlog {
class logger;
}  // namespace spdlog

namespace boxrun {

/// @brief Reduced-privilege principal sandboxed commands run as.
struct SandboxIdentity {
  /// @brief User id passed to setuid().
  uid_t uid;
  /// @brief Group id passed to setgid().
  gid_t gid;
};

/// @brief How child output pipes are drained.
enum class StreamMode : std::uint8_t {
  /// @brief Non-blocking reads from the control loop on every tick.
  nonblocking,
  /// @brief One blocking reader thread per stream.
  threaded,
};

/// @brief Minimal environment for sandboxed children (PATH, LANG, HOME).
Environment default_environment();

/// @brief Process-wide settings consumed by a Sandbox.
struct SandboxConfig {
  /// @brief Default sampling cadence.
  static constexpr std::chrono::milliseconds kDefaultSampleInterval{100};
  /// @brief Default size of a single pipe read.
  static constexpr std::size_t kDefaultReadChunkSize = 1024;
  /// @brief Default bounded wait for reader threads at teardown.
  static constexpr std::chrono::milliseconds kDefaultReaderJoinTimeout{500};

  /// @brief Run children as this identity in a fresh session.
  std::optional<SandboxIdentity> identity;
  /// @brief Environment used when a request does not carry one.
  Environment default_env = default_environment();
  /// @brief Put children into their own process group even without an identity.
  bool isolate_process_group = true;
  /// @brief Tick length of the deadline loop and sampler.
  std::chrono::milliseconds sample_interval{kDefaultSampleInterval};
  /// @brief Upper bound for a single pipe read.
  std::size_t read_chunk_size = kDefaultReadChunkSize;
  /// @brief Pipe draining strategy.
  StreamMode stream_mode = StreamMode::nonblocking;
  /// @brief How long teardown waits for reader threads (threaded mode).
  std::chrono::milliseconds reader_join_timeout{kDefaultReaderJoinTimeout};
  /// @brief Mount point of procfs used for process-tree sampling.
  std::filesystem::path proc_root{"/proc"};
  /// @brief Logger for launch/teardown events; a stderr logger is created when unset.
  std::shared_ptr<spdlog::logger> logger;

  /// @brief Defaults plus identity and log level taken from BOXRUN_* variables.
  ///
  /// Reads BOXRUN_SANDBOX_UID and BOXRUN_SANDBOX_GID (numeric ids or names) and
  /// BOXRUN_LOG_LEVEL (spdlog level name). A GID may be omitted when the UID names a user
  /// with a primary group.
  [[nodiscard]] static Result<SandboxConfig> from_environment();
};

/// @brief Create an unregistered logger writing to stderr.
std::shared_ptr<spdlog::logger> make_logger(std::string name,
                                            spdlog::level::level_enum level = spdlog::level::info);

}  // namespace boxrun
