#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "boxrun/config.hpp"
#include "boxrun/pipe.hpp"

namespace boxrun::internal {

// Byte chunks from one stream under a hard cap. A chunk is kept whole while the counter is
// below the cap, so the counter overshoots by at most one chunk; later chunks are dropped.
class CapturedStream {
 public:
  explicit CapturedStream(std::size_t cap) : cap_(cap) {}

  void accept(std::string_view chunk);

  [[nodiscard]] std::size_t bytes() const noexcept { return bytes_; }
  [[nodiscard]] std::size_t discarded() const noexcept { return discarded_; }
  [[nodiscard]] bool full() const noexcept { return bytes_ >= cap_; }
  [[nodiscard]] std::string concatenated() const;

 private:
  std::vector<std::string> chunks_;
  std::size_t cap_;
  std::size_t bytes_ = 0;
  std::size_t discarded_ = 0;
};

// Raw captured bytes, not yet decoded.
struct CapturedOutput {
  std::string stdout_bytes;
  std::string stderr_bytes;
};

struct StreamLimits {
  std::size_t max_bytes = 0;
  std::size_t chunk_size = SandboxConfig::kDefaultReadChunkSize;
  std::chrono::milliseconds join_timeout{SandboxConfig::kDefaultReaderJoinTimeout};
};

class StreamReader {
 public:
  virtual ~StreamReader() = default;
  // Takes ownership of the parent ends; an empty reader means the stream is not captured.
  virtual void start(PipeReader stdout_pipe, PipeReader stderr_pipe) = 0;
  // Called once per control-loop tick. The non-blocking reader drains each stream until EAGAIN,
  // up to 64 reads per stream (one 64 KiB pipe buffer at the default chunk size), so a child
  // writing faster than one chunk per tick never blocks on a full pipe.
  virtual void poll() = 0;
  // Called after the process group has been killed. Never blocks longer than the limits allow.
  virtual CapturedOutput finish() = 0;
};

std::unique_ptr<StreamReader> make_stream_reader(StreamMode mode, StreamLimits limits,
                                                 std::shared_ptr<spdlog::logger> logger);

}  // namespace boxrun::internal
