#include "boxrun/internal/stream_reader.hpp"

#include <array>
#include <condition_variable>
#include <mutex>
#include <span>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/logger.h>

namespace boxrun::internal {

namespace {

// Reads per stream and tick: a full 64 KiB pipe buffer at the default chunk size, so a
// fast writer does not stall between ticks.
constexpr std::size_t kMaxChunksPerTick = 64;

constexpr std::array<const char*, 2> kStreamNames = {"stdout", "stderr"};

class NonblockingStreamReader final : public StreamReader {
 public:
  NonblockingStreamReader(StreamLimits limits, std::shared_ptr<spdlog::logger> logger)
      : logger_(std::move(logger)),
        buffer_(limits.chunk_size),
        targets_{Target{.pipe = {}, .stream = CapturedStream(limits.max_bytes)},
                 Target{.pipe = {}, .stream = CapturedStream(limits.max_bytes)}} {}

  void start(PipeReader stdout_pipe, PipeReader stderr_pipe) override {
    targets_[0].pipe = std::move(stdout_pipe);
    targets_[1].pipe = std::move(stderr_pipe);
    for (std::size_t i = 0; i < targets_.size(); ++i) {
      auto& pipe = targets_[i].pipe;
      if (!pipe.is_open()) {
        continue;
      }
      auto nonblocking = pipe.set_nonblocking();
      if (!nonblocking) {
        logger_->debug("{}: cannot enable non-blocking reads ({}); not capturing", kStreamNames[i],
                       nonblocking.error().code.message());
        pipe.close();
      }
    }
  }

  void poll() override {
    for (std::size_t i = 0; i < targets_.size(); ++i) {
      drain_available(i);
    }
  }

  CapturedOutput finish() override {
    poll();
    for (auto& target : targets_) {
      target.pipe.close();
    }
    return CapturedOutput{.stdout_bytes = targets_[0].stream.concatenated(),
                          .stderr_bytes = targets_[1].stream.concatenated()};
  }

 private:
  struct Target {
    PipeReader pipe;
    CapturedStream stream;
  };

  void drain_available(std::size_t index) {
    auto& target = targets_[index];
    for (std::size_t chunk = 0; chunk < kMaxChunksPerTick && target.pipe.is_open(); ++chunk) {
      auto count = target.pipe.read_some(std::span<char>(buffer_));
      if (!count) {
        if (count.error().code == std::errc::resource_unavailable_try_again) {
          return;
        }
        logger_->debug("{}: read failed ({}); capture stopped at {} bytes", kStreamNames[index],
                       count.error().code.message(), target.stream.bytes());
        target.pipe.close();
        return;
      }
      if (*count == 0) {
        target.pipe.close();
        return;
      }
      target.stream.accept(std::string_view(buffer_.data(), *count));
    }
  }

  std::shared_ptr<spdlog::logger> logger_;
  std::vector<char> buffer_;
  std::array<Target, 2> targets_;
};

// Shared between a reader thread and the control loop; the thread may outlive the reader when
// the join wait expires.
struct SharedCapture {
  explicit SharedCapture(std::size_t cap) : stream(cap) {}

  std::mutex mutex;
  std::condition_variable done_cv;
  bool done = false;
  CapturedStream stream;
};

void blocking_read_loop(PipeReader pipe, std::shared_ptr<SharedCapture> capture,
                        std::size_t chunk_size, std::shared_ptr<spdlog::logger> logger,
                        const char* name) {
  std::vector<char> buffer(chunk_size);
  while (true) {
    auto count = pipe.read_some(std::span<char>(buffer));
    if (!count) {
      logger->debug("{}: read failed ({}); capture stopped", name, count.error().code.message());
      break;
    }
    if (*count == 0) {
      break;
    }
    std::lock_guard lock(capture->mutex);
    capture->stream.accept(std::string_view(buffer.data(), *count));
  }
  pipe.close();
  {
    std::lock_guard lock(capture->mutex);
    capture->done = true;
  }
  capture->done_cv.notify_all();
}

class ThreadedStreamReader final : public StreamReader {
 public:
  ThreadedStreamReader(StreamLimits limits, std::shared_ptr<spdlog::logger> logger)
      : limits_(limits), logger_(std::move(logger)) {}

  ThreadedStreamReader(const ThreadedStreamReader&) = delete;
  ThreadedStreamReader& operator=(const ThreadedStreamReader&) = delete;

  ~ThreadedStreamReader() override {
    for (auto& worker : workers_) {
      if (worker.thread.joinable()) {
        worker.thread.detach();
      }
    }
  }

  void start(PipeReader stdout_pipe, PipeReader stderr_pipe) override {
    std::array<PipeReader, 2> pipes = {std::move(stdout_pipe), std::move(stderr_pipe)};
    for (std::size_t i = 0; i < pipes.size(); ++i) {
      auto& worker = workers_[i];
      worker.capture = std::make_shared<SharedCapture>(limits_.max_bytes);
      if (!pipes[i].is_open()) {
        worker.capture->done = true;
        continue;
      }
      worker.thread = std::thread(blocking_read_loop, std::move(pipes[i]), worker.capture,
                                  limits_.chunk_size, logger_, kStreamNames[i]);
    }
  }

  void poll() override {}

  CapturedOutput finish() override {
    const auto deadline = std::chrono::steady_clock::now() + limits_.join_timeout;
    std::array<std::string, 2> bytes;
    for (std::size_t i = 0; i < workers_.size(); ++i) {
      auto& worker = workers_[i];
      if (!worker.capture) {
        continue;
      }
      bool finished = false;
      {
        std::unique_lock lock(worker.capture->mutex);
        finished = worker.capture->done_cv.wait_until(lock, deadline,
                                                      [&] { return worker.capture->done; });
      }
      if (worker.thread.joinable()) {
        if (finished) {
          worker.thread.join();
        } else {
          logger_->debug("{}: reader still blocked after {}ms; detaching", kStreamNames[i],
                         limits_.join_timeout.count());
          worker.thread.detach();
        }
      }
      std::lock_guard lock(worker.capture->mutex);
      bytes[i] = worker.capture->stream.concatenated();
    }
    return CapturedOutput{.stdout_bytes = std::move(bytes[0]),
                          .stderr_bytes = std::move(bytes[1])};
  }

 private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<SharedCapture> capture;
  };

  StreamLimits limits_;
  std::shared_ptr<spdlog::logger> logger_;
  std::array<Worker, 2> workers_;
};

}  // namespace

void CapturedStream::accept(std::string_view chunk) {
  if (full()) {
    discarded_ += chunk.size();
    return;
  }
  chunks_.emplace_back(chunk);
  bytes_ += chunk.size();
}

std::string CapturedStream::concatenated() const {
  std::string joined;
  joined.reserve(bytes_);
  for (const auto& chunk : chunks_) {
    joined += chunk;
  }
  return joined;
}

std::unique_ptr<StreamReader> make_stream_reader(StreamMode mode, StreamLimits limits,
                                                 std::shared_ptr<spdlog::logger> logger) {
  switch (mode) {
    case StreamMode::threaded:
      return std::make_unique<ThreadedStreamReader>(limits, std::move(logger));
    case StreamMode::nonblocking:
      break;
  }
  return std::make_unique<NonblockingStreamReader>(limits, std::move(logger));
}

}  // namespace boxrun::internal
