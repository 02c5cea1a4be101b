#pragma once

#include <cstddef>
#include <span>

#include "boxrun/result.hpp"

namespace boxrun {

/// @brief Parent-side read end of a child's output pipe.
class PipeReader {
 public:
  /// @brief Construct an empty reader.
  PipeReader() = default;
  /// @brief Take ownership of a native file descriptor.
  explicit PipeReader(int fd) : fd_(fd) {}
  /// @brief Move-construct a reader.
  PipeReader(PipeReader&& other) noexcept;
  /// @brief Move-assign a reader.
  PipeReader& operator=(PipeReader&& other) noexcept;
  PipeReader(const PipeReader&) = delete;
  PipeReader& operator=(const PipeReader&) = delete;
  /// @brief Destroy the reader and close if needed.
  ~PipeReader();

  /// @brief Native file descriptor handle, or -1.
  [[nodiscard]] int native_handle() const noexcept { return fd_; }
  /// @brief True while the descriptor is open.
  [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
  /// @brief Close the pipe.
  void close() noexcept;

  /// @brief Switch the descriptor to non-blocking mode.
  [[nodiscard]] Result<void> set_nonblocking() const;

  /// @brief Read up to buffer.size() bytes; 0 means end of stream.
  ///
  /// On a non-blocking descriptor with nothing buffered the error code compares equal to
  /// std::errc::resource_unavailable_try_again.
  [[nodiscard]] Result<std::size_t> read_some(std::span<char> buffer) const;

 private:
  /// @brief Native file descriptor, or -1 if empty.
  int fd_{-1};
};

}  // namespace boxrun
