#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <utility>

#include "boxrun/platform.hpp"
#include "boxrun/result.hpp"

namespace boxrun::internal {

inline Error make_errno_error(const char* context, int error = errno) {
  return Error{.code = std::error_code(error, std::system_category()), .context = context};
}

class unique_fd {
 public:
  unique_fd() = default;
  explicit unique_fd(int fd) : fd_(fd) {}
  unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
  unique_fd& operator=(unique_fd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }
  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;
  ~unique_fd() { reset(-1); }

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] int release() noexcept { return std::exchange(fd_, -1); }

  void reset(int fd) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

  explicit operator bool() const noexcept { return fd_ >= 0; }

 private:
  int fd_{-1};
};

struct PipeEnds {
  unique_fd read_end;
  unique_fd write_end;
};

inline Result<void> set_cloexec(int fd) {
  int flags = ::fcntl(fd, F_GETFD);
  if (flags == -1) {
    return make_errno_error("fcntl(F_GETFD)");
  }
  if (::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
    return make_errno_error("fcntl(F_SETFD)");
  }
  return {};
}

inline Result<void> set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL);
  if (flags == -1) {
    return make_errno_error("fcntl(F_GETFL)");
  }
  if ((flags & O_NONBLOCK) != 0) {
    return {};
  }
  if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    return make_errno_error("fcntl(F_SETFL)");
  }
  return {};
}

// Both ends are close-on-exec; the child side is dup2'ed onto 0/1/2 which clears the flag.
inline Result<PipeEnds> create_pipe() {
  std::array<int, 2> fds{};
#if BOXRUN_PLATFORM_LINUX
  if (::pipe2(fds.data(), O_CLOEXEC) == -1) {
    return make_errno_error("pipe2");
  }
  return PipeEnds{unique_fd(fds[0]), unique_fd(fds[1])};
#else
  if (::pipe(fds.data()) == -1) {
    return make_errno_error("pipe");
  }
  PipeEnds ends{unique_fd(fds[0]), unique_fd(fds[1])};
  for (int fd : fds) {
    auto cloexec = set_cloexec(fd);
    if (!cloexec) {
      return cloexec.error();
    }
  }
  return ends;
#endif
}

inline Result<unique_fd> open_null_for_reading() {
  int flags = O_RDONLY;
#if defined(O_CLOEXEC)
  flags |= O_CLOEXEC;
#endif
  int fd = ::open("/dev/null", flags);
  if (fd == -1) {
    return make_errno_error("open(/dev/null)");
  }
  return unique_fd(fd);
}

}  // namespace boxrun::internal
