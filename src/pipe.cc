#include "boxrun/pipe.hpp"

#include <unistd.h>

#include <cerrno>
#include <utility>

#include "boxrun/internal/fd.hpp"

namespace boxrun {

PipeReader::PipeReader(PipeReader&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

PipeReader& PipeReader::operator=(PipeReader&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

PipeReader::~PipeReader() { close(); }

void PipeReader::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

Result<void> PipeReader::set_nonblocking() const {
  if (fd_ < 0) {
    return Error{.code = make_error_code(errc::read_failed), .context = "set_nonblocking"};
  }
  return internal::set_nonblocking(fd_);
}

Result<std::size_t> PipeReader::read_some(std::span<char> buffer) const {
  if (fd_ < 0) {
    return Error{.code = make_error_code(errc::read_failed), .context = "read"};
  }
  while (true) {
    ssize_t rv = ::read(fd_, buffer.data(), buffer.size());
    if (rv >= 0) {
      return static_cast<std::size_t>(rv);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EWOULDBLOCK) {
      return internal::make_errno_error("read", EAGAIN);
    }
    return internal::make_errno_error("read");
  }
}

}  // namespace boxrun
