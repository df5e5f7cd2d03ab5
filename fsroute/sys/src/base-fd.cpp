#include "fsroute/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "fsroute/log.hpp"

namespace fsroute {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  const int fd = release();
  if (fd == kClosedFd) {
    return;
  }
  // On Linux the descriptor is released even if close is interrupted: never retry.
  if (::close(fd) != 0 && errno != EINTR) {
    log::error("Failed to close fd # {}: {}", fd, std::strerror(errno));
    return;
  }
  log::debug("fd # {} closed", fd);
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace fsroute
