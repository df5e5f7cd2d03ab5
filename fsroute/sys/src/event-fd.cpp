#include "fsroute/event-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstring>
#include <string_view>

#include "fsroute/errno-throw.hpp"
#include "fsroute/log.hpp"

namespace fsroute {

namespace {

// EAGAIN is expected: counter saturated on send, nothing to drain on read.
void LogUnexpectedFailure(std::string_view operation, int fd) noexcept {
  const int err = errno;
  if (err != EAGAIN) {
    log::error("EventFd {} on fd # {} failed: {}", operation, fd, std::strerror(err));
  }
}

}  // namespace

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("eventfd creation failed");
  }
  log::debug("EventFd fd # {} opened", fd());
}

void EventFd::send() const noexcept {
  if (::eventfd_write(fd(), 1) == -1) {
    LogUnexpectedFailure("write", fd());
  }
}

void EventFd::read() const noexcept {
  eventfd_t nbWakeups;
  if (::eventfd_read(fd(), &nbWakeups) == -1) {
    LogUnexpectedFailure("read", fd());
    return;
  }
  log::trace("EventFd fd # {} drained {} wakeup(s)", fd(), nbWakeups);
}

}  // namespace fsroute
