#include "fsroute/inotify-fd.hpp"

#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <functional>
#include <string_view>

#include "fsroute/errno-throw.hpp"
#include "fsroute/log.hpp"

namespace fsroute {

static_assert(InotifyFd::kContentMask == (IN_MODIFY | IN_ATTRIB | IN_CLOSE_WRITE | IN_MOVED_FROM | IN_MOVED_TO |
                                          IN_CREATE | IN_DELETE | IN_DELETE_SELF | IN_MOVE_SELF),
              "InotifyFd::kContentMask value mismatch");

InotifyFd::InotifyFd() : _baseFd(::inotify_init1(IN_NONBLOCK | IN_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("inotify_init1 failed");
  }
  log::debug("InotifyFd fd # {} opened", fd());
}

int InotifyFd::addWatch(const char* path, uint32_t mask) const {
  const int wd = ::inotify_add_watch(fd(), path, mask | IN_ONLYDIR);
  if (wd == -1) {
    const auto err = errno;
    log::warn("inotify_add_watch failed for '{}' (errno={}, msg={})", path, err, std::strerror(err));
  }
  return wd;
}

void InotifyFd::removeWatch(int watchDescriptor) const noexcept {
  if (::inotify_rm_watch(fd(), watchDescriptor) != 0) {
    // EINVAL is expected when the kernel already dropped the watch (IN_IGNORED)
    log::debug("inotify_rm_watch failed for wd {} (errno={})", watchDescriptor, errno);
  }
}

std::size_t InotifyFd::readEvents(const std::function<void(const InotifyEvent&)>& callback) const {
  alignas(inotify_event) char buf[16384];
  std::size_t nbEvents = 0;
  while (true) {
    const auto nbRead = ::read(fd(), buf, sizeof(buf));
    if (nbRead == -1) {
      if (errno == EINTR) {
        continue;
      }
      if (errno != EAGAIN) {
        log::error("inotify read failed (errno={}, msg={})", errno, std::strerror(errno));
      }
      break;
    }
    if (nbRead == 0) {
      break;
    }
    for (const char* ptr = buf; ptr < buf + nbRead;) {
      inotify_event rawEvent;
      std::memcpy(&rawEvent, ptr, sizeof(inotify_event));
      const char* namePtr = ptr + sizeof(inotify_event);
      const std::string_view name = rawEvent.len == 0 ? std::string_view() : std::string_view(namePtr);
      callback(InotifyEvent{rawEvent.wd, rawEvent.mask, name});
      ++nbEvents;
      ptr += sizeof(inotify_event) + rawEvent.len;
    }
  }
  return nbEvents;
}

}  // namespace fsroute
