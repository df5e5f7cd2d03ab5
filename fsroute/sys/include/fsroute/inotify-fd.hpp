#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

#include "fsroute/base-fd.hpp"

namespace fsroute {

// One decoded inotify event. 'name' points into the InotifyFd internal buffer and is only valid
// during the callback invocation of readEvents().
struct InotifyEvent {
  int watchDescriptor;
  uint32_t mask;
  std::string_view name;
};

// RAII wrapper over a non-blocking inotify instance.
class InotifyFd {
 public:
  // Events of interest for a content tree: creation, modification, deletion and moves.
  static constexpr uint32_t kContentMask = 0x00000002U | 0x00000004U | 0x00000008U | 0x00000040U | 0x00000080U |
                                           0x00000100U | 0x00000200U | 0x00000400U | 0x00000800U;

  // Creates the inotify instance. Throws std::system_error on failure.
  InotifyFd();

  // Returns the watch descriptor, or -1 on failure (logged).
  [[nodiscard]] int addWatch(const char* path, uint32_t mask = kContentMask) const;

  void removeWatch(int watchDescriptor) const noexcept;

  // Reads all available events without blocking and calls 'callback' for each.
  // Returns the number of decoded events.
  std::size_t readEvents(const std::function<void(const InotifyEvent&)>& callback) const;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace fsroute
