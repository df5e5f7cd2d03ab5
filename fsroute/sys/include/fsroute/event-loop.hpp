#pragma once

#include <cstdint>
#include <span>

#include "fsroute/base-fd.hpp"
#include "fsroute/timedef.hpp"

namespace fsroute {

using EventBmp = uint32_t;

inline constexpr EventBmp EventIn = 0x001;
inline constexpr EventBmp EventErr = 0x008;
inline constexpr EventBmp EventHup = 0x010;

// Thin RAII wrapper over epoll.
// The ready-event buffer starts at kInitialCapacity and doubles whenever a poll fills it; it never shrinks.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 8;

  struct Event {
    EventBmp eventBmp;
    int fd;
  };

  EventLoop() noexcept = default;

  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&& rhs) noexcept;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&& rhs) noexcept;

  ~EventLoop();

  // Register fd with given events. Throws std::system_error on failure.
  void addOrThrow(int fd, EventBmp eventBmp) const;

  // Delete fd from monitoring. Logs on error.
  void del(int fd) const;

  // Waits up to the poll timeout.
  //  - ready events: non-empty span over an internal buffer, valid until the next poll
  //  - timeout or EINTR: empty span with non-null data()
  //  - unrecoverable failure (logged): empty span with nullptr data()
  [[nodiscard]] std::span<const Event> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return _nbAllocatedEvents; }

 private:
  uint32_t _nbAllocatedEvents = 0;
  int _pollTimeoutMs = 0;
  BaseFd _baseFd;
  void* _pEvents = nullptr;
  Event* _pOut = nullptr;
};

}  // namespace fsroute
