#pragma once

#include "fsroute/base-fd.hpp"

namespace fsroute {

// Non-blocking eventfd used to wake up a thread blocked in EventLoop::poll.
class EventFd {
 public:
  EventFd();

  void send() const noexcept;

  // Drain pending wakeup events.
  void read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace fsroute
