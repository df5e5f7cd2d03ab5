#include "fsroute/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <new>
#include <span>
#include <stdexcept>
#include <utility>

#include "fsroute/errno-throw.hpp"
#include "fsroute/log.hpp"

namespace fsroute {

namespace {

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");

int ToMilliseconds(SysDuration duration) {
  return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
}

}  // namespace

EventLoop::EventLoop(SysDuration pollTimeout, uint32_t initialCapacity)
    : _nbAllocatedEvents(std::max(1U, initialCapacity)),
      _pollTimeoutMs(ToMilliseconds(pollTimeout)),
      _baseFd(::epoll_create1(EPOLL_CLOEXEC)),
      _pEvents(std::malloc(static_cast<std::size_t>(_nbAllocatedEvents) * sizeof(epoll_event))),
      _pOut(static_cast<Event*>(std::malloc(static_cast<std::size_t>(_nbAllocatedEvents) * sizeof(Event)))) {
  if (_pEvents == nullptr || _pOut == nullptr) {
    std::free(_pEvents);
    std::free(_pOut);
    throw std::bad_alloc();
  }
  if (!_baseFd) {
    const auto err = errno;
    std::free(_pEvents);
    std::free(_pOut);
    log::error("epoll_create1 failed (errno={}, msg={})", err, std::strerror(err));
    throw std::runtime_error("epoll_create1 failed");
  }
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

EventLoop::EventLoop(EventLoop&& rhs) noexcept
    : _nbAllocatedEvents(std::exchange(rhs._nbAllocatedEvents, 0)),
      _pollTimeoutMs(rhs._pollTimeoutMs),
      _baseFd(std::move(rhs._baseFd)),
      _pEvents(std::exchange(rhs._pEvents, nullptr)),
      _pOut(std::exchange(rhs._pOut, nullptr)) {}

EventLoop& EventLoop::operator=(EventLoop&& rhs) noexcept {
  if (this != &rhs) {
    std::free(_pEvents);
    std::free(_pOut);

    _nbAllocatedEvents = std::exchange(rhs._nbAllocatedEvents, 0);
    _pollTimeoutMs = rhs._pollTimeoutMs;
    _baseFd = std::move(rhs._baseFd);
    _pEvents = std::exchange(rhs._pEvents, nullptr);
    _pOut = std::exchange(rhs._pOut, nullptr);
  }
  return *this;
}

EventLoop::~EventLoop() {
  std::free(_pEvents);
  std::free(_pOut);
}

void EventLoop::addOrThrow(int fd, EventBmp eventBmp) const {
  epoll_event ev{};
  ev.events = eventBmp;
  ev.data.fd = fd;
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, fd, &ev) != 0) {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", fd, eventBmp);
  }
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) {
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
}

std::span<const EventLoop::Event> EventLoop::poll() {
  const uint32_t capacityBeforePoll = _nbAllocatedEvents;
  auto* epollEvents = static_cast<epoll_event*>(_pEvents);

  const int nbReadyFds = ::epoll_wait(_baseFd.fd(), epollEvents, static_cast<int>(capacityBeforePoll), _pollTimeoutMs);
  if (nbReadyFds == -1) {
    if (errno == EINTR) {
      return {_pOut, 0U};
    }
    const auto err = errno;
    log::error("epoll_wait failed (timeout_ms={}, errno={}, msg={})", _pollTimeoutMs, err, std::strerror(err));
    return {};
  }

  for (int idx = 0; idx < nbReadyFds; ++idx) {
    _pOut[idx] = Event{static_cast<EventBmp>(epollEvents[idx].events), epollEvents[idx].data.fd};
  }
  const std::span<const Event> ready(_pOut, static_cast<std::size_t>(nbReadyFds));

  if (std::cmp_equal(nbReadyFds, capacityBeforePoll)) {
    // Grow for the next poll. Current results stay valid as only unused capacity would be lost on failure.
    const uint32_t newCapacity = capacityBeforePoll * 2U;
    void* newEvents = std::realloc(_pEvents, static_cast<std::size_t>(newCapacity) * sizeof(epoll_event));
    if (newEvents == nullptr) {
      log::error("Failed to grow the epoll event buffer, keeping a capacity of {}", _nbAllocatedEvents);
      return ready;
    }
    _pEvents = newEvents;
    void* newOut = std::realloc(_pOut, static_cast<std::size_t>(newCapacity) * sizeof(Event));
    if (newOut == nullptr) {
      log::error("Failed to grow the ready event buffer, keeping a capacity of {}", _nbAllocatedEvents);
      return ready;
    }
    _pOut = static_cast<Event*>(newOut);
    _nbAllocatedEvents = newCapacity;
    return {_pOut, static_cast<std::size_t>(nbReadyFds)};
  }

  return ready;
}

}  // namespace fsroute
