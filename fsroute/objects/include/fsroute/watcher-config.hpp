#pragma once

#include <chrono>

namespace fsroute {

// Configuration of the file system watcher keeping the route index in sync with the content tree.
struct WatcherConfig {
  // Throws std::invalid_argument on inconsistent configuration.
  void validate() const;

  WatcherConfig& withEnabled(bool enable = true) {
    enabled = enable;
    return *this;
  }

  WatcherConfig& withPollTimeout(std::chrono::milliseconds timeout) {
    pollTimeout = timeout;
    return *this;
  }

  WatcherConfig& withRescanInterval(std::chrono::milliseconds interval) {
    rescanInterval = interval;
    return *this;
  }

  // Whether the router starts a watcher thread at construction.
  bool enabled{true};

  // Maximum blocking duration of one poll. Bounds the latency of stop requests and periodic rescans.
  std::chrono::milliseconds pollTimeout{std::chrono::milliseconds{200}};

  // Period of full revalidation of the content tree, compensating for events the kernel may drop.
  // 0 disables periodic rescans.
  std::chrono::milliseconds rescanInterval{std::chrono::milliseconds{0}};
};

}  // namespace fsroute
