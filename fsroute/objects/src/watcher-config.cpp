#include "fsroute/watcher-config.hpp"

#include <chrono>
#include <stdexcept>

namespace fsroute {

void WatcherConfig::validate() const {
  if (pollTimeout <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("WatcherConfig.pollTimeout must be strictly positive");
  }
  if (rescanInterval < std::chrono::milliseconds{0}) {
    throw std::invalid_argument("WatcherConfig.rescanInterval cannot be negative");
  }
}

}  // namespace fsroute
