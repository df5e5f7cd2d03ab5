#pragma once

#include <chrono>

namespace fsroute {

/// The system clock is the only one convertible to Unix epoch time, which HTTP dates need.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;

}  // namespace fsroute
