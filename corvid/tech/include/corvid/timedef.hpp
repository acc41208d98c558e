#pragma once

#include <chrono>

namespace corvid {

/// The system clock is used for wall time only. All timeouts are measured with the steady clock.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

}  // namespace corvid
