#pragma once

#include <cstdint>

#include "corvid/base-fd.hpp"
#include "corvid/timedef.hpp"

namespace corvid {

// Monotonic timerfd driving the reactor maintenance ticks.
// It is created disarmed, non-blocking and close-on-exec.
class TimerFd {
 public:
  TimerFd();

  // Fires every interval from now on. Zero or a negative interval disarms the timer.
  void setInterval(SysDuration interval) const;

  // Reads the pending expiration count, 0 if the timer did not fire since the last call.
  uint64_t consumeExpirations() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace corvid
