#include "corvid/timer-fd.hpp"

#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <system_error>

#include "corvid/errno-throw.hpp"
#include "corvid/log.hpp"
#include "corvid/timedef.hpp"

namespace corvid {

TimerFd::TimerFd() : _baseFd(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("timerfd_create failed");
  }
  log::debug("Maintenance timer fd # {} opened", fd());
}

void TimerFd::setInterval(SysDuration interval) const {
  itimerspec value{};
  if (interval > SysDuration::zero()) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(interval);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(interval - secs);
    value.it_value.tv_sec = static_cast<time_t>(secs.count());
    value.it_value.tv_nsec = static_cast<long>(nanos.count());
    value.it_interval = value.it_value;
  }
  if (::timerfd_settime(fd(), 0, &value, nullptr) == -1) {
    const int timerFd = fd();
    throw_errno("Unable to set interval of timer fd # {}", timerFd);
  }
}

uint64_t TimerFd::consumeExpirations() const noexcept {
  uint64_t nbExpirations = 0;
  ssize_t ret;
  do {
    ret = ::read(fd(), &nbExpirations, sizeof(nbExpirations));
  } while (ret == -1 && errno == EINTR);
  if (ret != static_cast<ssize_t>(sizeof(nbExpirations))) {
    if (ret == -1 && errno != EAGAIN) {
      log::error("Unable to read timer fd # {}: {}", fd(), std::system_category().message(errno));
    }
    return 0;
  }
  return nbExpirations;
}

}  // namespace corvid
