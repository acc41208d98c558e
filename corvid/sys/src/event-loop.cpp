#include "corvid/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <span>

#include "corvid/base-fd.hpp"
#include "corvid/errno-throw.hpp"
#include "corvid/event.hpp"
#include "corvid/log.hpp"
#include "corvid/timedef.hpp"

namespace corvid {

namespace {

int ToMs(SysDuration dur) {
  return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(dur).count());
}

}  // namespace

EventLoop::EventLoop(SysDuration pollTimeout, uint32_t initialCapacity)
    : _pollTimeoutMs(ToMs(pollTimeout)),
      _baseFd(::epoll_create1(EPOLL_CLOEXEC)),
      _epollEvents(std::max(1U, initialCapacity)) {
  if (!_baseFd) {
    throw_errno("epoll_create1 failed");
  }
  if (initialCapacity == 0) {
    log::warn("EventLoop constructed with initialCapacity=0; promoting to 1");
  }
  _readyEvents.reserve(_epollEvents.size());
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

void EventLoop::addOrThrow(EventFd event) const {
  if (!add(event)) [[unlikely]] {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", event.fd, event.eventBmp);
  }
}

bool EventLoop::add(EventFd event) const {
  epoll_event ev{};
  ev.events = event.eventBmp;
  ev.data.fd = event.fd;
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
               std::strerror(err));
    errno = err;
    return false;
  }
  return true;
}

bool EventLoop::mod(EventFd event) const {
  epoll_event ev{};
  ev.events = event.eventBmp;
  ev.data.fd = event.fd;
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_MOD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    // EBADF or ENOENT can occur when the fd was closed concurrently; downgrade severity.
    if (err == EBADF || err == ENOENT) {
      log::warn("epoll_ctl MOD benign failure (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp,
                err, std::strerror(err));
    } else {
      log::error("epoll_ctl MOD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
                 std::strerror(err));
    }
    return false;
  }
  return true;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) [[unlikely]] {
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
}

std::span<const EventLoop::EventFd> EventLoop::poll() {
  _readyEvents.clear();
  _lastPollFailed = false;

  const int nbReadyFds =
      ::epoll_wait(_baseFd.fd(), _epollEvents.data(), static_cast<int>(_epollEvents.size()), _pollTimeoutMs);

  if (nbReadyFds == -1) {
    if (errno != EINTR) {
      const auto err = errno;
      log::error("epoll_wait failed (timeout_ms={}, errno={}, msg={})", _pollTimeoutMs, err, std::strerror(err));
      _lastPollFailed = true;
    }
    return {};
  }

  for (int idx = 0; idx < nbReadyFds; ++idx) {
    _readyEvents.push_back(EventFd{static_cast<EventBmp>(_epollEvents[static_cast<std::size_t>(idx)].events),
                                   _epollEvents[static_cast<std::size_t>(idx)].data.fd});
  }

  // If saturated, grow buffer for subsequent polls.
  if (static_cast<std::size_t>(nbReadyFds) == _epollEvents.size()) {
    _epollEvents.resize(_epollEvents.size() * 2U);
  }

  return _readyEvents;
}

void EventLoop::updatePollTimeout(SysDuration pollTimeout) { _pollTimeoutMs = ToMs(pollTimeout); }

}  // namespace corvid
