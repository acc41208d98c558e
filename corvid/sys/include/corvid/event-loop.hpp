#pragma once

#include <sys/epoll.h>

#include <cstdint>
#include <span>
#include <vector>

#include "corvid/base-fd.hpp"
#include "corvid/event.hpp"
#include "corvid/timedef.hpp"

namespace corvid {

// Thin RAII wrapper over epoll.
//
//  * The event buffer starts with kInitialCapacity slots and doubles each time a poll
//    returns exactly capacity() events. It never shrinks.
//  * add()/mod()/del() return success/failure and log details on failure; the caller
//    decides the policy (drop connection, abort start-up...).
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    EventBmp eventBmp;
    int fd;
  };

  // Throws std::system_error if epoll_create1 fails.
  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&&) noexcept = default;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&&) noexcept = default;

  ~EventLoop() = default;

  // Register fd with given events. Throws std::system_error on failure.
  void addOrThrow(EventFd event) const;

  // Register fd with given events. Returns false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events. Returns false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Stop monitoring fd. Failures are logged at debug level.
  void del(int fd) const;

  // Polls for ready events up to the poll timeout.
  // Returns a span over an internal, reusable buffer, valid until the next call.
  //  - On timeout or interruption by a signal (EINTR): returns an empty span.
  //  - On unrecoverable failure (logged): returns an empty span and lastPollFailed() is true.
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] bool lastPollFailed() const noexcept { return _lastPollFailed; }

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

  void updatePollTimeout(SysDuration pollTimeout);

 private:
  int _pollTimeoutMs;
  bool _lastPollFailed{false};
  BaseFd _baseFd;
  std::vector<epoll_event> _epollEvents;
  std::vector<EventFd> _readyEvents;
};

}  // namespace corvid
