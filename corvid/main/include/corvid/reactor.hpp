#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <unordered_map>
#include <vector>

#include "corvid/event-handler.hpp"
#include "corvid/event-loop.hpp"
#include "corvid/event.hpp"
#include "corvid/timer-fd.hpp"

namespace corvid {

// Single threaded, non-blocking I/O multiplexing loop of a process.
//
// Each iteration (runOnce):
//  1. waits for readiness of the registered file descriptors (at most one tick interval),
//  2. calls onEvent of the handler owning each ready fd,
//  3. on a maintenance tick (timer expiry, or poll timeout), calls onTick of the subscribed handlers,
//  4. runs the deferred callbacks, including those deferred while running them.
//
// All member functions except stop() must be called from the thread running the loop.
class Reactor {
 public:
  static constexpr std::chrono::milliseconds kDefaultTickInterval{100};

  // Throws std::system_error if the epoll instance or the timer cannot be created.
  explicit Reactor(std::chrono::milliseconds tickInterval = kDefaultTickInterval);

  Reactor(const Reactor&) = delete;
  Reactor(Reactor&&) = delete;
  Reactor& operator=(const Reactor&) = delete;
  Reactor& operator=(Reactor&&) = delete;

  ~Reactor() = default;

  // Register fd with given events, notifying handler. Returns false on failure (logged).
  [[nodiscard]] bool add(int fd, EventBmp events, EventHandler& handler);

  // Same as add, throws std::system_error on failure.
  void addOrThrow(int fd, EventBmp events, EventHandler& handler);

  // Change the events watched for an already registered fd. Returns false on failure (logged).
  [[nodiscard]] bool modify(int fd, EventBmp events);

  // Stop watching fd. No-op if fd is not registered.
  void remove(int fd);

  [[nodiscard]] bool contains(int fd) const { return _handlers.contains(fd); }

  [[nodiscard]] std::size_t nbRegisteredFds() const noexcept { return _handlers.size(); }

  void subscribeTicks(EventHandler& handler);

  void unsubscribeTicks(EventHandler& handler);

  // Run callback after the I/O processing of the current (or next) iteration.
  void defer(std::function<void()> callback);

  [[nodiscard]] std::chrono::milliseconds tickInterval() const noexcept { return _tickInterval; }

  void setTickInterval(std::chrono::milliseconds tickInterval);

  // One loop iteration.
  void runOnce();

  // Runs until stop() is called, a termination signal is received or polling fails.
  void run();

  // Same as run(), also returning as soon as predicate returns true (checked after each iteration).
  void runUntil(const std::function<bool()>& predicate);

  // Request run() / runUntil() to return. Can be called from any thread. If the loop is not running,
  // the next run() returns after its first check.
  void stop() noexcept { _stopRequested.store(true, std::memory_order_relaxed); }

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_relaxed); }

  // True if the last poll failed in a non recoverable way.
  [[nodiscard]] bool failed() const noexcept { return _eventLoop.lastPollFailed(); }

 private:
  void tick();
  void runDeferred();

  std::chrono::milliseconds _tickInterval;
  EventLoop _eventLoop;
  TimerFd _timer;
  std::unordered_map<int, EventHandler*> _handlers;
  std::vector<EventHandler*> _tickHandlers;
  std::vector<std::function<void()>> _deferred;
  std::vector<std::function<void()>> _deferredRunning;
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _running{false};
};

}  // namespace corvid
