#include "corvid/reactor.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <utility>

#include "corvid/errno-throw.hpp"
#include "corvid/event-handler.hpp"
#include "corvid/event-loop.hpp"
#include "corvid/event.hpp"
#include "corvid/log.hpp"
#include "corvid/signal-handler.hpp"
#include "corvid/timedef.hpp"

namespace corvid {

Reactor::Reactor(std::chrono::milliseconds tickInterval) : _tickInterval(tickInterval), _eventLoop(tickInterval) {
  _eventLoop.addOrThrow(EventLoop::EventFd{EventIn, _timer.fd()});
  _timer.setInterval(_tickInterval);
}

bool Reactor::add(int fd, EventBmp events, EventHandler& handler) {
  if (!_eventLoop.add(EventLoop::EventFd{events, fd})) {
    return false;
  }
  _handlers[fd] = &handler;
  return true;
}

void Reactor::addOrThrow(int fd, EventBmp events, EventHandler& handler) {
  if (!add(fd, events, handler)) {
    throw_errno("Unable to register fd # {} in the reactor", fd);
  }
}

bool Reactor::modify(int fd, EventBmp events) { return _eventLoop.mod(EventLoop::EventFd{events, fd}); }

void Reactor::remove(int fd) {
  if (_handlers.erase(fd) != 0) {
    _eventLoop.del(fd);
  }
}

void Reactor::subscribeTicks(EventHandler& handler) {
  if (std::ranges::find(_tickHandlers, &handler) == _tickHandlers.end()) {
    _tickHandlers.push_back(&handler);
  }
}

void Reactor::unsubscribeTicks(EventHandler& handler) { std::erase(_tickHandlers, &handler); }

void Reactor::defer(std::function<void()> callback) { _deferred.push_back(std::move(callback)); }

void Reactor::setTickInterval(std::chrono::milliseconds tickInterval) {
  _tickInterval = tickInterval;
  _eventLoop.updatePollTimeout(tickInterval);
  _timer.setInterval(tickInterval);
}

void Reactor::runOnce() {
  const auto events = _eventLoop.poll();

  // A timeout (or EINTR) counts as a tick: under load the timer could otherwise be starved.
  bool maintenanceTick = events.empty();

  for (const auto event : events) {
    if (event.fd == _timer.fd()) {
      if (const auto nbExpirations = _timer.consumeExpirations(); nbExpirations > 1) {
        log::trace("Reactor missed {} maintenance ticks", nbExpirations - 1);
      }
      maintenanceTick = true;
      continue;
    }
    // Looked up for each event: a previous handler may have removed this fd.
    const auto it = _handlers.find(event.fd);
    if (it == _handlers.end()) {
      log::debug("Ignoring event for unregistered fd # {}", event.fd);
      continue;
    }
    try {
      it->second->onEvent(event.fd, event.eventBmp);
    } catch (const std::exception& ex) {
      log::error("Exception while handling events of fd # {}: {}", event.fd, ex.what());
    }
  }

  if (maintenanceTick) {
    tick();
  }

  runDeferred();
}

void Reactor::tick() {
  const auto now = SteadyClock::now();
  // Handlers may (un)subscribe from onTick.
  const auto handlers = _tickHandlers;
  for (EventHandler* pHandler : handlers) {
    if (std::ranges::find(_tickHandlers, pHandler) == _tickHandlers.end()) {
      continue;
    }
    try {
      pHandler->onTick(now);
    } catch (const std::exception& ex) {
      log::error("Exception in maintenance tick: {}", ex.what());
    }
  }
}

void Reactor::runDeferred() {
  while (!_deferred.empty()) {
    _deferredRunning.swap(_deferred);
    for (auto& callback : _deferredRunning) {
      try {
        callback();
      } catch (const std::exception& ex) {
        log::error("Exception in deferred callback: {}", ex.what());
      }
    }
    _deferredRunning.clear();
  }
}

void Reactor::run() {
  runUntil([] { return false; });
}

void Reactor::runUntil(const std::function<bool()>& predicate) {
  _running.store(true, std::memory_order_relaxed);
  while (!_stopRequested.load(std::memory_order_relaxed)) {
    runOnce();
    if (_eventLoop.lastPollFailed()) {
      log::error("Reactor stopping after a polling failure");
      break;
    }
    if (SignalHandler::IsStopRequested()) {
      log::info("Reactor stopping on signal {}", SignalHandler::StopSignal());
      break;
    }
    if (predicate()) {
      break;
    }
  }
  _stopRequested.store(false, std::memory_order_relaxed);
  _running.store(false, std::memory_order_relaxed);
}

}  // namespace corvid
