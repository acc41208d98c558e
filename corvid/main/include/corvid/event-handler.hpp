#pragma once

#include "corvid/event.hpp"
#include "corvid/timedef.hpp"

namespace corvid {

// Receiver of the readiness notifications of the file descriptors it registered in a Reactor,
// and optionally of the periodic maintenance ticks.
class EventHandler {
 public:
  EventHandler() noexcept = default;

  EventHandler(const EventHandler&) = delete;
  EventHandler(EventHandler&&) = delete;
  EventHandler& operator=(const EventHandler&) = delete;
  EventHandler& operator=(EventHandler&&) = delete;

  virtual ~EventHandler() = default;

  virtual void onEvent(int fd, EventBmp events) = 0;

  // Called at each maintenance tick for handlers subscribed with Reactor::subscribeTicks.
  virtual void onTick([[maybe_unused]] SteadyTimePoint now) {}
};

}  // namespace corvid
