#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "corvid/server-config.hpp"
#include "corvid/socket.hpp"

namespace corvid {

// A bound, listening socket together with the address it was configured from.
struct Listener {
  ListenAddress address;
  // Actual port, resolved when address.port is 0.
  uint16_t port{0};
  Socket socket;
};

// Binds all listeners of config in order. SO_REUSEPORT is set when config.reusePort is true.
// Throws std::system_error or std::invalid_argument on the first failure (already bound sockets are closed).
std::vector<Listener> BindListeners(const ServerConfig& config);

// Actual ports of listeners, in order.
std::vector<uint16_t> ListenerPorts(std::span<const Listener> listeners);

}  // namespace corvid
