#include "corvid/listener.hpp"

#include <cstdint>
#include <span>
#include <vector>

#include "corvid/log.hpp"
#include "corvid/server-config.hpp"
#include "corvid/socket.hpp"

namespace corvid {

std::vector<Listener> BindListeners(const ServerConfig& config) {
  std::vector<Listener> listeners;
  listeners.reserve(config.listeners.size());
  for (const ListenAddress& address : config.listeners) {
    Listener& listener = listeners.emplace_back(address, address.port, Socket{});
    listener.socket.bindAndListen(address.host, listener.port, config.reusePort, config.backlog);
    log::info("Listening on {}:{} (fd # {})", address.host.empty() ? "*" : address.host, listener.port,
              listener.socket.fd());
  }
  return listeners;
}

std::vector<uint16_t> ListenerPorts(std::span<const Listener> listeners) {
  std::vector<uint16_t> ports;
  ports.reserve(listeners.size());
  for (const Listener& listener : listeners) {
    ports.push_back(listener.port);
  }
  return ports;
}

}  // namespace corvid
