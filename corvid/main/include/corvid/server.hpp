#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "corvid/action-registry.hpp"
#include "corvid/http-server.hpp"
#include "corvid/listener.hpp"
#include "corvid/route-table.hpp"
#include "corvid/server-config.hpp"
#include "corvid/supervisor-config.hpp"

namespace corvid {

// Top level entry point: serves the routes with SupervisorConfig::nbWorkers pre-forked worker processes,
// or in the calling process when it is 0.
//
// Listening sockets are shared by the workers so that the kernel spreads connections between them:
//  - ShareMode::Inherit: bound once in the constructor, inherited by each forked worker,
//  - ShareMode::ReusePort: each worker binds its own SO_REUSEPORT sockets (ports must be fixed).
// Each worker owns a private copy of the route table and of the registry.
class Server {
 public:
  // Throws std::invalid_argument on invalid configuration, std::system_error if binding fails.
  Server(ServerConfig config, RouteTable table, ActionRegistry registry = {},
         SupervisorConfig supervisorConfig = {});

  Server(const Server&) = delete;
  Server(Server&&) = delete;
  Server& operator=(const Server&) = delete;
  Server& operator=(Server&&) = delete;

  ~Server() = default;

  // Installed in every worker (and in the calling process when there is no worker).
  void setReloadHook(ReloadHook hook) { _reloadHook = std::move(hook); }

  // Bound ports (configured ports in ReusePort mode).
  [[nodiscard]] std::vector<uint16_t> ports() const;

  // Enables the SignalHandler and serves until SIGINT / SIGTERM. Single use.
  // Throws std::runtime_error if workers cannot be kept running.
  void run();

 private:
  [[nodiscard]] bool sharesByReusePort() const noexcept {
    return _supervisorConfig.nbWorkers != 0 && _supervisorConfig.shareMode == SupervisorConfig::ShareMode::ReusePort;
  }

  void serve(uint32_t workerIdx);

  ServerConfig _config;
  SupervisorConfig _supervisorConfig;
  RouteTable _table;
  ActionRegistry _registry;
  ReloadHook _reloadHook;
  std::vector<Listener> _listeners;
};

}  // namespace corvid
