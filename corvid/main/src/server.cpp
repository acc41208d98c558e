#include "corvid/server.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <utility>
#include <vector>

#include "corvid/action-registry.hpp"
#include "corvid/http-server.hpp"
#include "corvid/listener.hpp"
#include "corvid/log.hpp"
#include "corvid/route-table.hpp"
#include "corvid/server-config.hpp"
#include "corvid/signal-handler.hpp"
#include "corvid/supervisor-config.hpp"
#include "corvid/worker-supervisor.hpp"

namespace corvid {

Server::Server(ServerConfig config, RouteTable table, ActionRegistry registry, SupervisorConfig supervisorConfig)
    : _config(std::move(config)),
      _supervisorConfig(std::move(supervisorConfig)),
      _table(std::move(table)),
      _registry(std::move(registry)) {
  _config.validate();
  _supervisorConfig.validate();
  if (sharesByReusePort()) {
    for (const ListenAddress& address : _config.listeners) {
      if (address.port == 0) {
        throw std::invalid_argument("ReusePort share mode requires fixed listener ports");
      }
    }
    _config.reusePort = true;
  } else {
    _listeners = BindListeners(_config);
  }
}

std::vector<uint16_t> Server::ports() const {
  if (sharesByReusePort()) {
    std::vector<uint16_t> ports;
    for (const ListenAddress& address : _config.listeners) {
      ports.push_back(address.port);
    }
    return ports;
  }
  return ListenerPorts(_listeners);
}

void Server::run() {
  SignalHandler::Enable(_supervisorConfig.shutdownGracePeriod);
  if (_supervisorConfig.nbWorkers == 0) {
    serve(0);
    return;
  }
  log::info("Pre-forking {} worker(s), sockets shared by {}", _supervisorConfig.nbWorkers,
            ShareModeToStr(_supervisorConfig.shareMode));
  WorkerSupervisor supervisor(_supervisorConfig, [this](uint32_t workerIdx) {
    serve(workerIdx);
    return EXIT_SUCCESS;
  });
  supervisor.run();
}

void Server::serve(uint32_t workerIdx) {
  // A worker consumes the inherited sockets of its own copy of this object.
  std::vector<Listener> listeners = sharesByReusePort() ? BindListeners(_config) : std::move(_listeners);
  HttpServer server(_config, std::move(listeners), _table, _registry);
  server.setReloadHook(_reloadHook);
  log::info("Worker {} serving on port(s) {}", workerIdx, fmt::join(server.ports(), ", "));
  server.run();
}

}  // namespace corvid
