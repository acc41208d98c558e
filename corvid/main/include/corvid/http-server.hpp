#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

#include "corvid/action-dispatcher.hpp"
#include "corvid/action-registry.hpp"
#include "corvid/connection-state.hpp"
#include "corvid/event-handler.hpp"
#include "corvid/event.hpp"
#include "corvid/listener.hpp"
#include "corvid/reactor.hpp"
#include "corvid/route-table.hpp"
#include "corvid/router.hpp"
#include "corvid/server-config.hpp"
#include "corvid/timedef.hpp"

namespace corvid {

// Invoked on SIGHUP (from the maintenance tick) to swap a new table and / or registry into the router.
using ReloadHook = std::function<void(Router&)>;

// Single process HTTP/1.x server: accepts connections on its listeners, parses requests and dispatches them
// to actions, all from one Reactor thread.
//
// Lifecycle:
//  - Sockets are bound in the constructor (or handed over already bound), so ports() is valid right after it.
//  - run() / runUntil() drive the Reactor from the calling thread.
//  - A SIGINT / SIGTERM (see SignalHandler) or beginDrain() stops accepting, lets in-flight requests complete
//    with "Connection: close", then returns from run() when no connection remains or the drain deadline passes.
//  - stop() (from any thread) makes run() return promptly, closing all connections.
class HttpServer final : public EventHandler {
 public:
  // Binds the listeners of config. Throws std::invalid_argument on invalid config, std::system_error if a bind fails.
  explicit HttpServer(ServerConfig config, RouteTable table = {}, ActionRegistry registry = {});

  // Serves on listeners bound beforehand (typically inherited from a supervisor process).
  HttpServer(ServerConfig config, std::vector<Listener> listeners, RouteTable table = {},
             ActionRegistry registry = {});

  ~HttpServer() override;

  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

  // Actual ports of the listeners, in configuration order.
  [[nodiscard]] std::vector<uint16_t> ports() const;

  // Port of the first listener.
  [[nodiscard]] uint16_t port() const;

  [[nodiscard]] Router& router() noexcept { return _router; }

  // The Reactor of this server, shared with outbound requests issued by actions.
  [[nodiscard]] Reactor& reactor() noexcept { return _reactor; }

  void setReloadHook(ReloadHook hook) { _reloadHook = std::move(hook); }

  void run();

  // Also returns once predicate returns true (checked at each loop iteration).
  void runUntil(const std::function<bool()>& predicate);

  // Thread safe.
  void stop() noexcept { _stopRequested.store(true, std::memory_order_relaxed); }

  // Stop accepting new connections and close the existing ones once their current request is answered.
  // A zero maxWait waits without limit.
  void beginDrain(std::chrono::milliseconds maxWait = std::chrono::milliseconds{0});

  [[nodiscard]] bool isDraining() const noexcept { return _draining; }

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_relaxed); }

  [[nodiscard]] std::size_t nbConnections() const noexcept { return _connections.size(); }

  void onEvent(int fd, EventBmp events) override;

  void onTick(SteadyTimePoint now) override;

 private:
  using ConnectionMap = std::unordered_map<int, std::unique_ptr<ConnectionState>>;
  using ConnectionMapIt = ConnectionMap::iterator;

  void registerListeners();
  void closeListeners();
  void updateMaintenanceTimer();

  void acceptNewConnections(const Listener& listener);
  void handleReadable(int fd);
  void handleWritable(int fd);

  // Reads until EAGAIN, the peer closes (returns true) or the outbound limit pauses the connection.
  bool readAvailable(ConnectionState& state);

  [[nodiscard]] bool isOutboundFull(const ConnectionState& state) const noexcept {
    return state.pendingOutput().size() > _config.maxOutboundBufferBytes;
  }

  // Parses and answers the complete requests present in the input buffer.
  void processRequests(ConnectionState& state);

  // Queues an error response and marks the connection for closing after it is flushed.
  void emitErrorAndClose(ConnectionState& state, http::StatusCode status);

  void flushOutbound(ConnectionState& state);
  bool enableWritableInterest(ConnectionState& state);
  bool disableWritableInterest(ConnectionState& state);

  void sweepConnections(SteadyTimePoint now);
  ConnectionMapIt closeConnection(ConnectionMapIt cnxIt);
  void closeAllConnections();

  void applyReload();

  ServerConfig _config;
  Reactor _reactor;
  Router _router;
  ActionDispatcher _dispatcher;
  std::vector<Listener> _listeners;
  std::vector<uint16_t> _ports;
  ConnectionMap _connections;
  ReloadHook _reloadHook;
  SteadyTimePoint _drainDeadline;
  bool _draining{false};
  bool _stopped{false};
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _running{false};
};

}  // namespace corvid
