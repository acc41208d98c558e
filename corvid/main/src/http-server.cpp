#include "corvid/http-server.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "corvid/action-registry.hpp"
#include "corvid/connection-state.hpp"
#include "corvid/connection.hpp"
#include "corvid/event.hpp"
#include "corvid/http-method.hpp"
#include "corvid/http-request.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/http-version.hpp"
#include "corvid/listener.hpp"
#include "corvid/log.hpp"
#include "corvid/request-parser.hpp"
#include "corvid/route-table.hpp"
#include "corvid/server-config.hpp"
#include "corvid/signal-handler.hpp"
#include "corvid/socket-ops.hpp"
#include "corvid/timedef.hpp"
#include "corvid/upload-spool.hpp"

namespace corvid {

namespace {

constexpr EventBmp kReadEvents = EventIn | EventRdHup | EventEt;
constexpr EventBmp kReadWriteEvents = EventIn | EventOut | EventRdHup | EventEt;

const ServerConfig& Validated(const ServerConfig& config) {
  config.validate();
  return config;
}

bool IsSet(SteadyTimePoint tp) { return tp != SteadyTimePoint{}; }

}  // namespace

HttpServer::HttpServer(ServerConfig config, RouteTable table, ActionRegistry registry)
    : HttpServer(config, BindListeners(Validated(config)), std::move(table), std::move(registry)) {}

HttpServer::HttpServer(ServerConfig config, std::vector<Listener> listeners, RouteTable table,
                       ActionRegistry registry)
    : _config(std::move(config)),
      _reactor(_config.pollInterval),
      _router(std::move(table), std::move(registry)),
      _dispatcher(_router, _config.globalHeaders, &_reactor),
      _listeners(std::move(listeners)) {
  _config.validate();
  if (_listeners.empty()) {
    throw std::invalid_argument("HttpServer needs at least one listener");
  }
  if (const auto level = LogLevelFromName(_config.logLevel)) {
    log::set_level(*level);
  }
  _ports = ListenerPorts(_listeners);
  registerListeners();
  updateMaintenanceTimer();
  _reactor.subscribeTicks(*this);
}

HttpServer::~HttpServer() {
  closeAllConnections();
  closeListeners();
  _reactor.unsubscribeTicks(*this);
}

std::vector<uint16_t> HttpServer::ports() const { return _ports; }

uint16_t HttpServer::port() const { return _ports.front(); }

void HttpServer::registerListeners() {
  for (const Listener& listener : _listeners) {
    _reactor.addOrThrow(listener.socket.fd(), EventIn, *this);
  }
}

void HttpServer::closeListeners() {
  for (Listener& listener : _listeners) {
    if (listener.socket) {
      _reactor.remove(listener.socket.fd());
      listener.socket.close();
    }
  }
}

void HttpServer::updateMaintenanceTimer() {
  // Periodic maintenance timer: drives timeout sweeps at the granularity of the smallest enabled timeout.
  using namespace std::chrono;

  milliseconds minTimeout = _config.pollInterval;
  const auto consider = [&](milliseconds dur) {
    if (dur.count() > 0) {
      minTimeout = std::min(minTimeout, dur);
    }
  };

  if (_config.enableKeepAlive) {
    consider(_config.keepAliveTimeout);
  }
  consider(_config.headerReadTimeout);
  consider(_config.bodyReadTimeout);

  _reactor.setTickInterval(minTimeout);
}

void HttpServer::run() {
  runUntil([] { return false; });
}

void HttpServer::runUntil(const std::function<bool()>& predicate) {
  _running.store(true, std::memory_order_relaxed);
  log::info("Server running on port(s) {}", fmt::join(_ports, ", "));
  while (!_stopped) {
    _reactor.runOnce();
    if (_reactor.failed()) {
      log::error("Event loop failure, stopping server");
      break;
    }
    if (_stopRequested.load(std::memory_order_relaxed) || predicate()) {
      break;
    }
  }
  closeAllConnections();
  _stopRequested.store(false, std::memory_order_relaxed);
  _running.store(false, std::memory_order_relaxed);
  log::info("Server stopped");
}

void HttpServer::beginDrain(std::chrono::milliseconds maxWait) {
  const auto deadline = maxWait.count() > 0 ? SteadyClock::now() + maxWait : SteadyTimePoint{};
  if (_draining) {
    _drainDeadline = deadline;
    return;
  }
  _draining = true;
  _drainDeadline = deadline;
  closeListeners();
  log::info("Draining {} connection(s)", _connections.size());
}

void HttpServer::onEvent(int fd, EventBmp events) {
  const auto listenerIt =
      std::ranges::find_if(_listeners, [fd](const Listener& listener) { return listener.socket.fd() == fd; });
  if (listenerIt != _listeners.end()) {
    acceptNewConnections(*listenerIt);
    return;
  }
  if ((events & EventOut) != 0) {
    handleWritable(fd);
  }
  // EPOLLERR/EPOLLHUP/EPOLLRDHUP can be delivered without EPOLLIN.
  // Treat them as a read trigger so we promptly observe EOF/errors and close.
  if ((events & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
    handleReadable(fd);
  }
}

void HttpServer::onTick(SteadyTimePoint now) {
  sweepConnections(now);

  if (SignalHandler::ConsumeReloadRequest()) {
    applyReload();
  }

  if (_draining) {
    if (_connections.empty()) {
      _stopped = true;
    } else if (IsSet(_drainDeadline) && now >= _drainDeadline) {
      log::warn("Drain deadline reached with {} active connection(s); forcing close", _connections.size());
      closeAllConnections();
      _stopped = true;
    }
  } else if (SignalHandler::IsStopRequested()) {
    log::info("Stop requested by signal {}", SignalHandler::StopSignal());
    beginDrain(SignalHandler::GetMaxDrainPeriod());
  }
}

void HttpServer::acceptNewConnections(const Listener& listener) {
  while (true) {
    Connection cnx(listener.socket);
    if (!cnx) {
      break;
    }
    const int cnxFd = cnx.fd();
    if (_config.tcpNoDelay && !SetTcpNoDelay(cnxFd)) {
      log::warn("Unable to set TCP_NODELAY on fd # {}", cnxFd);
    }
    if (!_reactor.add(cnxFd, kReadEvents, *this)) {
      // Failure logged, the connection is closed by its destructor.
      continue;
    }
    auto state = std::make_unique<ConnectionState>(std::move(cnx), _config.parserLimits());
    state->peerAddress = GetPeerAddress(cnxFd);
    state->lastActivity = SteadyClock::now();
    log::debug("Accepted connection fd # {} from {}", cnxFd, state->peerAddress);
    _connections.emplace(cnxFd, std::move(state));

    // Edge triggered: bytes which arrived with the connection are only signalled once.
    handleReadable(cnxFd);
  }
}

void HttpServer::handleReadable(int fd) {
  const auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    log::error("Received an invalid fd # {} from the event loop (or already removed?)", fd);
    return;
  }
  ConnectionState& state = *cnxIt->second;
  if (state.hasPendingOutput()) {
    flushOutbound(state);
    if (state.canCloseImmediately()) {
      closeConnection(cnxIt);
      return;
    }
  }

  bool peerClosed = false;
  do {
    if (state.readPaused) {
      if (isOutboundFull(state)) {
        break;
      }
      // Serve the pipelined requests kept while paused before reading more.
      state.readPaused = false;
      log::trace("Resuming reads on fd # {}", fd);
      processRequests(state);
    }
    peerClosed = readAvailable(state);
    if (state.hasPendingOutput()) {
      flushOutbound(state);
    }
  } while (state.readPaused && !peerClosed && !state.isAnyCloseRequested() && !isOutboundFull(state));

  if (peerClosed && !state.isImmediateCloseRequested()) {
    // A partially received request is dropped without being dispatched.
    log::debug("Peer closed fd # {} in phase {}", fd, ConnectionPhaseToStr(state.phase));
    if (state.hasPendingOutput()) {
      state.requestDrainAndClose();
    } else {
      state.requestImmediateClose();
    }
  }

  if (state.hasPendingOutput()) {
    flushOutbound(state);
  }
  if (state.canCloseImmediately()) {
    closeConnection(cnxIt);
  }
}

bool HttpServer::readAvailable(ConnectionState& state) {
  const std::size_t chunkSize = _config.initialReadChunkBytes;
  while (!state.isAnyCloseRequested()) {
    if (isOutboundFull(state)) {
      state.readPaused = true;
      log::debug("Outbound buffer of fd # {} above {} bytes, pausing reads", state.fd(),
                 _config.maxOutboundBufferBytes);
      return false;
    }
    const std::size_t oldSize = state.inBuffer.size();
    state.inBuffer.resize(oldSize + chunkSize);
    const auto count = SafeRecv(state.fd(), state.inBuffer.data() + oldSize, chunkSize);
    if (count <= 0) {
      state.inBuffer.resize(oldSize);
      if (count == 0) {
        return true;
      }
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        log::debug("recv failed on fd # {}: {}", state.fd(), std::strerror(errno));
        state.requestImmediateClose();
      }
      return false;
    }
    state.inBuffer.resize(oldSize + static_cast<std::size_t>(count));
    state.lastActivity = SteadyClock::now();
    processRequests(state);
  }
  return false;
}

void HttpServer::handleWritable(int fd) {
  const auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    log::error("Received an invalid fd # {} from the event loop (or already removed?)", fd);
    return;
  }
  ConnectionState& state = *cnxIt->second;
  flushOutbound(state);
  if (state.canCloseImmediately()) {
    closeConnection(cnxIt);
    return;
  }
  if (state.readPaused && !isOutboundFull(state)) {
    handleReadable(fd);
  }
}

void HttpServer::processRequests(ConnectionState& state) {
  while (!state.isAnyCloseRequested()) {
    if (isOutboundFull(state)) {
      state.readPaused = true;
      return;
    }
    const http::StatusCode statusCode = state.parser.parse(state.inBuffer);
    if (statusCode == kStatusNeedMoreData) {
      state.updateReadProgress(SteadyClock::now());
      return;
    }
    if (statusCode != http::StatusCodeOK) {
      log::warn("Protocol error {} on fd # {} from {}", statusCode, state.fd(), state.peerAddress);
      emitErrorAndClose(state, statusCode);
      return;
    }

    HttpRequest& request = state.parser.request();
    const UploadSpool uploadSpool(request, _config.uploadDir);
    if (!uploadSpool.ok()) {
      emitErrorAndClose(state, http::StatusCodeInternalServerError);
      return;
    }
    const bool keepAlive = _config.enableKeepAlive && !_draining && request.wantsKeepAlive() &&
                           state.requestsServed + 1U < _config.maxRequestsPerConnection;
    state.phase = ConnectionPhase::Dispatched;
    const auto outcome = _dispatcher.dispatch(request, keepAlive, state.outBuffer, state.peerAddress);
    ++state.requestsServed;
    log::debug("{} {} -> {} on fd # {}", http::MethodToStr(request.method()), request.target(), outcome.status,
               state.fd());

    if (!outcome.keepAlive) {
      state.requestDrainAndClose();
      return;
    }
    state.prepareNextRequest();
  }
}

void HttpServer::emitErrorAndClose(ConnectionState& state, http::StatusCode status) {
  _dispatcher.respondError(status, http::HTTP_1_1, false, false, state.outBuffer);
  state.requestDrainAndClose();
}

void HttpServer::flushOutbound(ConnectionState& state) {
  while (state.hasPendingOutput()) {
    const auto written = SafeSend(state.fd(), state.pendingOutput());
    if (written < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
      log::warn("send failed on fd # {}: {}", state.fd(), std::strerror(errno));
      state.outBuffer.clear();
      state.outOffset = 0;
      state.requestImmediateClose();
      return;
    }
    if (written <= 0) {
      // Socket buffer full: resume on the next writable notification.
      if (!state.waitingWritable) {
        enableWritableInterest(state);
      }
      return;
    }
    state.consumeOutput(static_cast<std::size_t>(written));
  }
  if (state.waitingWritable) {
    disableWritableInterest(state);
  }
}

bool HttpServer::enableWritableInterest(ConnectionState& state) {
  if (_reactor.modify(state.fd(), kReadWriteEvents)) {
    state.waitingWritable = true;
    return true;
  }
  // Output could never be flushed without writable notifications.
  state.requestImmediateClose();
  return false;
}

bool HttpServer::disableWritableInterest(ConnectionState& state) {
  if (_reactor.modify(state.fd(), kReadEvents)) {
    state.waitingWritable = false;
    return true;
  }
  state.requestImmediateClose();
  return false;
}

void HttpServer::sweepConnections(SteadyTimePoint now) {
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    ConnectionState& state = *cnxIt->second;
    if (state.canCloseImmediately()) {
      cnxIt = closeConnection(cnxIt);
      continue;
    }
    if (state.isIdle()) {
      if (_draining || now > state.lastActivity + _config.keepAliveTimeout) {
        log::debug("Closing idle connection fd # {}", state.fd());
        cnxIt = closeConnection(cnxIt);
        continue;
      }
    } else if (!state.isAnyCloseRequested()) {
      if (_config.headerReadTimeout.count() > 0 && IsSet(state.headerStartTp) &&
          now > state.headerStartTp + _config.headerReadTimeout) {
        log::warn("Header read timeout on fd # {} from {}", state.fd(), state.peerAddress);
        emitErrorAndClose(state, http::StatusCodeRequestTimeout);
        flushOutbound(state);
      } else if (_config.bodyReadTimeout.count() > 0 && IsSet(state.bodyStartTp) &&
                 now > state.bodyStartTp + _config.bodyReadTimeout) {
        log::warn("Body read timeout on fd # {} from {}", state.fd(), state.peerAddress);
        emitErrorAndClose(state, http::StatusCodeRequestTimeout);
        flushOutbound(state);
      }
      if (state.canCloseImmediately()) {
        cnxIt = closeConnection(cnxIt);
        continue;
      }
    }
    ++cnxIt;
  }
}

HttpServer::ConnectionMapIt HttpServer::closeConnection(ConnectionMapIt cnxIt) {
  const int fd = cnxIt->first;
  log::debug("Closing connection fd # {}", fd);
  _reactor.remove(fd);
  cnxIt->second->phase = ConnectionPhase::Closed;
  return _connections.erase(cnxIt);
}

void HttpServer::closeAllConnections() {
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt = closeConnection(cnxIt);
  }
}

void HttpServer::applyReload() {
  if (!_reloadHook) {
    log::info("Reload requested but no reload hook is installed");
    return;
  }
  log::info("Reloading routes and actions");
  try {
    _reloadHook(_router);
  } catch (const std::exception& ex) {
    log::error("Reload failed, keeping the current routes: {}", ex.what());
  }
}

}  // namespace corvid
