#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>
#include <utility>

#include "corvid/action-registry.hpp"
#include "corvid/http-server.hpp"
#include "corvid/route-table.hpp"
#include "corvid/router.hpp"
#include "corvid/server-config.hpp"
#include "corvid/test-util.hpp"

namespace corvid::test {

// RAII test server harness:
//  * constructs the HttpServer on a loopback ephemeral port (binds immediately)
//  * runs its loop in a background jthread through runUntil(stopFlag)
//  * waits for readiness with a loopback connect instead of an arbitrary sleep
//  * stops and joins on destruction (idempotent)
struct TestServer {
  explicit TestServer(ServerConfig cfg, RouteTable table = {}, ActionRegistry registry = {},
                      std::chrono::milliseconds pollPeriod = std::chrono::milliseconds{5})
      : server(std::move(cfg.withPollInterval(pollPeriod)), std::move(table), std::move(registry)),
        loopThread([this] { server.runUntil([this] { return stopFlag.load(); }); }) {
    waitReady(std::chrono::milliseconds{500});
  }

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) noexcept = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) noexcept = delete;

  ~TestServer() { stop(); }

  [[nodiscard]] uint16_t port() const { return server.port(); }

  Router& router() { return server.router(); }

  void stop() {
    if (!stopFlag.exchange(true)) {
      server.stop();
    }
    if (loopThread.joinable()) {
      loopThread.join();
    }
  }

  HttpServer server;

 private:
  void waitReady(std::chrono::milliseconds timeout) const { ClientConnection cnx(port(), timeout); }

  std::atomic_bool stopFlag{false};
  std::jthread loopThread;
};

// Config listening on loopback only, on an ephemeral port.
inline ServerConfig LoopbackConfig() {
  ServerConfig config;
  config.listeners = {ListenAddress{"127.0.0.1", 0}};
  return config;
}

}  // namespace corvid::test
