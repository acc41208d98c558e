#include "corvid/server.hpp"

#include <gtest/gtest.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "corvid/action-context.hpp"
#include "corvid/action-registry.hpp"
#include "corvid/action.hpp"
#include "corvid/http-constants.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/log.hpp"
#include "corvid/route-table.hpp"
#include "corvid/server-config.hpp"
#include "corvid/stringconv.hpp"
#include "corvid/supervisor-config.hpp"
#include "corvid/test-server-fixture.hpp"
#include "corvid/test-util.hpp"

using namespace corvid;
using namespace std::chrono_literals;

namespace {

class PidAction : public Action {
 public:
  void get(ActionContext& ctx) override {
    ctx.respond(http::StatusCodeOK, std::to_string(::getpid()), http::ContentTypeTextPlain);
  }
};

class VersionAction : public Action {
 public:
  explicit VersionAction(std::string version) : _version(std::move(version)) {}

  void get(ActionContext& ctx) override { ctx.respond(http::StatusCodeOK, _version, http::ContentTypeTextPlain); }

 private:
  std::string _version;
};

RouteTable MakeTable() {
  RouteTable table;
  table.addLiteral("/pid", HandlerRef::Of<PidAction>());
  table.addLiteral("/version", "app.Version");
  return table;
}

ActionRegistry MakeRegistry(std::string version) {
  ActionRegistry registry;
  registry.add("app.Version", [version = std::move(version)](const RouteArgs&) -> std::unique_ptr<Action> {
    return std::make_unique<VersionAction>(version);
  });
  return registry;
}

// Runs server in a child process. The parent keeps the child pid only.
pid_t RunInChild(Server& server) {
  const pid_t pid = ::fork();
  if (pid == 0) {
    int status = EXIT_SUCCESS;
    try {
      server.run();
    } catch (const std::exception& ex) {
      log::error("Server failed: {}", ex.what());
      status = EXIT_FAILURE;
    }
    ::_exit(status);
  }
  return pid;
}

int WaitExitStatus(pid_t pid) {
  int status = 0;
  if (::waitpid(pid, &status, 0) != pid || !WIFEXITED(status)) {
    return -1;
  }
  return WEXITSTATUS(status);
}

// GET target, retried until a 200 answer or timeout.
std::optional<std::string> GetBody(uint16_t port, std::string_view target, std::chrono::milliseconds timeout = 3s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    test::ClientConnection cnx(port, 100ms);
    test::RequestOptions opt;
    opt.target = std::string(target);
    if (test::sendAll(cnx.fd(), test::buildRequest(opt))) {
      test::setRecvTimeout(cnx.fd(), 500ms);
      const auto parsed = test::parseResponse(test::recvUntilClosed(cnx.fd()));
      if (parsed && parsed->statusCode == http::StatusCodeOK) {
        return parsed->body;
      }
    }
    std::this_thread::sleep_for(5ms);
  }
  return std::nullopt;
}

}  // namespace

TEST(Server, ReusePortModeNeedsFixedPorts) {
  EXPECT_THROW(Server(test::LoopbackConfig(), MakeTable(), {},
                      SupervisorConfig{}.withNbWorkers(2).withShareMode(SupervisorConfig::ShareMode::ReusePort)),
               std::invalid_argument);
}

TEST(Server, InvalidSupervisorConfigThrows) {
  EXPECT_THROW(Server(test::LoopbackConfig(), MakeTable(), {}, SupervisorConfig{}.withPollInterval(0ms)),
               std::invalid_argument);
}

TEST(Server, SingleProcessStopsOnTermination) {
  Server server(test::LoopbackConfig().withPollInterval(5ms), MakeTable(), MakeRegistry("v1"));
  const uint16_t port = server.ports().front();
  const pid_t child = RunInChild(server);
  ASSERT_GT(child, 0);

  const auto body = GetBody(port, "/pid");
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(StringToIntegral<pid_t>(*body), child);

  ASSERT_EQ(::kill(child, SIGTERM), 0);
  EXPECT_EQ(WaitExitStatus(child), EXIT_SUCCESS);
}

TEST(Server, KilledWorkerIsReplacedAndServiceContinues) {
  auto supervisorConfig =
      SupervisorConfig{}.withNbWorkers(2).withMinWorkerUptime(1ms).withRestartBackoff(1ms).withPollInterval(5ms);
  Server server(test::LoopbackConfig().withPollInterval(5ms), MakeTable(), MakeRegistry("v1"), supervisorConfig);
  const uint16_t port = server.ports().front();
  const pid_t supervisorPid = RunInChild(server);
  ASSERT_GT(supervisorPid, 0);

  const auto body = GetBody(port, "/pid");
  ASSERT_TRUE(body.has_value());
  const auto workerPid = StringToIntegral<pid_t>(*body);
  ASSERT_TRUE(workerPid.has_value());
  EXPECT_NE(*workerPid, supervisorPid);
  ASSERT_EQ(::kill(*workerPid, SIGKILL), 0);

  for (int iter = 0; iter < 10; ++iter) {
    const auto nextBody = GetBody(port, "/pid");
    ASSERT_TRUE(nextBody.has_value());
    EXPECT_NE(StringToIntegral<pid_t>(*nextBody), workerPid);
  }

  ASSERT_EQ(::kill(supervisorPid, SIGTERM), 0);
  EXPECT_EQ(WaitExitStatus(supervisorPid), EXIT_SUCCESS);
}

TEST(Server, ReloadSignalSwapsRegistryInWorkers) {
  auto supervisorConfig = SupervisorConfig{}.withNbWorkers(1).withPollInterval(5ms);
  Server server(test::LoopbackConfig().withPollInterval(5ms), MakeTable(), MakeRegistry("v1"), supervisorConfig);
  server.setReloadHook([](Router& router) { router.reload(MakeRegistry("v2")); });
  const uint16_t port = server.ports().front();
  const pid_t supervisorPid = RunInChild(server);
  ASSERT_GT(supervisorPid, 0);

  auto body = GetBody(port, "/version");
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(*body, "v1");

  ASSERT_EQ(::kill(supervisorPid, SIGHUP), 0);
  const auto deadline = std::chrono::steady_clock::now() + 3s;
  while (body == "v1" && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
    body = GetBody(port, "/version");
  }
  EXPECT_EQ(body, "v2");

  ASSERT_EQ(::kill(supervisorPid, SIGTERM), 0);
  EXPECT_EQ(WaitExitStatus(supervisorPid), EXIT_SUCCESS);
}
