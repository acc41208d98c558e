#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "corvid/action-context.hpp"
#include "corvid/action-registry.hpp"
#include "corvid/action.hpp"
#include "corvid/http-constants.hpp"
#include "corvid/http-server.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/param-value.hpp"
#include "corvid/route-table.hpp"
#include "corvid/test-server-fixture.hpp"
#include "corvid/test-util.hpp"

using namespace corvid;
using namespace std::chrono_literals;

namespace {

// GET /validate/<number>/<word> echoes its typed parameters.
class ValidateAction : public Action {
 public:
  void get(ActionContext& ctx) override {
    const auto number = ctx.params().get<int64_t>("number");
    const auto& word = ctx.params().get<std::string>("word");
    ctx.respond(http::StatusCodeOK, "number=" + std::to_string(number + 1) + " word=" + word,
                http::ContentTypeTextPlain);
  }
};

class GreetAction : public Action {
 public:
  explicit GreetAction(const RouteArgs& args) : _greeting(args.get<std::string>("greeting")) {}

  void get(ActionContext& ctx) override {
    const auto name = ctx.argument("name");
    ctx.respond(http::StatusCodeOK, _greeting + " " + std::string(name.value_or("anonymous")),
                http::ContentTypeTextPlain);
  }

  void post(ActionContext& ctx) override {
    ctx.setStatus(http::StatusCodeCreated);
    ctx.setHeader("X-Body-Size", std::to_string(ctx.request().body().size()));
    ctx.composeHeaders();
    ctx.write("posted:");
    ctx.write(ctx.request().body());
  }

 private:
  std::string _greeting;
};

class FailingAction : public Action {
 public:
  void get(ActionContext&) override { throw std::runtime_error("boom"); }
};

// Writes part of a response before failing: the partial bytes must not reach the client.
class HalfWrittenFailingAction : public Action {
 public:
  void get(ActionContext& ctx) override {
    ctx.composeHeaders();
    ctx.write("partial");
    throw std::runtime_error("failed mid response");
  }
};

// Declares a Content-Length which does not match the body it writes ("/overlong" or "/short").
class MismatchedLengthAction : public Action {
 public:
  void get(ActionContext& ctx) override {
    ctx.setContentType(http::ContentTypeTextPlain);
    ctx.setHeader(http::ContentLength, "3");
    ctx.composeHeaders();
    ctx.write(ctx.request().path() == "/overlong" ? "hello" : "h");
  }
};

class SilentAction : public Action {
 public:
  void get(ActionContext&) override {}
};

class CookieAction : public Action {
 public:
  void get(ActionContext& ctx) override {
    ctx.setCookie(http::ResponseCookie{"session", "abc"});
    ctx.respond(http::StatusCodeOK, std::string(ctx.cookie("theme").value_or("none")), http::ContentTypeTextPlain);
  }
};

class NotFoundPage : public Action {
 public:
  void get(ActionContext& ctx) override {
    ctx.setContentType(http::ContentTypeTextHtml);
    ctx.setHeader(http::ContentLength, "22");
    ctx.composeHeaders();
    ctx.write("<h1>nothing here</h1>\n");
  }
};

class VersionedAction : public Action {
 public:
  explicit VersionedAction(const RouteArgs& args) : _version(args.get<std::string>("version")) {}

  void get(ActionContext& ctx) override { ctx.respond(http::StatusCodeOK, _version, http::ContentTypeTextPlain); }

 private:
  std::string _version;
};

RouteTable MakeTable() {
  RouteTable table;
  table.add(R"(/validate/(number:\d+)/(word:\w+))", HandlerRef::Of<ValidateAction>());
  table.addLiteral("/greet", HandlerRef::Of<GreetAction>(), {{"greeting", std::string("hello")}});
  table.addLiteral("/fail", HandlerRef::Of<FailingAction>());
  table.addLiteral("/half", HandlerRef::Of<HalfWrittenFailingAction>());
  table.addLiteral("/silent", HandlerRef::Of<SilentAction>());
  table.addLiteral("/overlong", HandlerRef::Of<MismatchedLengthAction>());
  table.addLiteral("/short", HandlerRef::Of<MismatchedLengthAction>());
  table.addLiteral("/cookie", HandlerRef::Of<CookieAction>());
  table.addLiteral("/versioned", "versioned.Action");
  table.addLiteral("/unregistered", "missing.Action");
  return table;
}

ActionRegistry MakeRegistry(std::string version) {
  ActionRegistry registry;
  registry.add("versioned.Action", [version = std::move(version)](const RouteArgs&) -> std::unique_ptr<Action> {
    return std::make_unique<VersionedAction>(RouteArgs{{"version", version}});
  });
  return registry;
}

}  // namespace

class HttpServerDispatchTest : public ::testing::Test {
 protected:
  test::TestServer ts{test::LoopbackConfig(), MakeTable(), MakeRegistry("v1")};
};

TEST_F(HttpServerDispatchTest, TypedParamsReachTheAction) {
  const auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/validate/42/justatest"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "number=43 word=justatest");
  EXPECT_EQ(resp.headers.at("Content-Type"), http::ContentTypeTextPlain);
  EXPECT_EQ(resp.headers.at("Server"), "corvid");
}

TEST_F(HttpServerDispatchTest, CoercionMismatchIsNotFound) {
  const auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/validate/abc/justatest"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeNotFound);
  EXPECT_EQ(resp.body, "Not Found");
}

TEST_F(HttpServerDispatchTest, RouteArgsAndQueryArguments) {
  auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/greet?name=world"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "hello world");

  resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/greet"));
  EXPECT_EQ(resp.body, "hello anonymous");
}

TEST_F(HttpServerDispatchTest, PostStreamsBody) {
  test::RequestOptions opt;
  opt.method = "POST";
  opt.target = "/greet";
  opt.body = "payload";
  opt.headers.emplace_back("Content-Type", "application/octet-stream");
  const auto resp = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), opt));
  EXPECT_EQ(resp.statusCode, http::StatusCodeCreated);
  EXPECT_TRUE(resp.chunked);
  EXPECT_EQ(resp.headers.at("X-Body-Size"), "7");
  EXPECT_EQ(resp.body, "posted:payload");
}

TEST_F(HttpServerDispatchTest, UnimplementedVerbIs405) {
  test::RequestOptions opt;
  opt.method = "DELETE";
  opt.target = "/greet";
  const auto resp = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), opt));
  EXPECT_EQ(resp.statusCode, http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(resp.body, "Method Not Supported");
}

TEST_F(HttpServerDispatchTest, HeadRunsGetWithoutBody) {
  test::RequestOptions opt;
  opt.method = "HEAD";
  opt.target = "/greet?name=x";
  const auto raw = test::requestOrThrow(ts.port(), opt);
  const auto resp = test::parseResponseOrThrow(raw);
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.headers.at("Content-Length"), "7");
  EXPECT_TRUE(resp.body.empty());
}

TEST_F(HttpServerDispatchTest, ActionExceptionGives500AndCloses) {
  test::ClientConnection cnx(ts.port());
  test::RequestOptions opt;
  opt.target = "/fail";
  opt.connection = "keep-alive";
  ASSERT_TRUE(test::sendAll(cnx.fd(), test::buildRequest(opt)));
  const auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
  EXPECT_EQ(resp.statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(resp.headers.at("Connection"), "close");
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));

  // the server keeps serving other connections
  EXPECT_EQ(test::parseResponseOrThrow(test::simpleGet(ts.port(), "/greet")).statusCode, http::StatusCodeOK);
}

TEST_F(HttpServerDispatchTest, PartialOutputOfFailedActionIsDiscarded) {
  const auto raw = test::simpleGet(ts.port(), "/half");
  EXPECT_EQ(raw.find("partial"), std::string::npos);
  EXPECT_EQ(test::countOccurrences(raw, "HTTP/1.1 "), 1);
  EXPECT_EQ(test::parseResponseOrThrow(raw).statusCode, http::StatusCodeInternalServerError);
}

TEST_F(HttpServerDispatchTest, BodyBeyondContentLengthIs500AndCloses) {
  test::RequestOptions opt;
  opt.target = "/overlong";
  opt.connection = "keep-alive";
  const auto first = test::buildRequest(opt);
  opt.target = "/greet";
  const auto raw = test::sendAndCollect(ts.port(), first + test::buildRequest(opt));
  EXPECT_EQ(test::countOccurrences(raw, "HTTP/1.1 "), 1);
  EXPECT_EQ(raw.find("hello"), std::string::npos);
  const auto resp = test::parseResponseOrThrow(raw);
  EXPECT_EQ(resp.statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(resp.headers.at("Connection"), "close");
}

TEST_F(HttpServerDispatchTest, BodyShorterThanContentLengthIs500) {
  const auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/short"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeInternalServerError);
}

TEST_F(HttpServerDispatchTest, ActionWithoutOutputGivesEmpty200) {
  const auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/silent"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_TRUE(resp.body.empty());
}

TEST_F(HttpServerDispatchTest, CookiesBothWays) {
  test::RequestOptions opt;
  opt.target = "/cookie";
  opt.headers.emplace_back("Cookie", "theme=dark; lang=en");
  const auto resp = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), opt));
  EXPECT_EQ(resp.body, "dark");
  ASSERT_TRUE(resp.headers.contains("Set-Cookie"));
  EXPECT_EQ(resp.headers.at("Set-Cookie").rfind("session=abc", 0), 0U);
}

TEST_F(HttpServerDispatchTest, UnresolvedHandlerIdentifierIs500) {
  const auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/unregistered"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeInternalServerError);
}

TEST_F(HttpServerDispatchTest, RegistryReloadSwapsStringReferencedHandlers) {
  EXPECT_EQ(test::parseResponseOrThrow(test::simpleGet(ts.port(), "/versioned")).body, "v1");
  ts.router().reload(MakeRegistry("v2"));
  EXPECT_EQ(test::parseResponseOrThrow(test::simpleGet(ts.port(), "/versioned")).body, "v2");
  // directly referenced handlers are untouched
  EXPECT_EQ(test::parseResponseOrThrow(test::simpleGet(ts.port(), "/greet")).body, "hello anonymous");
}

TEST_F(HttpServerDispatchTest, PublishReplacesRoutes) {
  RouteTable table;
  table.addLiteral("/only", HandlerRef::Of<SilentAction>());
  ts.router().publish(std::move(table));
  EXPECT_EQ(test::parseResponseOrThrow(test::simpleGet(ts.port(), "/greet")).statusCode, http::StatusCodeNotFound);
  EXPECT_EQ(test::parseResponseOrThrow(test::simpleGet(ts.port(), "/only")).statusCode, http::StatusCodeOK);
}

TEST_F(HttpServerDispatchTest, ErrorActionRendersNotFound) {
  ts.router().setErrorAction(http::StatusCodeNotFound, HandlerRef::Of<NotFoundPage>());
  const auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/nowhere"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeNotFound);
  EXPECT_EQ(resp.headers.at("Content-Type"), http::ContentTypeTextHtml);
  EXPECT_EQ(resp.body, "<h1>nothing here</h1>\n");
}

TEST(HttpServerLifecycle, ConstructorValidatesConfig) {
  auto config = test::LoopbackConfig();
  config.maxRequestsPerConnection = 0;
  EXPECT_THROW(HttpServer server(config), std::invalid_argument);
}

TEST(HttpServerLifecycle, StopFromAnotherThread) {
  HttpServer server(test::LoopbackConfig().withPollInterval(5ms));
  std::jthread stopper([&server] {
    std::this_thread::sleep_for(30ms);
    server.stop();
  });
  server.run();
  EXPECT_FALSE(server.isRunning());
}

TEST(HttpServerLifecycle, DrainLetsInFlightRequestFinish) {
  RouteTable table;
  table.addLiteral("/greet", HandlerRef::Of<GreetAction>(), {{"greeting", std::string("bye")}});
  HttpServer server(test::LoopbackConfig().withPollInterval(5ms), std::move(table));

  test::ClientConnection cnx(server.port());
  // head not complete yet: the request is in flight when the drain starts
  ASSERT_TRUE(test::sendAll(cnx.fd(), "GET /greet HTTP/1.1\r\nHost: x\r\n"));
  while (server.nbConnections() == 0) {
    server.reactor().runOnce();
  }

  server.beginDrain(2s);
  EXPECT_TRUE(server.isDraining());
  ASSERT_TRUE(test::sendAll(cnx.fd(), "\r\n"));
  // returns once the last connection is closed
  server.run();
  EXPECT_EQ(server.nbConnections(), 0U);

  const auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "bye anonymous");
  EXPECT_EQ(resp.headers.at("Connection"), "close");
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
}
