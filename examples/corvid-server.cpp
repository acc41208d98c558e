#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>

#include "corvid/action-context.hpp"
#include "corvid/action-registry.hpp"
#include "corvid/action.hpp"
#include "corvid/http-constants.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/log.hpp"
#include "corvid/route-table.hpp"
#include "corvid/router.hpp"
#include "corvid/server-config.hpp"
#include "corvid/server.hpp"
#include "corvid/static-file-action.hpp"
#include "corvid/supervisor-config.hpp"

using namespace corvid;

namespace {

class HelloAction : public Action {
 public:
  explicit HelloAction(const RouteArgs& args) : _greeting(args.get<std::string>("greeting")) {}

  void get(ActionContext& ctx) override {
    std::string body = _greeting;
    body.append(", you requested ").append(ctx.request().path());
    body.append(" from worker pid ").append(std::to_string(::getpid())).append("\n");
    ctx.respond(http::StatusCodeOK, body, http::ContentTypeTextPlain);
  }

 private:
  std::string _greeting;
};

// GET /validate/<number>/<word>
class ValidateAction : public Action {
 public:
  void get(ActionContext& ctx) override {
    const auto number = ctx.params().get<int64_t>("number");
    const auto& word = ctx.params().get<std::string>("word");
    ctx.setContentType(http::ContentTypeTextPlain);
    ctx.composeHeaders();
    ctx.write("number + 1 = ");
    ctx.write(std::to_string(number + 1));
    ctx.write("\nword = ");
    ctx.write(word);
    ctx.write("\n");
  }
};

// Echoes the submitted form field "message".
class FormAction : public Action {
 public:
  void get(ActionContext& ctx) override {
    ctx.respond(http::StatusCodeOK,
                "<form method=\"post\"><input name=\"message\"><button>send</button></form>\n",
                http::ContentTypeTextHtml);
  }

  void post(ActionContext& ctx) override {
    const auto message = ctx.argument("message");
    if (!message) {
      ctx.respond(http::StatusCodeBadRequest, "missing message\n", http::ContentTypeTextPlain);
      return;
    }
    ctx.respond(http::StatusCodeOK, "you said: " + std::string(*message) + "\n", http::ContentTypeTextPlain);
  }
};

// Old location of the form page.
class LegacyFormAction : public Action {
 public:
  void get(ActionContext& ctx) override { ctx.redirect("/api/form"); }
};

class NotFoundAction : public Action {
 public:
  void get(ActionContext& ctx) override {
    std::string body("<h1>Nothing to see at ");
    body.append(ctx.request().path()).append("</h1>\n");
    ctx.respond(ctx.status(), body, http::ContentTypeTextHtml);
  }
};

ActionRegistry MakeRegistry(std::string_view greeting) {
  ActionRegistry registry;
  registry.add("demo.Hello", [greeting = std::string(greeting)](const RouteArgs&) -> std::unique_ptr<Action> {
    return std::make_unique<HelloAction>(RouteArgs{{"greeting", greeting}});
  });
  return registry;
}

RouteTable MakeRoutes(const std::string& staticRoot) {
  RouteTable api;
  api.add(R"(/validate/(number:\d+)/(word:\w+))", HandlerRef::Of<ValidateAction>());
  api.addLiteral("/form", HandlerRef::Of<FormAction>());
  api.addLiteral("/contact", HandlerRef::Of<LegacyFormAction>());

  RouteTable table;
  table.addLiteral("/", "demo.Hello");
  table.addLiteral("/static", R"(/(file:[\w./-]+))", HandlerRef::Of<StaticFileAction>(), {{"root", staticRoot}});
  table.addSubRoutes("/api", std::move(api));
  table.setErrorAction(http::StatusCodeNotFound, HandlerRef::Of<NotFoundAction>());
  return table;
}

bool ParseArg(const char* arg, auto& value) {
  const char* end = arg + std::strlen(arg);
  const auto [ptr, errc] = std::from_chars(arg, end, value);
  return errc == std::errc{} && ptr == end;
}

}  // namespace

// Usage: corvid-server [port] [nbWorkers] [staticRoot]
// Files below staticRoot (current directory by default) are served under /static/.
// SIGHUP swaps the greeting of the "demo.Hello" handler in every worker.
int main(int argc, char** argv) {
  uint16_t port = 8080;
  uint32_t nbWorkers = 2;
  if (argc > 1 && !ParseArg(argv[1], port)) {
    std::cerr << "Invalid port number: " << argv[1] << '\n';
    return EXIT_FAILURE;
  }
  if (argc > 2 && !ParseArg(argv[2], nbWorkers)) {
    std::cerr << "Invalid number of workers: " << argv[2] << '\n';
    return EXIT_FAILURE;
  }

  const std::string staticRoot = argc > 3 ? argv[3] : ".";

  try {
    Server server(ServerConfig{}.withPort(port), MakeRoutes(staticRoot), MakeRegistry("Hello"),
                  SupervisorConfig{}.withNbWorkers(nbWorkers));
    server.setReloadHook([](Router& router) {
      log::info("Swapping greeting handler");
      router.reload(MakeRegistry("Hello again"));
    });
    server.run();  // blocking, until Ctrl+C
  } catch (const std::exception& ex) {
    std::cerr << "Server encountered error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
