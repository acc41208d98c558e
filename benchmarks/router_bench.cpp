// Route resolution benchmarks:
//  - literal routes only
//  - typed regex routes (coercion of captured groups)
//  - sub route tables
//  - misses (every route is tried)

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "corvid/action-context.hpp"
#include "corvid/action-registry.hpp"
#include "corvid/action.hpp"
#include "corvid/http-method.hpp"
#include "corvid/route-table.hpp"
#include "corvid/router.hpp"

namespace corvid {

namespace {

class NoopAction : public Action {
 public:
  void get(ActionContext&) override {}
};

std::mt19937_64 gen;

struct RouterWithPaths {
  std::string_view pickRandomPath() {
    std::uniform_int_distribution<std::size_t> dist(0, paths.size() - 1);
    return paths[dist(gen)];
  }

  std::vector<std::string> paths;
  std::unique_ptr<Router> router;
};

RouterWithPaths LiteralRoutes() {
  RouterWithPaths ret;
  RouteTable table;
  for (const char* path : {"/", "/health", "/metrics", "/api/v1/users", "/api/v1/orders", "/api/v1/products",
                           "/api/v1/categories", "/api/v2/users", "/api/v2/orders", "/static/index.html"}) {
    table.addLiteral(path, HandlerRef::Of<NoopAction>());
    ret.paths.emplace_back(path);
  }
  ret.router = std::make_unique<Router>(std::move(table));
  return ret;
}

RouterWithPaths TypedRoutes() {
  RouterWithPaths ret;
  RouteTable table;
  table.add(R"(/users/(id<int>:\d+))", HandlerRef::Of<NoopAction>());
  table.add(R"(/users/(id<int>:\d+)/orders/(order<int>:\d+))", HandlerRef::Of<NoopAction>());
  table.add(R"(/products/(sku:\w+)/price/(amount<float>:\d+\.\d+))", HandlerRef::Of<NoopAction>());
  table.add(R"(/flags/(name:\w+)/(enabled<bool>:\w+))", HandlerRef::Of<NoopAction>());
  table.addLiteral("/files", R"((rest:.*))", HandlerRef::Of<NoopAction>());
  ret.paths = {"/users/42", "/users/42/orders/1337", "/products/ab12/price/12.50", "/flags/beta/true",
               "/files/docs/readme.txt"};
  ret.router = std::make_unique<Router>(std::move(table));
  return ret;
}

RouterWithPaths SubRoutes() {
  RouterWithPaths ret;
  RouteTable root;
  for (int version = 1; version <= 4; ++version) {
    RouteTable children;
    children.add(R"(/users/(id<int>:\d+))", HandlerRef::Of<NoopAction>());
    children.addLiteral("/status", HandlerRef::Of<NoopAction>());
    root.addSubRoutes("/api/v" + std::to_string(version), std::move(children));
    ret.paths.push_back("/api/v" + std::to_string(version) + "/users/7");
    ret.paths.push_back("/api/v" + std::to_string(version) + "/status");
  }
  ret.router = std::make_unique<Router>(std::move(root));
  return ret;
}

void Resolve(benchmark::State& state, RouterWithPaths routes) {
  for ([[maybe_unused]] auto iter : state) {
    auto result = routes.router->resolve(http::Method::GET, routes.pickRandomPath());
    benchmark::DoNotOptimize(result);
  }
}

}  // namespace

static void BM_LiteralRoutes(benchmark::State& state) { Resolve(state, LiteralRoutes()); }
BENCHMARK(BM_LiteralRoutes);

static void BM_TypedRoutes(benchmark::State& state) { Resolve(state, TypedRoutes()); }
BENCHMARK(BM_TypedRoutes);

static void BM_SubRoutes(benchmark::State& state) { Resolve(state, SubRoutes()); }
BENCHMARK(BM_SubRoutes);

static void BM_Miss(benchmark::State& state) {
  auto routes = TypedRoutes();
  for ([[maybe_unused]] auto iter : state) {
    auto result = routes.router->resolve(http::Method::GET, "/nowhere/to/be/found");
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_Miss);

}  // namespace corvid

BENCHMARK_MAIN();
