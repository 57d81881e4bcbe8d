#include "scheduling/policies.hpp"
#include <benchmark/benchmark.h>
#include <vector>

using namespace lbsim;

namespace {

// Pool with a ragged load profile so every policy has to scan.
auto make_pool(std::size_t n) -> std::vector<Server> {
  std::vector<Server> servers(n);
  for (std::size_t i = 0; i < n; ++i) {
    const auto k = (i * 7) % 5;
    for (std::size_t r = 0; r < k; ++r) {
      Request req;
      req.cpu_demand = 10.0;
      req.memory_demand = 6.0;
      req.service_duration_ms = 100.0 + static_cast<double>(r);
      (void)servers[i].admit(req);
    }
    servers[i].reclaim_completed(100.0 + static_cast<double>(i % 3));
  }
  return servers;
}

void run_policy(benchmark::State &state, PolicyKind kind) {
  auto servers = make_pool(static_cast<std::size_t>(state.range(0)));
  auto policy = make_policy(kind, 42);
  Request req;
  req.cpu_demand = 5.0;
  req.memory_demand = 3.0;

  std::size_t cursor = 0;
  for (auto _ : state) {
    auto idx = policy->select_server(servers, req, cursor);
    cursor = (idx + 1) % servers.size();
    benchmark::DoNotOptimize(idx);
  }
  state.SetItemsProcessed(state.iterations());
}

} // namespace

static void BM_Select_RoundRobin(benchmark::State &state) {
  run_policy(state, PolicyKind::RoundRobin);
}

static void BM_Select_Random(benchmark::State &state) {
  run_policy(state, PolicyKind::Random);
}

static void BM_Select_LeastRequests(benchmark::State &state) {
  run_policy(state, PolicyKind::LeastRequests);
}

static void BM_Select_LeastResponseTime(benchmark::State &state) {
  run_policy(state, PolicyKind::LeastResponseTime);
}

static void BM_Select_DynamicCpu(benchmark::State &state) {
  run_policy(state, PolicyKind::DynamicCpu);
}

BENCHMARK(BM_Select_RoundRobin)->RangeMultiplier(4)->Range(4, 64);
BENCHMARK(BM_Select_Random)->RangeMultiplier(4)->Range(4, 64);
BENCHMARK(BM_Select_LeastRequests)->RangeMultiplier(4)->Range(4, 64);
BENCHMARK(BM_Select_LeastResponseTime)->RangeMultiplier(4)->Range(4, 64);
BENCHMARK(BM_Select_DynamicCpu)->RangeMultiplier(4)->Range(4, 64);

BENCHMARK_MAIN();
