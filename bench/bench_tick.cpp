#include "serialization/json_serializer.hpp"
#include "simulation/load_balancer.hpp"
#include <benchmark/benchmark.h>
#include <nlohmann/json.hpp>
#include <string>

using namespace lbsim;
using namespace lbsim::sim;

namespace {

auto make_balancer(std::size_t servers, double rate, const char *policy)
    -> LoadBalancer {
  SimConfig cfg;
  cfg.server_count = servers;
  cfg.arrival_rate = rate;
  cfg.policy = policy;
  cfg.seed = 7;
  return std::move(*LoadBalancer::create(cfg));
}

} // namespace

// Ticks per second with the pool at steady state.
static void BM_Tick(benchmark::State &state) {
  auto lb = make_balancer(static_cast<std::size_t>(state.range(0)),
                          static_cast<double>(state.range(1)), "least-requests");
  for (int i = 0; i < 100; ++i) {
    lb.tick();
  }

  for (auto _ : state) {
    auto report = lb.tick();
    benchmark::DoNotOptimize(report);
  }
  state.SetItemsProcessed(state.iterations());
}

static void BM_Submit(benchmark::State &state) {
  auto lb = make_balancer(16, 1.0, "dynamic-cpu");
  Request req;
  req.cpu_demand = 1.0;
  req.memory_demand = 1.0;
  req.service_duration_ms = 1.0;

  for (auto _ : state) {
    auto r = lb.submit(req);
    benchmark::DoNotOptimize(r);
    // Drain periodically so the pool never saturates.
    if (lb.total_arrivals() % 1024 == 0) {
      lb.advance_clock(10.0);
      lb.reclaim();
    }
  }
}

static void BM_TickSerialization(benchmark::State &state) {
  auto lb = make_balancer(static_cast<std::size_t>(state.range(0)), 200.0,
                          "round-robin");
  auto report = lb.tick();

  for (auto _ : state) {
    std::string s = tick_to_json(report, lb).dump();
    benchmark::DoNotOptimize(s);
  }
}

static void BM_SnapshotSerialization(benchmark::State &state) {
  auto lb = make_balancer(static_cast<std::size_t>(state.range(0)), 200.0,
                          "round-robin");
  for (int i = 0; i < 60; ++i) {
    lb.tick();
  }

  for (auto _ : state) {
    std::string s = snapshot_to_json(lb).dump();
    benchmark::DoNotOptimize(s);
  }
}

BENCHMARK(BM_Tick)->Args({4, 10})->Args({16, 200})->Args({64, 2000});
BENCHMARK(BM_Submit);
BENCHMARK(BM_TickSerialization)->RangeMultiplier(4)->Range(4, 64);
BENCHMARK(BM_SnapshotSerialization)->RangeMultiplier(4)->Range(4, 64);

BENCHMARK_MAIN();
