/// @file test_load_balancer.cpp
/// @brief Unit tests for admission control, tick sequencing and
///        reconfiguration of the LoadBalancer.

#include "core/error.hpp"
#include "simulation/load_balancer.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace lbsim;
using namespace lbsim::sim;

namespace {

auto make_request(std::uint64_t id, double cpu, double memory,
                  double duration_ms = 10'000.0) -> Request {
  return Request{
      .id = id,
      .cpu_demand = cpu,
      .memory_demand = memory,
      .service_duration_ms = duration_ms,
  };
}

/// Always proposes an index past the end of the pool.
class OutOfRangePolicy final : public SchedulingPolicy {
public:
  auto select_server(std::span<const Server> servers, const Request &,
                     std::size_t) -> std::size_t override {
    return servers.size() + 5;
  }
  auto kind() const noexcept -> PolicyKind override {
    return PolicyKind::RoundRobin;
  }
};

} // namespace

class LoadBalancerTest : public ::testing::Test {
protected:
  void SetUp() override {
    cfg_.server_count = 4;
    cfg_.policy = "round-robin";
    cfg_.seed = 42;
  }

  auto build() -> LoadBalancer {
    auto lb = LoadBalancer::create(cfg_);
    EXPECT_TRUE(lb.has_value());
    return std::move(*lb);
  }

  SimConfig cfg_;
};

// ─── Construction ───────────────────────────────────────────────────────

TEST_F(LoadBalancerTest, CreateRejectsInvalidConfig) {
  cfg_.server_count = 0;
  auto lb = LoadBalancer::create(cfg_);
  ASSERT_FALSE(lb.has_value());
  EXPECT_EQ(lb.error(), Errc::invalid_server_count);

  cfg_.server_count = 4;
  cfg_.policy = "fastest";
  lb = LoadBalancer::create(cfg_);
  ASSERT_FALSE(lb.has_value());
  EXPECT_EQ(lb.error(), Errc::unknown_policy);
}

TEST_F(LoadBalancerTest, CreateRefusesOversizedHistory) {
  cfg_.history_capacity = static_cast<std::size_t>(-1);
  auto lb = LoadBalancer::create(cfg_);
  ASSERT_FALSE(lb.has_value());
  EXPECT_EQ(lb.error(), Errc::invalid_history_capacity);
}

TEST_F(LoadBalancerTest, CreateAppliesConfig) {
  cfg_.policy = "Least Requests";
  cfg_.arrival_rate = 12.5;
  auto lb = build();
  EXPECT_EQ(lb.server_count(), 4u);
  EXPECT_EQ(lb.policy_kind(), PolicyKind::LeastRequests);
  EXPECT_DOUBLE_EQ(lb.arrival_rate(), 12.5);
  EXPECT_EQ(lb.cursor(), 0u);
  EXPECT_DOUBLE_EQ(lb.now_ms(), 0.0);
}

// ─── Admission ──────────────────────────────────────────────────────────

TEST_F(LoadBalancerTest, RoundRobinSpreadsElevenHeavyRequests) {
  auto lb = build();
  for (std::uint64_t i = 0; i < 11; ++i) {
    ASSERT_TRUE(lb.submit(make_request(i, 10, 6)).has_value());
  }

  auto snap = lb.server_snapshot();
  EXPECT_EQ(snap[0].active_count, 3u);
  EXPECT_EQ(snap[1].active_count, 3u);
  EXPECT_EQ(snap[2].active_count, 3u);
  EXPECT_EQ(snap[3].active_count, 2u);
  EXPECT_EQ(lb.total_rejected(), 0u);
  EXPECT_EQ(lb.total_admitted(), 11u);
  EXPECT_EQ(lb.cursor(), 3u);
}

TEST_F(LoadBalancerTest, RoundRobinIsFairOverFullRotations) {
  cfg_.server_count = 5;
  auto lb = build();
  for (std::uint64_t i = 0; i < 20; ++i) {
    ASSERT_TRUE(lb.submit(make_request(i, 5, 3)).has_value());
  }
  for (const auto &s : lb.server_snapshot()) {
    EXPECT_EQ(s.active_count, 4u);
  }
}

TEST_F(LoadBalancerTest, CapacityRejectionCountsOnServerAndGlobally) {
  cfg_.server_count = 1;
  auto lb = build();

  auto first = lb.submit(make_request(0, 60, 10));
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, 0u);

  auto second = lb.submit(make_request(1, 50, 10));
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error(), Errc::capacity_exceeded);
  EXPECT_TRUE(is_rejection(second.error()));

  EXPECT_EQ(lb.servers()[0].rejected_count(), 1u);
  EXPECT_EQ(lb.servers()[0].active_count(), 1u);
  EXPECT_DOUBLE_EQ(lb.servers()[0].current_load().cpu, 60.0);
  EXPECT_EQ(lb.total_rejected(), 1u);
  EXPECT_EQ(lb.total_arrivals(), 2u);
}

TEST_F(LoadBalancerTest, OutOfRangeIndexIsGlobalRejectionOnly) {
  auto lb = build();
  lb.set_policy(std::make_unique<OutOfRangePolicy>());

  std::size_t hook_index = 0;
  lb.on_request_rejected(
      [&](const Request &, std::size_t idx) { hook_index = idx; });

  auto result = lb.submit(make_request(0, 1, 1));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Errc::policy_index_out_of_range);
  EXPECT_EQ(hook_index, 9u);
  EXPECT_EQ(lb.total_rejected(), 1u);
  for (const auto &s : lb.servers()) {
    EXPECT_EQ(s.rejected_count(), 0u);
    EXPECT_EQ(s.active_count(), 0u);
  }
  EXPECT_EQ(lb.cursor(), 0u);
}

TEST_F(LoadBalancerTest, NullPolicyIsIgnored) {
  auto lb = build();
  lb.set_policy(std::unique_ptr<SchedulingPolicy>{});
  EXPECT_EQ(lb.policy_kind(), PolicyKind::RoundRobin);
  EXPECT_TRUE(lb.submit(make_request(0, 1, 1)).has_value());
}

TEST_F(LoadBalancerTest, HooksFireForEveryOutcome) {
  cfg_.server_count = 1;
  auto lb = build();

  std::vector<std::uint64_t> admitted;
  std::vector<std::uint64_t> rejected;
  std::vector<std::uint64_t> completed;
  lb.on_request_admitted(
      [&](const Request &r, std::size_t) { admitted.push_back(r.id); });
  lb.on_request_rejected(
      [&](const Request &r, std::size_t) { rejected.push_back(r.id); });
  lb.on_request_completed(
      [&](const Request &r, std::size_t) { completed.push_back(r.id); });

  ASSERT_TRUE(lb.submit(make_request(0, 60, 10, 50.0)).has_value());
  ASSERT_FALSE(lb.submit(make_request(1, 60, 10, 50.0)).has_value());
  lb.advance_clock(50.0);
  EXPECT_EQ(lb.reclaim(), 1u);

  EXPECT_EQ(admitted, (std::vector<std::uint64_t>{0}));
  EXPECT_EQ(rejected, (std::vector<std::uint64_t>{1}));
  EXPECT_EQ(completed, (std::vector<std::uint64_t>{0}));
  EXPECT_EQ(lb.total_completed(), 1u);
}

TEST_F(LoadBalancerTest, ReclaimFreesCapacityForNextAdmission) {
  cfg_.server_count = 1;
  auto lb = build();
  ASSERT_TRUE(lb.submit(make_request(0, 60, 10, 100.0)).has_value());
  ASSERT_FALSE(lb.submit(make_request(1, 50, 10)).has_value());

  lb.advance_clock(100.0);
  EXPECT_EQ(lb.reclaim(), 1u);
  EXPECT_TRUE(lb.submit(make_request(2, 50, 10)).has_value());
}

// ─── Tick sequencing ────────────────────────────────────────────────────

class TickTest : public LoadBalancerTest {
protected:
  void SetUp() override {
    LoadBalancerTest::SetUp();
    cfg_.server_count = 1;
    cfg_.request_types = {{"big", 60.0, 10.0}};
    cfg_.min_service_ms = 100.0;
    cfg_.max_service_ms = 100.0;
    cfg_.arrival_rate = 10.0; // one arrival per 100 ms tick
    cfg_.tick_interval_ms = 100;
  }
};

TEST_F(TickTest, ReclaimRunsBeforeArrivals) {
  auto lb = build();

  auto t1 = lb.tick();
  EXPECT_EQ(t1.tick, 1u);
  EXPECT_DOUBLE_EQ(t1.now_ms, 100.0);
  EXPECT_EQ(t1.completed, 0u);
  EXPECT_EQ(t1.admitted, 1u);

  // The request from tick 1 finishes exactly now; without reclaiming first
  // the second 60% request would not fit.
  auto t2 = lb.tick();
  EXPECT_EQ(t2.completed, 1u);
  EXPECT_EQ(t2.admitted, 1u);
  EXPECT_EQ(t2.rejected, 0u);
  EXPECT_EQ(lb.total_rejected(), 0u);
}

TEST_F(TickTest, EachTickRecordsOneSample) {
  cfg_.history_capacity = 5;
  auto lb = build();
  for (int i = 0; i < 12; ++i) {
    lb.tick();
  }
  auto history = lb.balance_history();
  ASSERT_EQ(history.size(), 5u);
  EXPECT_DOUBLE_EQ(history.front().timestamp_ms, 800.0);
  EXPECT_DOUBLE_EQ(history.back().timestamp_ms, 1200.0);
  EXPECT_EQ(lb.tick_count(), 12u);
}

TEST_F(LoadBalancerTest, FractionalArrivalsCarryOver) {
  cfg_.arrival_rate = 1.0;
  cfg_.tick_interval_ms = 100;
  auto lb = build();

  for (int i = 0; i < 9; ++i) {
    lb.tick();
  }
  EXPECT_EQ(lb.total_arrivals(), 0u);
  lb.tick();
  EXPECT_EQ(lb.total_arrivals(), 1u);

  for (int i = 0; i < 90; ++i) {
    lb.tick();
  }
  EXPECT_EQ(lb.total_arrivals(), 10u);
}

TEST_F(LoadBalancerTest, InvariantsHoldUnderHeavyLoadForEveryPolicy) {
  cfg_.arrival_rate = 400.0;
  cfg_.request_types = {{"a", 30.0, 20.0}, {"b", 15.0, 35.0}, {"c", 5.0, 5.0}};
  cfg_.min_service_ms = 50.0;
  cfg_.max_service_ms = 800.0;

  for (const char *policy : {"round-robin", "random", "least-requests",
                             "least-response-time", "dynamic-cpu"}) {
    cfg_.policy = policy;
    auto lb = build();

    std::uint64_t prev_rejected = 0;
    std::uint64_t prev_completed = 0;
    for (int t = 0; t < 200; ++t) {
      auto report = lb.tick();
      for (const auto &s : lb.servers()) {
        auto load = s.current_load();
        ASSERT_LE(load.cpu, Server::kCapacityCpu + 1e-9) << policy;
        ASSERT_LE(load.memory, Server::kCapacityMemory + 1e-9) << policy;
      }
      EXPECT_GE(report.stats.cpu_balance, 0);
      EXPECT_LE(report.stats.cpu_balance, 100);
      EXPECT_GE(lb.total_rejected(), prev_rejected);
      EXPECT_GE(lb.total_completed(), prev_completed);
      prev_rejected = lb.total_rejected();
      prev_completed = lb.total_completed();
    }
    EXPECT_EQ(lb.total_arrivals(), lb.total_admitted() + lb.total_rejected())
        << policy;
    EXPECT_GT(lb.total_rejected(), 0u) << policy;
  }
}

TEST_F(LoadBalancerTest, SameSeedSameRun) {
  cfg_.policy = "random";
  cfg_.arrival_rate = 80.0;
  auto a = build();
  auto b = build();
  for (int t = 0; t < 50; ++t) {
    a.tick();
    b.tick();
  }
  EXPECT_EQ(a.server_snapshot(), b.server_snapshot());
  EXPECT_EQ(a.total_rejected(), b.total_rejected());
}

// ─── Reconfiguration ────────────────────────────────────────────────────

TEST_F(LoadBalancerTest, SetServerCountReplacesPool) {
  auto lb = build();
  ASSERT_TRUE(lb.submit(make_request(0, 10, 10)).has_value());
  ASSERT_TRUE(lb.submit(make_request(1, 10, 10)).has_value());

  ASSERT_TRUE(lb.set_server_count(3).has_value());
  EXPECT_EQ(lb.server_count(), 3u);
  EXPECT_EQ(lb.cursor(), 0u);
  for (const auto &s : lb.servers()) {
    EXPECT_EQ(s.active_count(), 0u);
  }
  // Global totals survive a resize.
  EXPECT_EQ(lb.total_admitted(), 2u);
}

TEST_F(LoadBalancerTest, SetServerCountRejectsOutOfRange) {
  auto lb = build();
  auto zero = lb.set_server_count(0);
  ASSERT_FALSE(zero.has_value());
  EXPECT_EQ(zero.error(), Errc::invalid_server_count);

  auto huge = lb.set_server_count(SimConfig::kMaxServers + 1);
  ASSERT_FALSE(huge.has_value());
  EXPECT_EQ(lb.server_count(), 4u);
}

TEST_F(LoadBalancerTest, SetPolicyKeepsServerState) {
  auto lb = build();
  ASSERT_TRUE(lb.submit(make_request(0, 10, 10)).has_value());

  ASSERT_TRUE(lb.set_policy("dynamic-cpu").has_value());
  EXPECT_EQ(lb.policy_kind(), PolicyKind::DynamicCpu);
  EXPECT_EQ(lb.servers()[0].active_count(), 1u);

  auto bad = lb.set_policy("bogus");
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), Errc::unknown_policy);
  EXPECT_EQ(lb.policy_kind(), PolicyKind::DynamicCpu);
}

TEST_F(LoadBalancerTest, SetArrivalRateValidates) {
  auto lb = build();
  EXPECT_TRUE(lb.set_arrival_rate(25.0).has_value());
  EXPECT_DOUBLE_EQ(lb.arrival_rate(), 25.0);

  for (double bad : {0.0, -3.0, std::nan("")}) {
    auto r = lb.set_arrival_rate(bad);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), Errc::invalid_arrival_rate);
  }
  EXPECT_DOUBLE_EQ(lb.arrival_rate(), 25.0);
}

TEST_F(LoadBalancerTest, ResetClearsEverything) {
  cfg_.arrival_rate = 100.0;
  auto lb = build();
  for (int t = 0; t < 30; ++t) {
    lb.tick();
  }
  ASSERT_GT(lb.total_arrivals(), 0u);

  lb.reset();
  EXPECT_EQ(lb.total_arrivals(), 0u);
  EXPECT_EQ(lb.total_admitted(), 0u);
  EXPECT_EQ(lb.total_rejected(), 0u);
  EXPECT_EQ(lb.total_completed(), 0u);
  EXPECT_EQ(lb.tick_count(), 0u);
  EXPECT_EQ(lb.cursor(), 0u);
  EXPECT_DOUBLE_EQ(lb.now_ms(), 0.0);
  EXPECT_TRUE(lb.balance_history().empty());
  EXPECT_EQ(lb.server_count(), 4u);
  for (const auto &s : lb.server_snapshot()) {
    EXPECT_EQ(s, ServerSnapshot{});
  }

  std::uint64_t first_id = 99;
  lb.on_request_admitted(
      [&](const Request &r, std::size_t) { first_id = r.id; });
  ASSERT_TRUE(lb.submit_generated().has_value());
  EXPECT_EQ(first_id, 0u);
}

TEST_F(LoadBalancerTest, ResetToRestoresLaunchSettings) {
  const SimConfig initial = cfg_;
  auto lb = build();
  ASSERT_TRUE(lb.set_server_count(9).has_value());
  ASSERT_TRUE(lb.set_policy("least-requests").has_value());
  ASSERT_TRUE(lb.set_arrival_rate(77.0).has_value());
  for (int t = 0; t < 5; ++t) {
    lb.tick();
  }

  ASSERT_TRUE(lb.reset_to(initial).has_value());
  EXPECT_EQ(lb.server_count(), 4u);
  EXPECT_EQ(lb.policy_kind(), PolicyKind::RoundRobin);
  EXPECT_DOUBLE_EQ(lb.arrival_rate(), initial.arrival_rate);
  EXPECT_EQ(lb.total_arrivals(), 0u);
  EXPECT_EQ(lb.tick_count(), 0u);
  EXPECT_TRUE(lb.balance_history().empty());
}

TEST_F(LoadBalancerTest, ResetToInvalidConfigChangesNothing) {
  auto lb = build();
  ASSERT_TRUE(lb.set_server_count(6).has_value());
  lb.tick();

  SimConfig bad = cfg_;
  bad.policy = "nope";
  auto result = lb.reset_to(bad);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Errc::unknown_policy);
  EXPECT_EQ(lb.server_count(), 6u);
  EXPECT_EQ(lb.tick_count(), 1u);
}

// ─── Queries ────────────────────────────────────────────────────────────

TEST_F(LoadBalancerTest, SnapshotIsIdempotent) {
  cfg_.arrival_rate = 50.0;
  auto lb = build();
  for (int t = 0; t < 10; ++t) {
    lb.tick();
  }
  auto first = lb.server_snapshot();
  auto second = lb.server_snapshot();
  EXPECT_EQ(first, second);
  EXPECT_EQ(lb.balance_history().size(), lb.balance_history().size());
}
