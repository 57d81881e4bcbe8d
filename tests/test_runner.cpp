/// @file test_runner.cpp
/// @brief Unit tests for SimulationRunner: run length, cancellation and
///        the cross-thread command queue.

#include "simulation/runner.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <thread>

using namespace lbsim;
using namespace lbsim::sim;

class RunnerTest : public ::testing::Test {
protected:
  void SetUp() override {
    SimConfig cfg;
    cfg.server_count = 3;
    cfg.seed = 5;
    cfg.arrival_rate = 20.0;
    cfg.tick_interval_ms = 100;
    auto lb = LoadBalancer::create(cfg);
    ASSERT_TRUE(lb.has_value());
    lb_ = std::make_unique<LoadBalancer>(std::move(*lb));
  }

  std::unique_ptr<LoadBalancer> lb_;
};

TEST_F(RunnerTest, RunCoversDuration) {
  SimulationRunner runner{*lb_, RunnerConfig{.run_duration_s = 1.0}};
  std::uint64_t callbacks = 0;
  auto summary =
      runner.run([&](const TickReport &, const LoadBalancer &) { ++callbacks; });

  EXPECT_EQ(summary.ticks, 10u);
  EXPECT_DOUBLE_EQ(summary.simulated_ms, 1000.0);
  EXPECT_FALSE(summary.stopped);
  EXPECT_EQ(callbacks, 10u);
  EXPECT_EQ(lb_->tick_count(), 10u);
  EXPECT_FALSE(runner.running());
}

TEST_F(RunnerTest, StopEndsAtNextTickBoundary) {
  SimulationRunner runner{*lb_, RunnerConfig{.run_duration_s = 60.0}};
  auto summary = runner.run([&](const TickReport &report, const LoadBalancer &) {
    if (report.tick == 3) {
      runner.stop();
    }
  });

  EXPECT_TRUE(summary.stopped);
  EXPECT_EQ(summary.ticks, 3u);
  EXPECT_EQ(lb_->tick_count(), 3u);
}

TEST_F(RunnerTest, StopBeforeRunIsHonoured) {
  SimulationRunner runner{*lb_, RunnerConfig{.run_duration_s = 2.0}};
  runner.stop();

  auto summary = runner.run();
  EXPECT_TRUE(summary.stopped);
  EXPECT_EQ(summary.ticks, 0u);
  EXPECT_EQ(lb_->tick_count(), 0u);

  // The pending stop is consumed; the next run goes the full length.
  summary = runner.run();
  EXPECT_FALSE(summary.stopped);
  EXPECT_EQ(summary.ticks, 20u);
}

TEST_F(RunnerTest, ClearStopDropsPendingStop) {
  SimulationRunner runner{*lb_, RunnerConfig{.run_duration_s = 0.5}};
  runner.stop();
  runner.clear_stop();

  auto summary = runner.run();
  EXPECT_FALSE(summary.stopped);
  EXPECT_EQ(summary.ticks, 5u);
}

TEST_F(RunnerTest, PostedCommandsApplyBeforeNextTick) {
  SimulationRunner runner{*lb_, RunnerConfig{.run_duration_s = 0.5}};
  runner.post([](LoadBalancer &lb) { (void)lb.set_server_count(7); });

  std::size_t seen_servers = 0;
  runner.run([&](const TickReport &report, const LoadBalancer &lb) {
    if (report.tick == 1) {
      seen_servers = lb.server_count();
    }
  });
  EXPECT_EQ(seen_servers, 7u);
}

TEST_F(RunnerTest, DrainReturnsAppliedCount) {
  SimulationRunner runner{*lb_};
  runner.post([](LoadBalancer &lb) { (void)lb.set_arrival_rate(3.0); });
  runner.post([](LoadBalancer &lb) { (void)lb.set_policy("random"); });
  runner.post(nullptr);

  EXPECT_EQ(runner.drain_commands(), 2u);
  EXPECT_DOUBLE_EQ(lb_->arrival_rate(), 3.0);
  EXPECT_EQ(lb_->policy_kind(), PolicyKind::Random);
  EXPECT_EQ(runner.drain_commands(), 0u);
}

TEST_F(RunnerTest, PostAndStopFromAnotherThread) {
  SimulationRunner runner{*lb_, RunnerConfig{.run_duration_s = 1e6}};

  std::thread controller([&] {
    while (!runner.running()) {
      std::this_thread::yield();
    }
    runner.post([](LoadBalancer &lb) { (void)lb.set_server_count(2); });
    runner.post([&](LoadBalancer &) { runner.stop(); });
  });

  auto summary = runner.run();
  controller.join();

  EXPECT_TRUE(summary.stopped);
  EXPECT_EQ(lb_->server_count(), 2u);
}

TEST_F(RunnerTest, RealtimePacesTicks) {
  SimulationRunner runner{*lb_,
                          RunnerConfig{.run_duration_s = 0.5, .realtime = true}};
  auto summary = runner.run();
  EXPECT_EQ(summary.ticks, 5u);
  EXPECT_GE(summary.wall_time, std::chrono::milliseconds(450));
}
