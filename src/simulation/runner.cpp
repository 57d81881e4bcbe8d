/// @file runner.cpp
/// @brief SimulationRunner implementation.

#include "simulation/runner.hpp"

#include <thread>
#include <utility>

namespace lbsim::sim {

SimulationRunner::SimulationRunner(LoadBalancer &balancer, RunnerConfig cfg)
    : balancer_{balancer}, cfg_{cfg} {}

void SimulationRunner::post(Command cmd) {
  if (!cmd)
    return;
  std::lock_guard lock(commands_mutex_);
  commands_.push_back(std::move(cmd));
}

auto SimulationRunner::drain_commands() -> std::size_t {
  std::deque<Command> pending;
  {
    std::lock_guard lock(commands_mutex_);
    pending.swap(commands_);
  }
  for (auto &cmd : pending) {
    cmd(balancer_);
  }
  return pending.size();
}

auto SimulationRunner::run(const TickCallback &on_tick) -> RunSummary {
  using Clock = std::chrono::steady_clock;
  const auto t0 = Clock::now();

  running_.store(true);

  RunSummary summary;
  const double budget_ms = cfg_.run_duration_s * 1000.0;
  const auto interval = std::chrono::milliseconds(balancer_.tick_interval_ms());

  auto next_deadline = Clock::now();
  while (summary.simulated_ms < budget_ms) {
    // A stop() issued before run() started still counts; it is consumed here.
    if (stop_requested_.exchange(false)) {
      summary.stopped = true;
      break;
    }

    drain_commands();

    auto report = balancer_.tick();
    ++summary.ticks;
    summary.simulated_ms += static_cast<double>(balancer_.tick_interval_ms());

    if (on_tick) {
      on_tick(report, balancer_);
    }

    if (cfg_.realtime) {
      next_deadline += interval;
      std::this_thread::sleep_until(next_deadline);
    }
  }

  running_.store(false);
  summary.wall_time = Clock::now() - t0;
  return summary;
}

} // namespace lbsim::sim
