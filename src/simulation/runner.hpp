#pragma once
/// @file runner.hpp
/// @brief Tick source for a LoadBalancer.
///
/// The runner is the only place ticks come from. Other threads (the live
/// server's I/O thread) never touch the balancer directly: they post
/// commands, which the runner applies on its own thread at the next tick
/// boundary, so all core mutation stays serialized once per tick.

#include "simulation/load_balancer.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>

namespace lbsim::sim {

/// @brief Deferred mutation, applied on the tick thread.
using Command = std::function<void(LoadBalancer &)>;

/// @brief Called after every tick with the report and the balancer state.
using TickCallback =
    std::function<void(const TickReport &, const LoadBalancer &)>;

struct RunnerConfig {
  double run_duration_s = 60.0;
  bool realtime = false; ///< Sleep one tick interval of wall time per tick.
};

/// @brief Outcome of one run() call.
struct RunSummary {
  std::uint64_t ticks = 0;
  double simulated_ms = 0.0;
  bool stopped = false; ///< True if stop() ended the run early.
  std::chrono::steady_clock::duration wall_time{};
};

class SimulationRunner {
public:
  explicit SimulationRunner(LoadBalancer &balancer, RunnerConfig cfg = {});

  /// @brief Tick until the run duration is covered or stop() is called.
  ///        Requests still active at the end are simply left in place.
  auto run(const TickCallback &on_tick = nullptr) -> RunSummary;

  /// @brief Halt run() at the next tick boundary. Callable from any thread.
  ///        If no run is in progress the request stays pending and the next
  ///        run() returns before its first tick.
  void stop() noexcept { stop_requested_.store(true); }

  /// @brief Drop a pending stop(). Call when a new start is accepted.
  void clear_stop() noexcept { stop_requested_.store(false); }

  /// @brief Queue @p cmd for the tick thread. Callable from any thread.
  void post(Command cmd);

  /// @brief Apply every queued command now. Tick thread only.
  /// @return Number of commands applied.
  auto drain_commands() -> std::size_t;

  [[nodiscard]] auto running() const noexcept -> bool {
    return running_.load();
  }

  void set_run_duration(double seconds) noexcept {
    cfg_.run_duration_s = seconds;
  }
  [[nodiscard]] auto config() const noexcept -> const RunnerConfig & {
    return cfg_;
  }

private:
  LoadBalancer &balancer_;
  RunnerConfig cfg_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> running_{false};

  std::mutex commands_mutex_;
  std::deque<Command> commands_;
};

} // namespace lbsim::sim
