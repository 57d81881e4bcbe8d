#pragma once
/// @file load_balancer.hpp
/// @brief Admission controller and tick driver.
///
/// LoadBalancer owns the server pool, the active scheduling policy, the
/// request generator, the simulated clock and the statistics engine. Each
/// tick() runs, in this order:
///   1. completion reclamation on every server,
///   2. the arrivals owed for this tick (generate, select, admit/reject),
///   3. one statistics sample.
///
/// Not thread-safe: every mutating call must come from the tick thread.
/// Outside callers go through SimulationRunner's command queue.

#include "config/sim_config.hpp"
#include "core/request.hpp"
#include "core/server.hpp"
#include "scheduling/policy.hpp"
#include "simulation/request_generator.hpp"
#include "stats/statistics.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

namespace lbsim::sim {

/// @brief Hook signature: the request and the server index it concerns.
///        For a policy_index_out_of_range rejection the index is the
///        out-of-range value the policy returned.
using RequestCallback = std::function<void(const Request &, std::size_t)>;

/// @brief Everything that happened in one tick.
struct TickReport {
  std::uint64_t tick = 0; ///< 1-based tick number since the last reset.
  double now_ms = 0.0;    ///< Simulated clock after advancing.
  std::size_t completed = 0;
  std::size_t admitted = 0;
  std::size_t rejected = 0;
  LoadStatistics stats{};
};

class LoadBalancer {
public:
  /// @brief Build a balancer from a validated configuration.
  /// @return The balancer, or the first configuration error.
  [[nodiscard]] static auto create(const SimConfig &cfg)
      -> std::expected<LoadBalancer, std::error_code>;

  LoadBalancer(LoadBalancer &&) = default;
  LoadBalancer &operator=(LoadBalancer &&) = default;
  LoadBalancer(const LoadBalancer &) = delete;
  LoadBalancer &operator=(const LoadBalancer &) = delete;

  // ─── Admission ───────────────────────────────────────────────────────

  /// @brief Place @p request on the server chosen by the active policy.
  /// @return Index of the admitting server, or capacity_exceeded /
  ///         policy_index_out_of_range. A rejected request is discarded.
  auto submit(const Request &request)
      -> std::expected<std::size_t, std::error_code>;

  /// @brief Generate one request at the current clock and submit it.
  auto submit_generated() -> std::expected<std::size_t, std::error_code>;

  /// @brief Remove requests whose service time has elapsed.
  /// @return Number of completions.
  auto reclaim() -> std::size_t;

  /// @brief Advance the clock one interval and run a full tick.
  auto tick() -> TickReport;

  /// @brief Advance the simulated clock without running a tick.
  void advance_clock(double delta_ms) noexcept { now_ms_ += delta_ms; }

  // ─── Reconfiguration ─────────────────────────────────────────────────

  /// @brief Replace the pool with @p n fresh servers.
  [[nodiscard]] auto set_server_count(std::size_t n)
      -> std::expected<void, std::error_code>;

  /// @brief Switch policy by slug or display name. Server state is kept.
  [[nodiscard]] auto set_policy(std::string_view name)
      -> std::expected<void, std::error_code>;

  /// @brief Install a custom policy. Null is ignored.
  void set_policy(std::unique_ptr<SchedulingPolicy> policy);

  /// @brief Requests per simulated second.
  [[nodiscard]] auto set_arrival_rate(double rate)
      -> std::expected<void, std::error_code>;

  /// @brief Clear all servers, counters, the clock and the balance history.
  void reset();

  /// @brief reset(), then restore the server count, policy and arrival rate
  ///        of @p initial. Nothing changes if @p initial does not validate.
  [[nodiscard]] auto reset_to(const SimConfig &initial)
      -> std::expected<void, std::error_code>;

  // ─── Hooks ───────────────────────────────────────────────────────────

  void on_request_admitted(RequestCallback cb) { on_admitted_ = std::move(cb); }
  void on_request_rejected(RequestCallback cb) { on_rejected_ = std::move(cb); }
  void on_request_completed(RequestCallback cb) {
    on_completed_ = std::move(cb);
  }

  // ─── Queries ─────────────────────────────────────────────────────────

  [[nodiscard]] auto server_snapshot() const -> std::vector<ServerSnapshot>;
  [[nodiscard]] auto balance_history() const -> std::vector<BalanceSample>;
  [[nodiscard]] auto latest_stats() const noexcept -> const LoadStatistics & {
    return stats_.latest();
  }
  [[nodiscard]] auto servers() const noexcept -> std::span<const Server> {
    return servers_;
  }
  [[nodiscard]] auto server_count() const noexcept -> std::size_t {
    return servers_.size();
  }
  [[nodiscard]] auto policy_kind() const noexcept -> PolicyKind {
    return policy_->kind();
  }
  [[nodiscard]] auto arrival_rate() const noexcept -> double {
    return arrival_rate_;
  }
  [[nodiscard]] auto cursor() const noexcept -> std::size_t { return cursor_; }
  [[nodiscard]] auto now_ms() const noexcept -> double { return now_ms_; }
  [[nodiscard]] auto tick_count() const noexcept -> std::uint64_t {
    return tick_count_;
  }
  [[nodiscard]] auto tick_interval_ms() const noexcept -> std::size_t {
    return tick_interval_ms_;
  }
  [[nodiscard]] auto total_arrivals() const noexcept -> std::uint64_t {
    return total_arrivals_;
  }
  [[nodiscard]] auto total_admitted() const noexcept -> std::uint64_t {
    return total_admitted_;
  }
  [[nodiscard]] auto total_rejected() const noexcept -> std::uint64_t {
    return total_rejected_;
  }
  [[nodiscard]] auto total_completed() const noexcept -> std::uint64_t {
    return total_completed_;
  }
  [[nodiscard]] auto request_types() const noexcept
      -> const std::vector<RequestType> & {
    return generator_.request_types();
  }

private:
  LoadBalancer(const SimConfig &cfg, std::unique_ptr<SchedulingPolicy> policy,
               RequestGenerator generator);

  std::vector<Server> servers_;
  std::unique_ptr<SchedulingPolicy> policy_;
  RequestGenerator generator_;
  StatisticsEngine stats_;

  std::uint64_t seed_ = 0;
  double arrival_rate_ = 1.0;
  std::size_t tick_interval_ms_ = 100;
  std::size_t cursor_ = 0;
  double now_ms_ = 0.0;
  double arrival_credit_ = 0.0; ///< Fractional arrivals carried to next tick.
  std::uint64_t tick_count_ = 0;

  std::uint64_t total_arrivals_ = 0;
  std::uint64_t total_admitted_ = 0;
  std::uint64_t total_rejected_ = 0;
  std::uint64_t total_completed_ = 0;

  RequestCallback on_admitted_;
  RequestCallback on_rejected_;
  RequestCallback on_completed_;
};

} // namespace lbsim::sim
