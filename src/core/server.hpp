#pragma once
/// @file server.hpp
/// @brief Capacity-bounded simulated server.
///
/// A Server hosts the requests admitted to it and keeps running totals of
/// completions, served time and rejections. The capacity invariant
/// (summed active demand never above capacity, for both CPU and memory) is
/// enforced by admit(): a request that does not fit is refused without any
/// mutation.

#include "core/request.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace lbsim {

/// @brief Current aggregate demand on a server.
struct Load {
  double cpu = 0.0;
  double memory = 0.0;
};

/// @brief Read-only view of one server, as exposed to presentation.
struct ServerSnapshot {
  double cpu_load = 0.0;
  double memory_load = 0.0;
  std::size_t active_count = 0;
  double avg_response_time_ms = 0.0;
  std::uint64_t rejected_count = 0;
  std::uint64_t completed_count = 0;

  auto operator==(const ServerSnapshot &) const -> bool = default;
};

/// @brief Invoked for every request removed by reclaim_completed().
using CompletionCallback = std::function<void(const Request &)>;

class Server {
public:
  static constexpr double kCapacityCpu = 100.0;
  static constexpr double kCapacityMemory = 100.0;

  Server() = default;

  /// @brief Admission test: would @p req fit without exceeding capacity?
  [[nodiscard]] auto can_admit(const Request &req) const noexcept -> bool;

  /// @brief Host @p req if it fits.
  /// @return false (and no state change) if admitting would break capacity.
  auto admit(const Request &req) -> bool;

  /// @brief Count a rejection attributed to this server.
  void record_rejection() noexcept { ++rejected_count_; }

  /// @brief Remove every request whose service time has elapsed at
  ///        @p now_ms, updating completion counters.
  /// @return Number of requests completed.
  auto reclaim_completed(double now_ms,
                         const CompletionCallback &on_complete = nullptr)
      -> std::size_t;

  /// @brief Drop active requests and zero all counters.
  void reset() noexcept;

  [[nodiscard]] auto current_load() const noexcept -> Load;
  [[nodiscard]] auto active_requests() const noexcept
      -> const std::vector<Request> & {
    return active_;
  }
  [[nodiscard]] auto active_count() const noexcept -> std::size_t {
    return active_.size();
  }
  [[nodiscard]] auto completed_count() const noexcept -> std::uint64_t {
    return completed_count_;
  }
  [[nodiscard]] auto cumulative_response_time_ms() const noexcept -> double {
    return cumulative_response_ms_;
  }
  [[nodiscard]] auto rejected_count() const noexcept -> std::uint64_t {
    return rejected_count_;
  }

  /// @brief cumulative_response_time / completed_count, or 0 before any
  ///        completion.
  [[nodiscard]] auto average_response_time_ms() const noexcept -> double;

  [[nodiscard]] auto snapshot() const noexcept -> ServerSnapshot;

private:
  std::vector<Request> active_;
  std::uint64_t completed_count_ = 0;
  double cumulative_response_ms_ = 0.0;
  std::uint64_t rejected_count_ = 0;
};

} // namespace lbsim
