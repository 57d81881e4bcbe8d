#pragma once
/// @file statistics.hpp
/// @brief Per-tick load statistics and the bounded balance-score history.

#include "core/server.hpp"
#include "stats/ring_buffer.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace lbsim {

/// @brief Population summary of a set of values.
struct Stats {
  double mean = 0.0;
  double variance = 0.0; ///< Population variance (divides by N).
  double std_dev = 0.0;
  double min = 0.0;
  double max = 0.0;
};

/// @brief Balance scores recorded at one sampling instant.
struct BalanceSample {
  double timestamp_ms = 0.0;
  int cpu_balance = 100;
  int memory_balance = 100;
};

/// @brief Result of one StatisticsEngine::sample() call.
struct LoadStatistics {
  Stats cpu;
  Stats memory;
  int cpu_balance = 100;
  int memory_balance = 100;
};

/// @brief Summary statistics. Empty input yields all zeros.
[[nodiscard]] auto compute_stats(std::span<const double> values) -> Stats;

/// @brief Worst-case-deviation fairness score in [0, 100].
///
/// score = max(0, 100 * (1 - max|v - mean| / (2 * mean))), rounded.
/// Empty input or a zero mean is perfectly balanced (100).
[[nodiscard]] auto balance_score(std::span<const double> values) -> int;

/// @brief Samples server loads once per tick and keeps the last N balance
///        scores.
class StatisticsEngine {
public:
  static constexpr std::size_t kDefaultHistoryCapacity = 50;

  explicit StatisticsEngine(
      std::size_t history_capacity = kDefaultHistoryCapacity);

  /// @brief Compute statistics over @p servers and record a BalanceSample.
  auto sample(std::span<const Server> servers, double now_ms)
      -> LoadStatistics;

  /// @brief Balance samples, oldest first.
  [[nodiscard]] auto history() const -> std::vector<BalanceSample>;

  /// @brief Statistics from the most recent sample() (defaults before any).
  [[nodiscard]] auto latest() const noexcept -> const LoadStatistics & {
    return latest_;
  }

  [[nodiscard]] auto history_capacity() const noexcept -> std::size_t {
    return history_.capacity();
  }

  /// @brief Drop all history and the latest statistics.
  void clear() noexcept;

private:
  RingBuffer<BalanceSample> history_;
  LoadStatistics latest_{};
};

} // namespace lbsim
