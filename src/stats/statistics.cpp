/// @file statistics.cpp
/// @brief Load statistics and balance scoring.

#include "stats/statistics.hpp"

#include <algorithm>
#include <cmath>

namespace lbsim {

auto compute_stats(std::span<const double> values) -> Stats {
  Stats s;
  if (values.empty()) {
    return s;
  }

  const auto n = static_cast<double>(values.size());
  double sum = 0.0;
  for (auto v : values)
    sum += v;
  s.mean = sum / n;

  double sq = 0.0;
  for (auto v : values)
    sq += (v - s.mean) * (v - s.mean);
  s.variance = sq / n;
  s.std_dev = std::sqrt(s.variance);

  const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
  s.min = *lo;
  s.max = *hi;
  return s;
}

auto balance_score(std::span<const double> values) -> int {
  if (values.empty()) {
    return 100;
  }

  double sum = 0.0;
  for (auto v : values)
    sum += v;
  const double mean = sum / static_cast<double>(values.size());
  if (mean == 0.0) {
    return 100;
  }

  double max_dev = 0.0;
  for (auto v : values)
    max_dev = std::max(max_dev, std::abs(v - mean));

  // Deviation equal to the mean halves the score; twice the mean zeroes it.
  const double score = std::max(0.0, 100.0 * (1.0 - max_dev / (2.0 * mean)));
  return static_cast<int>(std::lround(score));
}

// ─── StatisticsEngine ───────────────────────────────────────────────────

StatisticsEngine::StatisticsEngine(std::size_t history_capacity)
    : history_{history_capacity} {}

auto StatisticsEngine::sample(std::span<const Server> servers, double now_ms)
    -> LoadStatistics {
  std::vector<double> cpu;
  std::vector<double> memory;
  cpu.reserve(servers.size());
  memory.reserve(servers.size());
  for (const auto &server : servers) {
    const auto load = server.current_load();
    cpu.push_back(load.cpu);
    memory.push_back(load.memory);
  }

  latest_ = LoadStatistics{
      .cpu = compute_stats(cpu),
      .memory = compute_stats(memory),
      .cpu_balance = balance_score(cpu),
      .memory_balance = balance_score(memory),
  };

  history_.push(BalanceSample{
      .timestamp_ms = now_ms,
      .cpu_balance = latest_.cpu_balance,
      .memory_balance = latest_.memory_balance,
  });
  return latest_;
}

auto StatisticsEngine::history() const -> std::vector<BalanceSample> {
  return history_.to_vector();
}

void StatisticsEngine::clear() noexcept {
  history_.clear();
  latest_ = LoadStatistics{};
}

} // namespace lbsim
