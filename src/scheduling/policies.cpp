/// @file policies.cpp
/// @brief Policy implementations and name-based construction.

#include "scheduling/policies.hpp"

#include "core/error.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <numeric>
#include <vector>

namespace lbsim {

// ─── Name lookup ────────────────────────────────────────────────────────

auto parse_policy_kind(std::string_view name)
    -> std::expected<PolicyKind, std::error_code> {
  static constexpr std::array<PolicyKind, 5> kinds = {
      PolicyKind::RoundRobin,        PolicyKind::Random,
      PolicyKind::LeastRequests,     PolicyKind::LeastResponseTime,
      PolicyKind::DynamicCpu,
  };
  for (auto k : kinds) {
    if (name == to_slug(k) || name == to_string(k)) {
      return k;
    }
  }
  return std::unexpected(make_error_code(Errc::unknown_policy));
}

auto make_policy(PolicyKind kind, std::uint64_t seed)
    -> std::unique_ptr<SchedulingPolicy> {
  switch (kind) {
  case PolicyKind::RoundRobin:
    return std::make_unique<RoundRobinPolicy>();
  case PolicyKind::Random:
    return std::make_unique<RandomPolicy>(seed);
  case PolicyKind::LeastRequests:
    return std::make_unique<LeastRequestsPolicy>();
  case PolicyKind::LeastResponseTime:
    return std::make_unique<LeastResponseTimePolicy>();
  case PolicyKind::DynamicCpu:
    return std::make_unique<DynamicCpuPolicy>();
  }
  return std::make_unique<RoundRobinPolicy>();
}

auto make_policy(std::string_view name, std::uint64_t seed)
    -> std::expected<std::unique_ptr<SchedulingPolicy>, std::error_code> {
  auto kind = parse_policy_kind(name);
  if (!kind.has_value()) {
    return std::unexpected(kind.error());
  }
  return make_policy(*kind, seed);
}

// ─── Round Robin ────────────────────────────────────────────────────────

auto RoundRobinPolicy::select_server(std::span<const Server> servers,
                                     const Request &request, std::size_t cursor)
    -> std::size_t {
  const auto n = servers.size();
  for (std::size_t i = 0; i < n; ++i) {
    const auto idx = (cursor + i) % n;
    if (servers[idx].can_admit(request)) {
      return idx;
    }
  }
  return cursor;
}

// ─── Random ─────────────────────────────────────────────────────────────

RandomPolicy::RandomPolicy(std::uint64_t seed)
    : rng_{seed != 0 ? seed : std::random_device{}()} {}

auto RandomPolicy::select_server(std::span<const Server> servers,
                                 const Request &request,
                                 std::size_t /*cursor*/) -> std::size_t {
  const auto n = servers.size();
  std::vector<std::size_t> order(n);
  std::iota(order.begin(), order.end(), std::size_t{0});

  // Incremental Fisher-Yates: each step draws one untried index.
  for (std::size_t i = 0; i < n; ++i) {
    std::uniform_int_distribution<std::size_t> pick(i, n - 1);
    std::swap(order[i], order[pick(rng_)]);
    if (servers[order[i]].can_admit(request)) {
      return order[i];
    }
  }

  std::uniform_int_distribution<std::size_t> any(0, n - 1);
  return any(rng_);
}

// ─── Least Requests ─────────────────────────────────────────────────────

auto LeastRequestsPolicy::select_server(std::span<const Server> servers,
                                        const Request & /*request*/,
                                        std::size_t /*cursor*/)
    -> std::size_t {
  std::size_t selected = 0;
  auto fewest = std::numeric_limits<std::size_t>::max();
  for (std::size_t i = 0; i < servers.size(); ++i) {
    if (servers[i].active_count() < fewest) {
      fewest = servers[i].active_count();
      selected = i;
    }
  }
  return selected;
}

// ─── Least Response Time ────────────────────────────────────────────────

auto LeastResponseTimePolicy::select_server(std::span<const Server> servers,
                                            const Request & /*request*/,
                                            std::size_t /*cursor*/)
    -> std::size_t {
  std::size_t selected = 0;
  auto best = std::numeric_limits<double>::infinity();
  for (std::size_t i = 0; i < servers.size(); ++i) {
    const auto avg = servers[i].average_response_time_ms();
    const auto score =
        avg == 0.0
            ? static_cast<double>(servers[i].active_count()) *
                  kNoHistoryPenaltyMs
            : avg;
    if (score < best) {
      best = score;
      selected = i;
    }
  }
  return selected;
}

// ─── Dynamic CPU ────────────────────────────────────────────────────────

auto DynamicCpuPolicy::select_server(std::span<const Server> servers,
                                     const Request & /*request*/,
                                     std::size_t /*cursor*/) -> std::size_t {
  std::size_t selected = 0;
  auto lowest = std::numeric_limits<double>::infinity();
  for (std::size_t i = 0; i < servers.size(); ++i) {
    const auto cpu = servers[i].current_load().cpu;
    if (cpu < lowest) {
      lowest = cpu;
      selected = i;
    }
  }
  return selected;
}

} // namespace lbsim
