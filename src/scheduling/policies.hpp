#pragma once
/// @file policies.hpp
/// @brief The five concrete scheduling policies.

#include "scheduling/policy.hpp"

#include <cstdint>
#include <random>

namespace lbsim {

// RoundRobinPolicy scans circularly from the cursor for a server that can
// take the request. If no server can, the cursor itself is returned and the
// admission test rejects the request there.
class RoundRobinPolicy final : public SchedulingPolicy {
public:
  auto select_server(std::span<const Server> servers, const Request &request,
                     std::size_t cursor) -> std::size_t override;
  auto kind() const noexcept -> PolicyKind override {
    return PolicyKind::RoundRobin;
  }
};

// RandomPolicy samples indices without replacement until one can take the
// request; when every server has been tried it returns a random index anyway.
class RandomPolicy final : public SchedulingPolicy {
public:
  explicit RandomPolicy(std::uint64_t seed);

  auto select_server(std::span<const Server> servers, const Request &request,
                     std::size_t cursor) -> std::size_t override;
  auto kind() const noexcept -> PolicyKind override {
    return PolicyKind::Random;
  }

private:
  std::mt19937_64 rng_;
};

// LeastRequestsPolicy picks the fewest active requests; first wins ties.
class LeastRequestsPolicy final : public SchedulingPolicy {
public:
  auto select_server(std::span<const Server> servers, const Request &request,
                     std::size_t cursor) -> std::size_t override;
  auto kind() const noexcept -> PolicyKind override {
    return PolicyKind::LeastRequests;
  }
};

// LeastResponseTimePolicy picks the lowest average response time. A server
// with no completions scores active_count * 100 instead of 0.
class LeastResponseTimePolicy final : public SchedulingPolicy {
public:
  static constexpr double kNoHistoryPenaltyMs = 100.0;

  auto select_server(std::span<const Server> servers, const Request &request,
                     std::size_t cursor) -> std::size_t override;
  auto kind() const noexcept -> PolicyKind override {
    return PolicyKind::LeastResponseTime;
  }
};

// DynamicCpuPolicy picks the lowest aggregate active CPU demand.
class DynamicCpuPolicy final : public SchedulingPolicy {
public:
  auto select_server(std::span<const Server> servers, const Request &request,
                     std::size_t cursor) -> std::size_t override;
  auto kind() const noexcept -> PolicyKind override {
    return PolicyKind::DynamicCpu;
  }
};

} // namespace lbsim
