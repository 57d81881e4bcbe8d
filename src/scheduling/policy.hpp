#pragma once
/// @file policy.hpp
/// @brief Scheduling policy interface and policy selection by name.
///
/// A policy only proposes a target server; the LoadBalancer's admission test
/// is authoritative. Policies never mutate servers, and the rotation cursor
/// they read is owned by the caller.

#include "core/request.hpp"
#include "core/server.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string_view>
#include <system_error>

namespace lbsim {

/// @brief The five built-in policies.
enum class PolicyKind : std::uint8_t {
  RoundRobin,
  Random,
  LeastRequests,
  LeastResponseTime,
  DynamicCpu,
};

/// @brief Display name ("Round Robin", ...).
[[nodiscard]] constexpr auto to_string(PolicyKind k) -> const char * {
  switch (k) {
  case PolicyKind::RoundRobin:
    return "Round Robin";
  case PolicyKind::Random:
    return "Random";
  case PolicyKind::LeastRequests:
    return "Least Requests";
  case PolicyKind::LeastResponseTime:
    return "Least Response Time";
  case PolicyKind::DynamicCpu:
    return "Dynamic CPU";
  }
  return "Unknown";
}

/// @brief Config/CLI name ("round-robin", ...).
[[nodiscard]] constexpr auto to_slug(PolicyKind k) -> const char * {
  switch (k) {
  case PolicyKind::RoundRobin:
    return "round-robin";
  case PolicyKind::Random:
    return "random";
  case PolicyKind::LeastRequests:
    return "least-requests";
  case PolicyKind::LeastResponseTime:
    return "least-response-time";
  case PolicyKind::DynamicCpu:
    return "dynamic-cpu";
  }
  return "unknown";
}

/// @brief Parse either a slug or a display name.
/// @return The policy kind, or Errc::unknown_policy.
[[nodiscard]] auto parse_policy_kind(std::string_view name)
    -> std::expected<PolicyKind, std::error_code>;

/// @brief Proposes which server should receive the next request.
class SchedulingPolicy {
public:
  virtual ~SchedulingPolicy() = default;

  /// @param servers Current servers, in index order. Never empty.
  /// @param request The request being placed.
  /// @param cursor  Caller-held rotation cursor.
  /// @return Candidate server index. Out-of-range values are treated as a
  ///         rejection by the caller.
  [[nodiscard]] virtual auto select_server(std::span<const Server> servers,
                                           const Request &request,
                                           std::size_t cursor)
      -> std::size_t = 0;

  [[nodiscard]] virtual auto kind() const noexcept -> PolicyKind = 0;
};

/// @brief Instantiate a policy.
/// @param seed Seed for policies that draw random numbers; 0 picks one
///             from std::random_device.
[[nodiscard]] auto make_policy(PolicyKind kind, std::uint64_t seed = 0)
    -> std::unique_ptr<SchedulingPolicy>;

/// @brief Instantiate a policy by name.
[[nodiscard]] auto make_policy(std::string_view name, std::uint64_t seed = 0)
    -> std::expected<std::unique_ptr<SchedulingPolicy>, std::error_code>;

} // namespace lbsim
