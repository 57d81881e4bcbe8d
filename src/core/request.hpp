#pragma once
/// @file request.hpp
/// @brief Immutable unit of work and the catalog of request types.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lbsim {

/// @brief One entry of the request-type catalog.
struct RequestType {
  std::string name; ///< e.g. "light", "heavy".
  double cpu;       ///< CPU demand in percent of one server (0–100).
  double memory;    ///< Memory demand in percent of one server (0–100).
};

/// @brief The catalog used when no other is configured.
[[nodiscard]] inline auto default_request_types() -> std::vector<RequestType> {
  return {
      {"light", 5.0, 3.0},
      {"cpu-medium", 8.0, 4.0},
      {"memory-medium", 4.0, 8.0},
      {"heavy", 10.0, 6.0},
  };
}

/// @brief A simulated request. Never mutated after creation.
struct Request {
  std::uint64_t id = 0;             ///< Monotonic request ID.
  std::size_t type = 0;             ///< Index into the request-type catalog.
  double cpu_demand = 0.0;          ///< Percent of server CPU.
  double memory_demand = 0.0;       ///< Percent of server memory.
  double service_duration_ms = 0.0; ///< Simulated processing time.
  double arrival_time_ms = 0.0;     ///< Simulated clock at creation.

  /// @brief True once the request has been served for its full duration.
  [[nodiscard]] auto is_complete(double now_ms) const noexcept -> bool {
    return now_ms - arrival_time_ms >= service_duration_ms;
  }

  /// @brief Fraction of the service time elapsed, clamped to [0, 1].
  [[nodiscard]] auto progress(double now_ms) const noexcept -> double {
    if (service_duration_ms <= 0.0)
      return 1.0;
    const double p = (now_ms - arrival_time_ms) / service_duration_ms;
    return p < 0.0 ? 0.0 : (p > 1.0 ? 1.0 : p);
  }
};

} // namespace lbsim
