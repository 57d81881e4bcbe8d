#pragma once
/// @file request_generator.hpp
/// @brief Synthetic request source for the load balancer.
///
/// Draws request types uniformly from a catalog and service durations
/// uniformly from a configured range. Owns its random engine and the id
/// counter, so independent simulations never share state.

#include "core/request.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <random>
#include <system_error>
#include <vector>

namespace lbsim::sim {

/// @brief Request generator configuration.
struct GeneratorConfig {
  std::vector<RequestType> request_types = default_request_types();
  double min_service_ms = 1.0;
  double max_service_ms = 500.0;
  std::uint64_t seed = 0; ///< 0 = seed from std::random_device.
};

class RequestGenerator {
public:
  /// @brief Build a generator.
  /// @return The generator, or empty_request_catalog / invalid_service_time.
  [[nodiscard]] static auto create(GeneratorConfig cfg)
      -> std::expected<RequestGenerator, std::error_code>;

  /// @brief Produce the next request, arriving at @p now_ms.
  [[nodiscard]] auto generate(double now_ms) -> Request;

  /// @brief Restart ids at 0.
  void reset() noexcept { next_id_ = 0; }

  /// @brief Id the next generated request will get.
  [[nodiscard]] auto next_id() const noexcept -> std::uint64_t {
    return next_id_;
  }

  [[nodiscard]] auto request_types() const noexcept
      -> const std::vector<RequestType> & {
    return cfg_.request_types;
  }

private:
  explicit RequestGenerator(GeneratorConfig cfg);

  GeneratorConfig cfg_;
  std::mt19937_64 rng_;
  std::uint64_t next_id_ = 0;
};

} // namespace lbsim::sim
