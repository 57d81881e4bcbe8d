/// @file request_generator.cpp
/// @brief Request generator implementation.

#include "simulation/request_generator.hpp"

#include "core/error.hpp"

#include <cmath>
#include <utility>

namespace lbsim::sim {

auto RequestGenerator::create(GeneratorConfig cfg)
    -> std::expected<RequestGenerator, std::error_code> {
  if (cfg.request_types.empty()) {
    return std::unexpected(make_error_code(Errc::empty_request_catalog));
  }
  if (!std::isfinite(cfg.min_service_ms) || !std::isfinite(cfg.max_service_ms) ||
      cfg.min_service_ms <= 0.0 || cfg.min_service_ms > cfg.max_service_ms) {
    return std::unexpected(make_error_code(Errc::invalid_service_time));
  }
  return RequestGenerator{std::move(cfg)};
}

RequestGenerator::RequestGenerator(GeneratorConfig cfg)
    : cfg_{std::move(cfg)},
      rng_{cfg_.seed != 0 ? cfg_.seed : std::random_device{}()} {}

auto RequestGenerator::generate(double now_ms) -> Request {
  std::uniform_int_distribution<std::size_t> type_dist(
      0, cfg_.request_types.size() - 1);
  const auto type = type_dist(rng_);
  const auto &entry = cfg_.request_types[type];

  double duration = cfg_.min_service_ms;
  if (cfg_.max_service_ms > cfg_.min_service_ms) {
    std::uniform_real_distribution<double> dur_dist(cfg_.min_service_ms,
                                                    cfg_.max_service_ms);
    duration = dur_dist(rng_);
  }

  return Request{
      .id = next_id_++,
      .type = type,
      .cpu_demand = entry.cpu,
      .memory_demand = entry.memory,
      .service_duration_ms = duration,
      .arrival_time_ms = now_ms,
  };
}

} // namespace lbsim::sim
