#pragma once
/// @file sim_config.hpp
/// @brief Simulation configuration: defaults, JSON loading, validation.
///
/// Sources are layered: built-in defaults, then an optional JSON file
/// (apply_json), then CLI flags applied by the caller. validate() must pass
/// before a LoadBalancer is built from the result.

#include "core/request.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <system_error>
#include <vector>

namespace lbsim {

/// @brief Live visualization server settings.
struct ServerOptions {
  bool enabled = false;
  unsigned short port = 8080;
  std::string web_root = "web";
};

/// @brief Every knob of a simulation run.
struct SimConfig {
  static constexpr std::size_t kMaxServers = 64;
  static constexpr std::size_t kMaxTickIntervalMs = 60'000;
  static constexpr std::size_t kMaxHistoryCapacity = 100'000;

  double arrival_rate = 1.0; ///< Requests per simulated second.
  std::size_t server_count = 4;
  std::string policy = "round-robin";
  double run_duration_s = 60.0;
  std::size_t tick_interval_ms = 100;
  std::size_t history_capacity = 50;
  double min_service_ms = 1.0;
  double max_service_ms = 500.0;
  std::uint64_t seed = 0; ///< 0 = nondeterministic.
  std::vector<RequestType> request_types = default_request_types();
  bool realtime = false; ///< Pace ticks to wall-clock time.
  ServerOptions server{};
};

/// @brief Check every field.
/// @return The first violation found, as an lbsim::Errc code.
[[nodiscard]] auto validate(const SimConfig &cfg)
    -> std::expected<void, std::error_code>;

/// @brief Overlay the keys present in @p j onto @p cfg. Absent keys keep
///        their current value. Type mismatches yield config_parse_error.
[[nodiscard]] auto apply_json(SimConfig &cfg, const nlohmann::json &j)
    -> std::expected<void, std::error_code>;

/// @brief Parse @p text as JSON and overlay it onto the defaults.
[[nodiscard]] auto parse_config(const std::string &text)
    -> std::expected<SimConfig, std::error_code>;

/// @brief Parse an unsigned CLI value. Unlike std::stoull a leading '-' is
///        refused instead of wrapping.
/// @throws std::invalid_argument, std::out_of_range
[[nodiscard]] auto parse_unsigned_arg(const std::string &text) -> std::uint64_t;

/// @brief Parse a TCP port (0-65535).
/// @throws std::invalid_argument, std::out_of_range
[[nodiscard]] auto parse_port_arg(const std::string &text) -> unsigned short;

/// @brief Read and parse a JSON configuration file.
[[nodiscard]] auto load_config(const std::string &path)
    -> std::expected<SimConfig, std::error_code>;

} // namespace lbsim
