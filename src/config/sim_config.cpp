/// @file sim_config.cpp
/// @brief Validation and JSON loading for SimConfig.

#include "config/sim_config.hpp"

#include "core/error.hpp"
#include "scheduling/policy.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace lbsim {

namespace {

auto fail(Errc e) -> std::unexpected<std::error_code> {
  return std::unexpected(make_error_code(e));
}

auto valid_demand(double v) -> bool {
  return std::isfinite(v) && v >= 0.0 && v <= 100.0;
}

} // namespace

auto validate(const SimConfig &cfg) -> std::expected<void, std::error_code> {
  if (cfg.server_count == 0 || cfg.server_count > SimConfig::kMaxServers)
    return fail(Errc::invalid_server_count);
  if (!parse_policy_kind(cfg.policy).has_value())
    return fail(Errc::unknown_policy);
  if (!std::isfinite(cfg.arrival_rate) || cfg.arrival_rate <= 0.0)
    return fail(Errc::invalid_arrival_rate);
  if (!std::isfinite(cfg.run_duration_s) || cfg.run_duration_s <= 0.0)
    return fail(Errc::invalid_run_duration);
  if (cfg.tick_interval_ms == 0 ||
      cfg.tick_interval_ms > SimConfig::kMaxTickIntervalMs)
    return fail(Errc::invalid_tick_interval);
  if (cfg.history_capacity == 0 ||
      cfg.history_capacity > SimConfig::kMaxHistoryCapacity)
    return fail(Errc::invalid_history_capacity);
  if (!std::isfinite(cfg.min_service_ms) || !std::isfinite(cfg.max_service_ms) ||
      cfg.min_service_ms <= 0.0 || cfg.min_service_ms > cfg.max_service_ms)
    return fail(Errc::invalid_service_time);
  if (cfg.request_types.empty())
    return fail(Errc::empty_request_catalog);
  for (const auto &t : cfg.request_types) {
    if (!valid_demand(t.cpu) || !valid_demand(t.memory))
      return fail(Errc::invalid_request_demand);
  }
  return {};
}

auto apply_json(SimConfig &cfg, const nlohmann::json &j)
    -> std::expected<void, std::error_code> {
  if (!j.is_object()) {
    return fail(Errc::config_parse_error);
  }

  try {
    cfg.arrival_rate = j.value("arrival_rate", cfg.arrival_rate);
    cfg.server_count = j.value("server_count", cfg.server_count);
    cfg.policy = j.value("policy", cfg.policy);
    cfg.run_duration_s = j.value("run_duration_s", cfg.run_duration_s);
    cfg.tick_interval_ms = j.value("tick_interval_ms", cfg.tick_interval_ms);
    cfg.history_capacity = j.value("history_capacity", cfg.history_capacity);
    cfg.seed = j.value("seed", cfg.seed);
    cfg.realtime = j.value("realtime", cfg.realtime);

    if (j.contains("service_time_ms")) {
      const auto &st = j.at("service_time_ms");
      cfg.min_service_ms = st.value("min", cfg.min_service_ms);
      cfg.max_service_ms = st.value("max", cfg.max_service_ms);
    }

    if (j.contains("request_types")) {
      std::vector<RequestType> types;
      for (const auto &t : j.at("request_types")) {
        types.push_back(RequestType{
            .name = t.value("name", std::string{"type"} +
                                        std::to_string(types.size())),
            .cpu = t.at("cpu").get<double>(),
            .memory = t.at("memory").get<double>(),
        });
      }
      cfg.request_types = std::move(types);
    }

    if (j.contains("server")) {
      const auto &s = j.at("server");
      cfg.server.enabled = s.value("enabled", cfg.server.enabled);
      cfg.server.port = s.value("port", cfg.server.port);
      cfg.server.web_root = s.value("web_root", cfg.server.web_root);
    }
  } catch (const nlohmann::json::exception &) {
    return fail(Errc::config_parse_error);
  }
  return {};
}

auto parse_config(const std::string &text)
    -> std::expected<SimConfig, std::error_code> {
  auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    return fail(Errc::config_parse_error);
  }

  SimConfig cfg;
  if (auto applied = apply_json(cfg, j); !applied) {
    return std::unexpected(applied.error());
  }
  return cfg;
}

auto parse_unsigned_arg(const std::string &text) -> std::uint64_t {
  const auto first = text.find_first_not_of(" \t");
  if (first != std::string::npos && text[first] == '-') {
    throw std::invalid_argument("negative value '" + text + "'");
  }
  std::size_t used = 0;
  const auto value = std::stoull(text, &used);
  if (used != text.size()) {
    throw std::invalid_argument("trailing characters in '" + text + "'");
  }
  return value;
}

auto parse_port_arg(const std::string &text) -> unsigned short {
  const auto value = parse_unsigned_arg(text);
  if (value > std::numeric_limits<unsigned short>::max()) {
    throw std::out_of_range("port " + text + " exceeds 65535");
  }
  return static_cast<unsigned short>(value);
}

auto load_config(const std::string &path)
    -> std::expected<SimConfig, std::error_code> {
  std::ifstream file(path);
  if (!file) {
    return fail(Errc::config_file_unreadable);
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  return parse_config(ss.str());
}

} // namespace lbsim
