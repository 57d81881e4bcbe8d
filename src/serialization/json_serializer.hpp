#pragma once
/// @file json_serializer.hpp
/// @brief nlohmann/json serialization for snapshots, samples and tick reports.

#include "core/request.hpp"
#include "core/server.hpp"
#include "simulation/load_balancer.hpp"
#include "stats/statistics.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace lbsim {

inline void to_json(nlohmann::json &j, const Stats &s) {
  j = nlohmann::json{
      {"mean", s.mean}, {"variance", s.variance}, {"std_dev", s.std_dev},
      {"min", s.min},   {"max", s.max},
  };
}

inline void to_json(nlohmann::json &j, const ServerSnapshot &s) {
  j = nlohmann::json{
      {"cpu_load", s.cpu_load},
      {"memory_load", s.memory_load},
      {"active_count", s.active_count},
      {"avg_response_time_ms", s.avg_response_time_ms},
      {"rejected_count", s.rejected_count},
      {"completed_count", s.completed_count},
  };
}

inline void to_json(nlohmann::json &j, const BalanceSample &b) {
  j = nlohmann::json{
      {"timestamp_ms", b.timestamp_ms},
      {"cpu_balance", b.cpu_balance},
      {"memory_balance", b.memory_balance},
  };
}

inline void to_json(nlohmann::json &j, const LoadStatistics &l) {
  j = nlohmann::json{
      {"cpu", l.cpu},
      {"memory", l.memory},
      {"cpu_balance", l.cpu_balance},
      {"memory_balance", l.memory_balance},
  };
}

inline void to_json(nlohmann::json &j, const Request &r) {
  j = nlohmann::json{
      {"id", r.id},
      {"type", r.type},
      {"cpu_demand", r.cpu_demand},
      {"memory_demand", r.memory_demand},
      {"service_duration_ms", r.service_duration_ms},
      {"arrival_time_ms", r.arrival_time_ms},
  };
}

inline void to_json(nlohmann::json &j, const RequestType &t) {
  j = nlohmann::json{{"name", t.name}, {"cpu", t.cpu}, {"memory", t.memory}};
}

/// @brief A single request lifecycle event ("admitted", "rejected",
///        "completed").
inline auto request_event_to_json(std::string_view kind, const Request &r,
                                  std::size_t server_index) -> nlohmann::json {
  nlohmann::json j;
  j["type"] = "request";
  j["event"] = std::string{kind};
  j["server"] = server_index;
  j["request"] = r;
  return j;
}

/// @brief Per-tick update broadcast to live clients.
inline auto tick_to_json(const sim::TickReport &report,
                         const sim::LoadBalancer &lb) -> nlohmann::json {
  nlohmann::json j;
  j["type"] = "tick";
  j["tick"] = report.tick;
  j["now_ms"] = report.now_ms;
  j["completed"] = report.completed;
  j["admitted"] = report.admitted;
  j["rejected"] = report.rejected;
  j["stats"] = report.stats;
  j["total_rejected"] = lb.total_rejected();
  j["servers"] = lb.server_snapshot();
  return j;
}

/// @brief Full state for initial client sync.
inline auto snapshot_to_json(const sim::LoadBalancer &lb) -> nlohmann::json {
  nlohmann::json j;
  j["type"] = "snapshot";
  j["policy"] = to_string(lb.policy_kind());
  j["arrival_rate"] = lb.arrival_rate();
  j["now_ms"] = lb.now_ms();
  j["tick_interval_ms"] = lb.tick_interval_ms();
  j["total_arrivals"] = lb.total_arrivals();
  j["total_admitted"] = lb.total_admitted();
  j["total_rejected"] = lb.total_rejected();
  j["total_completed"] = lb.total_completed();
  j["request_types"] = lb.request_types();
  j["servers"] = lb.server_snapshot();
  j["stats"] = lb.latest_stats();
  j["balance_history"] = lb.balance_history();
  return j;
}

/// @brief Error notification for a rejected control command.
inline auto error_to_json(std::string_view command, std::string_view message)
    -> nlohmann::json {
  return nlohmann::json{
      {"type", "error"},
      {"command", std::string{command}},
      {"message", std::string{message}}};
}

} // namespace lbsim
