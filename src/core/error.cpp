/// @file error.cpp
/// @brief std::error_category implementation for lbsim::Errc.

#include "core/error.hpp"

#include <string>

namespace lbsim {

namespace {

class LbsimCategory final : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "lbsim";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<Errc>(ev)) {
    case Errc::capacity_exceeded:
      return "request exceeds the remaining server capacity";
    case Errc::policy_index_out_of_range:
      return "scheduling policy returned an out-of-range server index";
    case Errc::invalid_server_count:
      return "server count must be between 1 and the supported maximum";
    case Errc::unknown_policy:
      return "unknown scheduling policy name";
    case Errc::invalid_arrival_rate:
      return "arrival rate must be a positive finite number";
    case Errc::invalid_run_duration:
      return "run duration must be a positive finite number of seconds";
    case Errc::invalid_tick_interval:
      return "tick interval must be between 1 ms and one minute";
    case Errc::invalid_history_capacity:
      return "balance history capacity must be between 1 and 100000";
    case Errc::invalid_service_time:
      return "service time range must satisfy 0 < min <= max";
    case Errc::empty_request_catalog:
      return "request type catalog is empty";
    case Errc::invalid_request_demand:
      return "request type demand must lie in [0, 100]";
    case Errc::config_parse_error:
      return "malformed configuration document";
    case Errc::config_file_unreadable:
      return "configuration file could not be read";
    }
    return "unknown lbsim error";
  }
};

} // namespace

auto lbsim_category() noexcept -> const std::error_category & {
  static const LbsimCategory category;
  return category;
}

} // namespace lbsim
