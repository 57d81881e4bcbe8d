#pragma once
/// @file error.hpp
/// @brief Error codes for admission outcomes and configuration failures.
///
/// All fallible operations return std::expected<T, std::error_code>; the
/// codes below live in their own "lbsim" category so callers can compare
/// against lbsim::Errc values directly.

#include <system_error>
#include <type_traits>

namespace lbsim {

enum class Errc : int {
  // Admission outcomes (non-fatal, expected under load).
  capacity_exceeded = 1,
  policy_index_out_of_range,

  // Configuration errors.
  invalid_server_count,
  unknown_policy,
  invalid_arrival_rate,
  invalid_run_duration,
  invalid_tick_interval,
  invalid_history_capacity,
  invalid_service_time,
  empty_request_catalog,
  invalid_request_demand,
  config_parse_error,
  config_file_unreadable,
};

/// @brief The category singleton for lbsim::Errc.
[[nodiscard]] auto lbsim_category() noexcept -> const std::error_category &;

[[nodiscard]] inline auto make_error_code(Errc e) noexcept -> std::error_code {
  return {static_cast<int>(e), lbsim_category()};
}

} // namespace lbsim

template <> struct std::is_error_code_enum<lbsim::Errc> : std::true_type {};

namespace lbsim {

/// @brief True for the two codes that represent a rejected request.
[[nodiscard]] inline auto is_rejection(const std::error_code &ec) noexcept
    -> bool {
  return ec == Errc::capacity_exceeded || ec == Errc::policy_index_out_of_range;
}

} // namespace lbsim
