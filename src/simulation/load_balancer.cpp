/// @file load_balancer.cpp
/// @brief Admission control, completion reclamation and tick sequencing.

#include "simulation/load_balancer.hpp"

#include "core/error.hpp"

#include <cmath>
#include <utility>

namespace lbsim::sim {

namespace {

// Absorbs accumulated rounding so e.g. ten ticks of 0.1 owe one arrival.
constexpr double kArrivalEpsilon = 1e-9;

// Decorrelates the policy's engine from the generator's when both are seeded.
auto derive_policy_seed(std::uint64_t seed) noexcept -> std::uint64_t {
  return seed != 0 ? seed ^ 0x9E3779B97F4A7C15ULL : 0;
}

} // namespace

// ─── Construction ───────────────────────────────────────────────────────

auto LoadBalancer::create(const SimConfig &cfg)
    -> std::expected<LoadBalancer, std::error_code> {
  if (auto ok = validate(cfg); !ok) {
    return std::unexpected(ok.error());
  }

  auto kind = parse_policy_kind(cfg.policy);
  if (!kind.has_value()) {
    return std::unexpected(kind.error());
  }

  auto generator = RequestGenerator::create(GeneratorConfig{
      .request_types = cfg.request_types,
      .min_service_ms = cfg.min_service_ms,
      .max_service_ms = cfg.max_service_ms,
      .seed = cfg.seed,
  });
  if (!generator.has_value()) {
    return std::unexpected(generator.error());
  }
  return LoadBalancer{cfg, make_policy(*kind, derive_policy_seed(cfg.seed)),
                      std::move(*generator)};
}

LoadBalancer::LoadBalancer(const SimConfig &cfg,
                           std::unique_ptr<SchedulingPolicy> policy,
                           RequestGenerator generator)
    : servers_(cfg.server_count), policy_{std::move(policy)},
      generator_{std::move(generator)},
      stats_{cfg.history_capacity}, seed_{cfg.seed},
      arrival_rate_{cfg.arrival_rate},
      tick_interval_ms_{cfg.tick_interval_ms} {}

// ─── Admission ──────────────────────────────────────────────────────────

auto LoadBalancer::submit(const Request &request)
    -> std::expected<std::size_t, std::error_code> {
  ++total_arrivals_;

  const auto index = policy_->select_server(servers_, request, cursor_);
  if (index >= servers_.size()) {
    ++total_rejected_;
    if (on_rejected_) {
      on_rejected_(request, index);
    }
    return std::unexpected(make_error_code(Errc::policy_index_out_of_range));
  }

  auto &server = servers_[index];
  if (!server.admit(request)) {
    server.record_rejection();
    ++total_rejected_;
    if (on_rejected_) {
      on_rejected_(request, index);
    }
    return std::unexpected(make_error_code(Errc::capacity_exceeded));
  }

  cursor_ = (index + 1) % servers_.size();
  ++total_admitted_;
  if (on_admitted_) {
    on_admitted_(request, index);
  }
  return index;
}

auto LoadBalancer::submit_generated()
    -> std::expected<std::size_t, std::error_code> {
  return submit(generator_.generate(now_ms_));
}

auto LoadBalancer::reclaim() -> std::size_t {
  std::size_t completed = 0;
  for (std::size_t i = 0; i < servers_.size(); ++i) {
    CompletionCallback notify;
    if (on_completed_) {
      notify = [this, i](const Request &r) { on_completed_(r, i); };
    }
    completed += servers_[i].reclaim_completed(now_ms_, notify);
  }
  total_completed_ += completed;
  return completed;
}

auto LoadBalancer::tick() -> TickReport {
  TickReport report;
  report.tick = ++tick_count_;

  now_ms_ += static_cast<double>(tick_interval_ms_);
  report.now_ms = now_ms_;

  // 1. Free capacity before any new admission test.
  report.completed = reclaim();

  // 2. Arrivals owed for this interval.
  arrival_credit_ +=
      arrival_rate_ * static_cast<double>(tick_interval_ms_) / 1000.0;
  const auto owed = std::floor(arrival_credit_ + kArrivalEpsilon);
  arrival_credit_ -= owed;
  for (auto i = static_cast<std::uint64_t>(owed); i > 0; --i) {
    if (submit_generated().has_value()) {
      ++report.admitted;
    } else {
      ++report.rejected;
    }
  }

  // 3. One sample per tick.
  report.stats = stats_.sample(servers_, now_ms_);
  return report;
}

// ─── Reconfiguration ────────────────────────────────────────────────────

auto LoadBalancer::set_server_count(std::size_t n)
    -> std::expected<void, std::error_code> {
  if (n == 0 || n > SimConfig::kMaxServers) {
    return std::unexpected(make_error_code(Errc::invalid_server_count));
  }
  servers_.assign(n, Server{});
  cursor_ = 0;
  return {};
}

auto LoadBalancer::set_policy(std::string_view name)
    -> std::expected<void, std::error_code> {
  auto policy = make_policy(name, derive_policy_seed(seed_));
  if (!policy.has_value()) {
    return std::unexpected(policy.error());
  }
  policy_ = std::move(*policy);
  return {};
}

void LoadBalancer::set_policy(std::unique_ptr<SchedulingPolicy> policy) {
  if (policy) {
    policy_ = std::move(policy);
  }
}

auto LoadBalancer::set_arrival_rate(double rate)
    -> std::expected<void, std::error_code> {
  if (!std::isfinite(rate) || rate <= 0.0) {
    return std::unexpected(make_error_code(Errc::invalid_arrival_rate));
  }
  arrival_rate_ = rate;
  return {};
}

void LoadBalancer::reset() {
  for (auto &server : servers_) {
    server.reset();
  }
  generator_.reset();
  stats_.clear();
  cursor_ = 0;
  now_ms_ = 0.0;
  arrival_credit_ = 0.0;
  tick_count_ = 0;
  total_arrivals_ = 0;
  total_admitted_ = 0;
  total_rejected_ = 0;
  total_completed_ = 0;
}

auto LoadBalancer::reset_to(const SimConfig &initial)
    -> std::expected<void, std::error_code> {
  if (auto ok = validate(initial); !ok) {
    return std::unexpected(ok.error());
  }
  if (auto ok = set_server_count(initial.server_count); !ok) {
    return ok;
  }
  if (auto ok = set_policy(initial.policy); !ok) {
    return ok;
  }
  if (auto ok = set_arrival_rate(initial.arrival_rate); !ok) {
    return ok;
  }
  reset();
  return {};
}

// ─── Queries ────────────────────────────────────────────────────────────

auto LoadBalancer::server_snapshot() const -> std::vector<ServerSnapshot> {
  std::vector<ServerSnapshot> out;
  out.reserve(servers_.size());
  for (const auto &server : servers_) {
    out.push_back(server.snapshot());
  }
  return out;
}

auto LoadBalancer::balance_history() const -> std::vector<BalanceSample> {
  return stats_.history();
}

} // namespace lbsim::sim
