/// @file server.cpp
/// @brief Implementation of the capacity-bounded Server.

#include "core/server.hpp"

#include <algorithm>

namespace lbsim {

auto Server::current_load() const noexcept -> Load {
  Load load;
  for (const auto &r : active_) {
    load.cpu += r.cpu_demand;
    load.memory += r.memory_demand;
  }
  return load;
}

auto Server::can_admit(const Request &req) const noexcept -> bool {
  const auto load = current_load();
  return load.cpu + req.cpu_demand <= kCapacityCpu &&
         load.memory + req.memory_demand <= kCapacityMemory;
}

auto Server::admit(const Request &req) -> bool {
  if (!can_admit(req)) {
    return false;
  }
  active_.push_back(req);
  return true;
}

auto Server::reclaim_completed(double now_ms,
                               const CompletionCallback &on_complete)
    -> std::size_t {
  std::size_t done = 0;
  for (const auto &r : active_) {
    if (!r.is_complete(now_ms))
      continue;
    ++done;
    ++completed_count_;
    cumulative_response_ms_ += r.service_duration_ms;
    if (on_complete) {
      on_complete(r);
    }
  }
  if (done > 0) {
    std::erase_if(active_,
                  [now_ms](const Request &r) { return r.is_complete(now_ms); });
  }
  return done;
}

void Server::reset() noexcept {
  active_.clear();
  completed_count_ = 0;
  cumulative_response_ms_ = 0.0;
  rejected_count_ = 0;
}

auto Server::average_response_time_ms() const noexcept -> double {
  if (completed_count_ == 0)
    return 0.0;
  return cumulative_response_ms_ / static_cast<double>(completed_count_);
}

auto Server::snapshot() const noexcept -> ServerSnapshot {
  const auto load = current_load();
  return ServerSnapshot{
      .cpu_load = load.cpu,
      .memory_load = load.memory,
      .active_count = active_.size(),
      .avg_response_time_ms = average_response_time_ms(),
      .rejected_count = rejected_count_,
      .completed_count = completed_count_,
  };
}

} // namespace lbsim
