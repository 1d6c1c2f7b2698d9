#pragma once

// pine/state.hpp: The single mutable context every operation runs against.
//
// OWNERSHIP:
//   AnalyticsState owns every subsystem by value. Operations receive it by
//   reference; there is no ambient global state besides the process-wide
//   observability sinks and audit log.
//
// CONCURRENCY:
//   Single writer. One operation is fully applied before the next begins.
//   Concurrent readers are safe only against a state no one is mutating.

#include <cstdint>
#include <map>
#include <string>

#include "pine/event_store.hpp"
#include "pine/rate_limiter.hpp"
#include "pine/rbac.hpp"
#include "pine/types.hpp"

namespace pine {

struct AnalyticsState {
  AnalyticsState() = default;
  explicit AnalyticsState(const Owner& super_admin,
                          const RateLimitConfig& rate_limits = RateLimitConfig{},
                          uint32_t merkle_depth = 16)
      : admin_owner(super_admin),
        store(merkle_depth),
        rbac(super_admin),
        rate_limiter(rate_limits),
        merkle_depth(merkle_depth) {}

  std::map<ApplicationId, AppConfig> monitored_applications;
  Owner admin_owner;
  EventStore store;
  std::map<MetricKey, MetricValue> aggregated_metrics;
  std::map<std::string, MetricDefinition> metric_definitions;
  rbac::RbacState rbac;
  RateLimiter rate_limiter;
  BlockHeight current_block{0};
  uint32_t merkle_depth{16};
};

}  // namespace pine
