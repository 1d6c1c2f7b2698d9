#pragma once

// pine/operations.hpp: Authorized operations and read-only queries over
// AnalyticsState.
//
// AUTHORIZATION (checked before any mutation):
//   add_monitored_app / update_app_config   add_application
//   remove_monitored_app                     remove_application
//   submit_event / submit_batch              capture_events
//   define_metric / update_metric            modify_metrics
//   assign_role / remove_role                manage_roles + can_manage(target)
//   update_rate_limit_config, pause_ingestion,
//   resume_ingestion, unblock_app            control_ingestion
//   admin_action                             configure_system
// Queries are not gated.
//
// SIDE CHANNELS:
//   Every single-event ingestion emits an IngestEvent. Role, ingestion
//   control, rate-limit and admin actions are appended to the global audit
//   log whether they succeed or not.

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pine/aggregation.hpp"
#include "pine/merkle.hpp"
#include "pine/rate_limiter.hpp"
#include "pine/rbac.hpp"
#include "pine/state.hpp"
#include "pine/types.hpp"

namespace pine {

struct OperationResult {
  Status status;
  std::optional<EventId> event_id;

  bool ok() const { return status.ok(); }
  std::string to_json() const;
};

enum class AdminActionType {
  pause_ingestion,
  resume_ingestion,
  set_rate_limit,
  clear_events,
  rebuild_merkle_index,
  transfer_super_admin,
};

std::string to_string(AdminActionType t);
std::optional<AdminActionType> admin_action_from_string(const std::string& s);

struct AdminAction {
  AdminActionType type{AdminActionType::pause_ingestion};
  // set_rate_limit
  uint64_t max_events_per_app_per_block{0};
  uint64_t max_total_events_per_block{0};
  // transfer_super_admin
  Owner new_admin;
};

// ---------------------------------------------------------------------------
// Mutating operations
// ---------------------------------------------------------------------------

// Inserts or replaces the configuration keyed by config.application_id.
OperationResult add_monitored_app(AnalyticsState& state, const Owner& caller, AppConfig config);
OperationResult remove_monitored_app(AnalyticsState& state, const Owner& caller,
                                     const ApplicationId& app_id);
// application_not_found if app_id is not monitored. The stored config's
// application_id is always app_id.
OperationResult update_app_config(AnalyticsState& state, const Owner& caller,
                                  const ApplicationId& app_id, AppConfig config);

OperationResult submit_event(AnalyticsState& state, const Owner& caller, CapturedEvent event);

// event_id is the last admitted id. status is batch_partial_failure when any
// item was rejected, with event_id still set if at least one was admitted.
OperationResult submit_batch(AnalyticsState& state, const Owner& caller,
                             std::vector<CapturedEvent> events);

// invalid_metric on an empty name.
OperationResult define_metric(AnalyticsState& state, const Owner& caller, MetricDefinition def);
// invalid_metric on an empty key.
OperationResult update_metric(AnalyticsState& state, const Owner& caller,
                              const MetricKey& key, MetricValue value);

OperationResult assign_role(AnalyticsState& state, const Owner& caller,
                            const Owner& target, rbac::Role role);
OperationResult remove_role(AnalyticsState& state, const Owner& caller, const Owner& target);

// invalid_configuration if the config fails validation.
OperationResult update_rate_limit_config(AnalyticsState& state, const Owner& caller,
                                         const RateLimitConfig& config);
OperationResult pause_ingestion(AnalyticsState& state, const Owner& caller);
OperationResult resume_ingestion(AnalyticsState& state, const Owner& caller);
// Succeeds whether or not the app was blocked.
OperationResult unblock_app(AnalyticsState& state, const Owner& caller, const ApplicationId& app_id);

OperationResult admin_action(AnalyticsState& state, const Owner& caller, const AdminAction& action);

// Supplied by the transport layer. Not gated.
void set_block_height(AnalyticsState& state, BlockHeight block);

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

struct TimeSeriesPoint {
  Timestamp timestamp{0};
  uint64_t count{0};  // events in [timestamp, timestamp + granularity)
};

// Upper bound on points returned by get_time_series.
inline constexpr size_t kMaxTimeSeriesPoints = 10000;

struct RbacInfo {
  Owner owner;
  rbac::Role role{rbac::Role::viewer};
  std::vector<rbac::Permission> permissions;

  std::string to_json() const;
};

struct SystemHealth {
  uint64_t total_events{0};        // lifetime, survives clear
  uint64_t stored_events{0};
  uint64_t total_applications{0};
  std::optional<Digest> merkle_root;
  bool rate_limit_enabled{true};
  bool ingestion_paused{false};
  BlockHeight current_block{0};

  std::string to_json() const;
};

// One analytics sample. event_id is set when the sample came from an event
// payload rather than a stored metric.
struct MetricSample {
  Timestamp timestamp{0};
  double value{0.0};
  std::optional<EventId> event_id;
};

// If a definition with a non-empty extraction path exists for metric, the
// numeric payload values at that path over events in range (timestamp
// order, app filter applied). Otherwise every stored metric whose key
// contains metric, in key order, stamped with its index.
std::vector<MetricSample> resolve_metric_samples(
    const AnalyticsState& state, const std::string& metric,
    const std::optional<TimeRange>& range = std::nullopt,
    const std::optional<std::vector<ApplicationId>>& app_filter = std::nullopt);

std::vector<AppConfig> get_monitored_applications(const AnalyticsState& state);
// Stored metrics whose key starts with app_id.
std::vector<std::pair<MetricKey, MetricValue>> get_application_metrics(
    const AnalyticsState& state, const ApplicationId& app_id);

std::vector<CapturedEvent> get_events(const AnalyticsState& state,
                                      const EventFilters& filters,
                                      const Pagination& pagination = Pagination{});
std::optional<CapturedEvent> get_event(const AnalyticsState& state, EventId id);
std::vector<CapturedEvent> get_app_events(const AnalyticsState& state, const ApplicationId& app_id);
std::vector<CapturedEvent> get_events_in_range(const AnalyticsState& state, const TimeRange& range);

// A zero granularity yields one point covering the whole range.
std::vector<TimeSeriesPoint> get_time_series(const AnalyticsState& state,
                                             const TimeRange& range,
                                             uint64_t granularity_ms);

aggregation::AggregatedResult query_aggregation(const AnalyticsState& state,
                                                const aggregation::AggregationQuery& query);
// One result per time bucket that holds at least one sample.
std::vector<aggregation::AggregatedResult> query_aggregation_series(
    const AnalyticsState& state, const aggregation::AggregationQuery& query);
aggregation::CorrelationMatrix query_correlation(const AnalyticsState& state,
                                                 const std::vector<std::string>& metrics,
                                                 const std::optional<TimeRange>& range = std::nullopt);
std::vector<aggregation::AnomalyEvent> query_anomalies(const AnalyticsState& state,
                                                       const std::string& metric,
                                                       double sensitivity,
                                                       const std::optional<TimeRange>& range = std::nullopt);
std::vector<aggregation::MovingAveragePoint> query_moving_average(
    const AnalyticsState& state, const std::string& metric, uint64_t window_size,
    const std::optional<TimeRange>& range = std::nullopt);

std::optional<MerkleProof> get_event_proof(const AnalyticsState& state, EventId id);
std::optional<BatchProof> get_batch_proof(const AnalyticsState& state,
                                          const std::vector<EventId>& ids, uint64_t batch_id);
bool verify_proof(const MerkleProof& proof, const Digest& expected_root);
std::optional<Digest> get_merkle_root(const AnalyticsState& state);

RateLimitStats get_rate_limit_stats(const AnalyticsState& state);
// Defaults to the super admin when owner is absent.
RbacInfo get_rbac_info(const AnalyticsState& state, const std::optional<Owner>& owner = std::nullopt);
SystemHealth get_system_health(const AnalyticsState& state);

}  // namespace pine
