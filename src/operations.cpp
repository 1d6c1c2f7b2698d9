#include "pine/operations.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <limits>
#include <sstream>

#include "pine/audit.hpp"
#include "pine/hash.hpp"
#include "pine/jsonlite.hpp"
#include "pine/observability.hpp"

namespace pine {

namespace {

OperationResult fail(ErrorCode code, std::string detail = "") {
  OperationResult r;
  r.status = Status::failure(code, std::move(detail));
  return r;
}

OperationResult done(std::optional<EventId> id = std::nullopt) {
  OperationResult r;
  r.event_id = id;
  return r;
}

OperationResult from_status(Status s) {
  OperationResult r;
  r.status = std::move(s);
  return r;
}

// Returns a populated failure when the caller lacks the permission.
std::optional<OperationResult> require(const AnalyticsState& state, const Owner& caller,
                                       rbac::Permission permission) {
  const rbac::RbacContext ctx = state.rbac.check(caller, permission);
  if (ctx.ok) return std::nullopt;
  return fail(ErrorCode::unauthorized, ctx.denial_reason);
}

// Audit append never fails the operation; a lost entry is surfaced as a
// diagnostic instead.
void audit(const AnalyticsState& state, const Owner& caller, const std::string& action,
           const std::string& target, const OperationResult& result) {
  AdminRecord rec;
  rec.actor = caller;
  rec.action = action;
  rec.target = target;
  rec.ok = result.ok();
  rec.error_code = to_string(result.status.code);
  rec.block = state.current_block;
  if (!global_audit_log().append(rec)) {
    emit_diagnostic("audit", "failed to append " + action + " entry");
  }
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool contains_id(const std::vector<ApplicationId>& ids, const ApplicationId& id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

bool matches(const CapturedEvent& e, const EventFilters& f, const std::string& needle) {
  if (f.application_ids && !contains_id(*f.application_ids, e.source_app)) return false;
  if (f.event_types &&
      std::find(f.event_types->begin(), f.event_types->end(), e.event_type) ==
          f.event_types->end()) {
    return false;
  }
  if (f.time_range && !f.time_range->contains(e.timestamp)) return false;
  if (f.severity && *f.severity != e.severity) return false;
  if (!needle.empty() && lower(jsonlite::to_json(e.data)).find(needle) == std::string::npos) {
    return false;
  }
  return true;
}

// Persisted metrics must survive a JSON round trip, which has no NaN or inf.
bool all_finite(const MetricValue& value) {
  if (const auto* g = std::get_if<GaugeValue>(&value)) return std::isfinite(g->value);
  if (const auto* h = std::get_if<HistogramValue>(&value)) {
    return std::all_of(h->samples.begin(), h->samples.end(),
                       [](double d) { return std::isfinite(d); });
  }
  if (const auto* sm = std::get_if<SummaryValue>(&value)) {
    return std::isfinite(sm->sum) && std::isfinite(sm->avg);
  }
  return true;
}

aggregation::Series to_series(const std::vector<MetricSample>& samples) {
  aggregation::Series s;
  s.reserve(samples.size());
  for (const auto& m : samples) s.emplace_back(m.timestamp, m.value);
  return s;
}

std::vector<double> to_values(const std::vector<MetricSample>& samples) {
  std::vector<double> v;
  v.reserve(samples.size());
  for (const auto& m : samples) v.push_back(m.value);
  return v;
}

}  // namespace

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

std::string OperationResult::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok() ? "true" : "false");
  if (event_id) o << ",\"event_id\":" << *event_id;
  if (!ok()) {
    o << ",\"error_code\":\"" << to_string(status.code) << "\"";
    if (!status.detail.empty()) o << ",\"detail\":\"" << jsonlite::escape(status.detail) << "\"";
  }
  o << "}";
  return o.str();
}

std::string RbacInfo::to_json() const {
  std::ostringstream o;
  o << "{\"owner\":\"" << jsonlite::escape(owner) << "\""
    << ",\"role\":\"" << rbac::role_to_string(role) << "\""
    << ",\"permissions\":[";
  for (size_t i = 0; i < permissions.size(); ++i) {
    if (i) o << ",";
    o << "\"" << rbac::permission_to_string(permissions[i]) << "\"";
  }
  o << "]}";
  return o.str();
}

std::string SystemHealth::to_json() const {
  std::ostringstream o;
  o << "{\"total_events\":" << total_events
    << ",\"stored_events\":" << stored_events
    << ",\"total_applications\":" << total_applications
    << ",\"merkle_root\":";
  if (merkle_root) {
    o << "\"" << digest_to_hex(*merkle_root) << "\"";
  } else {
    o << "null";
  }
  o << ",\"rate_limit_enabled\":" << (rate_limit_enabled ? "true" : "false")
    << ",\"ingestion_paused\":" << (ingestion_paused ? "true" : "false")
    << ",\"current_block\":" << current_block
    << "}";
  return o.str();
}

std::string to_string(AdminActionType t) {
  switch (t) {
    case AdminActionType::pause_ingestion:      return "pause_ingestion";
    case AdminActionType::resume_ingestion:     return "resume_ingestion";
    case AdminActionType::set_rate_limit:       return "set_rate_limit";
    case AdminActionType::clear_events:         return "clear_events";
    case AdminActionType::rebuild_merkle_index: return "rebuild_merkle_index";
    case AdminActionType::transfer_super_admin: return "transfer_super_admin";
  }
  return "unknown";
}

std::optional<AdminActionType> admin_action_from_string(const std::string& s) {
  if (s == "pause_ingestion") return AdminActionType::pause_ingestion;
  if (s == "resume_ingestion") return AdminActionType::resume_ingestion;
  if (s == "set_rate_limit") return AdminActionType::set_rate_limit;
  if (s == "clear_events") return AdminActionType::clear_events;
  if (s == "rebuild_merkle_index") return AdminActionType::rebuild_merkle_index;
  if (s == "transfer_super_admin") return AdminActionType::transfer_super_admin;
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Application management
// ---------------------------------------------------------------------------

OperationResult add_monitored_app(AnalyticsState& state, const Owner& caller, AppConfig config) {
  if (auto denied = require(state, caller, rbac::Permission::add_application)) return *denied;
  if (config.application_id.empty()) {
    return fail(ErrorCode::invalid_configuration, "application_id must not be empty");
  }
  const ApplicationId id = config.application_id;
  state.monitored_applications[id] = std::move(config);
  return done();
}

OperationResult remove_monitored_app(AnalyticsState& state, const Owner& caller,
                                     const ApplicationId& app_id) {
  if (auto denied = require(state, caller, rbac::Permission::remove_application)) return *denied;
  if (state.monitored_applications.erase(app_id) == 0) {
    return fail(ErrorCode::application_not_found, app_id);
  }
  return done();
}

OperationResult update_app_config(AnalyticsState& state, const Owner& caller,
                                  const ApplicationId& app_id, AppConfig config) {
  if (auto denied = require(state, caller, rbac::Permission::add_application)) return *denied;
  auto it = state.monitored_applications.find(app_id);
  if (it == state.monitored_applications.end()) {
    return fail(ErrorCode::application_not_found, app_id);
  }
  config.application_id = app_id;
  it->second = std::move(config);
  return done();
}

// ---------------------------------------------------------------------------
// Ingestion
// ---------------------------------------------------------------------------

OperationResult submit_event(AnalyticsState& state, const Owner& caller, CapturedEvent event) {
  IngestEvent ev;
  ev.source_app = event.source_app;
  ev.transaction_hash = event.transaction_hash;
  ev.block = state.current_block;

  if (auto denied = require(state, caller, rbac::Permission::capture_events)) {
    ev.error = ErrorCode::unauthorized;
    emit_ingest_event(ev);
    return *denied;
  }

  IngestResult result;
  {
    ScopeTimer timer(ev.duration_ns);
    result = state.store.ingest(std::move(event), state.rate_limiter, state.current_block);
  }
  ev.ok = result.ok();
  ev.error = result.status.code;
  if (result.ok()) ev.event_id = result.event_id;
  emit_ingest_event(ev);

  if (!result.ok()) return from_status(result.status);
  return done(result.event_id);
}

OperationResult submit_batch(AnalyticsState& state, const Owner& caller,
                             std::vector<CapturedEvent> events) {
  if (auto denied = require(state, caller, rbac::Permission::capture_events)) {
    for (const auto& e : events) {
      IngestEvent ev;
      ev.source_app = e.source_app;
      ev.transaction_hash = e.transaction_hash;
      ev.block = state.current_block;
      ev.batch = true;
      ev.error = ErrorCode::unauthorized;
      emit_ingest_event(ev);
    }
    return *denied;
  }

  // Items are timed back to back: each duration runs from the previous
  // observer call (or batch start) to this one.
  auto item_start = std::chrono::steady_clock::now();
  const BlockHeight block = state.current_block;
  const BatchItemObserver observer = [&](size_t index, const CapturedEvent& input,
                                         const IngestResult& result) {
    const auto now = std::chrono::steady_clock::now();
    IngestEvent ev;
    ev.source_app = input.source_app;
    ev.transaction_hash = input.transaction_hash;
    ev.block = block;
    ev.batch = true;
    ev.duration_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(now - item_start).count());
    ev.ok = result.ok();
    ev.error = result.status.code;
    if (result.ok()) ev.event_id = result.event_id;
    emit_ingest_event(ev);
    if (!result.ok()) {
      emit_diagnostic("batch_item",
                      "item " + std::to_string(index) + " rejected: " + result.status.detail);
    }
    item_start = now;
  };

  BatchIngestResult batch =
      state.store.ingest_batch(std::move(events), state.rate_limiter, block, observer);

  OperationResult r;
  r.status = std::move(batch.status);
  r.event_id = batch.last_event_id;
  return r;
}

// ---------------------------------------------------------------------------
// Metrics
// ---------------------------------------------------------------------------

OperationResult define_metric(AnalyticsState& state, const Owner& caller, MetricDefinition def) {
  if (auto denied = require(state, caller, rbac::Permission::modify_metrics)) return *denied;
  if (def.name.empty()) return fail(ErrorCode::invalid_metric, "metric name must not be empty");
  const std::string name = def.name;
  state.metric_definitions[name] = std::move(def);
  return done();
}

OperationResult update_metric(AnalyticsState& state, const Owner& caller,
                              const MetricKey& key, MetricValue value) {
  if (auto denied = require(state, caller, rbac::Permission::modify_metrics)) return *denied;
  if (key.empty()) return fail(ErrorCode::invalid_metric, "metric key must not be empty");
  if (!all_finite(value)) return fail(ErrorCode::invalid_metric, "metric values must be finite: " + key);
  state.aggregated_metrics[key] = std::move(value);
  return done();
}

// ---------------------------------------------------------------------------
// Roles
// ---------------------------------------------------------------------------

OperationResult assign_role(AnalyticsState& state, const Owner& caller,
                            const Owner& target, rbac::Role role) {
  OperationResult r;
  if (auto denied = require(state, caller, rbac::Permission::manage_roles)) {
    r = *denied;
  } else if (!state.rbac.can_manage(caller, target)) {
    r = fail(ErrorCode::unauthorized, caller + " cannot manage " + target);
  } else if (role > state.rbac.get_role(caller)) {
    r = fail(ErrorCode::unauthorized,
             "role ceiling: " + caller + " cannot grant " + rbac::role_to_string(role) +
                 " above its own role " + rbac::role_to_string(state.rbac.get_role(caller)));
  } else {
    r = from_status(state.rbac.assign_role(target, role));
  }
  audit(state, caller, "assign_role:" + rbac::role_to_string(role), target, r);
  return r;
}

OperationResult remove_role(AnalyticsState& state, const Owner& caller, const Owner& target) {
  OperationResult r;
  if (auto denied = require(state, caller, rbac::Permission::manage_roles)) {
    r = *denied;
  } else if (!state.rbac.can_manage(caller, target)) {
    r = fail(ErrorCode::unauthorized, caller + " cannot manage " + target);
  } else {
    r = from_status(state.rbac.remove_role(target));
  }
  audit(state, caller, "remove_role", target, r);
  return r;
}

// ---------------------------------------------------------------------------
// Ingestion control
// ---------------------------------------------------------------------------

OperationResult update_rate_limit_config(AnalyticsState& state, const Owner& caller,
                                         const RateLimitConfig& config) {
  OperationResult r;
  if (auto denied = require(state, caller, rbac::Permission::control_ingestion)) {
    r = *denied;
  } else {
    r = from_status(state.rate_limiter.update_config(config));
  }
  audit(state, caller, "update_rate_limit_config", "", r);
  return r;
}

OperationResult pause_ingestion(AnalyticsState& state, const Owner& caller) {
  OperationResult r;
  if (auto denied = require(state, caller, rbac::Permission::control_ingestion)) {
    r = *denied;
  } else {
    state.rate_limiter.pause();
  }
  audit(state, caller, "pause_ingestion", "", r);
  return r;
}

OperationResult resume_ingestion(AnalyticsState& state, const Owner& caller) {
  OperationResult r;
  if (auto denied = require(state, caller, rbac::Permission::control_ingestion)) {
    r = *denied;
  } else {
    state.rate_limiter.resume();
  }
  audit(state, caller, "resume_ingestion", "", r);
  return r;
}

OperationResult unblock_app(AnalyticsState& state, const Owner& caller, const ApplicationId& app_id) {
  OperationResult r;
  if (auto denied = require(state, caller, rbac::Permission::control_ingestion)) {
    r = *denied;
  } else {
    state.rate_limiter.unblock_app(app_id);  // not being blocked is fine
  }
  audit(state, caller, "unblock_app", app_id, r);
  return r;
}

OperationResult admin_action(AnalyticsState& state, const Owner& caller, const AdminAction& action) {
  const std::string name = to_string(action.type);
  std::string target;
  OperationResult r;

  if (auto denied = require(state, caller, rbac::Permission::configure_system)) {
    r = *denied;
  } else {
    switch (action.type) {
      case AdminActionType::pause_ingestion:
        state.rate_limiter.pause();
        break;
      case AdminActionType::resume_ingestion:
        state.rate_limiter.resume();
        break;
      case AdminActionType::set_rate_limit: {
        RateLimitConfig cfg = state.rate_limiter.config();
        cfg.max_events_per_app_per_block = action.max_events_per_app_per_block;
        cfg.max_total_events_per_block = action.max_total_events_per_block;
        r = from_status(state.rate_limiter.update_config(cfg));
        break;
      }
      case AdminActionType::clear_events:
        emit_diagnostic("admin", "clearing " + std::to_string(state.store.events().size()) +
                                     " stored events");
        state.store.clear();
        break;
      case AdminActionType::rebuild_merkle_index:
        state.store.rebuild_merkle();
        break;
      case AdminActionType::transfer_super_admin:
        target = action.new_admin;
        if (action.new_admin.empty()) {
          r = fail(ErrorCode::invalid_configuration, "new admin must not be empty");
          break;
        }
        // The previous role table does not survive the transfer.
        state.admin_owner = action.new_admin;
        state.rbac = rbac::RbacState(action.new_admin);
        break;
    }
  }
  audit(state, caller, name, target, r);
  return r;
}

void set_block_height(AnalyticsState& state, BlockHeight block) { state.current_block = block; }

// ---------------------------------------------------------------------------
// Sample resolution
// ---------------------------------------------------------------------------

std::vector<MetricSample> resolve_metric_samples(
    const AnalyticsState& state, const std::string& metric,
    const std::optional<TimeRange>& range,
    const std::optional<std::vector<ApplicationId>>& app_filter) {
  std::vector<MetricSample> out;

  auto def = state.metric_definitions.find(metric);
  if (def != state.metric_definitions.end() && !def->second.extraction_path.empty()) {
    const TimeRange r = range.value_or(TimeRange{0, std::numeric_limits<Timestamp>::max()});
    for (const CapturedEvent* e : state.store.in_range(r.start, r.end)) {
      if (app_filter && !contains_id(*app_filter, e->source_app)) continue;
      const jsonlite::Value* v = jsonlite::find_path(e->data, def->second.extraction_path);
      if (!v) continue;
      const auto num = jsonlite::as_number(*v);
      if (!num) continue;
      out.push_back(MetricSample{e->timestamp, *num, e->id});
    }
    return out;
  }

  Timestamp index = 0;
  for (const auto& [key, value] : state.aggregated_metrics) {
    if (key.find(metric) == std::string::npos) continue;
    out.push_back(MetricSample{index++, aggregation::extract_metric_value(value), std::nullopt});
  }
  return out;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::vector<AppConfig> get_monitored_applications(const AnalyticsState& state) {
  std::vector<AppConfig> out;
  out.reserve(state.monitored_applications.size());
  for (const auto& [id, cfg] : state.monitored_applications) out.push_back(cfg);
  return out;
}

std::vector<std::pair<MetricKey, MetricValue>> get_application_metrics(
    const AnalyticsState& state, const ApplicationId& app_id) {
  std::vector<std::pair<MetricKey, MetricValue>> out;
  for (auto it = state.aggregated_metrics.lower_bound(app_id);
       it != state.aggregated_metrics.end() && it->first.compare(0, app_id.size(), app_id) == 0;
       ++it) {
    out.emplace_back(it->first, it->second);
  }
  return out;
}

std::vector<CapturedEvent> get_events(const AnalyticsState& state,
                                      const EventFilters& filters,
                                      const Pagination& pagination) {
  const std::string needle = filters.search_text ? lower(*filters.search_text) : "";
  std::vector<CapturedEvent> out;
  size_t skipped = 0;
  for (const auto& e : state.store.events()) {
    if (out.size() >= pagination.limit) break;
    if (!matches(e, filters, needle)) continue;
    if (skipped < pagination.offset) {
      ++skipped;
      continue;
    }
    out.push_back(e);
  }
  return out;
}

std::optional<CapturedEvent> get_event(const AnalyticsState& state, EventId id) {
  const CapturedEvent* e = state.store.get(id);
  if (!e) return std::nullopt;
  return *e;
}

std::vector<CapturedEvent> get_app_events(const AnalyticsState& state, const ApplicationId& app_id) {
  std::vector<CapturedEvent> out;
  for (const CapturedEvent* e : state.store.by_app(app_id)) out.push_back(*e);
  return out;
}

std::vector<CapturedEvent> get_events_in_range(const AnalyticsState& state, const TimeRange& range) {
  std::vector<CapturedEvent> out;
  if (range.start > range.end) return out;
  for (const CapturedEvent* e : state.store.in_range(range.start, range.end)) out.push_back(*e);
  return out;
}

std::vector<TimeSeriesPoint> get_time_series(const AnalyticsState& state,
                                             const TimeRange& range,
                                             uint64_t granularity_ms) {
  std::vector<TimeSeriesPoint> out;
  if (range.start > range.end) return out;

  const auto& index = state.store.time_index();
  // Events with timestamp in [from, to).
  auto count_between = [&index](Timestamp from, Timestamp to) {
    uint64_t n = 0;
    for (auto it = index.lower_bound(from); it != index.end() && it->first < to; ++it) {
      n += it->second.size();
    }
    return n;
  };

  if (granularity_ms == 0) {
    uint64_t n = count_between(range.start, range.end);
    auto last = index.find(range.end);
    if (last != index.end()) n += last->second.size();
    out.push_back(TimeSeriesPoint{range.start, n});
    return out;
  }

  constexpr Timestamp kMax = std::numeric_limits<Timestamp>::max();
  Timestamp current = range.start;
  while (current <= range.end && out.size() < kMaxTimeSeriesPoints) {
    const bool last_step = current > kMax - granularity_ms;
    const Timestamp next = last_step ? kMax : current + granularity_ms;
    uint64_t n = count_between(current, next);
    if (last_step) {
      auto tail = index.find(kMax);
      if (tail != index.end()) n += tail->second.size();
    }
    out.push_back(TimeSeriesPoint{current, n});
    if (last_step) break;
    current = next;
  }
  return out;
}

aggregation::AggregatedResult query_aggregation(const AnalyticsState& state,
                                                const aggregation::AggregationQuery& query) {
  const auto samples = resolve_metric_samples(
      state, query.metric, TimeRange{query.start_time, query.end_time}, query.app_filter);
  const auto values = to_values(samples);

  aggregation::AggregatedResult r;
  r.metric = query.metric;
  r.aggregation = query.aggregation;
  r.value = aggregation::aggregate(values, query.aggregation);
  r.sample_count = values.size();
  return r;
}

std::vector<aggregation::AggregatedResult> query_aggregation_series(
    const AnalyticsState& state, const aggregation::AggregationQuery& query) {
  const auto samples = resolve_metric_samples(
      state, query.metric, TimeRange{query.start_time, query.end_time}, query.app_filter);

  std::map<aggregation::TimeBucket, std::vector<double>> buckets;
  for (const auto& s : samples) {
    buckets[aggregation::TimeBucket::from_timestamp(s.timestamp, query.granularity_ms)]
        .push_back(s.value);
  }

  std::vector<aggregation::AggregatedResult> out;
  out.reserve(buckets.size());
  for (const auto& [bucket, values] : buckets) {
    aggregation::AggregatedResult r;
    r.metric = query.metric;
    r.aggregation = query.aggregation;
    r.value = aggregation::aggregate(values, query.aggregation);
    r.bucket = bucket;
    r.sample_count = values.size();
    out.push_back(std::move(r));
  }
  return out;
}

aggregation::CorrelationMatrix query_correlation(const AnalyticsState& state,
                                                 const std::vector<std::string>& metrics,
                                                 const std::optional<TimeRange>& range) {
  std::vector<std::vector<double>> values;
  values.reserve(metrics.size());
  for (const auto& m : metrics) values.push_back(to_values(resolve_metric_samples(state, m, range)));

  aggregation::CorrelationMatrix matrix;
  matrix.series = metrics;
  matrix.metric = "correlation";
  const size_t n = metrics.size();
  matrix.coefficients.assign(n * n, 0.0);
  for (size_t i = 0; i < n; ++i) {
    for (size_t j = 0; j < n; ++j) {
      if (i == j) {
        matrix.coefficients[i * n + j] = 1.0;
      } else if (values[i].size() == values[j].size() && !values[i].empty()) {
        matrix.coefficients[i * n + j] = aggregation::correlation(values[i], values[j]);
      }
    }
  }
  return matrix;
}

std::vector<aggregation::AnomalyEvent> query_anomalies(const AnalyticsState& state,
                                                       const std::string& metric,
                                                       double sensitivity,
                                                       const std::optional<TimeRange>& range) {
  const auto samples = resolve_metric_samples(state, metric, range);
  auto anomalies = aggregation::detect_anomalies(to_series(samples), sensitivity);
  for (auto& a : anomalies) {
    if (a.index < samples.size()) a.event_id = samples[a.index].event_id;
  }
  return anomalies;
}

std::vector<aggregation::MovingAveragePoint> query_moving_average(
    const AnalyticsState& state, const std::string& metric, uint64_t window_size,
    const std::optional<TimeRange>& range) {
  const auto samples = resolve_metric_samples(state, metric, range);
  return aggregation::moving_average(to_series(samples), static_cast<size_t>(window_size));
}

std::optional<MerkleProof> get_event_proof(const AnalyticsState& state, EventId id) {
  return state.store.merkle().generate_proof(id);
}

std::optional<BatchProof> get_batch_proof(const AnalyticsState& state,
                                          const std::vector<EventId>& ids, uint64_t batch_id) {
  return state.store.merkle().generate_batch_proof(ids, batch_id);
}

bool verify_proof(const MerkleProof& proof, const Digest& expected_root) {
  return MerkleIndex::verify_proof(expected_root, proof);
}

std::optional<Digest> get_merkle_root(const AnalyticsState& state) {
  return state.store.merkle().root();
}

RateLimitStats get_rate_limit_stats(const AnalyticsState& state) {
  return state.rate_limiter.get_stats();
}

RbacInfo get_rbac_info(const AnalyticsState& state, const std::optional<Owner>& owner) {
  RbacInfo info;
  info.owner = owner.value_or(state.admin_owner);
  info.role = state.rbac.get_role(info.owner);
  info.permissions = rbac::permissions_for(info.role);
  return info;
}

SystemHealth get_system_health(const AnalyticsState& state) {
  SystemHealth h;
  h.total_events = state.store.total_events_captured();
  h.stored_events = state.store.events().size();
  h.total_applications = state.monitored_applications.size();
  h.merkle_root = state.store.merkle().root();
  h.rate_limit_enabled = state.rate_limiter.config().enabled;
  h.ingestion_paused = state.rate_limiter.paused();
  h.current_block = state.current_block;
  return h;
}

}  // namespace pine
