#include "pine/dispatch.hpp"

#include <functional>
#include <limits>
#include <map>
#include <optional>

#include "pine/aggregation.hpp"
#include "pine/hash.hpp"
#include "pine/merkle.hpp"
#include "pine/operations.hpp"
#include "pine/rbac.hpp"

namespace pine {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

using Handler = std::function<DispatchResult(AnalyticsState&, const Object&)>;

DispatchResult bad_request(const std::string& detail) {
  DispatchResult r;
  r.status = Status::failure(ErrorCode::json_parse_error, detail);
  r.response = "{\"ok\":false,\"error_code\":\"json_parse_error\",\"detail\":\"" +
               jsonlite::escape(detail) + "\"}";
  return r;
}

DispatchResult from_operation(const OperationResult& op) {
  return DispatchResult{op.status, op.to_json()};
}

DispatchResult ok_result(const std::string& result_json) {
  return DispatchResult{Status::success(), "{\"ok\":true,\"result\":" + result_json + "}"};
}

DispatchResult ok_value(const Value& v) { return ok_result(jsonlite::to_json(v)); }

bool has(const Object& req, const std::string& key) {
  auto it = req.find(key);
  return it != req.end() && !it->second.is_null();
}

const Value* field(const Object& req, const std::string& key) {
  auto it = req.find(key);
  return it == req.end() ? nullptr : &it->second;
}

std::optional<TimeRange> range_field(const Object& req) {
  if (!has(req, "start_time") && !has(req, "end_time")) return std::nullopt;
  return TimeRange{jsonlite::get_u64(req, "start_time", 0),
                   jsonlite::get_u64(req, "end_time", std::numeric_limits<uint64_t>::max())};
}

Value events_to_value(const std::vector<CapturedEvent>& events) {
  Array a;
  a.reserve(events.size());
  for (const auto& e : events) a.push_back(event_to_value(e));
  return Value{std::move(a)};
}

std::optional<std::vector<CapturedEvent>> events_field(const Object& req) {
  const Array* arr = jsonlite::get_array(req, "events");
  if (!arr) return std::nullopt;
  std::vector<CapturedEvent> out;
  out.reserve(arr->size());
  for (const auto& v : *arr) {
    auto e = event_from_value(v);
    if (!e) return std::nullopt;
    out.push_back(std::move(*e));
  }
  return out;
}

std::string caller_of(const Object& req) { return jsonlite::get_string(req, "caller"); }

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------

const std::map<std::string, Handler>& handlers() {
  static const std::map<std::string, Handler> table = {
      // -- applications ------------------------------------------------------
      {"add_monitored_app",
       [](AnalyticsState& s, const Object& req) {
         const Value* v = field(req, "config");
         auto cfg = v ? app_config_from_value(*v) : std::nullopt;
         if (!cfg) return bad_request("config: expected an application config");
         return from_operation(add_monitored_app(s, caller_of(req), std::move(*cfg)));
       }},
      {"remove_monitored_app",
       [](AnalyticsState& s, const Object& req) {
         if (!has(req, "app_id")) return bad_request("app_id: required");
         return from_operation(
             remove_monitored_app(s, caller_of(req), jsonlite::get_string(req, "app_id")));
       }},
      {"update_app_config",
       [](AnalyticsState& s, const Object& req) {
         const Value* v = field(req, "config");
         auto cfg = v ? app_config_from_value(*v) : std::nullopt;
         if (!cfg || !has(req, "app_id")) return bad_request("app_id and config: required");
         return from_operation(update_app_config(s, caller_of(req),
                                                 jsonlite::get_string(req, "app_id"),
                                                 std::move(*cfg)));
       }},

      // -- ingestion ---------------------------------------------------------
      {"submit_event",
       [](AnalyticsState& s, const Object& req) {
         const Value* v = field(req, "event");
         auto e = v ? event_from_value(*v) : std::nullopt;
         if (!e) return bad_request("event: source_app and transaction_hash are required");
         return from_operation(submit_event(s, caller_of(req), std::move(*e)));
       }},
      {"submit_batch",
       [](AnalyticsState& s, const Object& req) {
         auto events = events_field(req);
         if (!events) return bad_request("events: expected an array of events");
         return from_operation(submit_batch(s, caller_of(req), std::move(*events)));
       }},

      // -- metrics -----------------------------------------------------------
      {"define_metric",
       [](AnalyticsState& s, const Object& req) {
         const Value* v = field(req, "definition");
         auto def = v ? definition_from_value(*v) : std::nullopt;
         if (!def) return bad_request("definition: expected a metric definition");
         return from_operation(define_metric(s, caller_of(req), std::move(*def)));
       }},
      {"update_metric",
       [](AnalyticsState& s, const Object& req) {
         const Value* v = field(req, "value");
         auto m = v ? metric_from_value(*v) : std::nullopt;
         if (!m) return bad_request("value: expected a tagged metric value");
         return from_operation(
             update_metric(s, caller_of(req), jsonlite::get_string(req, "key"), std::move(*m)));
       }},

      // -- roles -------------------------------------------------------------
      {"assign_role",
       [](AnalyticsState& s, const Object& req) {
         auto role = rbac::role_from_string(jsonlite::get_string(req, "role"));
         if (!role || !has(req, "target")) return bad_request("target and role: required");
         return from_operation(
             assign_role(s, caller_of(req), jsonlite::get_string(req, "target"), *role));
       }},
      {"remove_role",
       [](AnalyticsState& s, const Object& req) {
         if (!has(req, "target")) return bad_request("target: required");
         return from_operation(remove_role(s, caller_of(req), jsonlite::get_string(req, "target")));
       }},

      // -- ingestion control -------------------------------------------------
      {"update_rate_limit_config",
       [](AnalyticsState& s, const Object& req) {
         const Object* cfg = jsonlite::get_object(req, "config");
         if (!cfg) return bad_request("config: expected an object");
         return from_operation(
             update_rate_limit_config(s, caller_of(req), rate_limit_config_from_object(*cfg)));
       }},
      {"pause_ingestion",
       [](AnalyticsState& s, const Object& req) {
         return from_operation(pause_ingestion(s, caller_of(req)));
       }},
      {"resume_ingestion",
       [](AnalyticsState& s, const Object& req) {
         return from_operation(resume_ingestion(s, caller_of(req)));
       }},
      {"unblock_app",
       [](AnalyticsState& s, const Object& req) {
         if (!has(req, "app_id")) return bad_request("app_id: required");
         return from_operation(unblock_app(s, caller_of(req), jsonlite::get_string(req, "app_id")));
       }},
      {"admin_action",
       [](AnalyticsState& s, const Object& req) {
         auto type = admin_action_from_string(jsonlite::get_string(req, "action"));
         if (!type) return bad_request("action: unknown admin action");
         AdminAction action;
         action.type = *type;
         action.max_events_per_app_per_block =
             jsonlite::get_u64(req, "max_events_per_app_per_block", 0);
         action.max_total_events_per_block = jsonlite::get_u64(req, "max_total_events_per_block", 0);
         action.new_admin = jsonlite::get_string(req, "new_admin");
         return from_operation(admin_action(s, caller_of(req), action));
       }},
      {"set_block_height",
       [](AnalyticsState& s, const Object& req) {
         if (!has(req, "block")) return bad_request("block: required");
         set_block_height(s, jsonlite::get_u64(req, "block", 0));
         return from_operation(OperationResult{});
       }},

      // -- queries -----------------------------------------------------------
      {"get_monitored_applications",
       [](AnalyticsState& s, const Object&) {
         Array a;
         for (const auto& cfg : get_monitored_applications(s)) a.push_back(app_config_to_value(cfg));
         return ok_value(Value{std::move(a)});
       }},
      {"get_application_metrics",
       [](AnalyticsState& s, const Object& req) {
         Object o;
         for (const auto& [key, value] :
              get_application_metrics(s, jsonlite::get_string(req, "app_id"))) {
           o[key] = metric_to_value(value);
         }
         return ok_value(Value{std::move(o)});
       }},
      {"get_events",
       [](AnalyticsState& s, const Object& req) {
         EventFilters f;
         if (has(req, "application_ids")) f.application_ids = jsonlite::get_string_array(req, "application_ids");
         if (has(req, "event_types")) f.event_types = jsonlite::get_string_array(req, "event_types");
         f.time_range = range_field(req);
         if (has(req, "severity")) {
           f.severity = severity_from_string(jsonlite::get_string(req, "severity"));
           if (!f.severity) return bad_request("severity: unknown level");
         }
         if (has(req, "search_text")) f.search_text = jsonlite::get_string(req, "search_text");
         Pagination page;
         page.offset = jsonlite::get_u64(req, "offset", page.offset);
         page.limit = jsonlite::get_u64(req, "limit", page.limit);
         return ok_value(events_to_value(get_events(s, f, page)));
       }},
      {"get_event",
       [](AnalyticsState& s, const Object& req) {
         auto e = get_event(s, jsonlite::get_u64(req, "id", 0));
         if (!e) {
           return DispatchResult{Status::failure(ErrorCode::event_not_found),
                                 "{\"ok\":false,\"error_code\":\"event_not_found\"}"};
         }
         return ok_value(event_to_value(*e));
       }},
      {"get_app_events",
       [](AnalyticsState& s, const Object& req) {
         return ok_value(events_to_value(get_app_events(s, jsonlite::get_string(req, "app_id"))));
       }},
      {"get_events_in_range",
       [](AnalyticsState& s, const Object& req) {
         const TimeRange r = range_field(req).value_or(
             TimeRange{0, std::numeric_limits<uint64_t>::max()});
         return ok_value(events_to_value(get_events_in_range(s, r)));
       }},
      {"get_time_series",
       [](AnalyticsState& s, const Object& req) {
         const TimeRange r = range_field(req).value_or(TimeRange{0, 0});
         Array a;
         for (const auto& p : get_time_series(s, r, jsonlite::get_u64(req, "granularity_ms", 0))) {
           Object o;
           o["timestamp"] = Value{static_cast<uint64_t>(p.timestamp)};
           o["count"] = Value{static_cast<uint64_t>(p.count)};
           a.push_back(Value{std::move(o)});
         }
         return ok_value(Value{std::move(a)});
       }},
      {"query_aggregation",
       [](AnalyticsState& s, const Object& req) {
         const Value* v = field(req, "query");
         auto q = v ? aggregation::query_from_value(*v) : std::nullopt;
         if (!q) return bad_request("query: expected an aggregation query");
         return ok_value(query_aggregation(s, *q).to_value());
       }},
      {"query_aggregation_series",
       [](AnalyticsState& s, const Object& req) {
         const Value* v = field(req, "query");
         auto q = v ? aggregation::query_from_value(*v) : std::nullopt;
         if (!q) return bad_request("query: expected an aggregation query");
         Array a;
         for (const auto& r : query_aggregation_series(s, *q)) a.push_back(r.to_value());
         return ok_value(Value{std::move(a)});
       }},
      {"query_correlation",
       [](AnalyticsState& s, const Object& req) {
         const auto m = query_correlation(s, jsonlite::get_string_array(req, "metrics"),
                                          range_field(req));
         Object o;
         Array names;
         for (const auto& n : m.series) names.push_back(Value{n});
         Array coeffs;
         for (double c : m.coefficients) coeffs.push_back(Value{c});
         o["series"] = Value{std::move(names)};
         o["coefficients"] = Value{std::move(coeffs)};
         o["metric"] = Value{m.metric};
         return ok_value(Value{std::move(o)});
       }},
      {"query_anomalies",
       [](AnalyticsState& s, const Object& req) {
         Array a;
         for (const auto& an : query_anomalies(s, jsonlite::get_string(req, "metric"),
                                               jsonlite::get_double(req, "sensitivity", 2.0),
                                               range_field(req))) {
           Object o;
           o["index"] = Value{static_cast<uint64_t>(an.index)};
           o["value"] = Value{an.value};
           o["z_score"] = Value{an.z_score};
           o["timestamp"] = Value{static_cast<uint64_t>(an.timestamp)};
           o["event_id"] = an.event_id ? Value{static_cast<uint64_t>(*an.event_id)} : Value{};
           a.push_back(Value{std::move(o)});
         }
         return ok_value(Value{std::move(a)});
       }},
      {"query_moving_average",
       [](AnalyticsState& s, const Object& req) {
         Array a;
         for (const auto& p : query_moving_average(s, jsonlite::get_string(req, "metric"),
                                                   jsonlite::get_u64(req, "window_size", 0),
                                                   range_field(req))) {
           Object o;
           o["timestamp"] = Value{static_cast<uint64_t>(p.timestamp)};
           o["value"] = Value{p.value};
           o["window_size"] = Value{static_cast<uint64_t>(p.window_size)};
           a.push_back(Value{std::move(o)});
         }
         return ok_value(Value{std::move(a)});
       }},

      // -- integrity ---------------------------------------------------------
      {"get_event_proof",
       [](AnalyticsState& s, const Object& req) {
         auto p = get_event_proof(s, jsonlite::get_u64(req, "id", 0));
         if (!p) {
           return DispatchResult{Status::failure(ErrorCode::event_not_found),
                                 "{\"ok\":false,\"error_code\":\"event_not_found\"}"};
         }
         return ok_result(p->to_json());
       }},
      {"get_batch_proof",
       [](AnalyticsState& s, const Object& req) {
         std::vector<EventId> ids;
         if (const Array* arr = jsonlite::get_array(req, "ids")) {
           for (const auto& v : *arr) {
             const auto* id = std::get_if<uint64_t>(&v.v);
             if (!id) return bad_request("ids: expected unsigned integers");
             ids.push_back(*id);
           }
         }
         auto p = get_batch_proof(s, ids, jsonlite::get_u64(req, "batch_id", 0));
         if (!p) return ok_result("null");
         return ok_result(p->to_json());
       }},
      {"verify_proof",
       [](AnalyticsState&, const Object& req) {
         const Value* v = field(req, "proof");
         auto proof = v ? proof_from_value(*v) : std::nullopt;
         auto root = digest_from_hex(jsonlite::get_string(req, "root"));
         if (!proof || !root) return bad_request("proof and root: required");
         return ok_result(verify_proof(*proof, *root) ? "true" : "false");
       }},
      {"get_merkle_root",
       [](AnalyticsState& s, const Object&) {
         auto root = get_merkle_root(s);
         return ok_result(root ? "\"" + digest_to_hex(*root) + "\"" : std::string("null"));
       }},

      // -- status ------------------------------------------------------------
      {"get_rate_limit_stats",
       [](AnalyticsState& s, const Object&) { return ok_result(get_rate_limit_stats(s).to_json()); }},
      {"get_rbac_info",
       [](AnalyticsState& s, const Object& req) {
         std::optional<Owner> owner;
         if (has(req, "owner")) owner = jsonlite::get_string(req, "owner");
         return ok_result(get_rbac_info(s, owner).to_json());
       }},
      {"get_system_health",
       [](AnalyticsState& s, const Object&) { return ok_result(get_system_health(s).to_json()); }},
  };
  return table;
}

}  // namespace

DispatchResult apply_operation(AnalyticsState& state, const Object& request) {
  const std::string op = jsonlite::get_string(request, "op");
  const auto& table = handlers();
  auto it = table.find(op);
  if (it == table.end()) return bad_request("unknown op: " + op);
  return it->second(state, request);
}

DispatchResult apply_operation_json(AnalyticsState& state, const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  const Object request = jsonlite::parse(line, &err);
  if (err) return bad_request(err->message);
  return apply_operation(state, request);
}

std::vector<std::string> supported_operations() {
  std::vector<std::string> out;
  for (const auto& [name, handler] : handlers()) out.push_back(name);
  return out;
}

}  // namespace pine
