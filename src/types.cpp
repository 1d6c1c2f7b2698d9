#include "pine/types.hpp"

#include <sstream>

namespace pine {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::unauthorized: return "unauthorized";
    case ErrorCode::duplicate_event: return "duplicate_event";
    case ErrorCode::app_blocked: return "app_blocked";
    case ErrorCode::global_limit_exceeded: return "global_limit_exceeded";
    case ErrorCode::app_limit_exceeded: return "app_limit_exceeded";
    case ErrorCode::ingestion_paused: return "ingestion_paused";
    case ErrorCode::cannot_demote_super_admin: return "cannot_demote_super_admin";
    case ErrorCode::application_not_found: return "application_not_found";
    case ErrorCode::event_not_found: return "event_not_found";
    case ErrorCode::invalid_configuration: return "invalid_configuration";
    case ErrorCode::batch_partial_failure: return "batch_partial_failure";
    case ErrorCode::invalid_metric: return "invalid_metric";
    case ErrorCode::snapshot_io_failed: return "snapshot_io_failed";
    case ErrorCode::snapshot_corrupt: return "snapshot_corrupt";
    case ErrorCode::json_parse_error: return "json_parse_error";
  }
  return "";
}

bool is_rate_limit_error(ErrorCode code) {
  return code == ErrorCode::app_blocked ||
         code == ErrorCode::global_limit_exceeded ||
         code == ErrorCode::app_limit_exceeded ||
         code == ErrorCode::ingestion_paused;
}

std::string Status::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok() ? "true" : "false");
  if (!ok()) {
    o << ",\"error_code\":\"" << to_string(code) << "\"";
    if (!detail.empty()) o << ",\"detail\":\"" << jsonlite::escape(detail) << "\"";
  }
  o << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// Severity
// ---------------------------------------------------------------------------

std::string to_string(Severity s) {
  switch (s) {
    case Severity::debug:    return "debug";
    case Severity::info:     return "info";
    case Severity::warning:  return "warning";
    case Severity::error:    return "error";
    case Severity::critical: return "critical";
  }
  return "info";
}

std::optional<Severity> severity_from_string(const std::string& s) {
  if (s == "debug")    return Severity::debug;
  if (s == "info")     return Severity::info;
  if (s == "warning")  return Severity::warning;
  if (s == "error")    return Severity::error;
  if (s == "critical") return Severity::critical;
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// CapturedEvent <-> JSON
// ---------------------------------------------------------------------------

Value event_to_value(const CapturedEvent& e) {
  Object o;
  o["id"] = Value{static_cast<std::uint64_t>(e.id)};
  o["source_app"] = Value{e.source_app};
  o["source_chain"] = Value{e.source_chain};
  o["timestamp"] = Value{static_cast<std::uint64_t>(e.timestamp)};
  o["event_type"] = Value{e.event_type};
  o["data"] = e.data;
  o["transaction_hash"] = Value{e.transaction_hash};
  o["block_height"] = e.block_height ? Value{static_cast<std::uint64_t>(*e.block_height)} : Value{nullptr};
  o["severity"] = Value{to_string(e.severity)};
  return Value{std::move(o)};
}

std::optional<CapturedEvent> event_from_value(const Value& v) {
  const auto* o = std::get_if<Object>(&v.v);
  if (!o) return std::nullopt;
  CapturedEvent e;
  e.id = jsonlite::get_u64(*o, "id", 0);
  e.source_app = jsonlite::get_string(*o, "source_app");
  e.source_chain = jsonlite::get_string(*o, "source_chain");
  e.timestamp = jsonlite::get_u64(*o, "timestamp", 0);
  e.event_type = jsonlite::get_string(*o, "event_type");
  e.transaction_hash = jsonlite::get_string(*o, "transaction_hash");
  if (auto it = o->find("data"); it != o->end()) e.data = it->second;
  if (auto it = o->find("block_height");
      it != o->end() && std::holds_alternative<std::uint64_t>(it->second.v)) {
    e.block_height = std::get<std::uint64_t>(it->second.v);
  }
  const auto sev = severity_from_string(jsonlite::get_string(*o, "severity", "info"));
  if (!sev) return std::nullopt;
  e.severity = *sev;
  if (e.source_app.empty() || e.transaction_hash.empty()) return std::nullopt;
  return e;
}

std::string canonical_event_json(const CapturedEvent& e) {
  return jsonlite::to_json(event_to_value(e));
}

// ---------------------------------------------------------------------------
// MetricValue <-> JSON
// ---------------------------------------------------------------------------
// Tagged form: {"counter":5}, {"gauge":1.5}, {"histogram":[...]},
// {"summary":{"sum":..,"count":..,"avg":..}}.

Value metric_to_value(const MetricValue& m) {
  Object o;
  if (const auto* c = std::get_if<CounterValue>(&m)) {
    o["counter"] = Value{static_cast<std::uint64_t>(c->value)};
  } else if (const auto* g = std::get_if<GaugeValue>(&m)) {
    o["gauge"] = Value{g->value};
  } else if (const auto* h = std::get_if<HistogramValue>(&m)) {
    Array a;
    for (double s : h->samples) a.push_back(Value{s});
    o["histogram"] = Value{std::move(a)};
  } else {
    const auto& s = std::get<SummaryValue>(m);
    Object so;
    so["sum"] = Value{s.sum};
    so["count"] = Value{static_cast<std::uint64_t>(s.count)};
    so["avg"] = Value{s.avg};
    o["summary"] = Value{std::move(so)};
  }
  return Value{std::move(o)};
}

std::optional<MetricValue> metric_from_value(const Value& v) {
  const auto* o = std::get_if<Object>(&v.v);
  if (!o || o->size() != 1) return std::nullopt;
  const auto& [tag, body] = *o->begin();
  if (tag == "counter") {
    if (!std::holds_alternative<std::uint64_t>(body.v)) return std::nullopt;
    return MetricValue{CounterValue{std::get<std::uint64_t>(body.v)}};
  }
  if (tag == "gauge") {
    const auto n = jsonlite::as_number(body);
    if (!n) return std::nullopt;
    return MetricValue{GaugeValue{*n}};
  }
  if (tag == "histogram") {
    const auto* a = std::get_if<Array>(&body.v);
    if (!a) return std::nullopt;
    HistogramValue h;
    for (const auto& item : *a) {
      const auto n = jsonlite::as_number(item);
      if (!n) return std::nullopt;
      h.samples.push_back(*n);
    }
    return MetricValue{std::move(h)};
  }
  if (tag == "summary") {
    const auto* so = std::get_if<Object>(&body.v);
    if (!so) return std::nullopt;
    SummaryValue s;
    s.sum = jsonlite::get_double(*so, "sum", 0.0);
    s.count = jsonlite::get_u64(*so, "count", 0);
    s.avg = jsonlite::get_double(*so, "avg", 0.0);
    return MetricValue{s};
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// MetricDefinition
// ---------------------------------------------------------------------------

std::string to_string(MetricType t) {
  switch (t) {
    case MetricType::counter:   return "counter";
    case MetricType::gauge:     return "gauge";
    case MetricType::histogram: return "histogram";
    case MetricType::summary:   return "summary";
  }
  return "gauge";
}

std::string to_string(AggregationMethod m) {
  switch (m) {
    case AggregationMethod::sum:     return "sum";
    case AggregationMethod::average: return "average";
    case AggregationMethod::min:     return "min";
    case AggregationMethod::max:     return "max";
    case AggregationMethod::last:    return "last";
  }
  return "sum";
}

std::optional<MetricType> metric_type_from_string(const std::string& s) {
  if (s == "counter")   return MetricType::counter;
  if (s == "gauge")     return MetricType::gauge;
  if (s == "histogram") return MetricType::histogram;
  if (s == "summary")   return MetricType::summary;
  return std::nullopt;
}

std::optional<AggregationMethod> aggregation_method_from_string(const std::string& s) {
  if (s == "sum")     return AggregationMethod::sum;
  if (s == "average") return AggregationMethod::average;
  if (s == "min")     return AggregationMethod::min;
  if (s == "max")     return AggregationMethod::max;
  if (s == "last")    return AggregationMethod::last;
  return std::nullopt;
}

Value definition_to_value(const MetricDefinition& d) {
  Object o;
  o["name"] = Value{d.name};
  o["description"] = Value{d.description};
  o["metric_type"] = Value{to_string(d.metric_type)};
  o["extraction_path"] = Value{d.extraction_path};
  o["aggregation"] = Value{to_string(d.aggregation)};
  return Value{std::move(o)};
}

std::optional<MetricDefinition> definition_from_value(const Value& v) {
  const auto* o = std::get_if<Object>(&v.v);
  if (!o) return std::nullopt;
  MetricDefinition d;
  d.name = jsonlite::get_string(*o, "name");
  d.description = jsonlite::get_string(*o, "description");
  d.extraction_path = jsonlite::get_string(*o, "extraction_path");
  const auto type = metric_type_from_string(jsonlite::get_string(*o, "metric_type", "gauge"));
  const auto agg = aggregation_method_from_string(jsonlite::get_string(*o, "aggregation", "sum"));
  if (!type || !agg) return std::nullopt;
  d.metric_type = *type;
  d.aggregation = *agg;
  return d;
}

// ---------------------------------------------------------------------------
// AppConfig
// ---------------------------------------------------------------------------

Value app_config_to_value(const AppConfig& a) {
  Object o;
  o["application_id"] = Value{a.application_id};
  o["chain_id"] = Value{a.chain_id};
  o["endpoint"] = Value{a.endpoint};
  o["enabled"] = Value{a.enabled};
  o["priority"] = Value{static_cast<std::uint64_t>(a.priority)};
  Array metrics;
  for (const auto& m : a.custom_metrics) metrics.push_back(definition_to_value(m));
  o["custom_metrics"] = Value{std::move(metrics)};
  Array tags;
  for (const auto& t : a.tags) tags.push_back(Value{t});
  o["tags"] = Value{std::move(tags)};
  return Value{std::move(o)};
}

std::optional<AppConfig> app_config_from_value(const Value& v) {
  const auto* o = std::get_if<Object>(&v.v);
  if (!o) return std::nullopt;
  AppConfig a;
  a.application_id = jsonlite::get_string(*o, "application_id");
  if (a.application_id.empty()) return std::nullopt;
  a.chain_id = jsonlite::get_string(*o, "chain_id");
  a.endpoint = jsonlite::get_string(*o, "endpoint");
  a.enabled = jsonlite::get_bool(*o, "enabled", true);
  const auto prio = jsonlite::get_u64(*o, "priority", 0);
  if (prio > 255) return std::nullopt;
  a.priority = static_cast<uint8_t>(prio);
  if (const auto* metrics = jsonlite::get_array(*o, "custom_metrics")) {
    for (const auto& m : *metrics) {
      auto d = definition_from_value(m);
      if (!d) return std::nullopt;
      a.custom_metrics.push_back(std::move(*d));
    }
  }
  a.tags = jsonlite::get_string_array(*o, "tags");
  return a;
}

}  // namespace pine
