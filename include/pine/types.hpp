#pragma once

// pine/types.hpp: Core data model for the pine analytics core.
//
// MEMORY OWNERSHIP:
//   - Every type here is a value type. No borrowed references, no raw pointers.
//   - Events are owned by the EventStore log; queries hand out copies or
//     const pointers that are valid until the next mutation.
//
// DETERMINISM:
//   - canonical_event_json() is the sole input to an event's Merkle leaf hash.
//     It covers every field (including id and block height) with sorted keys.
//     Changing the field set changes every leaf and therefore every root.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "pine/jsonlite.hpp"

namespace pine {

using EventId = uint64_t;
using Timestamp = uint64_t;
using BlockHeight = uint64_t;
using ApplicationId = std::string;
using ChainId = std::string;
using Owner = std::string;
using MetricKey = std::string;

// ---------------------------------------------------------------------------
// Error taxonomy
// ---------------------------------------------------------------------------
enum class ErrorCode {
  none,
  unauthorized,
  duplicate_event,
  app_blocked,
  global_limit_exceeded,
  app_limit_exceeded,
  ingestion_paused,
  cannot_demote_super_admin,
  application_not_found,
  event_not_found,
  invalid_configuration,
  batch_partial_failure,
  invalid_metric,
  snapshot_io_failed,
  snapshot_corrupt,
  json_parse_error,
};

std::string to_string(ErrorCode code);

// True for the four admission-control failures.
bool is_rate_limit_error(ErrorCode code);

// Outcome of an operation. Never thrown; always returned.
struct Status {
  ErrorCode code{ErrorCode::none};
  std::string detail;

  bool ok() const { return code == ErrorCode::none; }

  static Status success() { return {}; }
  static Status failure(ErrorCode c, std::string d = "") { return Status{c, std::move(d)}; }

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------
enum class Severity : uint8_t {
  debug    = 0,
  info     = 1,
  warning  = 2,
  error    = 3,
  critical = 4,
};

std::string to_string(Severity s);
std::optional<Severity> severity_from_string(const std::string& s);

struct CapturedEvent {
  EventId id{0};                       // assigned at ingestion
  ApplicationId source_app;
  ChainId source_chain;
  Timestamp timestamp{0};
  std::string event_type;
  jsonlite::Value data;                // structured payload
  std::string transaction_hash;        // deduplication key
  std::optional<BlockHeight> block_height;  // assigned at ingestion
  Severity severity{Severity::info};
};

jsonlite::Value event_to_value(const CapturedEvent& e);
std::optional<CapturedEvent> event_from_value(const jsonlite::Value& v);

// Sorted-key compact JSON of every field. Input to the leaf hash.
std::string canonical_event_json(const CapturedEvent& e);

// ---------------------------------------------------------------------------
// Metrics
// ---------------------------------------------------------------------------
struct CounterValue { uint64_t value{0}; };
struct GaugeValue { double value{0.0}; };
struct HistogramValue { std::vector<double> samples; };
struct SummaryValue {
  double sum{0.0};
  uint64_t count{0};
  double avg{0.0};
};

using MetricValue = std::variant<CounterValue, GaugeValue, HistogramValue, SummaryValue>;

jsonlite::Value metric_to_value(const MetricValue& m);
std::optional<MetricValue> metric_from_value(const jsonlite::Value& v);

enum class MetricType { counter, gauge, histogram, summary };
enum class AggregationMethod { sum, average, min, max, last };

std::string to_string(MetricType t);
std::string to_string(AggregationMethod m);
std::optional<MetricType> metric_type_from_string(const std::string& s);
std::optional<AggregationMethod> aggregation_method_from_string(const std::string& s);

struct MetricDefinition {
  std::string name;
  std::string description;
  MetricType metric_type{MetricType::gauge};
  std::string extraction_path;  // dotted path into event payloads; may be empty
  AggregationMethod aggregation{AggregationMethod::sum};
};

jsonlite::Value definition_to_value(const MetricDefinition& d);
std::optional<MetricDefinition> definition_from_value(const jsonlite::Value& v);

// ---------------------------------------------------------------------------
// Monitored applications
// ---------------------------------------------------------------------------
struct AppConfig {
  ApplicationId application_id;
  ChainId chain_id;
  std::string endpoint;
  bool enabled{true};
  std::vector<MetricDefinition> custom_metrics;
  uint8_t priority{0};
  std::vector<std::string> tags;
};

jsonlite::Value app_config_to_value(const AppConfig& a);
std::optional<AppConfig> app_config_from_value(const jsonlite::Value& v);

// ---------------------------------------------------------------------------
// Query helpers
// ---------------------------------------------------------------------------
struct TimeRange {
  Timestamp start{0};
  Timestamp end{0};

  // Inclusive on both ends.
  bool contains(Timestamp t) const { return t >= start && t <= end; }
};

struct EventFilters {
  std::optional<std::vector<ApplicationId>> application_ids;
  std::optional<std::vector<std::string>> event_types;
  std::optional<TimeRange> time_range;
  std::optional<Severity> severity;
  std::optional<std::string> search_text;  // case-insensitive, over payload JSON
};

struct Pagination {
  size_t offset{0};
  size_t limit{100};
};

}  // namespace pine
