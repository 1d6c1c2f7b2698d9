#pragma once

// pine/aggregation.hpp: Stateless numeric analytics over metric series.
//
// Every function here is pure: no state, no I/O, no allocation beyond the
// returned value. Degenerate inputs never produce NaN from a division by
// zero; each function documents what it returns instead.

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pine/types.hpp"

namespace pine {
namespace aggregation {

// ---------------------------------------------------------------------------
// Query model
// ---------------------------------------------------------------------------

enum class AggregationType {
  sum,
  average,
  min,
  max,
  count,
  percentile,
  standard_deviation,
};

struct AggregationKind {
  AggregationType type{AggregationType::sum};
  double p{0.0};  // only meaningful for percentile, e.g. 0.95

  static AggregationKind percentile(double p) { return {AggregationType::percentile, p}; }

  bool operator==(const AggregationKind& other) const {
    return type == other.type && (type != AggregationType::percentile || p == other.p);
  }
};

// "sum", "average", ..., or {"percentile": p}.
jsonlite::Value kind_to_value(const AggregationKind& k);
std::optional<AggregationKind> kind_from_value(const jsonlite::Value& v);
std::string kind_to_string(const AggregationKind& k);

struct TimeBucket {
  Timestamp start{0};
  uint64_t duration_ms{0};

  // Floors timestamp to a multiple of granularity_ms. A zero granularity
  // yields a zero-length bucket starting at timestamp.
  static TimeBucket from_timestamp(Timestamp timestamp, uint64_t granularity_ms);

  auto operator<=>(const TimeBucket&) const = default;
};

struct AggregationQuery {
  std::string metric;
  AggregationKind aggregation;
  Timestamp start_time{0};
  Timestamp end_time{0};
  uint64_t granularity_ms{0};
  std::optional<std::vector<ApplicationId>> app_filter;
};

std::optional<AggregationQuery> query_from_value(const jsonlite::Value& v);

struct AggregatedResult {
  std::string metric;
  AggregationKind aggregation;
  double value{0.0};
  std::optional<TimeBucket> bucket;
  uint64_t sample_count{0};

  jsonlite::Value to_value() const;
};

struct MovingAveragePoint {
  Timestamp timestamp{0};
  double value{0.0};
  uint64_t window_size{0};
};

struct AnomalyEvent {
  uint64_t index{0};
  double value{0.0};
  double z_score{0.0};
  Timestamp timestamp{0};
  std::optional<EventId> event_id;
};

// Row-major square matrix over `series`; coefficients[i * n + j].
struct CorrelationMatrix {
  std::vector<std::string> series;
  std::vector<double> coefficients;
  std::string metric;

  double at(size_t i, size_t j) const { return coefficients[i * series.size() + j]; }
};

using Series = std::vector<std::pair<Timestamp, double>>;

// ---------------------------------------------------------------------------
// Engine
// ---------------------------------------------------------------------------

// Arithmetic mean. 0 for empty input.
double mean(const std::vector<double>& values);

// Sample standard deviation (n - 1). 0 with fewer than two samples.
double std_dev(const std::vector<double>& values);

// Nearest rank: sorted[round(p * (n - 1))], index clamped to [0, n - 1].
// 0 for empty input.
double percentile(const std::vector<double>& values, double p);

// One point per full window, stamped with the window's last timestamp.
// Empty when the series is shorter than the window or the window is 0.
std::vector<MovingAveragePoint> moving_average(const Series& series, size_t window_size);

// Flags points with |z| > sensitivity, z = (v - mean) / std_dev(values).
// A constant series (std_dev 0) has no anomalies.
std::vector<AnomalyEvent> detect_anomalies(const Series& series, double sensitivity);

// Pearson correlation. 0 on length mismatch, n < 2, or a zero deviation.
double correlation(const std::vector<double>& x, const std::vector<double>& y);

// Min of empty input is DBL_MAX and max of empty input is -DBL_MAX.
double aggregate(const std::vector<double>& values, const AggregationKind& kind);

std::map<TimeBucket, std::vector<const CapturedEvent*>> bucket_events(
    const std::vector<const CapturedEvent*>& events, uint64_t granularity_ms);

// Counter -> value, Gauge -> value, Histogram -> mean, Summary -> avg.
double extract_metric_value(const MetricValue& metric);

}  // namespace aggregation
}  // namespace pine
