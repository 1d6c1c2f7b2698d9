#include "pine/aggregation.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace pine {
namespace aggregation {

namespace {

// Strict weak order that sorts NaN after every number.
bool nan_last_less(double a, double b) {
  if (std::isnan(a)) return false;
  if (std::isnan(b)) return true;
  return a < b;
}

double sum_of(const std::vector<double>& values) {
  double s = 0.0;
  for (double v : values) s += v;
  return s;
}

}  // namespace

// ---------------------------------------------------------------------------
// AggregationKind
// ---------------------------------------------------------------------------

std::string kind_to_string(const AggregationKind& k) {
  switch (k.type) {
    case AggregationType::sum:                return "sum";
    case AggregationType::average:            return "average";
    case AggregationType::min:                return "min";
    case AggregationType::max:                return "max";
    case AggregationType::count:              return "count";
    case AggregationType::percentile:         return "percentile";
    case AggregationType::standard_deviation: return "standard_deviation";
  }
  return "sum";
}

jsonlite::Value kind_to_value(const AggregationKind& k) {
  if (k.type == AggregationType::percentile) {
    jsonlite::Object o;
    o["percentile"] = jsonlite::Value{k.p};
    return jsonlite::Value{std::move(o)};
  }
  return jsonlite::Value{kind_to_string(k)};
}

std::optional<AggregationKind> kind_from_value(const jsonlite::Value& v) {
  if (const auto* s = std::get_if<std::string>(&v.v)) {
    if (*s == "sum")                return AggregationKind{AggregationType::sum};
    if (*s == "average")            return AggregationKind{AggregationType::average};
    if (*s == "min")                return AggregationKind{AggregationType::min};
    if (*s == "max")                return AggregationKind{AggregationType::max};
    if (*s == "count")              return AggregationKind{AggregationType::count};
    if (*s == "standard_deviation") return AggregationKind{AggregationType::standard_deviation};
    return std::nullopt;
  }
  if (const auto* o = std::get_if<jsonlite::Object>(&v.v)) {
    auto it = o->find("percentile");
    if (it == o->end() || o->size() != 1) return std::nullopt;
    const auto p = jsonlite::as_number(it->second);
    if (!p) return std::nullopt;
    return AggregationKind::percentile(*p);
  }
  return std::nullopt;
}

std::optional<AggregationQuery> query_from_value(const jsonlite::Value& v) {
  const auto* o = std::get_if<jsonlite::Object>(&v.v);
  if (!o) return std::nullopt;
  AggregationQuery q;
  q.metric = jsonlite::get_string(*o, "metric");
  if (q.metric.empty()) return std::nullopt;
  if (auto it = o->find("aggregation"); it != o->end()) {
    auto kind = kind_from_value(it->second);
    if (!kind) return std::nullopt;
    q.aggregation = *kind;
  }
  q.start_time = jsonlite::get_u64(*o, "start_time", 0);
  q.end_time = jsonlite::get_u64(*o, "end_time", std::numeric_limits<uint64_t>::max());
  q.granularity_ms = jsonlite::get_u64(*o, "granularity_ms", 0);
  if (o->count("app_filter") && !(*o).at("app_filter").is_null()) {
    q.app_filter = jsonlite::get_string_array(*o, "app_filter");
  }
  return q;
}

jsonlite::Value AggregatedResult::to_value() const {
  jsonlite::Object o;
  o["metric"] = jsonlite::Value{metric};
  o["aggregation"] = kind_to_value(aggregation);
  o["value"] = jsonlite::Value{value};
  o["sample_count"] = jsonlite::Value{static_cast<uint64_t>(sample_count)};
  if (bucket) {
    jsonlite::Object b;
    b["start"] = jsonlite::Value{static_cast<uint64_t>(bucket->start)};
    b["duration_ms"] = jsonlite::Value{static_cast<uint64_t>(bucket->duration_ms)};
    o["bucket"] = jsonlite::Value{std::move(b)};
  } else {
    o["bucket"] = jsonlite::Value{nullptr};
  }
  return jsonlite::Value{std::move(o)};
}

TimeBucket TimeBucket::from_timestamp(Timestamp timestamp, uint64_t granularity_ms) {
  if (granularity_ms == 0) return TimeBucket{timestamp, 0};
  return TimeBucket{(timestamp / granularity_ms) * granularity_ms, granularity_ms};
}

// ---------------------------------------------------------------------------
// Engine
// ---------------------------------------------------------------------------

double mean(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  return sum_of(values) / static_cast<double>(values.size());
}

double std_dev(const std::vector<double>& values) {
  if (values.size() < 2) return 0.0;
  const double m = mean(values);
  double sq = 0.0;
  for (double v : values) sq += (v - m) * (v - m);
  return std::sqrt(sq / static_cast<double>(values.size() - 1));
}

double percentile(const std::vector<double>& values, double p) {
  if (values.empty()) return 0.0;
  std::vector<double> sorted = values;
  std::sort(sorted.begin(), sorted.end(), nan_last_less);

  const size_t last = sorted.size() - 1;
  const double pos = std::round(p * static_cast<double>(last));
  size_t index = 0;
  if (pos > 0.0) {
    index = pos >= static_cast<double>(last) ? last : static_cast<size_t>(pos);
  }
  return sorted[index];
}

std::vector<MovingAveragePoint> moving_average(const Series& series, size_t window_size) {
  std::vector<MovingAveragePoint> out;
  if (window_size == 0 || series.size() < window_size) return out;

  out.reserve(series.size() - window_size + 1);
  for (size_t end = window_size; end <= series.size(); ++end) {
    double sum = 0.0;
    for (size_t i = end - window_size; i < end; ++i) sum += series[i].second;
    out.push_back(MovingAveragePoint{series[end - 1].first,
                                     sum / static_cast<double>(window_size),
                                     static_cast<uint64_t>(window_size)});
  }
  return out;
}

std::vector<AnomalyEvent> detect_anomalies(const Series& series, double sensitivity) {
  std::vector<double> values;
  values.reserve(series.size());
  for (const auto& [ts, v] : series) values.push_back(v);

  const double m = mean(values);
  const double sd = std_dev(values);
  std::vector<AnomalyEvent> out;
  if (sd == 0.0) return out;

  for (size_t i = 0; i < series.size(); ++i) {
    const double z = (series[i].second - m) / sd;
    if (std::fabs(z) > sensitivity) {
      AnomalyEvent a;
      a.index = i;
      a.value = series[i].second;
      a.z_score = z;
      a.timestamp = series[i].first;
      out.push_back(a);
    }
  }
  return out;
}

double correlation(const std::vector<double>& x, const std::vector<double>& y) {
  if (x.size() != y.size() || x.size() < 2) return 0.0;

  const double mx = mean(x);
  const double my = mean(y);
  const double sx = std_dev(x);
  const double sy = std_dev(y);
  if (sx == 0.0 || sy == 0.0) return 0.0;

  double cov = 0.0;
  for (size_t i = 0; i < x.size(); ++i) cov += (x[i] - mx) * (y[i] - my);
  cov /= static_cast<double>(x.size() - 1);
  return cov / (sx * sy);
}

double aggregate(const std::vector<double>& values, const AggregationKind& kind) {
  switch (kind.type) {
    case AggregationType::sum:
      return sum_of(values);
    case AggregationType::average:
      return mean(values);
    case AggregationType::min: {
      double m = std::numeric_limits<double>::max();
      for (double v : values) m = std::fmin(m, v);
      return m;
    }
    case AggregationType::max: {
      double m = std::numeric_limits<double>::lowest();
      for (double v : values) m = std::fmax(m, v);
      return m;
    }
    case AggregationType::count:
      return static_cast<double>(values.size());
    case AggregationType::percentile:
      return percentile(values, kind.p);
    case AggregationType::standard_deviation:
      return std_dev(values);
  }
  return 0.0;
}

std::map<TimeBucket, std::vector<const CapturedEvent*>> bucket_events(
    const std::vector<const CapturedEvent*>& events, uint64_t granularity_ms) {
  std::map<TimeBucket, std::vector<const CapturedEvent*>> buckets;
  for (const CapturedEvent* e : events) {
    buckets[TimeBucket::from_timestamp(e->timestamp, granularity_ms)].push_back(e);
  }
  return buckets;
}

double extract_metric_value(const MetricValue& metric) {
  if (const auto* c = std::get_if<CounterValue>(&metric)) return static_cast<double>(c->value);
  if (const auto* g = std::get_if<GaugeValue>(&metric)) return g->value;
  if (const auto* h = std::get_if<HistogramValue>(&metric)) return mean(h->samples);
  return std::get<SummaryValue>(metric).avg;
}

}  // namespace aggregation
}  // namespace pine
