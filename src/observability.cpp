#include "pine/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#include "pine/version.hpp"

namespace pine {

namespace {

// MICRO_OPT: bit_width gives the bucket index in O(1) (BSR/CLZ).
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<IngestEventHook> g_event_hook{nullptr};

std::mutex g_sink_mu;
std::string g_event_log_override;

// Appends one line to the configured sink. Returns false only when a sink is
// configured and the write failed.
bool append_line(const std::string& line) {
  const std::string path = event_log_path();
  if (path.empty()) return true;
  std::lock_guard<std::mutex> lk(g_sink_mu);
  FILE* f = std::fopen(path.c_str(), "a");
  if (!f) return false;
  const bool ok = std::fwrite(line.data(), 1, line.size(), f) == line.size();
  return (std::fclose(f) == 0) && ok;
}

}  // namespace

std::string IngestEvent::to_json() const {
  std::ostringstream o;
  o << "{\"type\":\"ingest\""
    << ",\"v\":" << version::EVENT_LOG_VERSION
    << ",\"event_id\":" << event_id
    << ",\"source_app\":\"" << jsonlite::escape(source_app) << "\""
    << ",\"transaction_hash\":\"" << jsonlite::escape(transaction_hash) << "\""
    << ",\"block\":" << block
    << ",\"batch\":" << (batch ? "true" : "false")
    << ",\"ok\":" << (ok ? "true" : "false")
    << ",\"error_code\":\"" << to_string(error) << "\""
    << ",\"duration_ns\":" << duration_ns
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "{\"count\":%llu,\"mean_us\":%.2f,\"p50_us\":%.2f,\"p95_us\":%.2f,\"p99_us\":%.2f}",
                static_cast<unsigned long long>(count()), mean_us(),
                percentile(0.50), percentile(0.95), percentile(0.99));
  return buf;
}

// ---------------------------------------------------------------------------
// FailureCategoryStats
// ---------------------------------------------------------------------------

void FailureCategoryStats::record(ErrorCode code) {
  switch (code) {
    case ErrorCode::duplicate_event:       ++duplicate; break;
    case ErrorCode::app_blocked:           ++app_blocked; break;
    case ErrorCode::global_limit_exceeded: ++global_limit; break;
    case ErrorCode::app_limit_exceeded:    ++app_limit; break;
    case ErrorCode::ingestion_paused:      ++paused; break;
    case ErrorCode::unauthorized:          ++unauthorized; break;
    case ErrorCode::none:                  break;
    default:                               ++other; break;
  }
}

std::string FailureCategoryStats::to_json() const {
  std::ostringstream o;
  o << "{\"duplicate\":" << duplicate
    << ",\"app_blocked\":" << app_blocked
    << ",\"global_limit\":" << global_limit
    << ",\"app_limit\":" << app_limit
    << ",\"paused\":" << paused
    << ",\"unauthorized\":" << unauthorized
    << ",\"other\":" << other
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// IngestStats
// ---------------------------------------------------------------------------

void IngestStats::record_ingest(const IngestEvent& ev) {
  total_ingests.fetch_add(1, std::memory_order_relaxed);
  if (ev.ok) {
    accepted.fetch_add(1, std::memory_order_relaxed);
  } else {
    rejected.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(failure_mu_);
    failure_categories_.record(ev.error);
  }
  if (ev.batch) batch_items.fetch_add(1, std::memory_order_relaxed);

  latency_histogram.record(ev.duration_ns);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

FailureCategoryStats IngestStats::failure_categories_snapshot() const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  return failure_categories_;
}

std::vector<IngestEvent> IngestStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  std::vector<IngestEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

void IngestStats::reset() {
  total_ingests.store(0, std::memory_order_relaxed);
  accepted.store(0, std::memory_order_relaxed);
  rejected.store(0, std::memory_order_relaxed);
  batch_items.store(0, std::memory_order_relaxed);
  diagnostics_emitted.store(0, std::memory_order_relaxed);
  sink_write_failures.store(0, std::memory_order_relaxed);
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    failure_categories_ = FailureCategoryStats{};
  }
  std::lock_guard<std::mutex> lk(ring_mu_);
  ring_buffer_.clear();
  ring_head_ = 0;
}

std::string IngestStats::to_json() const {
  std::ostringstream o;
  o << "{\"total_ingests\":" << total_ingests.load(std::memory_order_relaxed)
    << ",\"accepted\":" << accepted.load(std::memory_order_relaxed)
    << ",\"rejected\":" << rejected.load(std::memory_order_relaxed)
    << ",\"batch_items\":" << batch_items.load(std::memory_order_relaxed)
    << ",\"diagnostics_emitted\":" << diagnostics_emitted.load(std::memory_order_relaxed)
    << ",\"sink_write_failures\":" << sink_write_failures.load(std::memory_order_relaxed)
    << ",\"latency\":" << latency_histogram.to_json()
    << ",\"failure_categories\":" << failure_categories_snapshot().to_json()
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// Global singleton + emission
// ---------------------------------------------------------------------------

IngestStats& global_ingest_stats() {
  static IngestStats inst;
  return inst;
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_event_log_override = path;
}

std::string event_log_path() {
  {
    std::lock_guard<std::mutex> lk(g_sink_mu);
    if (!g_event_log_override.empty()) return g_event_log_override;
  }
  const char* env = std::getenv("PINE_EVENT_LOG");
  return (env && env[0]) ? std::string(env) : std::string();
}

void set_ingest_event_hook(IngestEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_ingest_event(const IngestEvent& ev) {
  global_ingest_stats().record_ingest(ev);

  if (IngestEventHook hook = g_event_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }
  if (!append_line(ev.to_json() + "\n")) {
    global_ingest_stats().sink_write_failures.fetch_add(1, std::memory_order_relaxed);
  }
}

void emit_diagnostic(std::string_view category, std::string_view message) {
  global_ingest_stats().diagnostics_emitted.fetch_add(1, std::memory_order_relaxed);
  std::string line;
  line.reserve(96 + category.size() + message.size());
  line += "{\"type\":\"diagnostic\",\"v\":";
  line += std::to_string(version::EVENT_LOG_VERSION);
  line += ",\"category\":\"";
  line += jsonlite::escape(std::string(category));
  line += "\",\"message\":\"";
  line += jsonlite::escape(std::string(message));
  line += "\"}\n";
  if (!append_line(line)) {
    global_ingest_stats().sink_write_failures.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace pine
