#pragma once

// pine/observability.hpp: Structured ingestion observability.
//
// DESIGN:
//   IngestEvent is the canonical observable unit. Every single-event
//   ingestion attempt (standalone or as a batch item) emits one, which is:
//     - always folded into the process-wide IngestStats;
//     - handed to a registered hook if one is set; otherwise
//     - appended as one JSON line to the event log (set_event_log_path() or
//       PINE_EVENT_LOG), when one is configured.
//   Diagnostics (per-item batch failures, destructive admin actions) share
//   the same JSONL sink with "type":"diagnostic".
//
// INVARIANT:
//   Emission never fails the operation that triggered it. A sink that cannot
//   be opened drops the line and bumps IngestStats::sink_write_failures.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "pine/types.hpp"

namespace pine {

// ---------------------------------------------------------------------------
// IngestEvent: per-ingestion observable unit
// ---------------------------------------------------------------------------
struct IngestEvent {
  EventId event_id{0};          // 0 when rejected
  ApplicationId source_app;
  std::string transaction_hash;
  BlockHeight block{0};

  uint64_t duration_ns{0};
  bool batch{false};            // emitted from within a batch

  bool ok{false};
  ErrorCode error{ErrorCode::none};

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
// Bucket boundaries are part of the event-log schema (EVENT_LOG_VERSION).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds (bucket midpoint). 0.0 if empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  // MICRO_DOCUMENTED: buckets_ and the totals sit on separate cache lines so
  // concurrent readers of count() do not bounce the bucket line.
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// FailureCategoryStats: rejected ingestions by cause
// ---------------------------------------------------------------------------
struct FailureCategoryStats {
  uint64_t duplicate{0};
  uint64_t app_blocked{0};
  uint64_t global_limit{0};
  uint64_t app_limit{0};
  uint64_t paused{0};
  uint64_t unauthorized{0};
  uint64_t other{0};

  void record(ErrorCode code);
  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// IngestStats: process-wide aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; failure categories and the ring buffer
// are mutex-guarded.
class IngestStats {
 public:
  void record_ingest(const IngestEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> total_ingests{0};
  alignas(64) std::atomic<uint64_t> accepted{0};
  alignas(64) std::atomic<uint64_t> rejected{0};
  alignas(64) std::atomic<uint64_t> batch_items{0};
  alignas(64) std::atomic<uint64_t> diagnostics_emitted{0};
  alignas(64) std::atomic<uint64_t> sink_write_failures{0};

  LatencyHistogram latency_histogram;

  FailureCategoryStats failure_categories_snapshot() const;

  // Last kMaxRecentEvents events, oldest first.
  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<IngestEvent> recent_events_snapshot() const;

  // Zeroes every counter and drops the ring. Histogram is left as is.
  void reset();

 private:
  mutable std::mutex failure_mu_;
  FailureCategoryStats failure_categories_;

  // MICRO_OPT: fixed-capacity ring; ring_head_ is the next slot to
  // overwrite once the buffer is full.
  mutable std::mutex ring_mu_;
  std::vector<IngestEvent> ring_buffer_;
  size_t ring_head_{0};
};

IngestStats& global_ingest_stats();

// Overrides PINE_EVENT_LOG for this process. Empty string restores the
// environment lookup.
void set_event_log_path(const std::string& path);
std::string event_log_path();

void emit_ingest_event(const IngestEvent& ev);

// One {"type":"diagnostic",...} line on the event-log sink. Not routed to the
// hook.
void emit_diagnostic(std::string_view category, std::string_view message);

using IngestEventHook = void (*)(const IngestEvent&);
void set_ingest_event_hook(IngestEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace pine
