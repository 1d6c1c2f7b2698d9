#pragma once

// pine/event_store.hpp: Authoritative append-only event log and its indexes.
//
// INGESTION SEQUENCE (ingest):
//   dedup check -> rate limiter admission -> assign id + block height ->
//   append to log -> dedup set -> time index -> app index -> Merkle leaf ->
//   lifetime counter.
//
// INVARIANTS:
//   - A failed dedup or admission check leaves the log, every index and the
//     Merkle tree untouched.
//   - Event ids are strictly increasing in log order. next_event_id survives
//     clear(), so ids are never reused within a store's lifetime.
//   - The Merkle leaf set always equals {id -> content hash} over the log.
//
// THREAD SAFETY:
//   None. The owner (AnalyticsState) is driven by a single writer.

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "pine/merkle.hpp"
#include "pine/rate_limiter.hpp"
#include "pine/types.hpp"

namespace pine {

struct IngestResult {
  Status status;
  EventId event_id{0};  // valid only when status.ok()
  RateLimitDecision decision;

  bool ok() const { return status.ok(); }
};

struct BatchIngestResult {
  // batch_partial_failure when any item failed, even if others succeeded.
  Status status;
  std::optional<EventId> last_event_id;
  uint64_t accepted{0};
  uint64_t rejected{0};
};

// Called once per batch item, after it was processed.
using BatchItemObserver =
    std::function<void(size_t index, const CapturedEvent& input, const IngestResult& result)>;

class EventStore {
 public:
  explicit EventStore(uint32_t merkle_depth = 16) : merkle_(merkle_depth) {}

  IngestResult ingest(CapturedEvent event, RateLimiter& limiter, BlockHeight current_block);

  // Each item goes through ingest() independently; failures never abort the
  // remaining items.
  BatchIngestResult ingest_batch(std::vector<CapturedEvent> events,
                                 RateLimiter& limiter,
                                 BlockHeight current_block,
                                 const BatchItemObserver& observer = nullptr);

  // Empties the log, both indexes, the dedup set and the Merkle tree.
  void clear();

  // Resets the Merkle tree and reinserts every logged event in log order.
  void rebuild_merkle();

  bool is_duplicate(const std::string& transaction_hash) const {
    return tx_hashes_.count(transaction_hash) > 0;
  }

  const CapturedEvent* get(EventId id) const;
  std::vector<const CapturedEvent*> by_app(const ApplicationId& app) const;
  // Inclusive range, ascending timestamp, insertion order within a timestamp.
  std::vector<const CapturedEvent*> in_range(Timestamp start, Timestamp end) const;

  const std::vector<CapturedEvent>& events() const { return events_; }
  const std::map<Timestamp, std::vector<EventId>>& time_index() const { return time_index_; }
  const std::map<ApplicationId, std::vector<EventId>>& app_index() const { return app_index_; }
  const std::set<std::string>& tx_hashes() const { return tx_hashes_; }
  const MerkleIndex& merkle() const { return merkle_; }
  EventId next_event_id() const { return next_event_id_; }
  uint64_t total_events_captured() const { return total_events_captured_; }

  static Digest content_hash(const CapturedEvent& e);

  // Rebuilds a store from a persisted log. Indexes, dedup set and Merkle
  // tree are derived. nullopt if the log violates an invariant (ids not
  // strictly increasing or not below next_event_id, duplicate hashes).
  static std::optional<EventStore> restore(std::vector<CapturedEvent> events,
                                           EventId next_event_id,
                                           uint64_t total_events_captured,
                                           uint32_t merkle_depth);

 private:
  void index(const CapturedEvent& e);

  std::vector<CapturedEvent> events_;
  std::map<Timestamp, std::vector<EventId>> time_index_;
  std::map<ApplicationId, std::vector<EventId>> app_index_;
  std::set<std::string> tx_hashes_;
  MerkleIndex merkle_;
  EventId next_event_id_{0};
  uint64_t total_events_captured_{0};
};

}  // namespace pine
