#include "pine/event_store.hpp"

#include <algorithm>

#include "pine/hash.hpp"

namespace pine {

Digest EventStore::content_hash(const CapturedEvent& e) {
  return event_content_hash(canonical_event_json(e));
}

IngestResult EventStore::ingest(CapturedEvent event, RateLimiter& limiter,
                                BlockHeight current_block) {
  IngestResult r;
  if (is_duplicate(event.transaction_hash)) {
    r.status = Status::failure(ErrorCode::duplicate_event,
                               "duplicate event: " + event.transaction_hash);
    return r;
  }

  r.decision = limiter.check_and_increment(event.source_app, current_block);
  if (!r.decision.ok()) {
    r.status = r.decision.to_status(event.source_app);
    return r;
  }

  event.id = next_event_id_++;
  event.block_height = current_block;
  tx_hashes_.insert(event.transaction_hash);
  events_.push_back(std::move(event));

  const CapturedEvent& stored = events_.back();
  index(stored);
  merkle_.insert(stored.id, content_hash(stored));
  ++total_events_captured_;

  r.event_id = stored.id;
  return r;
}

BatchIngestResult EventStore::ingest_batch(std::vector<CapturedEvent> events,
                                           RateLimiter& limiter,
                                           BlockHeight current_block,
                                           const BatchItemObserver& observer) {
  BatchIngestResult out;
  for (size_t i = 0; i < events.size(); ++i) {
    // The observer sees the caller's input, so copy before moving it in.
    const CapturedEvent input = events[i];
    IngestResult r = ingest(std::move(events[i]), limiter, current_block);
    if (r.ok()) {
      out.last_event_id = r.event_id;
      ++out.accepted;
    } else {
      ++out.rejected;
    }
    if (observer) observer(i, input, r);
  }
  if (out.rejected > 0) {
    out.status = Status::failure(ErrorCode::batch_partial_failure,
                                 std::to_string(out.rejected) + " of " +
                                     std::to_string(events.size()) + " events rejected");
  }
  return out;
}

void EventStore::index(const CapturedEvent& e) {
  time_index_[e.timestamp].push_back(e.id);
  app_index_[e.source_app].push_back(e.id);
}

void EventStore::clear() {
  events_.clear();
  time_index_.clear();
  app_index_.clear();
  tx_hashes_.clear();
  merkle_.clear();
}

void EventStore::rebuild_merkle() {
  merkle_.clear();
  for (const auto& e : events_) merkle_.insert(e.id, content_hash(e));
}

// ---------------------------------------------------------------------------
// Lookups
// ---------------------------------------------------------------------------

const CapturedEvent* EventStore::get(EventId id) const {
  // Log is sorted by id.
  auto it = std::lower_bound(events_.begin(), events_.end(), id,
                             [](const CapturedEvent& e, EventId v) { return e.id < v; });
  if (it == events_.end() || it->id != id) return nullptr;
  return &*it;
}

std::vector<const CapturedEvent*> EventStore::by_app(const ApplicationId& app) const {
  std::vector<const CapturedEvent*> out;
  auto it = app_index_.find(app);
  if (it == app_index_.end()) return out;
  out.reserve(it->second.size());
  for (EventId id : it->second) {
    if (const auto* e = get(id)) out.push_back(e);
  }
  return out;
}

std::vector<const CapturedEvent*> EventStore::in_range(Timestamp start, Timestamp end) const {
  std::vector<const CapturedEvent*> out;
  if (start > end) return out;
  for (auto it = time_index_.lower_bound(start); it != time_index_.end() && it->first <= end; ++it) {
    for (EventId id : it->second) {
      if (const auto* e = get(id)) out.push_back(e);
    }
  }
  return out;
}

// ---------------------------------------------------------------------------
// restore
// ---------------------------------------------------------------------------

std::optional<EventStore> EventStore::restore(std::vector<CapturedEvent> events,
                                              EventId next_event_id,
                                              uint64_t total_events_captured,
                                              uint32_t merkle_depth) {
  EventStore store(merkle_depth);
  for (auto& e : events) {
    if (!store.events_.empty() && e.id <= store.events_.back().id) return std::nullopt;
    if (e.id >= next_event_id) return std::nullopt;
    if (!store.tx_hashes_.insert(e.transaction_hash).second) return std::nullopt;
    store.events_.push_back(std::move(e));
    store.index(store.events_.back());
  }
  if (total_events_captured < store.events_.size()) return std::nullopt;
  store.rebuild_merkle();
  store.next_event_id_ = next_event_id;
  store.total_events_captured_ = total_events_captured;
  return store;
}

}  // namespace pine
