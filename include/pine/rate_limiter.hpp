#pragma once

// pine/rate_limiter.hpp: Block-scoped admission control for ingestion.
//
// STATE MACHINE (per application):
//   Unblocked --(per-app limit hit)--> Blocked(until = block + cooldown)
//   Blocked   --(current block >= until, or unblock_app())--> Unblocked
//
// CHECK ORDER (check_and_increment):
//   1. paused            -> ingestion_paused (nothing touched)
//   2. disabled          -> admitted (nothing counted)
//   3. blocked           -> app_blocked while current < until, else unblock
//   4. new block         -> reset global and stale per-app counters
//   5. global limit      -> global_limit_exceeded (no block placed)
//   6. per-app limit     -> block the app, app_limit_exceeded
//   7. increment both counters
//
// Effective limits are floor(configured max * burst_multiplier), saturating
// at 0 and UINT64_MAX.

#include <cstdint>
#include <map>
#include <string>

#include "pine/types.hpp"

namespace pine {

struct RateLimitConfig {
  uint64_t max_events_per_app_per_block{100};
  uint64_t max_total_events_per_block{1000};
  double burst_multiplier{1.5};
  uint64_t cooldown_blocks{5};
  bool enabled{true};

  // burst_multiplier must be finite and > 0.
  Status validate() const;

  std::string to_json() const;
};

jsonlite::Value rate_limit_config_to_value(const RateLimitConfig& c);
// Missing keys keep their defaults. Does not validate.
RateLimitConfig rate_limit_config_from_object(const jsonlite::Object& o);

struct BlockEventCount {
  BlockHeight block_height{0};
  uint64_t count{0};
};

// Outcome of one admission check. On failure the fields relevant to the
// error code are populated; the rest stay zero.
struct RateLimitDecision {
  ErrorCode code{ErrorCode::none};
  uint64_t limit{0};
  uint64_t current{0};
  BlockHeight unblock_at{0};
  BlockHeight current_block{0};
  uint64_t cooldown_blocks{0};

  bool ok() const { return code == ErrorCode::none; }
  Status to_status(const ApplicationId& app_id) const;
};

struct RateLimitStats {
  uint64_t global_count{0};
  uint64_t global_limit{0};  // configured, not burst-scaled
  uint64_t blocked_apps_count{0};
  bool paused{false};
  bool enabled{true};

  std::string to_json() const;
};

class RateLimiter {
 public:
  RateLimiter() = default;
  explicit RateLimiter(RateLimitConfig config) : config_(config) {}

  RateLimitDecision check_and_increment(const ApplicationId& app_id, BlockHeight current_block);

  void pause() { paused_ = true; }
  void resume() { paused_ = false; }

  // Replaces the configuration atomically. Rejects invalid configs and
  // leaves the current one in place.
  Status update_config(const RateLimitConfig& config);

  // Clears a block regardless of its expiry. Returns false if not blocked.
  bool unblock_app(const ApplicationId& app_id);

  RateLimitStats get_stats() const;

  bool paused() const { return paused_; }
  const RateLimitConfig& config() const { return config_; }
  const std::map<ApplicationId, BlockEventCount>& app_counters() const { return app_counters_; }
  const BlockEventCount& global_counter() const { return global_counter_; }
  const std::map<ApplicationId, BlockHeight>& blocked_apps() const { return blocked_apps_; }

  // Snapshot persistence.
  jsonlite::Value to_value() const;
  static std::optional<RateLimiter> from_value(const jsonlite::Value& v);

 private:
  void reset_if_new_block(BlockHeight current_block);

  std::map<ApplicationId, BlockEventCount> app_counters_;
  BlockEventCount global_counter_;
  std::map<ApplicationId, BlockHeight> blocked_apps_;  // app -> unblock height
  RateLimitConfig config_;
  bool paused_{false};
};

}  // namespace pine
