#include "pine/rate_limiter.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace pine {

namespace {

// floor(max * burst) with saturation: NaN and non-positive products give 0,
// anything past the u64 range gives UINT64_MAX.
uint64_t effective_limit(uint64_t configured_max, double burst) {
  const double scaled = static_cast<double>(configured_max) * burst;
  if (!(scaled > 0.0)) return 0;
  if (scaled >= 18446744073709551616.0) return std::numeric_limits<uint64_t>::max();
  return static_cast<uint64_t>(scaled);
}

BlockHeight saturating_add(BlockHeight a, uint64_t b) {
  const BlockHeight max = std::numeric_limits<BlockHeight>::max();
  return (a > max - b) ? max : a + b;
}

}  // namespace

// ---------------------------------------------------------------------------
// RateLimitConfig
// ---------------------------------------------------------------------------

Status RateLimitConfig::validate() const {
  if (!std::isfinite(burst_multiplier) || burst_multiplier <= 0.0) {
    return Status::failure(ErrorCode::invalid_configuration,
                           "burst_multiplier must be finite and > 0");
  }
  return Status::success();
}

std::string RateLimitConfig::to_json() const {
  return jsonlite::to_json(rate_limit_config_to_value(*this));
}

jsonlite::Value rate_limit_config_to_value(const RateLimitConfig& c) {
  jsonlite::Object o;
  o["max_events_per_app_per_block"] = jsonlite::Value{static_cast<uint64_t>(c.max_events_per_app_per_block)};
  o["max_total_events_per_block"] = jsonlite::Value{static_cast<uint64_t>(c.max_total_events_per_block)};
  o["burst_multiplier"] = jsonlite::Value{c.burst_multiplier};
  o["cooldown_blocks"] = jsonlite::Value{static_cast<uint64_t>(c.cooldown_blocks)};
  o["enabled"] = jsonlite::Value{c.enabled};
  return jsonlite::Value{std::move(o)};
}

RateLimitConfig rate_limit_config_from_object(const jsonlite::Object& o) {
  RateLimitConfig c;
  c.max_events_per_app_per_block = jsonlite::get_u64(o, "max_events_per_app_per_block", c.max_events_per_app_per_block);
  c.max_total_events_per_block = jsonlite::get_u64(o, "max_total_events_per_block", c.max_total_events_per_block);
  c.burst_multiplier = jsonlite::get_double(o, "burst_multiplier", c.burst_multiplier);
  c.cooldown_blocks = jsonlite::get_u64(o, "cooldown_blocks", c.cooldown_blocks);
  c.enabled = jsonlite::get_bool(o, "enabled", c.enabled);
  return c;
}

// ---------------------------------------------------------------------------
// RateLimitDecision / RateLimitStats
// ---------------------------------------------------------------------------

Status RateLimitDecision::to_status(const ApplicationId& app_id) const {
  std::ostringstream d;
  switch (code) {
    case ErrorCode::none:
      return Status::success();
    case ErrorCode::ingestion_paused:
      d << "event ingestion is paused";
      break;
    case ErrorCode::app_blocked:
      d << "app " << app_id << " is blocked until block " << unblock_at
        << " (current: " << current_block << ")";
      break;
    case ErrorCode::global_limit_exceeded:
      d << "global limit of " << limit << " events exceeded (current: " << current << ")";
      break;
    case ErrorCode::app_limit_exceeded:
      d << "app " << app_id << " exceeded limit of " << limit
        << " events, blocked for " << cooldown_blocks << " blocks";
      break;
    default:
      break;
  }
  return Status::failure(code, d.str());
}

std::string RateLimitStats::to_json() const {
  std::ostringstream o;
  o << "{\"global_count\":" << global_count
    << ",\"global_limit\":" << global_limit
    << ",\"blocked_apps_count\":" << blocked_apps_count
    << ",\"paused\":" << (paused ? "true" : "false")
    << ",\"enabled\":" << (enabled ? "true" : "false")
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// RateLimiter
// ---------------------------------------------------------------------------

RateLimitDecision RateLimiter::check_and_increment(const ApplicationId& app_id,
                                                   BlockHeight current_block) {
  RateLimitDecision d;
  d.current_block = current_block;

  if (paused_) {
    d.code = ErrorCode::ingestion_paused;
    return d;
  }
  if (!config_.enabled) return d;

  if (auto it = blocked_apps_.find(app_id); it != blocked_apps_.end()) {
    // INVARIANT: strict '<'. With cooldown 0 a block placed at height h has
    // already expired at h; the spent per-app counter still rejects until
    // the next block.
    if (current_block < it->second) {
      d.code = ErrorCode::app_blocked;
      d.unblock_at = it->second;
      return d;
    }
    blocked_apps_.erase(it);
  }

  reset_if_new_block(current_block);

  const uint64_t max_global = effective_limit(config_.max_total_events_per_block,
                                              config_.burst_multiplier);
  if (global_counter_.count >= max_global) {
    d.code = ErrorCode::global_limit_exceeded;
    d.limit = max_global;
    d.current = global_counter_.count;
    return d;
  }

  const uint64_t max_app = effective_limit(config_.max_events_per_app_per_block,
                                           config_.burst_multiplier);
  auto counter = app_counters_.find(app_id);
  const uint64_t app_count = counter == app_counters_.end() ? 0 : counter->second.count;
  if (app_count >= max_app) {
    blocked_apps_[app_id] = saturating_add(current_block, config_.cooldown_blocks);
    d.code = ErrorCode::app_limit_exceeded;
    d.limit = max_app;
    d.current = app_count;
    d.cooldown_blocks = config_.cooldown_blocks;
    d.unblock_at = blocked_apps_[app_id];
    return d;
  }

  if (counter == app_counters_.end()) {
    counter = app_counters_.emplace(app_id, BlockEventCount{current_block, 0}).first;
  }
  counter->second.count += 1;
  global_counter_.count += 1;
  return d;
}

void RateLimiter::reset_if_new_block(BlockHeight current_block) {
  if (global_counter_.block_height == current_block) return;
  global_counter_ = BlockEventCount{current_block, 0};
  for (auto& [app, counter] : app_counters_) {
    if (counter.block_height != current_block) {
      counter = BlockEventCount{current_block, 0};
    }
  }
}

Status RateLimiter::update_config(const RateLimitConfig& config) {
  Status s = config.validate();
  if (!s.ok()) return s;
  config_ = config;
  return Status::success();
}

bool RateLimiter::unblock_app(const ApplicationId& app_id) {
  return blocked_apps_.erase(app_id) > 0;
}

RateLimitStats RateLimiter::get_stats() const {
  RateLimitStats s;
  s.global_count = global_counter_.count;
  s.global_limit = config_.max_total_events_per_block;
  s.blocked_apps_count = blocked_apps_.size();
  s.paused = paused_;
  s.enabled = config_.enabled;
  return s;
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

jsonlite::Value RateLimiter::to_value() const {
  using jsonlite::Value;
  jsonlite::Object o;
  o["config"] = rate_limit_config_to_value(config_);
  o["paused"] = Value{paused_};

  jsonlite::Object global;
  global["block_height"] = Value{static_cast<uint64_t>(global_counter_.block_height)};
  global["count"] = Value{static_cast<uint64_t>(global_counter_.count)};
  o["global_counter"] = Value{std::move(global)};

  jsonlite::Object counters;
  for (const auto& [app, c] : app_counters_) {
    jsonlite::Object entry;
    entry["block_height"] = Value{static_cast<uint64_t>(c.block_height)};
    entry["count"] = Value{static_cast<uint64_t>(c.count)};
    counters[app] = Value{std::move(entry)};
  }
  o["app_counters"] = Value{std::move(counters)};

  jsonlite::Object blocked;
  for (const auto& [app, until] : blocked_apps_) {
    blocked[app] = Value{static_cast<uint64_t>(until)};
  }
  o["blocked_apps"] = Value{std::move(blocked)};
  return Value{std::move(o)};
}

std::optional<RateLimiter> RateLimiter::from_value(const jsonlite::Value& v) {
  const auto* o = std::get_if<jsonlite::Object>(&v.v);
  if (!o) return std::nullopt;

  RateLimiter rl;
  if (const auto* cfg = jsonlite::get_object(*o, "config")) {
    rl.config_ = rate_limit_config_from_object(*cfg);
  }
  if (!rl.config_.validate().ok()) return std::nullopt;
  rl.paused_ = jsonlite::get_bool(*o, "paused", false);

  if (const auto* g = jsonlite::get_object(*o, "global_counter")) {
    rl.global_counter_.block_height = jsonlite::get_u64(*g, "block_height", 0);
    rl.global_counter_.count = jsonlite::get_u64(*g, "count", 0);
  }
  if (const auto* counters = jsonlite::get_object(*o, "app_counters")) {
    for (const auto& [app, entry] : *counters) {
      const auto* e = std::get_if<jsonlite::Object>(&entry.v);
      if (!e) return std::nullopt;
      BlockEventCount c;
      c.block_height = jsonlite::get_u64(*e, "block_height", 0);
      c.count = jsonlite::get_u64(*e, "count", 0);
      rl.app_counters_[app] = c;
    }
  }
  if (const auto* blocked = jsonlite::get_object(*o, "blocked_apps")) {
    for (const auto& [app, until] : *blocked) {
      if (!std::holds_alternative<uint64_t>(until.v)) return std::nullopt;
      rl.blocked_apps_[app] = std::get<uint64_t>(until.v);
    }
  }
  return rl;
}

}  // namespace pine
