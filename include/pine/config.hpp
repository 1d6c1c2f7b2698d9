#pragma once

// pine/config.hpp: Service configuration.
//
// SOURCES (later wins):
//   1. Built-in defaults.
//   2. A JSON config file (parse_service_config / load_service_config).
//   3. PINE_EVENT_LOG, PINE_AUDIT_LOG, PINE_SNAPSHOT (apply_env_overrides).
//
// Example:
//   {
//     "super_admin": "root",
//     "rate_limits": {"max_events_per_app_per_block": 100, "cooldown_blocks": 5},
//     "merkle_depth": 16,
//     "event_log_path": "/var/log/pine/events.jsonl",
//     "audit_log_path": "/var/log/pine/audit.ndjson",
//     "snapshot_path": "/var/lib/pine/state.snap",
//     "snapshot_encoding": "zstd"
//   }

#include <cstdint>
#include <optional>
#include <string>

#include "pine/rate_limiter.hpp"
#include "pine/types.hpp"

namespace pine {

enum class SnapshotEncoding { identity, zstd };

std::string to_string(SnapshotEncoding e);
std::optional<SnapshotEncoding> snapshot_encoding_from_string(const std::string& s);

struct ServiceConfig {
  Owner super_admin;
  RateLimitConfig rate_limits;
  uint32_t merkle_depth{16};  // informational; the tree grows past it
  std::string event_log_path;
  std::string audit_log_path;
  std::string snapshot_path;
  SnapshotEncoding snapshot_encoding{SnapshotEncoding::identity};

  // invalid_configuration on an empty super admin or bad rate limits.
  Status validate() const;

  std::string to_json() const;
};

// Missing keys keep their defaults. Sets *error and returns nullopt on bad
// JSON (json_parse_error), an unknown encoding or a failed validate()
// (invalid_configuration).
std::optional<ServiceConfig> parse_service_config(const std::string& text, Status* error);

// invalid_configuration if the file cannot be read.
std::optional<ServiceConfig> load_service_config(const std::string& path, Status* error);

// Non-empty PINE_EVENT_LOG / PINE_AUDIT_LOG / PINE_SNAPSHOT replace the
// corresponding paths.
void apply_env_overrides(ServiceConfig& config);

// Points the process-wide event log and audit log at the configured paths.
void install_sinks(const ServiceConfig& config);

}  // namespace pine
