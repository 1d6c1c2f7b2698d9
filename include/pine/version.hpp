#pragma once

// pine/version.hpp: Version manifest for every persisted or streamed format.
//
// PURPOSE:
//   Prevent silent format drift between the snapshot file, the Merkle hash
//   scheme, the JSONL event stream and the audit log. Every reader checks the
//   corresponding constant here before trusting data.
//
// INVARIANT:
//   All version constants are compile-time. A snapshot whose header carries a
//   different SNAPSHOT_FORMAT_VERSION is rejected by load_snapshot().

#include <cstdint>
#include <string>

namespace pine {
namespace version {

// ---------------------------------------------------------------------------
// SNAPSHOT_FORMAT_VERSION
// Layout of the persisted state file: one JSON header line followed by the
// (optionally zstd-compressed) canonical JSON body.
// ---------------------------------------------------------------------------
constexpr uint32_t SNAPSHOT_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256 with "evt:" leaf and "node:" interior domains.
// Bumping this invalidates every stored Merkle root and proof.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_LOG_VERSION
// Schema of IngestEvent / diagnostic lines written to PINE_EVENT_LOG.
// ---------------------------------------------------------------------------
constexpr uint32_t EVENT_LOG_VERSION = 1;

// ---------------------------------------------------------------------------
// AUDIT_LOG_VERSION
// Schema of AdminRecord lines written to the append-only audit log.
// ---------------------------------------------------------------------------
constexpr uint32_t AUDIT_LOG_VERSION = 1;

struct VersionManifest {
  uint32_t snapshot_format{SNAPSHOT_FORMAT_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  std::string semver;           // e.g. "0.3.0"
  std::string hash_primitive;   // "blake3"
  std::string build_timestamp;  // from __DATE__/__TIME__
};

// Returns the manifest populated at compile time.
VersionManifest current_manifest(const std::string& semver = "");

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace pine
