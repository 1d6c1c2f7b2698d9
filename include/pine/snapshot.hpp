#pragma once

// pine/snapshot.hpp: Durable whole-state snapshots.
//
// FILE LAYOUT:
//   line 1: {"body_digest":"<blake3 hex of body>","encoding":"identity"|"zstd",
//            "original_size":<body bytes>,"snapshot_version":N}
//   rest:   body (canonical JSON of the state), zstd-compressed when the
//           encoding says so.
//
// INVARIANTS:
//   - Writes are atomic: temp file in the target directory, then rename.
//     A crash leaves either the old snapshot or the new one, never a mix.
//   - Load rejects a body whose digest differs from the header, and a
//     state whose recomputed Merkle root differs from the persisted one.
//   - Indexes, the dedup set and the Merkle tree are not persisted. They are
//     rebuilt from the event log on load.

#include <optional>
#include <string>

#include "pine/config.hpp"
#include "pine/jsonlite.hpp"
#include "pine/state.hpp"
#include "pine/types.hpp"

namespace pine {

// Canonical JSON of every persisted field.
jsonlite::Value state_to_value(const AnalyticsState& state);

// snapshot_corrupt on a structurally invalid state.
std::optional<AnalyticsState> state_from_value(const jsonlite::Value& v, Status* error);

// snapshot_io_failed on a write failure, or on zstd without PINE_WITH_ZSTD.
Status save_snapshot(const AnalyticsState& state, const std::string& path,
                     SnapshotEncoding encoding = SnapshotEncoding::identity);

// snapshot_io_failed when the file cannot be read or decoded by this build.
// snapshot_corrupt on a header, digest, body or Merkle root mismatch.
std::optional<AnalyticsState> load_snapshot(const std::string& path, Status* error);

// Whether this build can write and read zstd snapshots.
bool snapshot_zstd_available();

}  // namespace pine
