#pragma once

// pine/audit.hpp: Immutable, append-only audit log for administrative actions.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a monotonically increasing sequence
//      number. Reopening an existing file resumes after its last entry.
//   3. CHAINED: each entry records the BLAKE3 hex digest of the previous
//      entry's serialized line ("prev"); the first entry chains to 64 zeros.
//   4. FAIL-SAFE: write failures never fail the audited operation. They
//      increment failure_count() instead.
//
// Every role change, ingestion control action, rate-limit change, clear,
// rebuild and super-admin transfer is recorded, whether it succeeded or not.

#include <cstdint>
#include <string>

#include "pine/types.hpp"

namespace pine {

// ---------------------------------------------------------------------------
// AdminRecord: one audited administrative action
// ---------------------------------------------------------------------------
struct AdminRecord {
  uint64_t    sequence{0};           // assigned by append()
  std::string previous_digest;       // assigned by append()
  Owner       actor;
  std::string action;                // e.g. "assign_role", "clear_events"
  std::string target;                // owner, app id or empty
  bool        ok{false};
  std::string error_code;            // empty if ok
  BlockHeight block{0};
  uint64_t    timestamp_unix_ms{0};  // assigned by append()
  uint32_t    audit_log_version{0};  // assigned by append()
};

// Compact single-line JSON (NDJSON entry).
std::string admin_record_to_json(const AdminRecord& r);

// ---------------------------------------------------------------------------
// ImmutableAuditLog: append-only NDJSON log writer
// ---------------------------------------------------------------------------
// Thread-safe: appends are serialized by an internal mutex.
class ImmutableAuditLog {
 public:
  // Empty path disables the log: append() succeeds without writing.
  // An existing log whose last line does not parse is never appended to:
  // append() fails and failure_count() reports it.
  explicit ImmutableAuditLog(const std::string& path = "");
  ~ImmutableAuditLog();

  ImmutableAuditLog(const ImmutableAuditLog&) = delete;
  ImmutableAuditLog& operator=(const ImmutableAuditLog&) = delete;

  // Assigns sequence, previous_digest, timestamp and version in place.
  // INVARIANT: if append() returns false, the entry was NOT written.
  bool append(AdminRecord& record);

  uint64_t entry_count() const;
  uint64_t failure_count() const;
  bool enabled() const;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  struct Impl;
  Impl* impl_{nullptr};
};

// Result of re-reading an audit file and recomputing its chain.
struct AuditChainReport {
  bool ok{false};
  uint64_t entries{0};
  uint64_t first_bad_line{0};  // 1-based; 0 when ok
  std::string reason;
};

// Checks sequence continuity and every "prev" link.
AuditChainReport verify_audit_chain(const std::string& path);

// ---------------------------------------------------------------------------
// Global audit log singleton
// ---------------------------------------------------------------------------
// Path from set_audit_log_path(), else PINE_AUDIT_LOG, else disabled.
ImmutableAuditLog& global_audit_log();

// Replaces the global log. References from earlier global_audit_log() calls
// are invalidated.
void set_audit_log_path(const std::string& path);

}  // namespace pine
