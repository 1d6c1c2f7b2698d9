#include "pine/audit.hpp"
#include "pine/hash.hpp"
#include "pine/jsonlite.hpp"
#include "pine/version.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace pine {

namespace {

const std::string kGenesisDigest(64, '0');

}  // namespace

// ---------------------------------------------------------------------------
// AdminRecord → JSON
// ---------------------------------------------------------------------------
std::string admin_record_to_json(const AdminRecord& r) {
  std::ostringstream o;
  o << "{"
    << "\"seq\":" << r.sequence
    << ",\"prev\":\"" << r.previous_digest << "\""
    << ",\"v\":" << r.audit_log_version
    << ",\"actor\":\"" << jsonlite::escape(r.actor) << "\""
    << ",\"action\":\"" << jsonlite::escape(r.action) << "\""
    << ",\"target\":\"" << jsonlite::escape(r.target) << "\""
    << ",\"ok\":" << (r.ok ? "true" : "false")
    << ",\"error_code\":\"" << r.error_code << "\""
    << ",\"block\":" << r.block
    << ",\"timestamp_unix_ms\":" << r.timestamp_unix_ms
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// ImmutableAuditLog
// ---------------------------------------------------------------------------

struct ImmutableAuditLog::Impl {
  std::mutex mu;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t entry_count{0};
  uint64_t failure_count{0};
  std::string last_digest{kGenesisDigest};
};

ImmutableAuditLog::ImmutableAuditLog(const std::string& path)
    : path_(path), impl_(new Impl()) {
  if (path_.empty()) return;

  // Resume the chain from the last entry already on disk.
  {
    std::ifstream in(path_);
    std::string line, last;
    while (std::getline(in, line)) {
      if (!line.empty()) last = line;
    }
    if (!last.empty()) {
      std::optional<jsonlite::JsonError> err;
      const auto obj = jsonlite::parse(last, &err);
      if (err) {
        // The chain cannot be resumed from an unreadable tail; appending
        // would restart at genesis and break verification.
        impl_->failure_count = 1;
        return;
      }
      impl_->seq = jsonlite::get_u64(obj, "seq", 0);
      impl_->last_digest = blake3_hex(last);
    }
  }
  impl_->file = std::fopen(path_.c_str(), "a");
}

ImmutableAuditLog::~ImmutableAuditLog() {
  if (impl_->file) std::fclose(impl_->file);
  delete impl_;
}

bool ImmutableAuditLog::append(AdminRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (path_.empty()) return true;  // disabled
  if (!impl_->file) {
    ++impl_->failure_count;
    return false;
  }

  // Seek to end before writing so the entry can only ever be appended.
  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  record.sequence = impl_->seq + 1;
  record.previous_digest = impl_->last_digest;
  record.audit_log_version = version::AUDIT_LOG_VERSION;
  record.timestamp_unix_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());

  const std::string line = admin_record_to_json(record);
  const std::string final_line = line + "\n";
  const bool written = std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) ==
                       final_line.size();
  std::fflush(impl_->file);

  if (written) {
    const long post_write_pos = std::ftell(impl_->file);
    if (post_write_pos >= 0 &&
        post_write_pos < pre_write_pos + static_cast<long>(final_line.size())) {
      ++impl_->failure_count;
      return false;
    }
  } else {
    ++impl_->failure_count;
    return false;
  }

  // Chain state only advances once the line is durably appended.
  impl_->seq = record.sequence;
  impl_->last_digest = blake3_hex(line);
  ++impl_->entry_count;
  return true;
}

uint64_t ImmutableAuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

uint64_t ImmutableAuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

bool ImmutableAuditLog::enabled() const { return !path_.empty(); }

// ---------------------------------------------------------------------------
// verify_audit_chain
// ---------------------------------------------------------------------------

AuditChainReport verify_audit_chain(const std::string& path) {
  AuditChainReport report;
  std::ifstream in(path);
  if (!in) {
    report.reason = "cannot open " + path;
    return report;
  }

  std::string expected_prev = kGenesisDigest;
  std::string line;
  uint64_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;

    std::optional<jsonlite::JsonError> err;
    const auto obj = jsonlite::parse(line, &err);
    if (err) {
      report.first_bad_line = line_no;
      report.reason = "malformed entry: " + err->message;
      return report;
    }
    if (jsonlite::get_u64(obj, "seq", 0) != report.entries + 1) {
      report.first_bad_line = line_no;
      report.reason = "sequence gap";
      return report;
    }
    if (jsonlite::get_string(obj, "prev") != expected_prev) {
      report.first_bad_line = line_no;
      report.reason = "broken chain";
      return report;
    }
    expected_prev = blake3_hex(line);
    ++report.entries;
  }
  report.ok = true;
  return report;
}

// ---------------------------------------------------------------------------
// Global singleton
// ---------------------------------------------------------------------------

namespace {
std::mutex g_audit_log_init_mu;
std::unique_ptr<ImmutableAuditLog> g_audit_log_instance;
}  // namespace

void set_audit_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_audit_log_init_mu);
  g_audit_log_instance = std::make_unique<ImmutableAuditLog>(path);
}

ImmutableAuditLog& global_audit_log() {
  std::lock_guard<std::mutex> lk(g_audit_log_init_mu);
  if (!g_audit_log_instance) {
    const char* env = std::getenv("PINE_AUDIT_LOG");
    g_audit_log_instance = std::make_unique<ImmutableAuditLog>((env && env[0]) ? env : "");
  }
  return *g_audit_log_instance;
}

}  // namespace pine
