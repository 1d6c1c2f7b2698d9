#include "pine/config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "pine/audit.hpp"
#include "pine/jsonlite.hpp"
#include "pine/observability.hpp"

namespace pine {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? std::string(e) : fallback;
}

}  // namespace

std::string to_string(SnapshotEncoding e) {
  return e == SnapshotEncoding::zstd ? "zstd" : "identity";
}

std::optional<SnapshotEncoding> snapshot_encoding_from_string(const std::string& s) {
  if (s == "identity") return SnapshotEncoding::identity;
  if (s == "zstd") return SnapshotEncoding::zstd;
  return std::nullopt;
}

Status ServiceConfig::validate() const {
  if (super_admin.empty()) {
    return Status::failure(ErrorCode::invalid_configuration, "super_admin must not be empty");
  }
  return rate_limits.validate();
}

std::string ServiceConfig::to_json() const {
  jsonlite::Object o;
  o["super_admin"] = jsonlite::Value{super_admin};
  o["rate_limits"] = rate_limit_config_to_value(rate_limits);
  o["merkle_depth"] = jsonlite::Value{static_cast<uint64_t>(merkle_depth)};
  o["event_log_path"] = jsonlite::Value{event_log_path};
  o["audit_log_path"] = jsonlite::Value{audit_log_path};
  o["snapshot_path"] = jsonlite::Value{snapshot_path};
  o["snapshot_encoding"] = jsonlite::Value{to_string(snapshot_encoding)};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

std::optional<ServiceConfig> parse_service_config(const std::string& text, Status* error) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(text, &err);
  if (err) {
    if (error) *error = Status::failure(ErrorCode::json_parse_error, err->message);
    return std::nullopt;
  }

  ServiceConfig c;
  c.super_admin = jsonlite::get_string(o, "super_admin");
  if (const auto* rl = jsonlite::get_object(o, "rate_limits")) {
    c.rate_limits = rate_limit_config_from_object(*rl);
  }
  const auto depth = jsonlite::get_u64(o, "merkle_depth", c.merkle_depth);
  if (depth == 0 || depth > 64) {
    if (error) *error = Status::failure(ErrorCode::invalid_configuration, "merkle_depth out of range");
    return std::nullopt;
  }
  c.merkle_depth = static_cast<uint32_t>(depth);
  c.event_log_path = jsonlite::get_string(o, "event_log_path");
  c.audit_log_path = jsonlite::get_string(o, "audit_log_path");
  c.snapshot_path = jsonlite::get_string(o, "snapshot_path");

  const std::string encoding = jsonlite::get_string(o, "snapshot_encoding", "identity");
  const auto enc = snapshot_encoding_from_string(encoding);
  if (!enc) {
    if (error) {
      *error = Status::failure(ErrorCode::invalid_configuration,
                               "unknown snapshot_encoding: " + encoding);
    }
    return std::nullopt;
  }
  c.snapshot_encoding = *enc;

  Status s = c.validate();
  if (!s.ok()) {
    if (error) *error = std::move(s);
    return std::nullopt;
  }
  return c;
}

std::optional<ServiceConfig> load_service_config(const std::string& path, Status* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (error) *error = Status::failure(ErrorCode::invalid_configuration, "cannot read " + path);
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return parse_service_config(ss.str(), error);
}

void apply_env_overrides(ServiceConfig& config) {
  config.event_log_path = env_or("PINE_EVENT_LOG", config.event_log_path);
  config.audit_log_path = env_or("PINE_AUDIT_LOG", config.audit_log_path);
  config.snapshot_path = env_or("PINE_SNAPSHOT", config.snapshot_path);
}

void install_sinks(const ServiceConfig& config) {
  set_event_log_path(config.event_log_path);
  set_audit_log_path(config.audit_log_path);
}

}  // namespace pine
