#include "pine/snapshot.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#if defined(PINE_WITH_ZSTD)
#include <zstd.h>
#endif

#include "pine/hash.hpp"
#include "pine/version.hpp"

namespace fs = std::filesystem;

namespace pine {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

#if defined(PINE_WITH_ZSTD)
// Upper bound on a decompressed body.
constexpr uint64_t kMaxBodyBytes = uint64_t{1} << 32;

std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

// original_size comes from the untrusted header: it must match the size the
// frame itself declares before anything is allocated.
std::optional<std::string> decompress_zstd(const std::string& data, uint64_t original_size) {
  const unsigned long long frame_size = ZSTD_getFrameContentSize(data.data(), data.size());
  if (frame_size == ZSTD_CONTENTSIZE_ERROR || frame_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    return std::nullopt;
  }
  if (frame_size != original_size || frame_size > kMaxBodyBytes) return std::nullopt;
  std::string out;
  out.resize(static_cast<size_t>(frame_size));
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".pine_tmp_" + std::to_string(dist(rng)))).string();
}

// Atomic write: temp file in the same directory, then rename into place.
bool atomic_write(const fs::path& target, const std::string& data) {
  fs::path dir = target.parent_path();
  if (dir.empty()) dir = ".";
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) return false;

  const std::string tmp = make_tmp_name(dir);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

template <typename T>
std::optional<T> fail(Status* error, ErrorCode code, std::string detail) {
  if (error) *error = Status::failure(code, std::move(detail));
  return std::nullopt;
}

}  // namespace

// ---------------------------------------------------------------------------
// State <-> JSON
// ---------------------------------------------------------------------------

Value state_to_value(const AnalyticsState& state) {
  Object o;
  o["admin_owner"] = Value{state.admin_owner};
  o["current_block"] = Value{static_cast<uint64_t>(state.current_block)};
  o["merkle_depth"] = Value{static_cast<uint64_t>(state.merkle_depth)};

  Array apps;
  for (const auto& [id, cfg] : state.monitored_applications) apps.push_back(app_config_to_value(cfg));
  o["applications"] = Value{std::move(apps)};

  Array events;
  for (const auto& e : state.store.events()) events.push_back(event_to_value(e));
  o["events"] = Value{std::move(events)};
  o["next_event_id"] = Value{static_cast<uint64_t>(state.store.next_event_id())};
  o["total_events_captured"] = Value{static_cast<uint64_t>(state.store.total_events_captured())};

  Object metrics;
  for (const auto& [key, value] : state.aggregated_metrics) metrics[key] = metric_to_value(value);
  o["aggregated_metrics"] = Value{std::move(metrics)};

  Array defs;
  for (const auto& [name, def] : state.metric_definitions) defs.push_back(definition_to_value(def));
  o["metric_definitions"] = Value{std::move(defs)};

  o["rbac"] = state.rbac.to_value();
  o["rate_limiter"] = state.rate_limiter.to_value();

  const auto root = state.store.merkle().root();
  o["merkle_root"] = root ? Value{digest_to_hex(*root)} : Value{nullptr};
  return Value{std::move(o)};
}

std::optional<AnalyticsState> state_from_value(const Value& v, Status* error) {
  const auto* o = std::get_if<Object>(&v.v);
  if (!o) return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "body is not an object");

  AnalyticsState state;
  state.admin_owner = jsonlite::get_string(*o, "admin_owner");
  state.current_block = jsonlite::get_u64(*o, "current_block", 0);
  const auto depth = jsonlite::get_u64(*o, "merkle_depth", 16);
  if (depth == 0 || depth > 64) {
    return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "merkle_depth out of range");
  }
  state.merkle_depth = static_cast<uint32_t>(depth);

  if (const Array* apps = jsonlite::get_array(*o, "applications")) {
    for (const auto& a : *apps) {
      auto cfg = app_config_from_value(a);
      if (!cfg) return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "bad application");
      const ApplicationId id = cfg->application_id;
      state.monitored_applications[id] = std::move(*cfg);
    }
  }

  std::vector<CapturedEvent> events;
  if (const Array* arr = jsonlite::get_array(*o, "events")) {
    events.reserve(arr->size());
    for (const auto& ev : *arr) {
      auto e = event_from_value(ev);
      if (!e) return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "bad event");
      events.push_back(std::move(*e));
    }
  }
  auto store = EventStore::restore(std::move(events), jsonlite::get_u64(*o, "next_event_id", 0),
                                   jsonlite::get_u64(*o, "total_events_captured", 0),
                                   state.merkle_depth);
  if (!store) {
    return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "event log violates ordering");
  }
  state.store = std::move(*store);

  if (const Object* metrics = jsonlite::get_object(*o, "aggregated_metrics")) {
    for (const auto& [key, mv] : *metrics) {
      auto m = metric_from_value(mv);
      if (!m) return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "bad metric " + key);
      state.aggregated_metrics[key] = std::move(*m);
    }
  }
  if (const Array* defs = jsonlite::get_array(*o, "metric_definitions")) {
    for (const auto& dv : *defs) {
      auto d = definition_from_value(dv);
      if (!d) return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "bad definition");
      const std::string name = d->name;
      state.metric_definitions[name] = std::move(*d);
    }
  }

  const Value* rbac_v = nullptr;
  const Value* limiter_v = nullptr;
  if (auto it = o->find("rbac"); it != o->end()) rbac_v = &it->second;
  if (auto it = o->find("rate_limiter"); it != o->end()) limiter_v = &it->second;
  auto rbac_state = rbac_v ? rbac::RbacState::from_value(*rbac_v) : std::nullopt;
  if (!rbac_state) return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "bad rbac state");
  if (rbac_state->super_admin().value_or("") != state.admin_owner) {
    return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "super admin mismatch");
  }
  state.rbac = std::move(*rbac_state);
  auto limiter = limiter_v ? RateLimiter::from_value(*limiter_v) : std::nullopt;
  if (!limiter) return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "bad rate limiter");
  state.rate_limiter = std::move(*limiter);

  // The persisted root must match the tree rebuilt from the log.
  const auto root = state.store.merkle().root();
  const std::string stored_root = jsonlite::get_string(*o, "merkle_root");
  if ((root ? digest_to_hex(*root) : std::string()) != stored_root) {
    return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "merkle root mismatch");
  }
  return state;
}

// ---------------------------------------------------------------------------
// File I/O
// ---------------------------------------------------------------------------

bool snapshot_zstd_available() {
#if defined(PINE_WITH_ZSTD)
  return true;
#else
  return false;
#endif
}

Status save_snapshot(const AnalyticsState& state, const std::string& path,
                     SnapshotEncoding encoding) {
  const std::string body = jsonlite::to_json(state_to_value(state));
  std::string payload = body;

  if (encoding == SnapshotEncoding::zstd) {
#if defined(PINE_WITH_ZSTD)
    payload = compress_zstd(body);
    if (payload.empty() && !body.empty()) {
      return Status::failure(ErrorCode::snapshot_io_failed, "zstd compression failed");
    }
#else
    return Status::failure(ErrorCode::snapshot_io_failed, "built without zstd support");
#endif
  }

  Object header;
  header["snapshot_version"] = Value{static_cast<uint64_t>(version::SNAPSHOT_FORMAT_VERSION)};
  header["encoding"] = Value{to_string(encoding)};
  header["original_size"] = Value{static_cast<uint64_t>(body.size())};
  header["body_digest"] = Value{blake3_hex(body)};

  const std::string file = jsonlite::to_json(Value{std::move(header)}) + "\n" + payload;
  if (!atomic_write(path, file)) {
    return Status::failure(ErrorCode::snapshot_io_failed, "cannot write " + path);
  }
  return Status::success();
}

std::optional<AnalyticsState> load_snapshot(const std::string& path, Status* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return fail<AnalyticsState>(error, ErrorCode::snapshot_io_failed, "cannot read " + path);
  std::ostringstream ss;
  ss << ifs.rdbuf();
  const std::string file = ss.str();

  const size_t nl = file.find('\n');
  if (nl == std::string::npos) {
    return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "missing header line");
  }
  std::optional<jsonlite::JsonError> err;
  const Object header = jsonlite::parse(file.substr(0, nl), &err);
  if (err) return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "bad header: " + err->message);

  if (jsonlite::get_u64(header, "snapshot_version", 0) != version::SNAPSHOT_FORMAT_VERSION) {
    return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "unsupported snapshot version");
  }
  const auto encoding = snapshot_encoding_from_string(jsonlite::get_string(header, "encoding"));
  if (!encoding) return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "unknown encoding");
  const auto original_size = jsonlite::get_u64(header, "original_size", 0);

  std::string body = file.substr(nl + 1);
  if (*encoding == SnapshotEncoding::zstd) {
#if defined(PINE_WITH_ZSTD)
    auto decoded = decompress_zstd(body, original_size);
    if (!decoded) return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "zstd decode failed");
    body = std::move(*decoded);
#else
    return fail<AnalyticsState>(error, ErrorCode::snapshot_io_failed, "built without zstd support");
#endif
  }

  if (body.size() != original_size ||
      blake3_hex(body) != jsonlite::get_string(header, "body_digest")) {
    return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "body digest mismatch");
  }

  const Value v = jsonlite::parse_value(body, &err);
  if (err) return fail<AnalyticsState>(error, ErrorCode::snapshot_corrupt, "bad body: " + err->message);
  return state_from_value(v, error);
}

}  // namespace pine
