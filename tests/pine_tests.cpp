#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "pine/aggregation.hpp"
#include "pine/audit.hpp"
#include "pine/config.hpp"
#include "pine/dispatch.hpp"
#include "pine/event_store.hpp"
#include "pine/hash.hpp"
#include "pine/jsonlite.hpp"
#include "pine/merkle.hpp"
#include "pine/observability.hpp"
#include "pine/operations.hpp"
#include "pine/rate_limiter.hpp"
#include "pine/rbac.hpp"
#include "pine/snapshot.hpp"
#include "pine/state.hpp"
#include "pine/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool near(double a, double b, double eps = 1e-4) { return std::fabs(a - b) < eps; }

fs::path scratch_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("pine_tests_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::string read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::vector<std::string> read_lines(const fs::path& p) {
  std::ifstream ifs(p);
  std::vector<std::string> out;
  std::string line;
  while (std::getline(ifs, line)) {
    if (!line.empty()) out.push_back(line);
  }
  return out;
}

pine::CapturedEvent make_event(const std::string& app, const std::string& tx,
                               pine::Timestamp ts = 1000, double value = 1.0) {
  pine::CapturedEvent e;
  e.source_app = app;
  e.source_chain = "chain-1";
  e.timestamp = ts;
  e.event_type = "transfer";
  pine::jsonlite::Object data;
  data["value"] = pine::jsonlite::Value{value};
  data["memo"] = pine::jsonlite::Value{"Payment for " + tx};
  e.data = pine::jsonlite::Value{std::move(data)};
  e.transaction_hash = tx;
  return e;
}

pine::Digest leaf(uint64_t n) { return pine::hash_domain("test:", std::to_string(n)); }

// Isolates tests from any sink configured in the environment.
void quiet_sinks() {
  pine::set_ingest_event_hook(nullptr);
  pine::set_event_log_path("");
  pine::set_audit_log_path("");
}

// ============================================================================
// Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(pine::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(pine::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const auto a = pine::hash_domain("evt:", "payload");
  const auto b = pine::hash_domain("node:", "payload");
  expect(a != b, "domains must separate identical payloads");
  expect(pine::event_content_hash("payload") == a, "event hash uses the evt: domain");
}

void test_node_hash_order_sensitive() {
  const auto l = leaf(1), r = leaf(2);
  expect(pine::node_hash(l, r) != pine::node_hash(r, l), "combine(a,b) != combine(b,a)");
  const auto zero = pine::zero_digest();
  expect(std::all_of(zero.begin(), zero.end(), [](uint8_t b) { return b == 0; }),
         "zero digest is 32 zero bytes");
}

void test_digest_hex_consistency() {
  const auto d = pine::hash_bytes_blake3("hello");
  const std::string hex = pine::digest_to_hex(d);
  expect(hex == pine::blake3_hex("hello"), "binary and hex forms agree");
  auto back = pine::digest_from_hex(hex);
  expect(back && *back == d, "hex parses back to the digest");
  expect(!pine::digest_from_hex("xyz"), "short hex rejected");
  expect(!pine::digest_from_hex(std::string(64, 'g')), "non-hex rejected");
}

// ============================================================================
// JSON + data model
// ============================================================================

void test_json_canonical_order() {
  std::optional<pine::jsonlite::JsonError> err;
  const std::string canon = pine::jsonlite::canonicalize_json("{\"b\":1,\"a\":{\"z\":true,\"y\":null}}", &err);
  expect(!err, "valid JSON parses");
  expect(canon == "{\"a\":{\"y\":null,\"z\":true},\"b\":1}", "keys are sorted: " + canon);
}

void test_json_find_path() {
  std::optional<pine::jsonlite::JsonError> err;
  const auto v = pine::jsonlite::parse_value("{\"order\":{\"items\":[{\"price\":2.5},{\"price\":4}]}}", &err);
  expect(!err, "parse");
  const auto* p = pine::jsonlite::find_path(v, "order.items.1.price");
  expect(p != nullptr, "array index resolves");
  expect(pine::jsonlite::as_number(*p).value_or(0) == 4.0, "integer price");
  expect(pine::jsonlite::find_path(v, "order.items.7.price") == nullptr, "out-of-range index");
  expect(pine::jsonlite::find_path(v, "order.missing") == nullptr, "missing key");
}

pine::AnalyticsState make_state();

void test_json_nesting_limit() {
  std::optional<pine::jsonlite::JsonError> err;
  (void)pine::jsonlite::parse_value(std::string(1000000, '['), &err);
  expect(err && err->code == "json_parse_error", "a million open brackets is an error, not a crash");

  err.reset();
  (void)pine::jsonlite::parse_value(std::string(256, '[') + std::string(256, ']'), &err);
  expect(!err, "256 levels parse");
  err.reset();
  (void)pine::jsonlite::parse_value(std::string(257, '[') + std::string(257, ']'), &err);
  expect(err && err->message == "nesting too deep", "257 levels rejected");

  quiet_sinks();
  auto s = make_state();
  const std::string line = "{\"op\":\"get_merkle_root\",\"pad\":" + std::string(5000, '[') +
                           std::string(5000, ']') + "}";
  const auto r = pine::apply_operation_json(s, line);
  expect(r.status.code == pine::ErrorCode::json_parse_error, "deep request rejected as a parse error");
}

void test_json_unicode_escapes() {
  auto str = [](const std::string& text, std::optional<pine::jsonlite::JsonError>* err) {
    const auto v = pine::jsonlite::parse_value(text, err);
    const auto* p = std::get_if<std::string>(&v.v);
    return p ? *p : std::string();
  };
  std::optional<pine::jsonlite::JsonError> err;
  expect(str("\"\\u00e9\"", &err) == "\xC3\xA9" && !err, "two-byte escape");
  expect(str("\"\\u20ac\"", &err) == "\xE2\x82\xAC" && !err, "three-byte escape");
  expect(str("\"\\ud83d\\ude00\"", &err) == "\xF0\x9F\x98\x80" && !err, "surrogate pair joins");

  (void)str("\"\\uzzzz\"", &err);
  expect(err && err->code == "json_parse_error", "non-hex digits rejected");
  err.reset();
  (void)str("\"\\u12\"", &err);
  expect(err.has_value(), "short escape rejected");
  err.reset();
  (void)str("\"\\ud83d\"", &err);
  expect(err.has_value(), "lone high surrogate rejected");
  err.reset();
  (void)str("\"\\ud83dx\"", &err);
  expect(err.has_value(), "high surrogate followed by a plain char rejected");
  err.reset();
  (void)str("\"\\ude00\"", &err);
  expect(err.has_value(), "lone low surrogate rejected");
}

void test_event_decoding_requires_keys() {
  auto v = pine::event_to_value(make_event("app", "0xaa"));
  expect(pine::event_from_value(v).has_value(), "complete event decodes");

  auto& o = std::get<pine::jsonlite::Object>(v.v);
  o["transaction_hash"] = pine::jsonlite::Value{""};
  expect(!pine::event_from_value(v), "empty transaction hash rejected");

  auto v2 = pine::event_to_value(make_event("app", "0xaa"));
  std::get<pine::jsonlite::Object>(v2.v)["severity"] = pine::jsonlite::Value{"loud"};
  expect(!pine::event_from_value(v2), "unknown severity rejected");
}

void test_canonical_event_covers_assignment() {
  auto e = make_event("app", "0xaa");
  const std::string before = pine::canonical_event_json(e);
  e.id = 7;
  e.block_height = 3;
  const std::string after = pine::canonical_event_json(e);
  expect(before != after, "id and block height are part of the canonical form");
  expect(after.find("\"block_height\":3") != std::string::npos, "block height serialized");
}

void test_metric_value_reduction() {
  using pine::aggregation::extract_metric_value;
  expect(extract_metric_value(pine::CounterValue{7}) == 7.0, "counter");
  expect(extract_metric_value(pine::GaugeValue{2.5}) == 2.5, "gauge");
  expect(extract_metric_value(pine::HistogramValue{{1.0, 2.0, 6.0}}) == 3.0, "histogram mean");
  expect(extract_metric_value(pine::SummaryValue{10.0, 4, 2.5}) == 2.5, "summary avg");
  expect(extract_metric_value(pine::HistogramValue{}) == 0.0, "empty histogram");

  auto v = pine::metric_to_value(pine::SummaryValue{10.0, 4, 2.5});
  auto back = pine::metric_from_value(v);
  expect(back && std::holds_alternative<pine::SummaryValue>(*back), "tagged form decodes");
  expect(!pine::metric_from_value(pine::jsonlite::Value{"gauge"}), "untagged value rejected");
}

// ============================================================================
// MerkleIndex
// ============================================================================

void test_merkle_empty_root_absent() {
  pine::MerkleIndex m;
  expect(!m.root().has_value(), "empty tree has no root");
  expect(!m.generate_proof(1), "no proof in empty tree");
  expect(!m.generate_batch_proof({1, 2}, 9), "no batch proof in empty tree");
}

void test_merkle_single_leaf() {
  pine::MerkleIndex m;
  m.insert(42, leaf(42));
  expect(m.root() == leaf(42), "single-leaf root is the leaf");
  auto p = m.generate_proof(42);
  expect(p && p->path.empty(), "single-leaf proof has no siblings");
  expect(pine::MerkleIndex::verify_proof(*m.root(), *p), "single-leaf proof verifies");
}

void test_merkle_permutation_determinism() {
  std::vector<pine::EventId> ids = {1, 2, 3, 4};
  pine::MerkleIndex reference;
  for (auto id : ids) reference.insert(id, leaf(id));
  const auto expected = reference.root();

  do {
    pine::MerkleIndex m;
    for (auto id : ids) m.insert(id, leaf(id));
    expect(m.root() == expected, "root independent of insertion order");
  } while (std::next_permutation(ids.begin(), ids.end()));
}

void test_merkle_known_shape() {
  pine::MerkleIndex m;
  for (uint64_t i = 1; i <= 3; ++i) m.insert(i, leaf(i));
  // Three leaves pad to four with the zero digest.
  const auto expected = pine::node_hash(pine::node_hash(leaf(1), leaf(2)),
                                        pine::node_hash(leaf(3), pine::zero_digest()));
  expect(m.root() == expected, "padding and pairing convention");
}

void test_merkle_proof_roundtrip() {
  pine::MerkleIndex m;
  for (uint64_t i = 10; i < 17; ++i) m.insert(i, leaf(i));
  const auto root = *m.root();
  for (uint64_t i = 10; i < 17; ++i) {
    auto p = m.generate_proof(i);
    expect(p.has_value(), "proof exists for indexed id");
    expect(p->path.size() == 3, "7 leaves pad to 8: three levels");
    expect(pine::MerkleIndex::verify_proof(root, *p), "proof verifies");
    auto tampered = *p;
    tampered.leaf_hash[0] ^= 0x01;
    expect(!pine::MerkleIndex::verify_proof(root, tampered), "tampered leaf rejected");
  }
  expect(!m.generate_proof(99), "unknown id has no proof");
}

void test_merkle_sibling_side_alternates() {
  pine::MerkleIndex m;
  for (uint64_t i = 0; i < 4; ++i) m.insert(i, leaf(i));
  auto p = m.generate_proof(1);  // index 1: sibling left, then parent 0: sibling right
  expect(p && p->path.size() == 2, "two levels");
  expect(p->path[0].sibling_is_left && p->path[0].sibling == leaf(0), "leaf-level sibling on the left");
  expect(!p->path[1].sibling_is_left, "parent-level sibling on the right");
}

void test_merkle_overwrite_leaf() {
  pine::MerkleIndex m;
  m.insert(1, leaf(1));
  m.insert(2, leaf(2));
  const auto before = m.root();
  m.insert(2, leaf(99));
  expect(m.event_count() == 2, "overwrite keeps leaf count");
  expect(m.root() != before, "overwrite changes root");
}

void test_merkle_batch_proof() {
  pine::MerkleIndex m;
  for (uint64_t i = 1; i <= 5; ++i) m.insert(i, leaf(i));
  auto b = m.generate_batch_proof({1, 3, 77}, 12);
  expect(b.has_value(), "batch proof exists");
  expect(b->batch_id == 12, "batch id echoed");
  expect(b->event_count == 3, "event_count counts requested ids");
  expect(b->proofs.size() == 2, "unknown id skipped");
  expect(b->batch_root == *m.root(), "batch shares the current root");
  for (const auto& p : b->proofs) {
    expect(pine::MerkleIndex::verify_proof(b->batch_root, p), "batch member verifies");
  }
  expect(!m.generate_batch_proof({70, 71}, 1), "no resolvable id yields no batch");
}

void test_merkle_proof_json_roundtrip() {
  pine::MerkleIndex m;
  for (uint64_t i = 1; i <= 6; ++i) m.insert(i, leaf(i));
  const auto p = *m.generate_proof(5);
  std::optional<pine::jsonlite::JsonError> err;
  const auto v = pine::jsonlite::parse_value(p.to_json(), &err);
  expect(!err, "proof JSON parses");
  auto back = pine::proof_from_value(v);
  expect(back.has_value(), "proof decodes");
  expect(pine::MerkleIndex::verify_proof(*m.root(), *back), "decoded proof verifies");
}

// ============================================================================
// RateLimiter
// ============================================================================

pine::RateLimitConfig strict_config() {
  pine::RateLimitConfig c;
  c.max_events_per_app_per_block = 5;
  c.max_total_events_per_block = 1000;
  c.burst_multiplier = 1.0;
  c.cooldown_blocks = 5;
  return c;
}

void test_admission_fairness() {
  pine::RateLimiter rl(strict_config());
  for (int i = 0; i < 5; ++i) {
    expect(rl.check_and_increment("A", 1).ok(), "first five admitted");
  }
  const auto d = rl.check_and_increment("A", 1);
  expect(d.code == pine::ErrorCode::app_limit_exceeded, "sixth exceeds app limit");
  expect(d.limit == 5 && d.current == 5, "decision carries limit and count");
  expect(d.unblock_at == 6, "blocked until block + cooldown");
  expect(rl.blocked_apps().count("A") == 1, "A is blocked");
  expect(rl.check_and_increment("B", 1).ok(), "other apps unaffected");
}

void test_block_expiry() {
  pine::RateLimiter rl(strict_config());
  for (int i = 0; i < 6; ++i) (void)rl.check_and_increment("A", 1);
  const auto blocked = rl.check_and_increment("A", 5);
  expect(blocked.code == pine::ErrorCode::app_blocked, "still blocked before until");
  expect(blocked.unblock_at == 6 && blocked.current_block == 5, "blocked context");
  expect(rl.check_and_increment("A", 6).ok(), "admitted once current >= until");
  expect(rl.blocked_apps().empty(), "expired block cleared");
}

void test_pause_dominance() {
  pine::RateLimiter rl(strict_config());
  rl.pause();
  expect(rl.check_and_increment("A", 1).code == pine::ErrorCode::ingestion_paused, "paused rejects A");
  expect(rl.check_and_increment("B", 1).code == pine::ErrorCode::ingestion_paused, "paused rejects B");
  expect(rl.global_counter().count == 0, "paused check touches no counters");
  rl.resume();
  expect(rl.check_and_increment("A", 1).ok(), "resume admits again");
}

void test_global_limit_is_brownout() {
  auto c = strict_config();
  c.max_total_events_per_block = 3;
  pine::RateLimiter rl(c);
  expect(rl.check_and_increment("A", 1).ok(), "1");
  expect(rl.check_and_increment("B", 1).ok(), "2");
  expect(rl.check_and_increment("C", 1).ok(), "3");
  const auto d = rl.check_and_increment("D", 1);
  expect(d.code == pine::ErrorCode::global_limit_exceeded, "global limit");
  expect(rl.blocked_apps().empty(), "global limit blocks nobody");
  expect(rl.check_and_increment("D", 2).ok(), "new block resets the global counter");
}

void test_burst_multiplier_floor() {
  auto c = strict_config();
  c.max_events_per_app_per_block = 3;
  c.burst_multiplier = 1.5;  // floor(4.5) = 4
  pine::RateLimiter rl(c);
  for (int i = 0; i < 4; ++i) expect(rl.check_and_increment("A", 1).ok(), "within burst");
  expect(rl.check_and_increment("A", 1).code == pine::ErrorCode::app_limit_exceeded, "burst floor");
}

void test_disabled_limiter_admits() {
  auto c = strict_config();
  c.enabled = false;
  pine::RateLimiter rl(c);
  for (int i = 0; i < 50; ++i) expect(rl.check_and_increment("A", 1).ok(), "disabled admits");
  expect(rl.global_counter().count == 0, "disabled counts nothing");
  rl.pause();
  expect(rl.check_and_increment("A", 1).code == pine::ErrorCode::ingestion_paused,
         "pause still dominates when disabled");
}

void test_unblock_and_stats() {
  pine::RateLimiter rl(strict_config());
  for (int i = 0; i < 6; ++i) (void)rl.check_and_increment("A", 1);
  auto stats = rl.get_stats();
  expect(stats.blocked_apps_count == 1 && stats.global_count == 5, "stats count");
  expect(stats.global_limit == 1000, "stats report the configured global limit");
  expect(rl.unblock_app("A"), "unblock removes the block");
  expect(!rl.unblock_app("A"), "second unblock is a no-op");
  expect(rl.check_and_increment("A", 2).ok(), "unblocked app admitted in a new block");
}

void test_config_validation() {
  auto c = strict_config();
  c.burst_multiplier = 0.0;
  expect(c.validate().code == pine::ErrorCode::invalid_configuration, "zero burst rejected");
  c.burst_multiplier = std::numeric_limits<double>::quiet_NaN();
  expect(!c.validate().ok(), "NaN burst rejected");
  pine::RateLimiter rl;
  expect(!rl.update_config(c).ok(), "update rejects invalid config");
  expect(rl.config().burst_multiplier == 1.5, "rejected update keeps old config");
}

// ============================================================================
// RBAC
// ============================================================================

void test_rbac_super_admin_immutable() {
  pine::rbac::RbacState s("root");
  expect(s.assign_role("root", pine::rbac::Role::viewer).code ==
             pine::ErrorCode::cannot_demote_super_admin, "demotion rejected");
  expect(s.remove_role("root").code == pine::ErrorCode::cannot_demote_super_admin, "removal rejected");
  expect(s.get_role("root") == pine::rbac::Role::super_admin, "still super admin");
  expect(s.assign_role("root", pine::rbac::Role::super_admin).ok(), "reassigning super admin is fine");
}

void test_rbac_permission_table() {
  using pine::rbac::Permission;
  using pine::rbac::Role;
  pine::rbac::RbacState s("root");
  for (auto p : {Permission::add_application, Permission::remove_application,
                 Permission::capture_events, Permission::modify_metrics,
                 Permission::configure_system, Permission::view_data,
                 Permission::manage_roles, Permission::control_ingestion}) {
    expect(s.has_permission("root", p), "super admin holds " + pine::rbac::permission_to_string(p));
  }
  expect(pine::rbac::permissions_for(Role::viewer) == std::vector<Permission>{Permission::view_data},
         "viewer holds view_data only");
  expect(s.has_permission("nobody", Permission::view_data), "default role is viewer");
  expect(!s.has_permission("nobody", Permission::capture_events), "viewer cannot capture");
  expect(pine::rbac::role_has_permission(Role::data_ingester, Permission::capture_events), "ingester captures");
  expect(!pine::rbac::role_has_permission(Role::operator_, Permission::modify_metrics), "operator cannot modify metrics");
  expect(pine::rbac::role_has_permission(Role::admin, Permission::control_ingestion), "admin controls ingestion");
  expect(!pine::rbac::role_has_permission(Role::admin, Permission::configure_system), "configure is super admin only");
}

void test_rbac_can_manage() {
  using pine::rbac::Role;
  pine::rbac::RbacState s("root");
  (void)s.assign_role("adm", Role::admin);
  (void)s.assign_role("adm2", Role::admin);
  (void)s.assign_role("op", Role::operator_);
  expect(s.can_manage("root", "adm"), "super admin manages admin");
  expect(s.can_manage("root", "root"), "super admin manages anyone");
  expect(s.can_manage("adm", "op"), "admin manages operator");
  expect(s.can_manage("adm", "stranger"), "admin manages viewer");
  expect(!s.can_manage("adm", "adm2"), "admin cannot manage admin");
  expect(!s.can_manage("adm", "root"), "admin cannot manage super admin");
  expect(!s.can_manage("op", "stranger"), "operator manages nobody");
}

void test_rbac_remove_reverts_to_viewer() {
  pine::rbac::RbacState s("root");
  (void)s.assign_role("op", pine::rbac::Role::operator_);
  expect(s.remove_role("op").ok(), "remove ok");
  expect(s.get_role("op") == pine::rbac::Role::viewer, "reverts to viewer");
  expect(pine::rbac::role_from_string("operator") == pine::rbac::Role::operator_, "role names");
  expect(!pine::rbac::role_from_string("god"), "unknown role");
}

// ============================================================================
// Aggregation
// ============================================================================

void test_statistics() {
  using namespace pine::aggregation;
  const std::vector<double> v = {1, 2, 3, 4, 5};
  expect(mean(v) == 3.0, "mean");
  expect(near(std_dev(v), 1.5811), "sample std dev");
  expect(mean({}) == 0.0 && std_dev({}) == 0.0 && std_dev({4.0}) == 0.0, "degenerate inputs");

  const std::vector<double> ten = {10, 9, 8, 7, 6, 5, 4, 3, 2, 1};
  expect(percentile(ten, 0.5) == 6.0, "p50 nearest rank");
  expect(percentile(ten, 0.9) == 9.0, "p90 nearest rank");
  expect(percentile(ten, 2.0) == 10.0 && percentile(ten, -1.0) == 1.0, "p clamped");
  expect(percentile({}, 0.5) == 0.0, "empty percentile");
}

void test_anomaly_detection() {
  using namespace pine::aggregation;
  const std::vector<double> v = {10, 11, 10.5, 9.5, 100, 10.2, 10.8};
  Series s;
  for (size_t i = 0; i < v.size(); ++i) s.emplace_back(i * 10, v[i]);
  const auto a = detect_anomalies(s, 2.0);
  expect(a.size() == 1, "one anomaly");
  expect(a[0].index == 4 && a[0].value == 100.0 && a[0].timestamp == 40, "index 4 flagged");
  expect(a[0].z_score > 2.0, "positive z");

  Series flat = {{0, 5.0}, {1, 5.0}, {2, 5.0}};
  expect(detect_anomalies(flat, 0.1).empty(), "constant series has no anomalies");
}

void test_correlation() {
  using namespace pine::aggregation;
  expect(near(correlation({1, 2, 3, 4, 5}, {2, 4, 6, 8, 10}), 1.0), "perfect positive");
  expect(near(correlation({1, 2, 3}, {3, 2, 1}), -1.0), "perfect negative");
  expect(correlation({1, 2, 3}, {1, 2}) == 0.0, "length mismatch");
  expect(correlation({1}, {1}) == 0.0, "fewer than two points");
  expect(correlation({1, 1, 1}, {1, 2, 3}) == 0.0, "zero deviation");
}

void test_moving_average() {
  using namespace pine::aggregation;
  Series s = {{1, 1.0}, {2, 2.0}, {3, 3.0}, {4, 4.0}};
  const auto ma = moving_average(s, 2);
  expect(ma.size() == 3, "n - w + 1 windows");
  expect(ma[0].value == 1.5 && ma[0].timestamp == 2, "first window at its last point");
  expect(ma[2].value == 3.5 && ma[2].timestamp == 4, "last window");
  expect(moving_average(s, 5).empty(), "window longer than series");
  expect(moving_average(s, 0).empty(), "zero window");
}

void test_aggregate_dispatch() {
  using namespace pine::aggregation;
  const std::vector<double> v = {4, 1, 3};
  expect(aggregate(v, {AggregationType::sum}) == 8.0, "sum");
  expect(near(aggregate(v, {AggregationType::average}), 8.0 / 3.0), "average");
  expect(aggregate(v, {AggregationType::min}) == 1.0, "min");
  expect(aggregate(v, {AggregationType::max}) == 4.0, "max");
  expect(aggregate(v, {AggregationType::count}) == 3.0, "count");
  expect(aggregate(v, AggregationKind::percentile(1.0)) == 4.0, "percentile");
  expect(aggregate({}, {AggregationType::min}) == std::numeric_limits<double>::max(), "empty min");
  expect(aggregate({}, {AggregationType::max}) == std::numeric_limits<double>::lowest(), "empty max");
}

void test_time_buckets() {
  using namespace pine::aggregation;
  expect(TimeBucket::from_timestamp(1234, 100).start == 1200, "floored");
  expect(TimeBucket::from_timestamp(1234, 0).start == 1234, "zero granularity");
  expect(TimeBucket{100, 10} < TimeBucket{200, 10}, "ordered by start");
  const uint64_t top = std::numeric_limits<uint64_t>::max();
  const auto last = TimeBucket::from_timestamp(top, 1000);
  expect(last.start == top - top % 1000 && last.start <= top && last.duration_ms == 1000,
         "bucket at the top of the range starts at or below the timestamp");

  std::vector<pine::CapturedEvent> events = {make_event("a", "1", 105), make_event("a", "2", 150),
                                             make_event("a", "3", 250)};
  std::vector<const pine::CapturedEvent*> ptrs;
  for (const auto& e : events) ptrs.push_back(&e);
  const auto buckets = bucket_events(ptrs, 100);
  expect(buckets.size() == 2, "two buckets");
  expect(buckets.begin()->first.start == 100 && buckets.begin()->second.size() == 2, "first bucket");
}

void test_aggregation_kind_json() {
  using namespace pine::aggregation;
  auto k = kind_from_value(kind_to_value(AggregationKind::percentile(0.95)));
  expect(k && *k == AggregationKind::percentile(0.95), "percentile kind");
  expect(!kind_from_value(pine::jsonlite::Value{"median"}), "unknown kind");
}

// ============================================================================
// EventStore
// ============================================================================

void test_dedup_idempotence() {
  pine::EventStore store;
  pine::RateLimiter rl;
  auto first = store.ingest(make_event("app", "0xdead"), rl, 1);
  auto second = store.ingest(make_event("app", "0xdead"), rl, 1);
  expect(first.ok(), "first admitted");
  expect(second.status.code == pine::ErrorCode::duplicate_event, "second is a duplicate");
  expect(store.total_events_captured() == 1, "lifetime counter incremented once");
  expect(rl.global_counter().count == 1, "duplicate consumed no quota");
}

void test_rejected_admission_is_pure() {
  pine::EventStore store;
  pine::RateLimiter rl(strict_config());
  (void)store.ingest(make_event("app", "0x1"), rl, 1);
  const auto root = store.merkle().root();
  rl.pause();
  auto r = store.ingest(make_event("app", "0x2"), rl, 1);
  expect(r.status.code == pine::ErrorCode::ingestion_paused, "paused");
  expect(store.events().size() == 1 && store.tx_hashes().size() == 1, "log untouched");
  expect(store.merkle().root() == root, "root untouched");
  expect(store.next_event_id() == 1, "no id consumed");
  expect(!store.is_duplicate("0x2"), "rejected hash not recorded");
}

void test_ids_and_indexes() {
  pine::EventStore store;
  pine::RateLimiter rl;
  auto a = store.ingest(make_event("alpha", "0x1", 300), rl, 4);
  auto b = store.ingest(make_event("beta", "0x2", 100), rl, 4);
  auto c = store.ingest(make_event("alpha", "0x3", 300), rl, 5);
  expect(a.event_id < b.event_id && b.event_id < c.event_id, "ids strictly increasing");
  expect(store.get(c.event_id)->block_height == 5u, "block height assigned");
  expect(store.by_app("alpha").size() == 2, "app index");
  const auto range = store.in_range(100, 300);
  expect(range.size() == 3 && range[0]->transaction_hash == "0x2", "time index ascending");
  expect(store.in_range(101, 299).empty(), "inclusive bounds");
  expect(store.merkle().event_count() == 3, "one leaf per event");
  expect(store.merkle().leaves().at(b.event_id) == pine::EventStore::content_hash(*store.get(b.event_id)),
         "leaf is the content hash");
}

void test_clear_and_rebuild() {
  pine::EventStore store;
  pine::RateLimiter rl;
  for (int i = 0; i < 5; ++i) (void)store.ingest(make_event("app", "0x" + std::to_string(i)), rl, 1);
  const auto root = store.merkle().root();
  store.rebuild_merkle();
  expect(store.merkle().root() == root, "rebuild reproduces the root");

  store.clear();
  expect(store.events().empty() && store.time_index().empty() && store.app_index().empty(), "cleared");
  expect(!store.merkle().root(), "tree reset");
  expect(store.total_events_captured() == 5, "lifetime counter survives clear");
  auto r = store.ingest(make_event("app", "0x0"), rl, 2);
  expect(r.ok() && r.event_id == 5, "ids are not reused and hashes may return");
}

void test_batch_continues_on_error() {
  pine::EventStore store;
  pine::RateLimiter rl;
  size_t observed = 0;
  auto r = store.ingest_batch({make_event("a", "0x1"), make_event("a", "0x1"), make_event("a", "0x2")},
                              rl, 1, [&](size_t, const pine::CapturedEvent&, const pine::IngestResult&) {
                                ++observed;
                              });
  expect(observed == 3, "observer sees every item");
  expect(r.status.code == pine::ErrorCode::batch_partial_failure, "partial failure reported");
  expect(r.accepted == 2 && r.rejected == 1, "per-batch counts");
  expect(r.last_event_id == std::optional<pine::EventId>(1), "last success surfaced");
}

void test_store_restore_validates() {
  auto e1 = make_event("a", "0x1");
  e1.id = 3;
  auto e2 = make_event("a", "0x2");
  e2.id = 2;
  expect(!pine::EventStore::restore({e1, e2}, 10, 2, 16), "decreasing ids rejected");
  e2.id = 4;
  expect(!pine::EventStore::restore({e1, e2}, 4, 2, 16), "id at next_event_id rejected");
  auto ok = pine::EventStore::restore({e1, e2}, 5, 9, 16);
  expect(ok && ok->merkle().event_count() == 2 && ok->by_app("a").size() == 2, "restored with indexes");
}

// ============================================================================
// Operations
// ============================================================================

pine::AnalyticsState make_state() {
  pine::AnalyticsState s("root");
  (void)pine::assign_role(s, "root", "ingest", pine::rbac::Role::data_ingester);
  (void)pine::assign_role(s, "root", "ops", pine::rbac::Role::operator_);
  (void)pine::assign_role(s, "root", "adm", pine::rbac::Role::admin);
  return s;
}

void test_op_submit_authorization() {
  quiet_sinks();
  auto s = make_state();
  auto denied = pine::submit_event(s, "stranger", make_event("app", "0x1"));
  expect(denied.status.code == pine::ErrorCode::unauthorized, "viewer cannot submit");
  expect(s.store.events().empty() && s.rate_limiter.global_counter().count == 0, "no state change");

  auto ok = pine::submit_event(s, "ingest", make_event("app", "0x1"));
  expect(ok.ok() && ok.event_id == std::optional<pine::EventId>(0), "ingester submits");
  auto dup = pine::submit_event(s, "ingest", make_event("app", "0x1"));
  expect(dup.status.code == pine::ErrorCode::duplicate_event, "duplicate surfaced");
}

void test_op_app_management() {
  quiet_sinks();
  auto s = make_state();
  pine::AppConfig cfg;
  cfg.application_id = "dex";
  cfg.chain_id = "chain-1";
  cfg.tags = {"defi"};
  expect(pine::add_monitored_app(s, "ingest", cfg).status.code == pine::ErrorCode::unauthorized,
         "ingester cannot add apps");
  expect(pine::add_monitored_app(s, "ops", cfg).ok(), "operator adds");
  expect(pine::get_monitored_applications(s).size() == 1, "listed");

  pine::AppConfig changed = cfg;
  changed.application_id = "something-else";
  changed.priority = 9;
  expect(pine::update_app_config(s, "ops", "dex", changed).ok(), "update ok");
  expect(s.monitored_applications.at("dex").application_id == "dex", "id forced to key");
  expect(s.monitored_applications.at("dex").priority == 9, "update applied");
  expect(pine::update_app_config(s, "ops", "nope", cfg).status.code ==
             pine::ErrorCode::application_not_found, "update unknown");
  expect(pine::remove_monitored_app(s, "ops", "nope").status.code ==
             pine::ErrorCode::application_not_found, "remove unknown");
  expect(pine::remove_monitored_app(s, "ops", "dex").ok(), "remove ok");
}

void test_op_batch_partial_failure() {
  quiet_sinks();
  auto s = make_state();
  auto r = pine::submit_batch(s, "ingest", {make_event("a", "0x1"), make_event("a", "0x1"),
                                            make_event("a", "0x2")});
  expect(r.status.code == pine::ErrorCode::batch_partial_failure, "partial failure");
  expect(r.event_id == std::optional<pine::EventId>(1), "last admitted id");
  auto none = pine::submit_batch(s, "stranger", {make_event("a", "0x9")});
  expect(none.status.code == pine::ErrorCode::unauthorized, "batch authorization");
  expect(s.store.events().size() == 2, "unauthorized batch stored nothing");
}

void test_op_metrics() {
  quiet_sinks();
  auto s = make_state();
  pine::MetricDefinition d;
  expect(pine::define_metric(s, "adm", d).status.code == pine::ErrorCode::invalid_metric, "empty name");
  d.name = "volume";
  expect(pine::define_metric(s, "ops", d).status.code == pine::ErrorCode::unauthorized, "operator cannot");
  expect(pine::define_metric(s, "adm", d).ok(), "admin defines");
  expect(pine::update_metric(s, "adm", "dex:volume", pine::GaugeValue{3.0}).ok(), "update metric");
  expect(pine::update_metric(s, "adm", "dex:fees", pine::CounterValue{2}).ok(), "update metric");
  expect(pine::update_metric(s, "adm", "amm:volume", pine::GaugeValue{5.0}).ok(), "update metric");
  expect(pine::get_application_metrics(s, "dex").size() == 2, "prefix match");
  expect(pine::get_application_metrics(s, "de").size() == 2, "prefix is a prefix");
  expect(pine::get_application_metrics(s, "zzz").empty(), "no match");
}

void test_op_metrics_reject_non_finite() {
  quiet_sinks();
  auto s = make_state();
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  expect(pine::update_metric(s, "adm", "dex:volume", pine::GaugeValue{3.0}).ok(), "finite gauge");

  const std::vector<pine::MetricValue> bad = {
      pine::GaugeValue{nan},
      pine::GaugeValue{-inf},
      pine::HistogramValue{{1.0, inf}},
      pine::SummaryValue{1.0, 1, nan},
  };
  for (const auto& v : bad) {
    expect(pine::update_metric(s, "adm", "dex:volume", v).status.code == pine::ErrorCode::invalid_metric,
           "non-finite value rejected");
  }
  const auto& kept = std::get<pine::GaugeValue>(s.aggregated_metrics.at("dex:volume"));
  expect(kept.value == 3.0 && s.aggregated_metrics.size() == 1, "rejected updates leave the metric alone");

  const auto dir = scratch_dir("metrics_finite");
  const auto path = (dir / "state.snap").string();
  expect(pine::save_snapshot(s, path).ok(), "snapshot after rejected updates");
  pine::Status err;
  auto loaded = pine::load_snapshot(path, &err);
  expect(loaded && loaded->aggregated_metrics.size() == 1, "snapshot reloads: " + err.detail);
  fs::remove_all(dir);
}

void test_op_role_management() {
  quiet_sinks();
  auto s = make_state();
  using pine::rbac::Role;
  expect(pine::assign_role(s, "ops", "x", Role::viewer).status.code == pine::ErrorCode::unauthorized,
         "operator cannot manage roles");
  expect(pine::assign_role(s, "adm", "x", Role::operator_).ok(), "admin assigns operator");
  expect(pine::assign_role(s, "adm", "x", Role::admin).ok(), "admin may promote a manageable target");
  expect(pine::assign_role(s, "adm", "x", Role::viewer).status.code == pine::ErrorCode::unauthorized,
         "admin cannot manage another admin");
  const auto above = pine::assign_role(s, "adm", "y", Role::super_admin);
  expect(above.status.code == pine::ErrorCode::unauthorized, "admin cannot grant super admin");
  expect(above.status.detail.find("role ceiling") != std::string::npos,
         "ceiling denial names the rule: " + above.status.detail);
  const auto peer = pine::assign_role(s, "adm", "x", Role::operator_);
  expect(peer.status.detail.find("cannot manage") != std::string::npos, "peer denial names the target rule");
  expect(peer.status.detail.find("role ceiling") == std::string::npos, "peer denial is not a ceiling denial");
  expect(pine::assign_role(s, "root", "root", Role::viewer).status.code ==
             pine::ErrorCode::cannot_demote_super_admin, "super admin immutable");
  expect(pine::remove_role(s, "root", "x").ok(), "super admin removes");
  expect(s.rbac.get_role("x") == Role::viewer, "removed");
}

void test_op_ingestion_control() {
  quiet_sinks();
  auto s = make_state();
  expect(pine::pause_ingestion(s, "ops").status.code == pine::ErrorCode::unauthorized, "operator cannot pause");
  expect(pine::pause_ingestion(s, "adm").ok(), "admin pauses");
  expect(pine::submit_event(s, "ingest", make_event("a", "0x1")).status.code ==
             pine::ErrorCode::ingestion_paused, "paused");
  expect(pine::resume_ingestion(s, "adm").ok(), "admin resumes");
  expect(pine::submit_event(s, "ingest", make_event("a", "0x1")).ok(), "resumed");
  expect(pine::unblock_app(s, "adm", "never-blocked").ok(), "unblock is idempotent");

  pine::RateLimitConfig bad;
  bad.burst_multiplier = -1.0;
  expect(pine::update_rate_limit_config(s, "adm", bad).status.code ==
             pine::ErrorCode::invalid_configuration, "invalid config rejected");
  auto good = strict_config();
  expect(pine::update_rate_limit_config(s, "adm", good).ok(), "valid config applied");
  expect(pine::get_rate_limit_stats(s).global_limit == 1000, "stats reflect config");
}

void test_op_admin_actions() {
  quiet_sinks();
  auto s = make_state();
  (void)pine::submit_event(s, "ingest", make_event("a", "0x1"));
  (void)pine::submit_event(s, "ingest", make_event("a", "0x2"));

  pine::AdminAction clear{pine::AdminActionType::clear_events};
  expect(pine::admin_action(s, "adm", clear).status.code == pine::ErrorCode::unauthorized,
         "admin actions are super admin only");
  expect(pine::admin_action(s, "root", clear).ok(), "super admin clears");
  auto h = pine::get_system_health(s);
  expect(h.total_events == 2 && h.stored_events == 0 && !h.merkle_root, "clear keeps lifetime total");

  pine::AdminAction limits{pine::AdminActionType::set_rate_limit, 7, 70};
  expect(pine::admin_action(s, "root", limits).ok(), "set limits");
  expect(s.rate_limiter.config().max_events_per_app_per_block == 7 &&
             s.rate_limiter.config().max_total_events_per_block == 70, "limits applied");
  expect(s.rate_limiter.config().burst_multiplier == 1.5, "other fields kept");

  pine::AdminAction pause{pine::AdminActionType::pause_ingestion};
  expect(pine::admin_action(s, "root", pause).ok() && s.rate_limiter.paused(), "admin pause");

  pine::AdminAction transfer{pine::AdminActionType::transfer_super_admin};
  transfer.new_admin = "heir";
  expect(pine::admin_action(s, "root", transfer).ok(), "transfer");
  expect(s.admin_owner == "heir" && s.rbac.get_role("heir") == pine::rbac::Role::super_admin, "new owner");
  expect(s.rbac.get_role("root") == pine::rbac::Role::viewer, "old role table dropped");
  expect(s.rbac.get_role("adm") == pine::rbac::Role::viewer, "fresh rbac state");
}

void test_op_get_events_filters() {
  quiet_sinks();
  auto s = make_state();
  auto e1 = make_event("dex", "0x1", 100);
  auto e2 = make_event("amm", "0x2", 200);
  e2.severity = pine::Severity::error;
  e2.event_type = "swap";
  auto e3 = make_event("dex", "0x3", 300);
  for (auto* e : {&e1, &e2, &e3}) (void)pine::submit_event(s, "ingest", *e);

  pine::EventFilters f;
  expect(pine::get_events(s, f).size() == 3, "no filters");
  f.application_ids = std::vector<pine::ApplicationId>{"dex"};
  expect(pine::get_events(s, f).size() == 2, "app filter");
  f.time_range = pine::TimeRange{150, 300};
  expect(pine::get_events(s, f).size() == 1, "inclusive time range");

  pine::EventFilters sev;
  sev.severity = pine::Severity::error;
  expect(pine::get_events(s, sev).size() == 1, "exact severity");
  pine::EventFilters types;
  types.event_types = std::vector<std::string>{"swap"};
  expect(pine::get_events(s, types).size() == 1, "event type");
  pine::EventFilters text;
  text.search_text = "PAYMENT FOR 0X3";
  const auto found = pine::get_events(s, text);
  expect(found.size() == 1 && found[0].transaction_hash == "0x3", "case-insensitive payload search");

  const auto page = pine::get_events(s, pine::EventFilters{}, pine::Pagination{1, 1});
  expect(page.size() == 1 && page[0].transaction_hash == "0x2", "offset and limit");
  expect(pine::get_event(s, 2).has_value() && !pine::get_event(s, 99), "get_event");
  expect(pine::get_app_events(s, "dex").size() == 2, "app events");
  expect(pine::get_events_in_range(s, pine::TimeRange{200, 300}).size() == 2, "range");
}

void test_op_time_series() {
  quiet_sinks();
  auto s = make_state();
  for (pine::Timestamp ts : {0, 5, 10, 25, 30}) {
    (void)pine::submit_event(s, "ingest", make_event("a", "0x" + std::to_string(ts), ts));
  }
  const auto series = pine::get_time_series(s, pine::TimeRange{0, 30}, 10);
  expect(series.size() == 4, "points at 0,10,20,30");
  expect(series[0].count == 2 && series[1].count == 1 && series[2].count == 1 && series[3].count == 1,
         "counts per bucket");
  const auto whole = pine::get_time_series(s, pine::TimeRange{0, 30}, 0);
  expect(whole.size() == 1 && whole[0].count == 5, "zero granularity is one point");
  const auto capped = pine::get_time_series(s, pine::TimeRange{0, std::numeric_limits<uint64_t>::max()}, 1);
  expect(capped.size() == pine::kMaxTimeSeriesPoints, "output capped");
  expect(pine::get_time_series(s, pine::TimeRange{10, 0}, 10).empty(), "inverted range");
}

void test_op_analytics_from_payloads() {
  quiet_sinks();
  auto s = make_state();
  pine::MetricDefinition d;
  d.name = "value";
  d.extraction_path = "value";
  (void)pine::define_metric(s, "adm", d);
  const std::vector<double> v = {10, 11, 10.5, 9.5, 100, 10.2, 10.8};
  for (size_t i = 0; i < v.size(); ++i) {
    (void)pine::submit_event(s, "ingest", make_event(i % 2 ? "odd" : "even", "0x" + std::to_string(i),
                                                     1000 + i * 100, v[i]));
  }

  pine::aggregation::AggregationQuery q;
  q.metric = "value";
  q.aggregation = {pine::aggregation::AggregationType::max};
  q.end_time = std::numeric_limits<uint64_t>::max();
  auto r = pine::query_aggregation(s, q);
  expect(r.value == 100.0 && r.sample_count == 7, "max over payloads");

  q.aggregation = {pine::aggregation::AggregationType::count};
  q.app_filter = std::vector<pine::ApplicationId>{"odd"};
  expect(pine::query_aggregation(s, q).value == 3.0, "app filter");
  q.app_filter.reset();
  q.start_time = 1100;
  q.end_time = 1300;
  expect(pine::query_aggregation(s, q).value == 3.0, "time range");

  q.start_time = 0;
  q.end_time = std::numeric_limits<uint64_t>::max();
  q.granularity_ms = 300;
  const auto buckets = pine::query_aggregation_series(s, q);
  expect(buckets.size() == 3, "three populated buckets");
  expect(buckets[0].bucket && buckets[0].bucket->start == 900 && buckets[0].value == 2.0, "first bucket");

  const auto anomalies = pine::query_anomalies(s, "value", 2.0);
  expect(anomalies.size() == 1 && anomalies[0].event_id == std::optional<pine::EventId>(4),
         "anomaly carries its event id");
  const auto ma = pine::query_moving_average(s, "value", 7);
  expect(ma.size() == 1 && ma[0].timestamp == 1600, "moving average over payloads");
}

void test_op_analytics_from_stored_metrics() {
  quiet_sinks();
  auto s = make_state();
  (void)pine::update_metric(s, "adm", "a:lat", pine::GaugeValue{1});
  (void)pine::update_metric(s, "adm", "b:lat", pine::GaugeValue{2});
  (void)pine::update_metric(s, "adm", "c:lat", pine::GaugeValue{3});
  (void)pine::update_metric(s, "adm", "a:tps", pine::GaugeValue{2});
  (void)pine::update_metric(s, "adm", "b:tps", pine::GaugeValue{4});
  (void)pine::update_metric(s, "adm", "c:tps", pine::GaugeValue{6});
  (void)pine::update_metric(s, "adm", "x:err", pine::GaugeValue{1});

  const auto samples = pine::resolve_metric_samples(s, "lat");
  expect(samples.size() == 3 && samples[2].timestamp == 2 && !samples[0].event_id, "index timestamps");

  const auto m = pine::query_correlation(s, {"lat", "tps", "err"});
  expect(m.metric == "correlation" && m.series.size() == 3, "matrix shape");
  expect(m.at(0, 0) == 1.0 && m.at(2, 2) == 1.0, "unit diagonal");
  expect(near(m.at(0, 1), 1.0) && near(m.at(1, 0), 1.0), "correlated series");
  expect(m.at(0, 2) == 0.0, "length mismatch is zero");
}

void test_op_proofs_and_status() {
  quiet_sinks();
  auto s = make_state();
  for (int i = 0; i < 5; ++i) (void)pine::submit_event(s, "ingest", make_event("a", "0x" + std::to_string(i)));
  const auto root = pine::get_merkle_root(s);
  expect(root.has_value(), "root present");
  for (pine::EventId id = 0; id < 5; ++id) {
    auto p = pine::get_event_proof(s, id);
    expect(p && pine::verify_proof(*p, *root), "every event proves");
  }
  expect(!pine::get_event_proof(s, 50), "unknown id");
  auto b = pine::get_batch_proof(s, {0, 4}, 1);
  expect(b && b->proofs.size() == 2, "batch proof");

  auto info = pine::get_rbac_info(s);
  expect(info.owner == "root" && info.role == pine::rbac::Role::super_admin && info.permissions.size() == 8,
         "defaults to the super admin");
  expect(pine::get_rbac_info(s, std::string("ingest")).permissions.size() == 2, "ingester permissions");

  pine::set_block_height(s, 9);
  const auto h = pine::get_system_health(s);
  expect(h.total_events == 5 && h.current_block == 9 && h.rate_limit_enabled && !h.ingestion_paused,
         "system health");
  expect(h.to_json().find("\"merkle_root\":\"" + pine::digest_to_hex(*root) + "\"") != std::string::npos,
         "health JSON carries the root");
}

void test_deterministic_replay() {
  quiet_sinks();
  auto run = [] {
    auto s = make_state();
    for (int i = 0; i < 20; ++i) {
      pine::set_block_height(s, i / 4);
      (void)pine::submit_event(s, "ingest", make_event("app" + std::to_string(i % 3), "0x" + std::to_string(i),
                                                       1000 + i));
    }
    return pine::jsonlite::to_json(pine::state_to_value(s));
  };
  expect(run() == run(), "identical operation streams reach identical state");
}

// ============================================================================
// Dispatch
// ============================================================================

void test_dispatch_roundtrip() {
  quiet_sinks();
  auto s = make_state();
  auto r = pine::apply_operation_json(
      s, "{\"op\":\"submit_event\",\"caller\":\"ingest\",\"event\":{\"source_app\":\"dex\","
         "\"transaction_hash\":\"0xabc\",\"timestamp\":5,\"event_type\":\"swap\",\"data\":{\"amount\":3}}}");
  expect(r.status.ok(), "submit via dispatch");
  expect(r.response == "{\"ok\":true,\"event_id\":0}", "response: " + r.response);

  auto proof = pine::apply_operation_json(s, "{\"op\":\"get_event_proof\",\"id\":0}");
  auto root = pine::apply_operation_json(s, "{\"op\":\"get_merkle_root\"}");
  expect(proof.status.ok() && root.status.ok(), "proof queries");

  std::optional<pine::jsonlite::JsonError> err;
  const auto proof_obj = pine::jsonlite::parse(proof.response, &err);
  const auto root_obj = pine::jsonlite::parse(root.response, &err);
  expect(!err, "responses are JSON");
  pine::jsonlite::Object verify;
  verify["op"] = pine::jsonlite::Value{"verify_proof"};
  verify["proof"] = proof_obj.at("result");
  verify["root"] = root_obj.at("result");
  auto v = pine::apply_operation(s, verify);
  expect(v.response == "{\"ok\":true,\"result\":true}", "verify via dispatch: " + v.response);
}

void test_dispatch_rejects_malformed() {
  quiet_sinks();
  auto s = make_state();
  auto bad_json = pine::apply_operation_json(s, "{not json");
  expect(bad_json.status.code == pine::ErrorCode::json_parse_error, "bad JSON");
  auto unknown = pine::apply_operation_json(s, "{\"op\":\"drop_tables\"}");
  expect(unknown.status.code == pine::ErrorCode::json_parse_error, "unknown op");
  auto missing = pine::apply_operation_json(s, "{\"op\":\"submit_event\",\"caller\":\"ingest\",\"event\":{}}");
  expect(missing.status.code == pine::ErrorCode::json_parse_error, "event without keys");
  expect(s.store.events().empty(), "malformed requests change nothing");
  auto denied = pine::apply_operation_json(s, "{\"op\":\"pause_ingestion\",\"caller\":\"ops\"}");
  expect(denied.response.find("\"error_code\":\"unauthorized\"") != std::string::npos, "typed failure");

  const auto ops = pine::supported_operations();
  expect(std::is_sorted(ops.begin(), ops.end()) && ops.size() >= 30, "operation table");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_parse() {
  pine::Status err;
  auto c = pine::parse_service_config(
      "{\"super_admin\":\"root\",\"rate_limits\":{\"cooldown_blocks\":9},\"snapshot_encoding\":\"zstd\"}", &err);
  expect(c.has_value(), "valid config: " + err.detail);
  expect(c->super_admin == "root" && c->rate_limits.cooldown_blocks == 9, "fields read");
  expect(c->rate_limits.max_events_per_app_per_block == 100 && c->merkle_depth == 16, "defaults kept");
  expect(c->snapshot_encoding == pine::SnapshotEncoding::zstd, "encoding");
}

void test_config_rejects() {
  pine::Status err;
  expect(!pine::parse_service_config("{\"rate_limits\":{}}", &err) &&
             err.code == pine::ErrorCode::invalid_configuration, "missing super admin");
  expect(!pine::parse_service_config("{\"super_admin\":\"r\",\"rate_limits\":{\"burst_multiplier\":0}}", &err) &&
             err.code == pine::ErrorCode::invalid_configuration, "bad burst");
  expect(!pine::parse_service_config("{\"super_admin\":\"r\",\"snapshot_encoding\":\"lz4\"}", &err) &&
             err.code == pine::ErrorCode::invalid_configuration, "unknown encoding");
  expect(!pine::parse_service_config("[1,2", &err) && err.code == pine::ErrorCode::json_parse_error,
         "bad JSON");
  expect(!pine::load_service_config("/nonexistent/pine.json", &err), "missing file");
}

void test_config_env_overrides() {
  pine::ServiceConfig c;
  c.snapshot_path = "from-file";
  ::setenv("PINE_SNAPSHOT", "from-env", 1);
  ::setenv("PINE_AUDIT_LOG", "", 1);
  pine::apply_env_overrides(c);
  ::unsetenv("PINE_SNAPSHOT");
  ::unsetenv("PINE_AUDIT_LOG");
  expect(c.snapshot_path == "from-env", "env wins");
  expect(c.audit_log_path.empty(), "empty env ignored");
}

// ============================================================================
// Snapshot
// ============================================================================

pine::AnalyticsState populated_state() {
  auto s = make_state();
  pine::AppConfig app;
  app.application_id = "dex";
  app.custom_metrics.push_back(pine::MetricDefinition{"fees", "fee total", pine::MetricType::counter,
                                                      "fee", pine::AggregationMethod::sum});
  (void)pine::add_monitored_app(s, "ops", app);
  (void)pine::update_metric(s, "adm", "dex:hist", pine::HistogramValue{{1.5, 2.5}});
  (void)pine::update_rate_limit_config(s, "adm", strict_config());
  pine::set_block_height(s, 3);
  for (int i = 0; i < 7; ++i) (void)pine::submit_event(s, "ingest", make_event("dex", "0x" + std::to_string(i)));
  return s;
}

void test_snapshot_roundtrip() {
  quiet_sinks();
  const auto dir = scratch_dir("snapshot");
  const auto path = (dir / "state.snap").string();
  auto s = populated_state();
  expect(pine::save_snapshot(s, path).ok(), "save");

  pine::Status err;
  auto loaded = pine::load_snapshot(path, &err);
  expect(loaded.has_value(), "load: " + err.detail);
  expect(pine::jsonlite::to_json(pine::state_to_value(*loaded)) ==
             pine::jsonlite::to_json(pine::state_to_value(s)), "state survives byte-identically");
  expect(loaded->store.is_duplicate("0x3"), "dedup set rebuilt");
  expect(loaded->store.by_app("dex").size() == 5, "app index rebuilt");
  expect(loaded->rate_limiter.blocked_apps().count("dex") == 1, "limiter state persisted");
  expect(loaded->rbac.get_role("adm") == pine::rbac::Role::admin, "roles persisted");

  auto next = pine::submit_event(*loaded, "ingest", make_event("other", "0xnew"));
  expect(next.ok() && next.event_id == std::optional<pine::EventId>(5), "ids continue after reload");
  fs::remove_all(dir);
}

void test_snapshot_corruption_detected() {
  quiet_sinks();
  const auto dir = scratch_dir("snapshot_corrupt");
  const auto path = (dir / "state.snap").string();
  expect(pine::save_snapshot(populated_state(), path).ok(), "save");

  std::string bytes = read_file(path);
  const size_t pos = bytes.find("0x4");
  expect(pos != std::string::npos, "payload present");
  bytes[pos + 2] = '9';
  {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << bytes;
  }
  pine::Status err;
  expect(!pine::load_snapshot(path, &err) && err.code == pine::ErrorCode::snapshot_corrupt,
         "tampered body rejected");
  expect(!pine::load_snapshot((dir / "missing.snap").string(), &err) &&
             err.code == pine::ErrorCode::snapshot_io_failed, "missing file");
  fs::remove_all(dir);
}

void test_snapshot_root_mismatch_detected() {
  auto s = populated_state();
  auto v = pine::state_to_value(s);
  std::get<pine::jsonlite::Object>(v.v)["merkle_root"] = pine::jsonlite::Value{std::string(64, 'a')};
  pine::Status err;
  expect(!pine::state_from_value(v, &err) && err.code == pine::ErrorCode::snapshot_corrupt,
         "persisted root must match the rebuilt tree");
}

void test_snapshot_zstd() {
  quiet_sinks();
  const auto dir = scratch_dir("snapshot_zstd");
  const auto path = (dir / "state.snap").string();
  auto s = populated_state();
  const pine::Status saved = pine::save_snapshot(s, path, pine::SnapshotEncoding::zstd);
  if (!pine::snapshot_zstd_available()) {
    expect(saved.code == pine::ErrorCode::snapshot_io_failed, "zstd unavailable in this build");
    fs::remove_all(dir);
    return;
  }
  expect(saved.ok(), "zstd save");
  pine::Status err;
  auto loaded = pine::load_snapshot(path, &err);
  expect(loaded && loaded->store.merkle().root() == s.store.merkle().root(), "zstd load");
  fs::remove_all(dir);
}

void test_snapshot_oversized_header_rejected() {
  const auto dir = scratch_dir("snapshot_oversized");
  const auto path = (dir / "state.snap").string();
  auto write = [&](const std::string& encoding) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << "{\"body_digest\":\"" << std::string(64, '0') << "\",\"encoding\":\"" << encoding
        << "\",\"original_size\":18446744073709551615,\"snapshot_version\":"
        << pine::version::SNAPSHOT_FORMAT_VERSION << "}\n"
        << std::string("\x28\xB5\x2F\xFD garbage body", 17);
  };

  write("zstd");
  pine::Status err;
  expect(!pine::load_snapshot(path, &err), "oversized zstd header rejected");
  const auto expected = pine::snapshot_zstd_available() ? pine::ErrorCode::snapshot_corrupt
                                                        : pine::ErrorCode::snapshot_io_failed;
  expect(err.code == expected, "zstd header error: " + err.detail);

  write("identity");
  err = pine::Status::success();
  expect(!pine::load_snapshot(path, &err) && err.code == pine::ErrorCode::snapshot_corrupt,
         "identity body shorter than declared size");
  fs::remove_all(dir);
}

// ============================================================================
// Audit log
// ============================================================================

void test_audit_chain() {
  const auto dir = scratch_dir("audit");
  const auto path = (dir / "audit.ndjson").string();
  {
    pine::ImmutableAuditLog log(path);
    for (int i = 0; i < 3; ++i) {
      pine::AdminRecord r;
      r.actor = "root";
      r.action = "pause_ingestion";
      r.ok = true;
      expect(log.append(r), "append");
      expect(r.sequence == static_cast<uint64_t>(i + 1), "sequence assigned");
    }
    expect(log.entry_count() == 3 && log.failure_count() == 0, "counts");
  }
  {
    pine::ImmutableAuditLog reopened(path);
    pine::AdminRecord r;
    r.action = "resume_ingestion";
    expect(reopened.append(r) && r.sequence == 4, "sequence resumes after reopen");
  }
  auto report = pine::verify_audit_chain(path);
  expect(report.ok && report.entries == 4, "chain verifies: " + report.reason);

  auto lines = read_lines(path);
  expect(lines[0].find(std::string("\"prev\":\"") + std::string(64, '0') + "\"") != std::string::npos,
         "genesis link");
  const size_t at = lines[1].find("pause_ingestion");
  lines[1].replace(at, 5, "PAUSE");
  {
    std::ofstream ofs(path, std::ios::trunc);
    for (const auto& l : lines) ofs << l << "\n";
  }
  report = pine::verify_audit_chain(path);
  expect(!report.ok && report.first_bad_line == 3 && report.reason == "broken chain",
         "edited entry breaks the next link");
  fs::remove_all(dir);
}

void test_audit_unreadable_tail_not_extended() {
  const auto dir = scratch_dir("audit_tail");
  const auto path = (dir / "audit.ndjson").string();
  {
    pine::ImmutableAuditLog log(path);
    pine::AdminRecord r;
    r.actor = "root";
    r.action = "pause_ingestion";
    expect(log.append(r), "append");
  }
  {
    std::ofstream ofs(path, std::ios::app);
    ofs << "{\"sequence\":2,\"truncated\n";
  }
  const std::string before = read_file(path);

  pine::ImmutableAuditLog log(path);
  pine::AdminRecord r;
  r.action = "resume_ingestion";
  expect(!log.append(r), "append refused after an unreadable tail");
  expect(log.failure_count() >= 1, "refusal counted");
  expect(read_file(path) == before, "log untouched");
  fs::remove_all(dir);
}

void test_operations_are_audited() {
  quiet_sinks();
  const auto dir = scratch_dir("audit_ops");
  const auto path = (dir / "audit.ndjson").string();
  pine::set_audit_log_path(path);
  auto s = make_state();  // three role assignments
  (void)pine::pause_ingestion(s, "stranger");
  (void)pine::admin_action(s, "root", pine::AdminAction{pine::AdminActionType::rebuild_merkle_index});
  (void)pine::submit_event(s, "ingest", make_event("a", "0x1"));  // not audited
  pine::set_audit_log_path("");

  const auto lines = read_lines(path);
  expect(lines.size() == 5, "role changes and admin actions audited");
  expect(lines[3].find("\"actor\":\"stranger\"") != std::string::npos &&
             lines[3].find("\"ok\":false") != std::string::npos &&
             lines[3].find("\"error_code\":\"unauthorized\"") != std::string::npos,
         "denied action audited");
  expect(lines[4].find("rebuild_merkle_index") != std::string::npos, "admin action audited");
  expect(pine::verify_audit_chain(path).ok, "operation audit chain verifies");
  fs::remove_all(dir);
}

// ============================================================================
// Observability
// ============================================================================

std::vector<pine::IngestEvent> g_hooked;
void capture_hook(const pine::IngestEvent& ev) { g_hooked.push_back(ev); }

void test_ingest_hook_and_stats() {
  quiet_sinks();
  pine::global_ingest_stats().reset();
  g_hooked.clear();
  pine::set_ingest_event_hook(&capture_hook);

  auto s = make_state();
  (void)pine::submit_event(s, "ingest", make_event("a", "0x1"));
  (void)pine::submit_event(s, "ingest", make_event("a", "0x1"));
  (void)pine::submit_event(s, "stranger", make_event("a", "0x2"));
  (void)pine::submit_batch(s, "ingest", {make_event("a", "0x3"), make_event("a", "0x3")});
  pine::set_ingest_event_hook(nullptr);

  expect(g_hooked.size() == 5, "one event per ingestion attempt");
  expect(g_hooked[0].ok && g_hooked[0].event_id == 0, "accepted event");
  expect(g_hooked[1].error == pine::ErrorCode::duplicate_event, "duplicate event");
  expect(g_hooked[2].error == pine::ErrorCode::unauthorized, "unauthorized emitted");
  expect(g_hooked[3].batch && g_hooked[4].batch && !g_hooked[4].ok, "batch items flagged");

  auto& stats = pine::global_ingest_stats();
  expect(stats.total_ingests.load() == 5 && stats.accepted.load() == 2 && stats.rejected.load() == 3,
         "counters");
  expect(stats.batch_items.load() == 2, "batch items");
  expect(stats.diagnostics_emitted.load() == 1, "rejected batch item emits a diagnostic");
  const auto cats = stats.failure_categories_snapshot();
  expect(cats.duplicate == 2 && cats.unauthorized == 1, "failure categories");
  expect(stats.latency_histogram.count() >= 5, "latency recorded");
}

void test_recent_events_ring() {
  pine::global_ingest_stats().reset();
  pine::set_ingest_event_hook(&capture_hook);
  for (uint64_t i = 1; i <= 300; ++i) {
    pine::IngestEvent ev;
    ev.event_id = i;
    ev.ok = true;
    pine::emit_ingest_event(ev);
  }
  pine::set_ingest_event_hook(nullptr);
  g_hooked.clear();
  const auto recent = pine::global_ingest_stats().recent_events_snapshot();
  expect(recent.size() == pine::IngestStats::kMaxRecentEvents, "ring bounded");
  expect(recent.front().event_id == 45 && recent.back().event_id == 300, "oldest first");
}

void test_event_log_sink() {
  quiet_sinks();
  const auto dir = scratch_dir("event_log");
  const auto path = (dir / "events.jsonl").string();
  pine::set_event_log_path(path);
  auto s = make_state();
  (void)pine::submit_event(s, "ingest", make_event("a", "0x1"));
  (void)pine::admin_action(s, "root", pine::AdminAction{pine::AdminActionType::clear_events});
  pine::set_event_log_path("");

  const auto lines = read_lines(path);
  expect(lines.size() == 2, "ingest line and clear diagnostic");
  expect(lines[0].find("\"type\":\"ingest\"") != std::string::npos &&
             lines[0].find("\"ok\":true") != std::string::npos, "ingest line");
  expect(lines[1].find("\"type\":\"diagnostic\"") != std::string::npos &&
             lines[1].find("\"category\":\"admin\"") != std::string::npos, "diagnostic line");
  fs::remove_all(dir);
}

void test_version_manifest() {
  const auto m = pine::version::current_manifest("1.2.3");
  expect(m.semver == "1.2.3" && m.hash_primitive == "blake3", "manifest");
  const std::string j = pine::version::manifest_to_json(m);
  expect(j.find("\"snapshot_format\":1") != std::string::npos, "snapshot format version");
  const auto h = pine::hash_runtime_info();
  expect(h.primitive == "blake3" && h.blake3_available, "runtime hash info");
}

}  // namespace

int main() {
  std::cout << "=== Pine Analytics Test Suite ===\n";

  std::cout << "\n[Hashing]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("node hash order sensitive", test_node_hash_order_sensitive);
  run_test("binary/hex consistency", test_digest_hex_consistency);

  std::cout << "\n[JSON + data model]\n";
  run_test("canonical key order", test_json_canonical_order);
  run_test("dotted path lookup", test_json_find_path);
  run_test("nesting limit", test_json_nesting_limit);
  run_test("unicode escapes", test_json_unicode_escapes);
  run_test("event decoding requires keys", test_event_decoding_requires_keys);
  run_test("canonical event covers assignment", test_canonical_event_covers_assignment);
  run_test("metric value reduction", test_metric_value_reduction);

  std::cout << "\n[MerkleIndex]\n";
  run_test("empty root absent", test_merkle_empty_root_absent);
  run_test("single leaf", test_merkle_single_leaf);
  run_test("permutation determinism", test_merkle_permutation_determinism);
  run_test("padding and pairing", test_merkle_known_shape);
  run_test("proof round-trip + tamper", test_merkle_proof_roundtrip);
  run_test("sibling side alternates", test_merkle_sibling_side_alternates);
  run_test("leaf overwrite", test_merkle_overwrite_leaf);
  run_test("batch proof", test_merkle_batch_proof);
  run_test("proof JSON decode", test_merkle_proof_json_roundtrip);

  std::cout << "\n[RateLimiter]\n";
  run_test("admission fairness", test_admission_fairness);
  run_test("block expiry", test_block_expiry);
  run_test("pause dominance", test_pause_dominance);
  run_test("global limit is a brownout", test_global_limit_is_brownout);
  run_test("burst multiplier floor", test_burst_multiplier_floor);
  run_test("disabled limiter admits", test_disabled_limiter_admits);
  run_test("unblock + stats", test_unblock_and_stats);
  run_test("config validation", test_config_validation);

  std::cout << "\n[RBAC]\n";
  run_test("super admin immutable", test_rbac_super_admin_immutable);
  run_test("permission table", test_rbac_permission_table);
  run_test("can_manage", test_rbac_can_manage);
  run_test("remove reverts to viewer", test_rbac_remove_reverts_to_viewer);

  std::cout << "\n[Aggregation]\n";
  run_test("statistics", test_statistics);
  run_test("anomaly detection", test_anomaly_detection);
  run_test("correlation", test_correlation);
  run_test("moving average", test_moving_average);
  run_test("aggregate dispatch", test_aggregate_dispatch);
  run_test("time buckets", test_time_buckets);
  run_test("aggregation kind JSON", test_aggregation_kind_json);

  std::cout << "\n[EventStore]\n";
  run_test("dedup idempotence", test_dedup_idempotence);
  run_test("rejected admission is pure", test_rejected_admission_is_pure);
  run_test("ids + indexes", test_ids_and_indexes);
  run_test("clear + rebuild", test_clear_and_rebuild);
  run_test("batch continues on error", test_batch_continues_on_error);
  run_test("restore validates", test_store_restore_validates);

  std::cout << "\n[Operations]\n";
  run_test("submit authorization", test_op_submit_authorization);
  run_test("app management", test_op_app_management);
  run_test("batch partial failure", test_op_batch_partial_failure);
  run_test("metrics", test_op_metrics);
  run_test("non-finite metrics rejected", test_op_metrics_reject_non_finite);
  run_test("role management", test_op_role_management);
  run_test("ingestion control", test_op_ingestion_control);
  run_test("admin actions", test_op_admin_actions);
  run_test("event filters", test_op_get_events_filters);
  run_test("time series", test_op_time_series);
  run_test("analytics over payloads", test_op_analytics_from_payloads);
  run_test("analytics over stored metrics", test_op_analytics_from_stored_metrics);
  run_test("proofs + status", test_op_proofs_and_status);
  run_test("deterministic replay", test_deterministic_replay);

  std::cout << "\n[Dispatch]\n";
  run_test("JSON round-trip", test_dispatch_roundtrip);
  run_test("malformed requests", test_dispatch_rejects_malformed);

  std::cout << "\n[Configuration]\n";
  run_test("parse", test_config_parse);
  run_test("rejects", test_config_rejects);
  run_test("env overrides", test_config_env_overrides);

  std::cout << "\n[Snapshot]\n";
  run_test("round-trip", test_snapshot_roundtrip);
  run_test("corruption detected", test_snapshot_corruption_detected);
  run_test("root mismatch detected", test_snapshot_root_mismatch_detected);
  run_test("zstd encoding", test_snapshot_zstd);
  run_test("oversized header rejected", test_snapshot_oversized_header_rejected);

  std::cout << "\n[Audit]\n";
  run_test("hash chain", test_audit_chain);
  run_test("unreadable tail not extended", test_audit_unreadable_tail_not_extended);
  run_test("operations audited", test_operations_are_audited);

  std::cout << "\n[Observability]\n";
  run_test("ingest hook + stats", test_ingest_hook_and_stats);
  run_test("recent events ring", test_recent_events_ring);
  run_test("event log sink", test_event_log_sink);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
