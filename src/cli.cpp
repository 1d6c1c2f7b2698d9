#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "pine/audit.hpp"
#include "pine/config.hpp"
#include "pine/dispatch.hpp"
#include "pine/hash.hpp"
#include "pine/jsonlite.hpp"
#include "pine/observability.hpp"
#include "pine/operations.hpp"
#include "pine/snapshot.hpp"
#include "pine/state.hpp"
#include "pine/version.hpp"

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.0.0"
#endif

namespace {

struct CliOptions {
  std::string config_path;
  std::string snapshot_path;
  std::string ops_path;
  std::string super_admin;
  std::string encoding;
};

CliOptions parse_options(int argc, char **argv) {
  CliOptions o;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) o.config_path = argv[++i];
    else if (a == "--snapshot" && i + 1 < argc) o.snapshot_path = argv[++i];
    else if (a == "--ops" && i + 1 < argc) o.ops_path = argv[++i];
    else if (a == "--super-admin" && i + 1 < argc) o.super_admin = argv[++i];
    else if (a == "--encoding" && i + 1 < argc) o.encoding = argv[++i];
  }
  return o;
}

// Positional arguments, skipping flags and their values.
std::vector<std::string> positional(int argc, char **argv) {
  std::vector<std::string> out;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a.rfind("--", 0) == 0) {
      ++i;
      continue;
    }
    out.push_back(a);
  }
  return out;
}

void print_error(const pine::Status &s) {
  std::cerr << "{\"ok\":false,\"error_code\":\"" << pine::to_string(s.code)
            << "\",\"detail\":\"" << pine::jsonlite::escape(s.detail) << "\"}\n";
}

// Config file if given, then env overrides, then flags.
std::optional<pine::ServiceConfig> resolve_config(const CliOptions &opts) {
  pine::ServiceConfig cfg;
  if (!opts.config_path.empty()) {
    pine::Status err;
    auto loaded = pine::load_service_config(opts.config_path, &err);
    if (!loaded) {
      print_error(err);
      return std::nullopt;
    }
    cfg = std::move(*loaded);
  }
  pine::apply_env_overrides(cfg);
  if (!opts.super_admin.empty()) cfg.super_admin = opts.super_admin;
  if (!opts.snapshot_path.empty()) cfg.snapshot_path = opts.snapshot_path;
  if (!opts.encoding.empty()) {
    auto enc = pine::snapshot_encoding_from_string(opts.encoding);
    if (!enc) {
      print_error(pine::Status::failure(pine::ErrorCode::invalid_configuration,
                                        "unknown encoding: " + opts.encoding));
      return std::nullopt;
    }
    cfg.snapshot_encoding = *enc;
  }
  return cfg;
}

// Existing snapshot if there is one; otherwise a fresh state owned by the
// configured super admin.
std::optional<pine::AnalyticsState> open_state(const pine::ServiceConfig &cfg) {
  if (!cfg.snapshot_path.empty() && std::filesystem::exists(cfg.snapshot_path)) {
    pine::Status err;
    auto state = pine::load_snapshot(cfg.snapshot_path, &err);
    if (!state) print_error(err);
    return state;
  }
  pine::Status s = cfg.validate();
  if (!s.ok()) {
    print_error(s);
    return std::nullopt;
  }
  return pine::AnalyticsState(cfg.super_admin, cfg.rate_limits, cfg.merkle_depth);
}

}  // namespace

int main(int argc, char **argv) {
  const auto args = positional(argc, argv);
  if (args.empty()) {
    std::cerr << "usage: pine <health|version|apply|stats|proof <id>|audit verify <path>> "
                 "[--config f] [--snapshot f] [--ops f] [--super-admin id] "
                 "[--encoding identity|zstd]\n";
    return 1;
  }
  const std::string &cmd = args[0];
  const CliOptions opts = parse_options(argc, argv);

  if (cmd == "health") {
    const auto h = pine::hash_runtime_info();
    std::cout << "{\"hash_primitive\":\"" << h.primitive
              << "\",\"hash_backend\":\"" << h.backend
              << "\",\"hash_version\":\"" << h.version
              << "\",\"hash_available\":"
              << (h.blake3_available ? "true" : "false");
    std::cout << ",\"snapshot_encodings\":[\"identity\"";
#if defined(PINE_WITH_ZSTD)
    std::cout << ",\"zstd\"";
#endif
    std::cout << "]";
    std::cout << ",\"versions\":"
              << pine::version::manifest_to_json(pine::version::current_manifest(PROJECT_VERSION));
    std::cout << "}" << "\n";
    return 0;
  }

  if (cmd == "version") {
    std::cout << pine::version::manifest_to_json(pine::version::current_manifest(PROJECT_VERSION))
              << "\n";
    return 0;
  }

  if (cmd == "audit" && args.size() >= 3 && args[1] == "verify") {
    const auto report = pine::verify_audit_chain(args[2]);
    std::cout << "{\"ok\":" << (report.ok ? "true" : "false")
              << ",\"entries\":" << report.entries
              << ",\"first_bad_line\":" << report.first_bad_line
              << ",\"reason\":\"" << pine::jsonlite::escape(report.reason) << "\"}\n";
    return report.ok ? 0 : 2;
  }

  auto cfg = resolve_config(opts);
  if (!cfg) return 1;
  pine::install_sinks(*cfg);

  if (cmd == "apply") {
    if (opts.ops_path.empty()) {
      std::cerr << "apply requires --ops <file>\n";
      return 1;
    }
    std::ifstream ops(opts.ops_path);
    if (!ops) {
      print_error(pine::Status::failure(pine::ErrorCode::invalid_configuration,
                                        "cannot read " + opts.ops_path));
      return 1;
    }
    auto state = open_state(*cfg);
    if (!state) return 1;

    bool all_ok = true;
    std::string line;
    while (std::getline(ops, line)) {
      if (line.empty()) continue;
      const auto r = pine::apply_operation_json(*state, line);
      all_ok = all_ok && r.status.ok();
      std::cout << r.response << "\n";
    }

    if (!cfg->snapshot_path.empty()) {
      pine::Status s = pine::save_snapshot(*state, cfg->snapshot_path, cfg->snapshot_encoding);
      if (!s.ok()) {
        print_error(s);
        return 1;
      }
    }
    std::cerr << pine::global_ingest_stats().to_json() << "\n";
    return all_ok ? 0 : 2;
  }

  if (cmd == "stats") {
    auto state = open_state(*cfg);
    if (!state) return 1;
    std::cout << "{\"health\":" << pine::get_system_health(*state).to_json()
              << ",\"rate_limits\":" << pine::get_rate_limit_stats(*state).to_json()
              << ",\"rbac\":" << pine::get_rbac_info(*state).to_json()
              << "}\n";
    return 0;
  }

  if (cmd == "proof" && args.size() >= 2) {
    auto state = open_state(*cfg);
    if (!state) return 1;
    const pine::EventId id = std::strtoull(args[1].c_str(), nullptr, 10);
    const auto proof = pine::get_event_proof(*state, id);
    const auto root = pine::get_merkle_root(*state);
    if (!proof || !root) {
      print_error(pine::Status::failure(pine::ErrorCode::event_not_found, args[1]));
      return 2;
    }
    const bool verified = pine::verify_proof(*proof, *root);
    std::cout << "{\"root\":\"" << pine::digest_to_hex(*root) << "\""
              << ",\"proof\":" << proof->to_json()
              << ",\"verified\":" << (verified ? "true" : "false") << "}\n";
    return verified ? 0 : 2;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}
