#include "pine/version.hpp"

#include <sstream>

namespace pine {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver          = semver.empty() ? "0.3.0" : semver;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"snapshot_format\":" << m.snapshot_format
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"event_log\":" << m.event_log
    << ",\"audit_log\":" << m.audit_log
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace pine
