#include "storefee/version.hpp"

#include <sstream>

namespace storefee {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver  = ENGINE_SEMVER;
  m.hash_primitive = "blake3";
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"catalog_format\":" << m.catalog_format
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"event_log\":" << m.event_log
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"ledger_format\":" << m.ledger_format
    << ",\"report_format\":" << m.report_format
    << "}";
  return o.str();
}

std::string check_catalog_version(uint64_t declared_version) {
  if (declared_version == 0) {
    return "catalog format_version must be >= 1";
  }
  if (declared_version > CATALOG_FORMAT_VERSION) {
    return "catalog format_version " + std::to_string(declared_version) +
           " is newer than supported version " +
           std::to_string(CATALOG_FORMAT_VERSION);
  }
  return "";
}

}  // namespace version
}  // namespace storefee
