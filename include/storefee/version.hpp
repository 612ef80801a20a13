#pragma once

// storefee/version.hpp — Version manifest for every persisted or streamed format.
//
// Every component that writes a versioned format (ledger lines, event log lines,
// fee report JSON) stamps the matching constant below. Readers of a plan catalog
// check CATALOG_FORMAT_VERSION before trusting its fields.
//
// INVARIANT:
//   A change to the field set or meaning of any format requires a bump here.
//   Never silently accept a catalog from a newer format version.

#include <cstdint>
#include <string>

namespace storefee {
namespace version {

constexpr const char* ENGINE_SEMVER = "0.3.0";

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256, hex-encoded to 64 chars, domain-prefixed.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// LEDGER_FORMAT_VERSION
// Version 1 = NDJSON, one entry per applied operation or settled report,
// chained through "prev" (BLAKE3 of the previous line).
// ---------------------------------------------------------------------------
constexpr uint32_t LEDGER_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// REPORT_FORMAT_VERSION
// Version 1 = canonical FeeReport JSON (sorted keys, amounts as decimal strings).
// Changing this changes every report_digest.
// ---------------------------------------------------------------------------
constexpr uint32_t REPORT_FORMAT_VERSION = 1;

// Version 1 = JSONL OperationEvent lines.
constexpr uint32_t EVENT_LOG_VERSION = 1;

// ---------------------------------------------------------------------------
// CATALOG_FORMAT_VERSION
// Version 1 = {"format_version":1,"units":[...]} plan catalog.
// A catalog without "format_version" is read as version 1.
// ---------------------------------------------------------------------------
constexpr uint32_t CATALOG_FORMAT_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t ledger_format{LEDGER_FORMAT_VERSION};
  uint32_t report_format{REPORT_FORMAT_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  uint32_t catalog_format{CATALOG_FORMAT_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

// Returns "" if a catalog declaring `declared_version` can be read by this
// build, otherwise a description of the mismatch. Never throws.
std::string check_catalog_version(uint64_t declared_version);

}  // namespace version
}  // namespace storefee
