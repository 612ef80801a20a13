#pragma once

#include <string>
#include <string_view>

namespace storefee {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
  bool blake3_available{false};
};

// Core BLAKE3 hashing (64-char lowercase hex).
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing. The prefixes are part of the digest contract:
//   "led:" ledger chain entries
//   "rep:" canonical fee reports
//   "run:" whole-run output streams
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string ledger_entry_hash(std::string_view ledger_line);
std::string report_json_hash(std::string_view canonical_report_json);
std::string run_output_hash(std::string_view output_stream);

}  // namespace storefee
