#include "storefee/hash.hpp"

// Hash authority for the ledger chain and report digests.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive. No fallbacks.
//   2. Domain separation: "led:", "rep:", "run:" prefixes keep a ledger line and
//      a report with identical bytes from producing the same digest.
//   3. version::HASH_ALGORITHM_VERSION is bumped whenever the algorithm or the
//      domain scheme changes.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace storefee {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.version = blake3_version();
  info.primitive = "blake3";
  info.blake3_available = true;
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string ledger_entry_hash(std::string_view ledger_line) {
  return hash_domain("led:", ledger_line);
}

std::string report_json_hash(std::string_view canonical_report_json) {
  return hash_domain("rep:", canonical_report_json);
}

std::string run_output_hash(std::string_view output_stream) {
  return hash_domain("run:", output_stream);
}

}  // namespace storefee
