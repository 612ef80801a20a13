#pragma once

// storefee/ledger.hpp — Append-only, hash-chained billing ledger.
//
// DESIGN INVARIANTS:
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a monotonically increasing sequence number.
//   3. CHAINED: each entry records "prev", the ledger_entry_hash() of the previous
//      line ("0"*64 for the first). Editing any line breaks every later link.
//   4. FAIL-SAFE: a write failure never fails the billing operation; it is counted
//      in failure_count() and the chain head is not advanced.
//   5. DETERMINISTIC: entries carry the simulated operation time, never the wall
//      clock, so replaying the same input yields a byte-identical ledger.

#include <cstdint>
#include <cstdio>
#include <string>

#include "storefee/types.hpp"

namespace storefee {

enum class LedgerEntryType { operation, report };

struct LedgerEntry {
  uint64_t        sequence{0};       // assigned by append()
  std::string     previous_digest;   // assigned by append()
  LedgerEntryType type{LedgerEntryType::operation};
  std::string     timestamp;         // operation time, ISO-8601
  std::string     kind;              // "UPLOAD" | "DELETE" | "UPDATE" | "CALC" | "SETTLE"
  std::string     unit_id;
  std::string     file_id;
  SizeMb          size_mb{0};
  SizeMb          current_usage_mb{0};
  std::string     report_json;       // canonical FeeReport JSON (report entries)
  std::string     report_digest;     // report_json_hash(report_json) (report entries)
};

std::string ledger_entry_to_json(const LedgerEntry& e);

// Recompute the chain over NDJSON ledger text. Returns "" when every "prev"
// matches the hash of the preceding line and every report entry's embedded
// report hashes to its report_digest, else a description of the first break.
std::string verify_ledger_chain(const std::string& ndjson);

class BillingLedger {
 public:
  // Creates or truncates `path`. Empty path: disabled, append() is a
  // successful no-op. A path that cannot be opened also disables the ledger and
  // sets open_failed().
  explicit BillingLedger(const std::string& path = "");
  ~BillingLedger();
  BillingLedger(const BillingLedger&) = delete;
  BillingLedger& operator=(const BillingLedger&) = delete;

  // Assigns sequence + previous_digest in place. Returns false on write error.
  bool append(LedgerEntry& entry);

  bool enabled() const { return file_ != nullptr; }
  bool open_failed() const { return !path_.empty() && file_ == nullptr; }
  uint64_t entry_count() const { return entry_count_; }
  uint64_t failure_count() const { return failure_count_; }
  const std::string& head_digest() const { return last_digest_; }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::FILE*  file_{nullptr};
  uint64_t    seq_{0};
  uint64_t    entry_count_{0};
  uint64_t    failure_count_{0};
  std::string last_digest_;
};

}  // namespace storefee
