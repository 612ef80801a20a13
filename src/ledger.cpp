#include "storefee/ledger.hpp"

#include <sstream>

#include "storefee/hash.hpp"
#include "storefee/jsonlite.hpp"
#include "storefee/version.hpp"

namespace storefee {

namespace {
const std::string kGenesisDigest(64, '0');
}  // namespace

std::string ledger_entry_to_json(const LedgerEntry& e) {
  std::ostringstream o;
  o << "{"
    << "\"v\":" << version::LEDGER_FORMAT_VERSION
    << ",\"seq\":" << e.sequence
    << ",\"prev\":\"" << e.previous_digest << "\""
    << ",\"type\":\"" << (e.type == LedgerEntryType::report ? "report" : "operation") << "\""
    << ",\"timestamp\":\"" << e.timestamp << "\""
    << ",\"kind\":\"" << e.kind << "\""
    << ",\"unit_id\":\"" << jsonlite::escape(e.unit_id) << "\"";
  if (e.type == LedgerEntryType::operation) {
    o << ",\"file_id\":\"" << jsonlite::escape(e.file_id) << "\""
      << ",\"size_mb\":" << e.size_mb
      << ",\"current_usage_mb\":" << e.current_usage_mb;
  } else {
    o << ",\"report\":" << e.report_json
      << ",\"report_digest\":\"" << e.report_digest << "\"";
  }
  o << "}";
  return o.str();
}

std::string verify_ledger_chain(const std::string& ndjson) {
  std::istringstream in(ndjson);
  std::string line;
  std::string expected_prev = kGenesisDigest;
  uint64_t expected_seq = 1;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const auto obj = jsonlite::parse(line, &err);
    if (err) return "seq " + std::to_string(expected_seq) + ": " + err->message;
    if (jsonlite::get_u64(obj, "seq") != expected_seq) {
      return "sequence gap at " + std::to_string(expected_seq);
    }
    if (jsonlite::get_string(obj, "prev") != expected_prev) {
      return "chain broken at seq " + std::to_string(expected_seq);
    }
    if (jsonlite::get_string(obj, "type") == "report") {
      // The digest covers the report's exact bytes, so hash the raw text.
      static const std::string kOpen = ",\"report\":";
      static const std::string kClose = ",\"report_digest\":\"";
      const auto begin = line.find(kOpen);
      const auto end = line.rfind(kClose);
      if (begin == std::string::npos || end == std::string::npos || end < begin + kOpen.size()) {
        return "malformed report entry at seq " + std::to_string(expected_seq);
      }
      const auto raw = line.substr(begin + kOpen.size(), end - begin - kOpen.size());
      if (report_json_hash(raw) != jsonlite::get_string(obj, "report_digest")) {
        return "report digest mismatch at seq " + std::to_string(expected_seq);
      }
    }
    expected_prev = ledger_entry_hash(line);
    ++expected_seq;
  }
  return "";
}

BillingLedger::BillingLedger(const std::string& path) : path_(path), last_digest_(kGenesisDigest) {
  // One ledger per run: the chain starts at genesis, so the file starts empty.
  if (!path_.empty()) file_ = std::fopen(path_.c_str(), "w");
}

BillingLedger::~BillingLedger() {
  if (file_) std::fclose(file_);
}

bool BillingLedger::append(LedgerEntry& entry) {
  if (!file_) return true;

  entry.sequence = seq_ + 1;
  entry.previous_digest = last_digest_;
  const std::string line = ledger_entry_to_json(entry);
  const std::string framed = line + "\n";

  const bool written = std::fwrite(framed.data(), 1, framed.size(), file_) == framed.size() &&
                       std::fflush(file_) == 0;
  if (!written) {
    ++failure_count_;
    return false;
  }
  ++seq_;
  ++entry_count_;
  last_digest_ = ledger_entry_hash(line);
  return true;
}

}  // namespace storefee
