#pragma once

// storefee/report_format.hpp — Human-readable output lines and output digests.
//
// OUTPUT LINES:
//   UPLOAD: ok <unit> <currentMB>                (same for DELETE / UPDATE)
//   CALC: <unit> <YYYY-MM> max=<MB> updated=<MB> current=<MB> storage=<fee>
//         update=<fee> usage=<fee>               (one line)
//   <KIND>: error <code> <detail>
//   STATEMENT: <unit> <YYYY-MM> ...              (end-of-run settlement, same fields)
//
// Fees are rendered with format_amount(). Every line is deterministic for a
// given input stream, so RunDigest over the lines identifies a replay.

#include <string>

#include "storefee/command_parser.hpp"
#include "storefee/types.hpp"

namespace storefee {

std::string format_report_fields(const FeeReport& report);
std::string format_result(const OperationResult& result);
std::string format_parse_error(const ParsedLine& parsed);
std::string format_statement(const FeeReport& report);

// report_json_hash() of the canonical report JSON.
std::string report_digest(const FeeReport& report);

// Accumulates output lines and hashes them as one '\n'-terminated stream.
class RunDigest {
 public:
  void add(const std::string& line);
  std::string digest() const;
  uint64_t line_count() const { return lines_; }

 private:
  std::string stream_;
  uint64_t lines_{0};
};

}  // namespace storefee
