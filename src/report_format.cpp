#include "storefee/report_format.hpp"

#include "storefee/hash.hpp"

namespace storefee {

std::string format_report_fields(const FeeReport& r) {
  std::string out;
  out.reserve(128);
  out += r.unit_id;
  out += ' ';
  out += r.month.to_string();
  out += " max=" + std::to_string(r.max_usage_mb);
  out += " updated=" + std::to_string(r.update_volume_mb);
  out += " current=" + std::to_string(r.current_usage_mb);
  out += " storage=" + format_amount(r.storage_fee);
  out += " update=" + format_amount(r.update_fee);
  out += " usage=" + format_amount(r.usage_fee);
  return out;
}

std::string format_result(const OperationResult& result) {
  const std::string label = to_string(result.kind);
  if (!result.ok) {
    return label + ": error " + to_string(result.error) + " " + result.detail;
  }
  if (result.report) return label + ": " + format_report_fields(*result.report);
  return label + ": ok " + result.unit_id + " " + std::to_string(result.current_usage_mb);
}

std::string format_parse_error(const ParsedLine& parsed) {
  if (!parsed.error) return {};
  return parsed.label + ": error " + to_string(parsed.error->code) + " " +
         parsed.error->message;
}

std::string format_statement(const FeeReport& report) {
  std::string line = "STATEMENT: " + format_report_fields(report);
  if (report.ceiling_applied) line += " ceiling";
  return line;
}

std::string report_digest(const FeeReport& report) {
  return report_json_hash(report.to_json());
}

void RunDigest::add(const std::string& line) {
  stream_ += line;
  stream_ += '\n';
  ++lines_;
}

std::string RunDigest::digest() const {
  return run_output_hash(stream_);
}

}  // namespace storefee
