#include "storefee/types.hpp"
#include "storefee/jsonlite.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace storefee {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::duplicate_unit: return "duplicate_unit";
    case ErrorCode::unit_not_found: return "unit_not_found";
    case ErrorCode::duplicate_file: return "duplicate_file";
    case ErrorCode::file_not_found: return "file_not_found";
    case ErrorCode::invalid_size: return "invalid_size";
    case ErrorCode::out_of_order_operation: return "out_of_order_operation";
    case ErrorCode::no_data_for_month: return "no_data_for_month";
    case ErrorCode::plan_restricted: return "plan_restricted";
    case ErrorCode::fee_limit_exceeded: return "fee_limit_exceeded";
    case ErrorCode::parse_error: return "parse_error";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

std::string to_string(OperationKind kind) {
  switch (kind) {
    case OperationKind::upload: return "UPLOAD";
    case OperationKind::remove: return "DELETE";
    case OperationKind::update: return "UPDATE";
    case OperationKind::calc:   return "CALC";
  }
  return "CALC";
}

// ---------------------------------------------------------------------------
// Calendar helpers
// ---------------------------------------------------------------------------

MonthKey MonthKey::previous() const {
  if (month <= 1) return MonthKey{year - 1, 12};
  return MonthKey{year, month - 1};
}

std::string MonthKey::to_string() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u", year, month);
  return buf;
}

MonthKey month_of(Timestamp at) {
  using namespace std::chrono;
  const year_month_day ymd{floor<days>(at)};
  return MonthKey{static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month())};
}

std::optional<Timestamp> make_timestamp(int year, unsigned month, unsigned day,
                                        int hour, int minute, int second) {
  using namespace std::chrono;
  const year_month_day ymd{std::chrono::year{year} / std::chrono::month{month} /
                           std::chrono::day{day}};
  if (!ymd.ok()) return std::nullopt;
  if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
    return std::nullopt;
  }
  return Timestamp{sys_days{ymd}} + hours{hour} + minutes{minute} + seconds{second};
}

std::string format_timestamp(Timestamp at) {
  using namespace std::chrono;
  const auto day_start = floor<days>(at);
  const year_month_day ymd{day_start};
  const long long secs = (at - day_start).count();
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02lld:%02lld:%02lld",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), secs / 3600, (secs / 60) % 60, secs % 60);
  return buf;
}

// ---------------------------------------------------------------------------
// Money helpers
// ---------------------------------------------------------------------------

std::string format_amount(Money micros) {
  const bool negative = micros < 0;
  const unsigned long long abs_micros =
      negative ? static_cast<unsigned long long>(-(micros + 1)) + 1ULL
               : static_cast<unsigned long long>(micros);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s%llu.%06llu", negative ? "-" : "",
                abs_micros / kMicrosPerUnit, abs_micros % kMicrosPerUnit);
  std::string out(buf);
  // Same trimming rule as the JSON number formatter: keep one digit after '.'.
  while (out.back() == '0') out.pop_back();
  if (out.back() == '.') out.push_back('0');
  return out;
}

std::optional<Money> parse_amount(const std::string& text) {
  if (text.empty()) return std::nullopt;
  Money whole = 0;
  Money frac = 0;
  int frac_digits = 0;
  bool seen_dot = false;
  bool seen_digit = false;
  for (char c : text) {
    if (c == '.') {
      if (seen_dot) return std::nullopt;
      seen_dot = true;
      continue;
    }
    if (c < '0' || c > '9') return std::nullopt;
    seen_digit = true;
    if (seen_dot) {
      if (++frac_digits > 6) return std::nullopt;
      frac = frac * 10 + (c - '0');
    } else {
      if (whole > (INT64_MAX / kMicrosPerUnit) / 10) return std::nullopt;
      whole = whole * 10 + (c - '0');
    }
  }
  if (!seen_digit) return std::nullopt;
  for (int i = frac_digits; i < 6; ++i) frac *= 10;
  return whole * kMicrosPerUnit + frac;
}

std::optional<Money> money_from_double(double value) {
  const double micros = value * static_cast<double>(kMicrosPerUnit);
  // 2^63 is exact as a double; anything below it converts without overflow.
  if (!std::isfinite(micros) || micros < 0.0 || micros >= 9223372036854775808.0) {
    return std::nullopt;
  }
  return static_cast<Money>(std::llround(micros));
}

// ---------------------------------------------------------------------------
// OperationRecord
// ---------------------------------------------------------------------------

OperationKind OperationRecord::kind() const {
  struct KindOf {
    OperationKind operator()(const UploadOp&) const { return OperationKind::upload; }
    OperationKind operator()(const DeleteOp&) const { return OperationKind::remove; }
    OperationKind operator()(const UpdateOp&) const { return OperationKind::update; }
    OperationKind operator()(const CalcOp&) const { return OperationKind::calc; }
  };
  return std::visit(KindOf{}, op);
}

std::string OperationRecord::file_id() const {
  if (const auto* u = std::get_if<UploadOp>(&op)) return u->file_id;
  if (const auto* d = std::get_if<DeleteOp>(&op)) return d->file_id;
  if (const auto* u = std::get_if<UpdateOp>(&op)) return u->file_id;
  return {};
}

// ---------------------------------------------------------------------------
// FeeReport
// ---------------------------------------------------------------------------

std::string FeeReport::to_json() const {
  // Keys in sorted order: this string is the canonical digest input.
  std::ostringstream o;
  o << "{"
    << "\"ceiling_applied\":" << (ceiling_applied ? "true" : "false")
    << ",\"current_usage_mb\":" << current_usage_mb
    << ",\"max_usage_mb\":" << max_usage_mb
    << ",\"month\":\"" << month.to_string() << "\""
    << ",\"storage_fee\":\"" << format_amount(storage_fee) << "\""
    << ",\"storage_fee_waived\":" << (storage_fee_waived ? "true" : "false")
    << ",\"unit_id\":\"" << jsonlite::escape(unit_id) << "\""
    << ",\"update_fee\":\"" << format_amount(update_fee) << "\""
    << ",\"update_fee_waived\":" << (update_fee_waived ? "true" : "false")
    << ",\"update_volume_mb\":" << update_volume_mb
    << ",\"usage_fee\":\"" << format_amount(usage_fee) << "\""
    << "}";
  return o.str();
}

}  // namespace storefee
