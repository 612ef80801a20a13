#pragma once

// storefee/types.hpp — Core value types for the storefee billing engine.
//
// ARITHMETIC:
//   - Sizes are whole megabytes (SizeMb, signed so a negative size survives the
//     parser and is rejected by the core with ErrorCode::invalid_size).
//   - Money is fixed-point: 1 unit of currency = 1'000'000 micros. Plan rates are
//     micros per MB, so fee = size_mb * rate with no rounding step. There is no
//     floating point anywhere on the fee path.
//
// TIME:
//   - Timestamps are UTC seconds (std::chrono::sys_seconds). Billing months are
//     calendar months of that UTC time.
//
// OWNERSHIP:
//   - All types here are value types. OperationRecord is transient: built per
//     input line, consumed by BillingEngine::apply(), never retained.

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace storefee {

using SizeMb    = std::int64_t;
using Money     = std::int64_t;  // micros
using Timestamp = std::chrono::sys_seconds;

constexpr Money kMicrosPerUnit = 1'000'000;

enum class ErrorCode {
  none,
  duplicate_unit,
  unit_not_found,
  duplicate_file,
  file_not_found,
  invalid_size,
  out_of_order_operation,
  no_data_for_month,
  plan_restricted,
  fee_limit_exceeded,
  parse_error,
  config_invalid,
};

std::string to_string(ErrorCode code);

// Error value returned by every fallible core operation. Mirrors the
// {code, message} shape of jsonlite::JsonError.
struct BillingError {
  ErrorCode   code{ErrorCode::none};
  std::string message;
};

// ---------------------------------------------------------------------------
// MonthKey — (year, month) of a billing period
// ---------------------------------------------------------------------------
struct MonthKey {
  int      year{0};
  unsigned month{0};  // 1..12

  auto operator<=>(const MonthKey&) const = default;

  MonthKey previous() const;
  std::string to_string() const;  // "YYYY-MM"
};

MonthKey month_of(Timestamp at);

// Returns std::nullopt for an impossible calendar date or time of day.
std::optional<Timestamp> make_timestamp(int year, unsigned month, unsigned day,
                                        int hour = 0, int minute = 0, int second = 0);

// "YYYY-MM-DDTHH:MM:SS"
std::string format_timestamp(Timestamp at);

// Render micros as a decimal string, trailing zeros trimmed, at least one
// fractional digit: 50'000'000 -> "50.0", 500 -> "0.0005".
std::string format_amount(Money micros);

// Parse a non-negative decimal amount ("0.0005", "12", "3.5") into micros.
// Returns std::nullopt on malformed input or more than 6 fractional digits.
std::optional<Money> parse_amount(const std::string& text);

// Convert a JSON number to micros (rounded to the nearest micro). nullopt when
// the value is negative, not finite, or has no int64 micros representation.
std::optional<Money> money_from_double(double value);

// ---------------------------------------------------------------------------
// OperationRecord — closed variant over the four operation kinds
// ---------------------------------------------------------------------------
enum class OperationKind { upload, remove, update, calc };

std::string to_string(OperationKind kind);  // "UPLOAD", "DELETE", "UPDATE", "CALC"

struct UploadOp {
  std::string file_id;
  SizeMb      size_mb{0};
};

struct DeleteOp {
  std::string file_id;
};

struct UpdateOp {
  std::string file_id;
  SizeMb      size_mb{0};
};

struct CalcOp {};

using Operation = std::variant<UploadOp, DeleteOp, UpdateOp, CalcOp>;

struct OperationRecord {
  Timestamp   timestamp{};
  std::string unit_id;
  Operation   op{CalcOp{}};

  OperationKind kind() const;
  // Empty for CALC.
  std::string file_id() const;
};

// ---------------------------------------------------------------------------
// FeeReport — fees for one unit and one month
// ---------------------------------------------------------------------------
struct FeeReport {
  std::string unit_id;
  MonthKey    month;
  SizeMb      max_usage_mb{0};
  SizeMb      update_volume_mb{0};
  SizeMb      current_usage_mb{0};  // inventory at the time the report was taken
  Money       storage_fee{0};
  Money       update_fee{0};
  Money       usage_fee{0};
  bool        storage_fee_waived{false};  // free cap applied
  bool        update_fee_waived{false};   // free cap applied
  bool        ceiling_applied{false};     // usage_fee clamped by monthly ceiling

  bool operator==(const FeeReport&) const = default;

  // Canonical JSON (sorted keys, amounts as decimal strings). Input of report_digest().
  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// OperationResult — outcome of BillingEngine::apply()
// ---------------------------------------------------------------------------
// Either ok (state mutated, report present for CALC) or failed (state unchanged,
// error set). Never both.
struct OperationResult {
  bool        ok{false};
  ErrorCode   error{ErrorCode::none};
  std::string detail;
  OperationKind kind{OperationKind::calc};
  std::string unit_id;
  std::string file_id;
  Timestamp   timestamp{};
  SizeMb      current_usage_mb{0};
  std::optional<FeeReport> report;
  uint64_t    sequence{0};  // 1-based position in the engine's apply() stream
};

}  // namespace storefee
