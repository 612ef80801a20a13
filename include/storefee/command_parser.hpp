#pragma once

// storefee/command_parser.hpp — Text command stream -> OperationRecord.
//
// LINE FORMAT:
//   <timestamp> <KIND> <unitId> [fileId] [sizeMB]
//     timestamp  YYYY-MM-DDTHH:MM or YYYY-MM-DDTHH:MM:SS, UTC, optional trailing 'Z'
//     KIND       UPLOAD | DELETE | UPDATE | CALC, case-insensitive
//   Field counts: UPLOAD 5, DELETE 4, UPDATE 5, CALC 3.
//   CALC may omit the unit id; it then expands to one CALC per registered unit,
//   in unit id order, and sets all_units. The runner skips expanded units with
//   no activity in the reported month.
//
// Blank lines and lines whose first non-space character is '#' yield no records.
//
// The parser checks shape only. Sizes are parsed as signed integers so that a
// negative size reaches the engine and fails there with invalid_size.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "storefee/types.hpp"

namespace storefee {

struct ParsedLine {
  // Kind token upper-cased ("UPLOAD", ...), or "PARSE" when no kind was read.
  std::string label;
  std::vector<OperationRecord> records;
  std::optional<BillingError> error;  // code = parse_error
  bool all_units{false};              // unit-less CALC expansion
};

ParsedLine parse_line(std::string_view line, const std::vector<std::string>& unit_ids);

std::optional<Timestamp> parse_timestamp(std::string_view text);
std::optional<OperationKind> parse_kind(std::string_view text);
std::optional<SizeMb> parse_size(std::string_view text);

}  // namespace storefee
