#include "storefee/command_parser.hpp"

#include <cctype>
#include <limits>

namespace storefee {

namespace {

std::vector<std::string_view> split_fields(std::string_view line) {
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    const size_t start = i;
    while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    if (i > start) out.push_back(line.substr(start, i - start));
  }
  return out;
}

// Reads exactly `width` digits at `pos`.
bool read_digits(std::string_view s, size_t pos, size_t width, int* out) {
  if (pos + width > s.size()) return false;
  int v = 0;
  for (size_t i = pos; i < pos + width; ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
    v = v * 10 + (s[i] - '0');
  }
  *out = v;
  return true;
}

std::string upper(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

size_t expected_fields(OperationKind kind) {
  switch (kind) {
    case OperationKind::upload: return 5;
    case OperationKind::remove: return 4;
    case OperationKind::update: return 5;
    case OperationKind::calc:   return 3;
  }
  return 0;
}

}  // namespace

std::optional<Timestamp> parse_timestamp(std::string_view text) {
  if (!text.empty() && (text.back() == 'Z' || text.back() == 'z')) {
    text.remove_suffix(1);
  }
  // 0123456789012345678
  // YYYY-MM-DDTHH:MM:SS
  if (text.size() != 16 && text.size() != 19) return std::nullopt;
  if (text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != 't') ||
      text[13] != ':') {
    return std::nullopt;
  }
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!read_digits(text, 0, 4, &year) || !read_digits(text, 5, 2, &month) ||
      !read_digits(text, 8, 2, &day) || !read_digits(text, 11, 2, &hour) ||
      !read_digits(text, 14, 2, &minute)) {
    return std::nullopt;
  }
  if (text.size() == 19) {
    if (text[16] != ':' || !read_digits(text, 17, 2, &second)) return std::nullopt;
  }
  return make_timestamp(year, static_cast<unsigned>(month), static_cast<unsigned>(day), hour,
                        minute, second);
}

std::optional<OperationKind> parse_kind(std::string_view text) {
  const auto k = upper(text);
  if (k == "UPLOAD") return OperationKind::upload;
  if (k == "DELETE") return OperationKind::remove;
  if (k == "UPDATE") return OperationKind::update;
  if (k == "CALC") return OperationKind::calc;
  return std::nullopt;
}

std::optional<SizeMb> parse_size(std::string_view text) {
  if (text.empty()) return std::nullopt;
  bool negative = false;
  if (text.front() == '-' || text.front() == '+') {
    negative = text.front() == '-';
    text.remove_prefix(1);
    if (text.empty()) return std::nullopt;
  }
  SizeMb v = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return std::nullopt;
    if (v > (std::numeric_limits<SizeMb>::max() - (c - '0')) / 10) return std::nullopt;
    v = v * 10 + (c - '0');
  }
  return negative ? -v : v;
}

ParsedLine parse_line(std::string_view line, const std::vector<std::string>& unit_ids) {
  ParsedLine out;
  out.label = "PARSE";

  const auto fields = split_fields(line);
  if (fields.empty() || fields.front().front() == '#') return out;

  auto fail = [&out](std::string message) {
    out.records.clear();
    out.error = BillingError{ErrorCode::parse_error, std::move(message)};
    return out;
  };

  if (fields.size() < 2) return fail("expected '<timestamp> <KIND> ...'");

  const auto kind = parse_kind(fields[1]);
  if (!kind) return fail("unknown operation kind '" + std::string(fields[1]) + "'");
  out.label = to_string(*kind);

  const auto ts = parse_timestamp(fields[0]);
  if (!ts) return fail("invalid timestamp '" + std::string(fields[0]) + "'");

  // Unit-less CALC.
  if (*kind == OperationKind::calc && fields.size() == 2) {
    out.all_units = true;
    for (const auto& id : unit_ids) out.records.push_back(OperationRecord{*ts, id, CalcOp{}});
    return out;
  }

  const size_t want = expected_fields(*kind);
  if (fields.size() != want) {
    return fail(out.label + " takes " + std::to_string(want) + " fields, got " +
                std::to_string(fields.size()));
  }

  OperationRecord record;
  record.timestamp = *ts;
  record.unit_id = std::string(fields[2]);

  switch (*kind) {
    case OperationKind::upload:
    case OperationKind::update: {
      const auto size = parse_size(fields[4]);
      if (!size) return fail("invalid size '" + std::string(fields[4]) + "'");
      if (*kind == OperationKind::upload) {
        record.op = UploadOp{std::string(fields[3]), *size};
      } else {
        record.op = UpdateOp{std::string(fields[3]), *size};
      }
      break;
    }
    case OperationKind::remove:
      record.op = DeleteOp{std::string(fields[3])};
      break;
    case OperationKind::calc:
      record.op = CalcOp{};
      break;
  }
  out.records.push_back(std::move(record));
  return out;
}

}  // namespace storefee
