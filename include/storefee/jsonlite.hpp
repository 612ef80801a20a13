#pragma once

// storefee/jsonlite.hpp — Strict, dependency-free JSON reader/writer used for
// plan catalogs and for the canonical JSON of ledger lines and reports.
//
// STRICTNESS:
//   - Duplicate object keys are rejected (json_duplicate_key).
//   - NaN/Infinity are rejected.
//   - Trailing data after the top-level value is rejected.
//   - Non-negative integers without fraction/exponent parse as uint64; every
//     other number parses as double.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace storefee::jsonlite {

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

// Parse a top-level object. On error returns {} and sets *error (if non-null).
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

// Type-safe extractors: return `def` when the key is absent or has another type.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
Array get_array(const Object& obj, const std::string& key);

bool has_key(const Object& obj, const std::string& key);
bool is_null(const Object& obj, const std::string& key);
bool is_number(const Object& obj, const std::string& key);

std::string escape(const std::string& s);
std::string format_double(double d);

}  // namespace storefee::jsonlite
