#include "storefee/plan.hpp"

#include <fstream>
#include <iterator>
#include <set>
#include <sstream>

#include "storefee/jsonlite.hpp"
#include "storefee/version.hpp"

namespace storefee {

namespace {

// 2^63: the first double that does not fit in SizeMb.
constexpr double kSizeLimit = 9223372036854775808.0;

PlanRef make_plan(std::string name, Money storage, Money update,
                  std::optional<SizeMb> free_cap, bool free_plan_allowed) {
  auto p = std::make_shared<Plan>();
  p->name = std::move(name);
  p->storage_price_per_mb = storage;
  p->update_price_per_mb = update;
  p->free_monthly_fee_cap_mb = free_cap;
  p->free_plan_allowed = free_plan_allowed;
  return p;
}

bool fail(BillingError* error, const std::string& message) {
  if (error) *error = BillingError{ErrorCode::config_invalid, message};
  return false;
}

// Reads an optional non-negative number field that may be absent or null.
// Returns false (and sets *error) if present with the wrong type or negative.
bool read_optional_amount(const jsonlite::Object& obj, const std::string& key,
                          const std::string& where, std::optional<double>* out,
                          BillingError* error) {
  if (!jsonlite::has_key(obj, key) || jsonlite::is_null(obj, key)) {
    *out = std::nullopt;
    return true;
  }
  if (!jsonlite::is_number(obj, key)) return fail(error, where + ": " + key + " must be a number");
  const double v = jsonlite::get_double(obj, key, -1.0);
  if (v < 0.0) return fail(error, where + ": " + key + " must be non-negative");
  *out = v;
  return true;
}

}  // namespace

std::string Plan::to_json() const {
  std::ostringstream o;
  o << "{\"free_monthly_fee_cap_mb\":";
  if (free_monthly_fee_cap_mb) o << *free_monthly_fee_cap_mb; else o << "null";
  o << ",\"free_plan_allowed\":" << (free_plan_allowed ? "true" : "false")
    << ",\"monthly_fee_ceiling\":";
  if (monthly_fee_ceiling) o << "\"" << format_amount(*monthly_fee_ceiling) << "\""; else o << "null";
  o << ",\"name\":\"" << jsonlite::escape(name) << "\""
    << ",\"storage_price_per_mb\":\"" << format_amount(storage_price_per_mb) << "\""
    << ",\"update_price_per_mb\":\"" << format_amount(update_price_per_mb) << "\""
    << "}";
  return o.str();
}

PlanCatalog builtin_catalog() {
  PlanCatalog c;
  c.units.push_back({"storage_A1", make_plan("A1", 10'000, 500, kDefaultFreeCapMb, true)});
  c.units.push_back({"storage_A2", make_plan("A2", 1'000, 10'000, kDefaultFreeCapMb, true)});
  c.units.push_back({"storage_B1", make_plan("B1", 10'000, 1'000, std::nullopt, false)});
  c.units.push_back({"storage_B2", make_plan("B2", 100, 500'000, std::nullopt, false)});
  return c;
}

std::optional<PlanCatalog> parse_catalog(const std::string& json_text, BillingError* error) {
  std::optional<jsonlite::JsonError> jerr;
  const auto root = jsonlite::parse(json_text, &jerr);
  if (jerr) {
    fail(error, jerr->code + ": " + jerr->message);
    return std::nullopt;
  }

  const auto declared = jsonlite::get_u64(root, "format_version", version::CATALOG_FORMAT_VERSION);
  if (const auto mismatch = version::check_catalog_version(declared); !mismatch.empty()) {
    fail(error, mismatch);
    return std::nullopt;
  }

  const auto units = jsonlite::get_array(root, "units");
  if (units.empty()) {
    fail(error, "catalog has no \"units\" array entries");
    return std::nullopt;
  }

  PlanCatalog catalog;
  std::set<std::string> seen;
  for (std::size_t idx = 0; idx < units.size(); ++idx) {
    const std::string where = "units[" + std::to_string(idx) + "]";
    if (!std::holds_alternative<jsonlite::Object>(units[idx].v)) {
      fail(error, where + ": expected an object");
      return std::nullopt;
    }
    const auto& u = std::get<jsonlite::Object>(units[idx].v);

    const std::string id = jsonlite::get_string(u, "id");
    if (id.empty()) {
      fail(error, where + ": missing \"id\"");
      return std::nullopt;
    }
    if (!seen.insert(id).second) {
      fail(error, where + ": duplicate unit id " + id);
      return std::nullopt;
    }
    if (!jsonlite::is_number(u, "storage_price_per_mb") ||
        !jsonlite::is_number(u, "update_price_per_mb")) {
      fail(error, where + ": storage_price_per_mb and update_price_per_mb are required numbers");
      return std::nullopt;
    }
    const double storage = jsonlite::get_double(u, "storage_price_per_mb");
    const double update = jsonlite::get_double(u, "update_price_per_mb");
    if (storage < 0.0 || update < 0.0) {
      fail(error, where + ": prices must be non-negative");
      return std::nullopt;
    }

    std::optional<double> cap;
    std::optional<double> ceiling;
    if (!read_optional_amount(u, "free_monthly_fee_cap_mb", where, &cap, error) ||
        !read_optional_amount(u, "monthly_fee_ceiling", where, &ceiling, error)) {
      return std::nullopt;
    }

    const auto storage_micros = money_from_double(storage);
    const auto update_micros = money_from_double(update);
    if (!storage_micros || !update_micros) {
      fail(error, where + ": prices are out of range");
      return std::nullopt;
    }
    if (cap && !(*cap < kSizeLimit)) {
      fail(error, where + ": free_monthly_fee_cap_mb is out of range");
      return std::nullopt;
    }
    std::optional<Money> ceiling_micros;
    if (ceiling) {
      ceiling_micros = money_from_double(*ceiling);
      if (!ceiling_micros) {
        fail(error, where + ": monthly_fee_ceiling is out of range");
        return std::nullopt;
      }
    }

    auto plan = std::make_shared<Plan>();
    plan->name = jsonlite::get_string(u, "plan", id);
    plan->storage_price_per_mb = *storage_micros;
    plan->update_price_per_mb = *update_micros;
    if (cap) plan->free_monthly_fee_cap_mb = static_cast<SizeMb>(*cap);
    plan->monthly_fee_ceiling = ceiling_micros;
    plan->free_plan_allowed = jsonlite::get_bool(u, "free_plan_allowed", true);
    catalog.units.push_back({id, std::move(plan)});
  }
  return catalog;
}

std::optional<PlanCatalog> load_catalog_file(const std::string& path, BillingError* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    fail(error, "cannot open plan catalog: " + path);
    return std::nullopt;
  }
  const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return parse_catalog(text, error);
}

}  // namespace storefee
