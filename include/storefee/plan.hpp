#pragma once

// storefee/plan.hpp — Immutable pricing/policy parameters of a storage unit type.
//
// A Plan is shared read-only (std::shared_ptr<const Plan>) by every StorageUnit
// that uses it. Rates are micros per MB (see types.hpp).

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "storefee/types.hpp"

namespace storefee {

struct Plan {
  std::string name;
  Money storage_price_per_mb{0};
  Money update_price_per_mb{0};
  // MB volume at or below which a fee type is waived. nullopt = no free tier.
  std::optional<SizeMb> free_monthly_fee_cap_mb;
  // Ceiling on usage_fee. nullopt = uncapped.
  std::optional<Money> monthly_fee_ceiling;
  // Whether units of this plan accept mutations in free-plan mode.
  bool free_plan_allowed{true};

  std::string to_json() const;
};

using PlanRef = std::shared_ptr<const Plan>;

// One unit to provision: unit id + plan it is governed by.
struct CatalogEntry {
  std::string unit_id;
  PlanRef     plan;
};

struct PlanCatalog {
  std::vector<CatalogEntry> units;
};

// The fixed set of storage units the simulator models:
//   storage_A1, storage_A2 (free-plan allowed, 1000 MB free cap),
//   storage_B1, storage_B2 (paid only, no free cap).
// The 1000 MB cap is a simulator default (kDefaultFreeCapMb), not a product
// rate. The product's free-plan limit is a fee amount: see
// EngineOptions::free_plan_fee_limit.
inline constexpr SizeMb kDefaultFreeCapMb = 1000;

PlanCatalog builtin_catalog();

// Load a catalog from JSON text. On failure returns std::nullopt and sets *error
// (code = ErrorCode::config_invalid). Never throws.
std::optional<PlanCatalog> parse_catalog(const std::string& json_text, BillingError* error);

// Read and parse a catalog file.
std::optional<PlanCatalog> load_catalog_file(const std::string& path, BillingError* error);

}  // namespace storefee
