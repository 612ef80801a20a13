#pragma once

// storefee/billing_engine.hpp — Owns the storage units and routes operations.
//
// ORDERING:
//   Records are applied strictly in the order supplied; the engine never sorts.
//   A malformed stream is caught by the per-unit timestamp check.
//
// ATOMICITY:
//   apply() either fully succeeds (unit mutated, result.ok) or fully fails (no
//   unit state changed, result.error set). Observability and the ledger are
//   written after the outcome is decided and never change it.
//
// FREE-PLAN MODE (EngineOptions::free_plan):
//   - Mutations on units whose plan has free_plan_allowed == false are rejected
//     with plan_restricted.
//   - With free_plan_fee_limit set, an UPLOAD/UPDATE whose projected usage fee for
//     the month, summed over all free-plan-allowed units, would exceed the limit is
//     rejected with fee_limit_exceeded. Rejection only blocks the new operation.

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "storefee/ledger.hpp"
#include "storefee/observability.hpp"
#include "storefee/plan.hpp"
#include "storefee/storage_unit.hpp"
#include "storefee/types.hpp"

namespace storefee {

enum class CalcTarget {
  timestamp_month,  // CALC reports the month containing its timestamp
  previous_month,   // CALC reports the calendar month before its timestamp
};

struct EngineOptions {
  bool free_plan{false};
  std::optional<Money> free_plan_fee_limit;
  CalcTarget calc_target{CalcTarget::timestamp_month};
  std::string ledger_path;     // empty = ledger disabled
  std::string event_log_path;  // empty = event log disabled
};

class BillingEngine {
 public:
  explicit BillingEngine(EngineOptions options = {});

  std::optional<BillingError> register_unit(const std::string& unit_id, PlanRef plan);

  // Registers every catalog entry; stops at the first failure.
  std::optional<BillingError> provision_catalog(const PlanCatalog& catalog);

  OperationResult apply(const OperationRecord& record);

  // End-of-run settlement of every touched month of every unit, ordered by
  // (unit id, month).
  std::vector<FeeReport> finalize();

  const StorageUnit* find_unit(const std::string& unit_id) const;
  std::vector<std::string> unit_ids() const;

  // True when `record` names a registered unit with activity in the month a
  // CALC at record.timestamp would report.
  bool has_calc_data(const OperationRecord& record) const;

  const EngineOptions& options() const { return options_; }
  const EngineStats& stats() const { return stats_; }
  EventLog& events() { return events_; }
  const BillingLedger& ledger() const { return ledger_; }

 private:
  friend struct OperationDispatcher;

  MonthKey calc_month(Timestamp at) const;
  std::optional<BillingError> check_free_plan(const StorageUnit& unit,
                                              const OperationRecord& record) const;
  void record_operation(const OperationRecord& record, const OperationResult& result);
  void record_report(const FeeReport& report, const std::string& kind, Timestamp at);

  EngineOptions options_;
  std::map<std::string, StorageUnit> units_;
  EngineStats stats_;
  EventLog events_;
  BillingLedger ledger_;
  uint64_t sequence_{0};
};

}  // namespace storefee
