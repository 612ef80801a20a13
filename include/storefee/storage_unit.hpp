#pragma once

// storefee/storage_unit.hpp — Per-unit billing state machine.
//
// INVARIANTS:
//   1. current_usage_mb() == sum of sizes of files in inventory, at all times.
//   2. For every month M, MonthStat::max_usage_mb is the running maximum of the
//      post-operation inventory totals observed in M. It never decreases.
//   3. MonthStat::update_volume_mb is the sum of |new - old| over the UPDATEs
//      applied in M. UPLOAD and DELETE never contribute to it.
//   4. Mutations carry timestamps >= last_timestamp(). A violation is rejected
//      with out_of_order_operation; nothing is reordered.
//   5. Every mutation either fully applies or leaves the unit untouched.
//   6. Fees are int64 micros. A mutation whose month volume or fee would not fit
//      is rejected with invalid_size, so compute_report() never overflows.
//
// File lifecycle: absent -UPLOAD-> present -UPDATE-> present -DELETE-> absent.
// A deleted id may be uploaded again as a fresh file.

#include <map>
#include <optional>
#include <string>

#include "storefee/plan.hpp"
#include "storefee/types.hpp"

namespace storefee {

struct StoredFile {
  std::string id;
  SizeMb      size_mb{0};
  Timestamp   created_at{};
  Timestamp   last_modified_at{};
};

struct MonthStat {
  SizeMb max_usage_mb{0};
  SizeMb update_volume_mb{0};
  // Fees cached by the last settle(). Cleared by any later mutation in the month.
  std::optional<FeeReport> settled;
};

// Effect an operation would have on its month, computed without applying it.
struct OperationEffect {
  MonthKey month;
  SizeMb   new_total_mb{0};
  SizeMb   update_delta_mb{0};
};

class StorageUnit {
 public:
  StorageUnit(std::string id, PlanRef plan);

  const std::string& id() const { return id_; }
  const Plan& plan() const { return *plan_; }

  // Mutations. Return std::nullopt on success.
  std::optional<BillingError> upload(const std::string& file_id, SizeMb size_mb, Timestamp at);
  std::optional<BillingError> remove(const std::string& file_id, Timestamp at);
  std::optional<BillingError> update(const std::string& file_id, SizeMb new_size_mb, Timestamp at);

  // Validate a mutation record against current state and report its effect.
  // No state change. CALC records are rejected with parse_error.
  std::optional<BillingError> preview(const OperationRecord& record, OperationEffect* effect) const;

  // Fee report for `month`. Pure. Fails with no_data_for_month when the month
  // has no recorded activity.
  std::optional<FeeReport> calculate(const MonthKey& month, BillingError* error = nullptr) const;

  // calculate() + cache the fees in the month's MonthStat.
  std::optional<FeeReport> settle(const MonthKey& month, BillingError* error = nullptr);

  // Report the month would have after an operation with `effect`. Pure.
  FeeReport project(const OperationEffect& effect) const;

  // Read-only inspection.
  const std::map<std::string, StoredFile>& inventory() const { return files_; }
  const StoredFile* find_file(const std::string& file_id) const;
  SizeMb current_usage_mb() const { return current_total_mb_; }
  const MonthStat* month_stat(const MonthKey& month) const;
  const std::map<MonthKey, MonthStat>& months() const { return months_; }
  std::optional<Timestamp> last_timestamp() const { return last_at_; }

 private:
  std::optional<BillingError> check_time(Timestamp at) const;
  std::optional<BillingError> check_size(const std::string& file_id, SizeMb size_mb) const;
  BillingError overflow_error(const std::string& file_id, SizeMb size_mb) const;
  bool billable(const OperationEffect& effect) const;
  FeeReport compute_report(const MonthKey& month, SizeMb max_usage_mb,
                           SizeMb update_volume_mb) const;
  // Record the post-operation total in `at`'s month and advance last_at_.
  MonthStat& touch(Timestamp at);

  std::string id_;
  PlanRef plan_;
  std::map<std::string, StoredFile> files_;
  std::map<MonthKey, MonthStat> months_;
  SizeMb current_total_mb_{0};
  std::optional<Timestamp> last_at_;
};

}  // namespace storefee
