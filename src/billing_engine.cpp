#include "storefee/billing_engine.hpp"

#include <limits>

#include "storefee/hash.hpp"

namespace storefee {

namespace {

void fail(OperationResult& result, const BillingError& error) {
  result.ok = false;
  result.error = error.code;
  result.detail = error.message;
}

SizeMb size_of(const Operation& op) {
  if (const auto* u = std::get_if<UploadOp>(&op)) return u->size_mb;
  if (const auto* u = std::get_if<UpdateOp>(&op)) return u->size_mb;
  return 0;
}

}  // namespace

// Exhaustive match over the closed operation variant. Adding an alternative to
// Operation without a handler here is a compile error.
struct OperationDispatcher {
  BillingEngine& engine;
  StorageUnit& unit;
  const OperationRecord& record;
  OperationResult& result;

  void operator()(const UploadOp& op) const {
    if (!admit()) return;
    finish(unit.upload(op.file_id, op.size_mb, record.timestamp));
  }

  void operator()(const DeleteOp& op) const {
    if (!admit()) return;
    finish(unit.remove(op.file_id, record.timestamp));
  }

  void operator()(const UpdateOp& op) const {
    if (!admit()) return;
    finish(unit.update(op.file_id, op.size_mb, record.timestamp));
  }

  void operator()(const CalcOp&) const {
    BillingError error;
    auto report = unit.settle(engine.calc_month(record.timestamp), &error);
    if (!report) {
      fail(result, error);
      return;
    }
    result.ok = true;
    result.current_usage_mb = unit.current_usage_mb();
    result.report = std::move(report);
  }

  bool admit() const {
    if (auto err = engine.check_free_plan(unit, record)) {
      fail(result, *err);
      return false;
    }
    return true;
  }

  void finish(const std::optional<BillingError>& err) const {
    if (err) {
      fail(result, *err);
      return;
    }
    result.ok = true;
    result.current_usage_mb = unit.current_usage_mb();
  }
};

BillingEngine::BillingEngine(EngineOptions options)
    : options_(std::move(options)),
      events_(options_.event_log_path),
      ledger_(options_.ledger_path) {}

std::optional<BillingError> BillingEngine::register_unit(const std::string& unit_id, PlanRef plan) {
  if (unit_id.empty()) {
    return BillingError{ErrorCode::config_invalid, "unit id must not be empty"};
  }
  if (!plan) {
    return BillingError{ErrorCode::config_invalid, "unit " + unit_id + " has no plan"};
  }
  if (units_.contains(unit_id)) {
    return BillingError{ErrorCode::duplicate_unit, "unit " + unit_id + " is already registered"};
  }
  units_.try_emplace(unit_id, unit_id, std::move(plan));
  return std::nullopt;
}

std::optional<BillingError> BillingEngine::provision_catalog(const PlanCatalog& catalog) {
  for (const auto& entry : catalog.units) {
    if (auto err = register_unit(entry.unit_id, entry.plan)) return err;
  }
  return std::nullopt;
}

MonthKey BillingEngine::calc_month(Timestamp at) const {
  const MonthKey month = month_of(at);
  return options_.calc_target == CalcTarget::previous_month ? month.previous() : month;
}

std::optional<BillingError> BillingEngine::check_free_plan(const StorageUnit& unit,
                                                           const OperationRecord& record) const {
  if (!options_.free_plan) return std::nullopt;
  if (!unit.plan().free_plan_allowed) {
    return BillingError{ErrorCode::plan_restricted,
                        "unit " + unit.id() + " (plan " + unit.plan().name +
                            ") is not available on the free plan"};
  }
  if (!options_.free_plan_fee_limit) return std::nullopt;
  const auto kind = record.kind();
  if (kind != OperationKind::upload && kind != OperationKind::update) return std::nullopt;

  // Validation errors take precedence over the limit.
  OperationEffect effect;
  if (auto err = unit.preview(record, &effect)) return err;

  Money projected = unit.project(effect).usage_fee;
  for (const auto& [id, other] : units_) {
    if (id == unit.id() || !other.plan().free_plan_allowed) continue;
    if (auto report = other.calculate(effect.month)) {
      // Saturate: every unit's fee fits in int64, their sum need not.
      const Money room = std::numeric_limits<Money>::max() - projected;
      projected = report->usage_fee > room ? std::numeric_limits<Money>::max()
                                           : projected + report->usage_fee;
    }
  }
  if (projected > *options_.free_plan_fee_limit) {
    return BillingError{ErrorCode::fee_limit_exceeded,
                        "projected free-plan usage fee " + format_amount(projected) +
                            " for " + effect.month.to_string() + " exceeds limit " +
                            format_amount(*options_.free_plan_fee_limit)};
  }
  return std::nullopt;
}

OperationResult BillingEngine::apply(const OperationRecord& record) {
  OperationResult result;
  result.sequence = ++sequence_;
  result.kind = record.kind();
  result.unit_id = record.unit_id;
  result.file_id = record.file_id();
  result.timestamp = record.timestamp;

  uint64_t duration_ns = 0;
  {
    ScopeTimer timer(duration_ns);
    const auto it = units_.find(record.unit_id);
    if (it == units_.end()) {
      fail(result, BillingError{ErrorCode::unit_not_found,
                                "unit " + record.unit_id + " is not registered"});
    } else {
      std::visit(OperationDispatcher{*this, it->second, record, result}, record.op);
    }
  }

  OperationEvent ev;
  ev.sequence = result.sequence;
  ev.kind = to_string(result.kind);
  ev.unit_id = result.unit_id;
  ev.file_id = result.file_id;
  ev.timestamp = format_timestamp(record.timestamp);
  ev.ok = result.ok;
  ev.error_code = to_string(result.error);
  ev.duration_ns = duration_ns;
  stats_.record(ev);
  events_.emit(ev);

  if (result.ok) record_operation(record, result);
  return result;
}

std::vector<FeeReport> BillingEngine::finalize() {
  std::vector<FeeReport> statements;
  for (auto& [id, unit] : units_) {
    // Copy the keys: settle() writes into the month map being walked.
    std::vector<MonthKey> months;
    for (const auto& [month, stat] : unit.months()) months.push_back(month);
    for (const auto& month : months) {
      auto report = unit.settle(month);
      if (!report) continue;
      record_report(*report, "SETTLE", unit.last_timestamp().value_or(Timestamp{}));
      statements.push_back(std::move(*report));
    }
  }
  return statements;
}

const StorageUnit* BillingEngine::find_unit(const std::string& unit_id) const {
  const auto it = units_.find(unit_id);
  return it == units_.end() ? nullptr : &it->second;
}

bool BillingEngine::has_calc_data(const OperationRecord& record) const {
  const auto* unit = find_unit(record.unit_id);
  return unit && unit->month_stat(calc_month(record.timestamp)) != nullptr;
}

std::vector<std::string> BillingEngine::unit_ids() const {
  std::vector<std::string> ids;
  ids.reserve(units_.size());
  for (const auto& [id, unit] : units_) ids.push_back(id);
  return ids;
}

void BillingEngine::record_operation(const OperationRecord& record, const OperationResult& result) {
  if (!ledger_.enabled()) return;
  if (result.report) {
    record_report(*result.report, "CALC", record.timestamp);
    return;
  }
  LedgerEntry entry;
  entry.type = LedgerEntryType::operation;
  entry.timestamp = format_timestamp(record.timestamp);
  entry.kind = to_string(result.kind);
  entry.unit_id = result.unit_id;
  entry.file_id = result.file_id;
  entry.size_mb = size_of(record.op);
  entry.current_usage_mb = result.current_usage_mb;
  // A failed ledger write is counted by the ledger and never fails billing.
  (void)ledger_.append(entry);
}

void BillingEngine::record_report(const FeeReport& report, const std::string& kind, Timestamp at) {
  if (!ledger_.enabled()) return;
  LedgerEntry entry;
  entry.type = LedgerEntryType::report;
  entry.timestamp = format_timestamp(at);
  entry.kind = kind;
  entry.unit_id = report.unit_id;
  entry.report_json = report.to_json();
  entry.report_digest = report_json_hash(entry.report_json);
  (void)ledger_.append(entry);
}

}  // namespace storefee
