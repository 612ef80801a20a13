#include "storefee/storage_unit.hpp"

#include <algorithm>
#include <limits>

namespace storefee {

namespace {

BillingError make_error(ErrorCode code, std::string message) {
  return BillingError{code, std::move(message)};
}

constexpr std::int64_t kInt64Max = std::numeric_limits<std::int64_t>::max();

SizeMb abs_delta(SizeMb a, SizeMb b) {
  return a > b ? a - b : b - a;
}

// Both operands non-negative.
bool mul_fits(std::int64_t a, std::int64_t b) {
  return a == 0 || b <= kInt64Max / a;
}

bool add_fits(std::int64_t a, std::int64_t b) {
  return b <= kInt64Max - a;
}

}  // namespace

StorageUnit::StorageUnit(std::string id, PlanRef plan)
    : id_(std::move(id)), plan_(std::move(plan)) {}

// ---------------------------------------------------------------------------
// Validation helpers
// ---------------------------------------------------------------------------

std::optional<BillingError> StorageUnit::check_time(Timestamp at) const {
  if (last_at_ && at < *last_at_) {
    return make_error(ErrorCode::out_of_order_operation,
                      "unit " + id_ + ": timestamp " + format_timestamp(at) +
                          " precedes last applied " + format_timestamp(*last_at_));
  }
  return std::nullopt;
}

std::optional<BillingError> StorageUnit::check_size(const std::string& file_id,
                                                    SizeMb size_mb) const {
  if (size_mb < 0) {
    return make_error(ErrorCode::invalid_size,
                      "file " + file_id + ": size " + std::to_string(size_mb) + " is negative");
  }
  return std::nullopt;
}

std::optional<BillingError> StorageUnit::preview(const OperationRecord& record,
                                                 OperationEffect* effect) const {
  if (auto err = check_time(record.timestamp)) return err;

  OperationEffect out;
  out.month = month_of(record.timestamp);

  if (const auto* up = std::get_if<UploadOp>(&record.op)) {
    if (auto err = check_size(up->file_id, up->size_mb)) return err;
    if (files_.contains(up->file_id)) {
      return make_error(ErrorCode::duplicate_file,
                        "file " + up->file_id + " already exists in " + id_);
    }
    if (!add_fits(current_total_mb_, up->size_mb)) {
      return overflow_error(up->file_id, up->size_mb);
    }
    out.new_total_mb = current_total_mb_ + up->size_mb;
  } else if (const auto* del = std::get_if<DeleteOp>(&record.op)) {
    const auto it = files_.find(del->file_id);
    if (it == files_.end()) {
      return make_error(ErrorCode::file_not_found,
                        "file " + del->file_id + " does not exist in " + id_);
    }
    out.new_total_mb = current_total_mb_ - it->second.size_mb;
  } else if (const auto* upd = std::get_if<UpdateOp>(&record.op)) {
    const auto it = files_.find(upd->file_id);
    if (it == files_.end()) {
      return make_error(ErrorCode::file_not_found,
                        "file " + upd->file_id + " does not exist in " + id_);
    }
    if (auto err = check_size(upd->file_id, upd->size_mb)) return err;
    const SizeMb others = current_total_mb_ - it->second.size_mb;
    if (!add_fits(others, upd->size_mb)) return overflow_error(upd->file_id, upd->size_mb);
    out.new_total_mb = others + upd->size_mb;
    out.update_delta_mb = abs_delta(upd->size_mb, it->second.size_mb);
  } else {
    return make_error(ErrorCode::parse_error, "CALC is not a mutation");
  }

  if (!billable(out)) {
    return make_error(ErrorCode::invalid_size, "file " + record.file_id() + ": month fees of " +
                                                   id_ + " would exceed the billable range");
  }
  if (effect) *effect = out;
  return std::nullopt;
}

BillingError StorageUnit::overflow_error(const std::string& file_id, SizeMb size_mb) const {
  return make_error(ErrorCode::invalid_size,
                    "file " + file_id + ": size " + std::to_string(size_mb) +
                        " exceeds the billable range of " + id_);
}

// The month's volumes after `effect`, and the fees on them, all fit in int64.
bool StorageUnit::billable(const OperationEffect& effect) const {
  SizeMb max_usage = effect.new_total_mb;
  SizeMb update_volume = effect.update_delta_mb;
  if (const auto it = months_.find(effect.month); it != months_.end()) {
    max_usage = std::max(max_usage, it->second.max_usage_mb);
    if (!add_fits(it->second.update_volume_mb, update_volume)) return false;
    update_volume += it->second.update_volume_mb;
  }
  if (!mul_fits(max_usage, plan_->storage_price_per_mb) ||
      !mul_fits(update_volume, plan_->update_price_per_mb)) {
    return false;
  }
  return add_fits(max_usage * plan_->storage_price_per_mb,
                  update_volume * plan_->update_price_per_mb);
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

MonthStat& StorageUnit::touch(Timestamp at) {
  auto& stat = months_[month_of(at)];
  stat.max_usage_mb = std::max(stat.max_usage_mb, current_total_mb_);
  stat.settled.reset();
  last_at_ = at;
  return stat;
}

std::optional<BillingError> StorageUnit::upload(const std::string& file_id, SizeMb size_mb,
                                                Timestamp at) {
  if (auto err = preview(OperationRecord{at, id_, UploadOp{file_id, size_mb}}, nullptr)) {
    return err;
  }
  files_.emplace(file_id, StoredFile{file_id, size_mb, at, at});
  current_total_mb_ += size_mb;
  touch(at);
  return std::nullopt;
}

std::optional<BillingError> StorageUnit::remove(const std::string& file_id, Timestamp at) {
  if (auto err = preview(OperationRecord{at, id_, DeleteOp{file_id}}, nullptr)) {
    return err;
  }
  const auto it = files_.find(file_id);
  current_total_mb_ -= it->second.size_mb;
  files_.erase(it);
  // The running max only sees the lower total; an earlier peak is retained.
  touch(at);
  return std::nullopt;
}

std::optional<BillingError> StorageUnit::update(const std::string& file_id, SizeMb new_size_mb,
                                                Timestamp at) {
  OperationEffect effect;
  if (auto err = preview(OperationRecord{at, id_, UpdateOp{file_id, new_size_mb}}, &effect)) {
    return err;
  }
  auto& file = files_.at(file_id);
  current_total_mb_ = effect.new_total_mb;
  file.size_mb = new_size_mb;
  file.last_modified_at = at;
  touch(at).update_volume_mb += effect.update_delta_mb;
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Fees
// ---------------------------------------------------------------------------

FeeReport StorageUnit::compute_report(const MonthKey& month, SizeMb max_usage_mb,
                                      SizeMb update_volume_mb) const {
  FeeReport r;
  r.unit_id = id_;
  r.month = month;
  r.max_usage_mb = max_usage_mb;
  r.update_volume_mb = update_volume_mb;
  r.current_usage_mb = current_total_mb_;

  // The free cap is applied to each fee type independently.
  const auto& cap = plan_->free_monthly_fee_cap_mb;
  r.storage_fee_waived = cap.has_value() && max_usage_mb <= *cap;
  r.update_fee_waived = cap.has_value() && update_volume_mb <= *cap;
  r.storage_fee = r.storage_fee_waived ? 0 : max_usage_mb * plan_->storage_price_per_mb;
  r.update_fee = r.update_fee_waived ? 0 : update_volume_mb * plan_->update_price_per_mb;

  r.usage_fee = r.storage_fee + r.update_fee;
  if (plan_->monthly_fee_ceiling && r.usage_fee > *plan_->monthly_fee_ceiling) {
    r.usage_fee = *plan_->monthly_fee_ceiling;
    r.ceiling_applied = true;
  }
  return r;
}

std::optional<FeeReport> StorageUnit::calculate(const MonthKey& month, BillingError* error) const {
  const auto it = months_.find(month);
  if (it == months_.end()) {
    if (error) {
      *error = make_error(ErrorCode::no_data_for_month,
                          "unit " + id_ + " has no activity in " + month.to_string());
    }
    return std::nullopt;
  }
  return compute_report(month, it->second.max_usage_mb, it->second.update_volume_mb);
}

std::optional<FeeReport> StorageUnit::settle(const MonthKey& month, BillingError* error) {
  auto report = calculate(month, error);
  if (report) months_.at(month).settled = *report;
  return report;
}

FeeReport StorageUnit::project(const OperationEffect& effect) const {
  SizeMb max_usage = effect.new_total_mb;
  SizeMb update_volume = effect.update_delta_mb;
  if (const auto it = months_.find(effect.month); it != months_.end()) {
    max_usage = std::max(max_usage, it->second.max_usage_mb);
    update_volume += it->second.update_volume_mb;
  }
  auto r = compute_report(effect.month, max_usage, update_volume);
  r.current_usage_mb = effect.new_total_mb;
  return r;
}

const StoredFile* StorageUnit::find_file(const std::string& file_id) const {
  const auto it = files_.find(file_id);
  return it == files_.end() ? nullptr : &it->second;
}

const MonthStat* StorageUnit::month_stat(const MonthKey& month) const {
  const auto it = months_.find(month);
  return it == months_.end() ? nullptr : &it->second;
}

}  // namespace storefee
