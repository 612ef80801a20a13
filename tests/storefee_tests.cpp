#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>
#include <vector>

#include "storefee/billing_engine.hpp"
#include "storefee/command_parser.hpp"
#include "storefee/hash.hpp"
#include "storefee/jsonlite.hpp"
#include "storefee/ledger.hpp"
#include "storefee/observability.hpp"
#include "storefee/plan.hpp"
#include "storefee/report_format.hpp"
#include "storefee/storage_unit.hpp"
#include "storefee/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ---- fixtures ---------------------------------------------------------------

storefee::Timestamp ts(int y, unsigned mo, unsigned d, int h = 0, int mi = 0) {
  return *storefee::make_timestamp(y, mo, d, h, mi, 0);
}

storefee::OperationRecord upload(storefee::Timestamp at, const std::string& unit,
                                 const std::string& file, storefee::SizeMb size) {
  return storefee::OperationRecord{at, unit, storefee::UploadOp{file, size}};
}

storefee::OperationRecord erase(storefee::Timestamp at, const std::string& unit,
                                const std::string& file) {
  return storefee::OperationRecord{at, unit, storefee::DeleteOp{file}};
}

storefee::OperationRecord update(storefee::Timestamp at, const std::string& unit,
                                 const std::string& file, storefee::SizeMb size) {
  return storefee::OperationRecord{at, unit, storefee::UpdateOp{file, size}};
}

storefee::OperationRecord calc(storefee::Timestamp at, const std::string& unit) {
  return storefee::OperationRecord{at, unit, storefee::CalcOp{}};
}

storefee::PlanRef flat_plan(storefee::Money storage, storefee::Money update,
                            std::optional<storefee::Money> ceiling = std::nullopt) {
  auto p = std::make_shared<storefee::Plan>();
  p->name = "flat";
  p->storage_price_per_mb = storage;
  p->update_price_per_mb = update;
  p->monthly_fee_ceiling = ceiling;
  return p;
}

// storage_A1 at 0.01/MB storage, 0.0005/MB update, no free cap.
void register_scenario_unit(storefee::BillingEngine& engine) {
  expect(!engine.register_unit("storage_A1", flat_plan(10'000, 500)), "register storage_A1");
}

void register_builtin(storefee::BillingEngine& engine) {
  expect(!engine.provision_catalog(storefee::builtin_catalog()), "provision built-in catalog");
}

std::string read_file(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

fs::path temp_path(const std::string& name) {
  return fs::temp_directory_path() / ("storefee_test_" + name);
}

// ============================================================================
// Scenarios
// ============================================================================

void test_scenario_a_upload_then_calc() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "file123", 5000)).ok, "upload");

  const auto r = engine.apply(calc(ts(2060, 4, 30), "storage_A1"));
  expect(r.ok && r.report.has_value(), "CALC must produce a report");
  expect(r.report->month == (storefee::MonthKey{2060, 4}), "CALC month");
  expect(r.report->storage_fee == 50'000'000, "storage fee 50.0");
  expect(r.report->update_fee == 0, "no update fee");
  expect(r.report->usage_fee == 50'000'000, "usage fee 50.0");
  expect(storefee::format_amount(r.report->storage_fee) == "50.0", "storage fee renders 50.0");
}

void test_scenario_b_update_adds_delta() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "file123", 5000)).ok, "upload");
  expect(engine.apply(update(ts(2060, 4, 5), "storage_A1", "file123", 7000)).ok, "update");

  const auto r = engine.apply(calc(ts(2060, 4, 6), "storage_A1"));
  expect(r.ok, "calc");
  expect(r.report->max_usage_mb == 7000, "max 7000");
  expect(r.report->update_volume_mb == 2000, "update volume 2000");
  expect(r.report->update_fee == 2000 * 500, "update fee = delta * rate");
}

void test_scenario_c_delete_retains_peak() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "file123", 5000)).ok, "upload");
  expect(engine.apply(update(ts(2060, 4, 5), "storage_A1", "file123", 7000)).ok, "update");
  const auto del = engine.apply(erase(ts(2060, 4, 10), "storage_A1", "file123"));
  expect(del.ok && del.current_usage_mb == 0, "delete empties the unit");

  const auto r = engine.apply(calc(ts(2060, 4, 10), "storage_A1"));
  expect(r.report->max_usage_mb == 7000, "peak retained after delete");
  expect(r.report->current_usage_mb == 0, "current inventory 0");
  expect(engine.find_unit("storage_A1")->inventory().empty(), "inventory empty");
}

void test_scenario_d_unknown_unit() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  const auto r = engine.apply(upload(ts(2060, 4, 1), "storage_Z9", "file999", 1000));
  expect(!r.ok, "upload to unknown unit must fail");
  expect(r.error == storefee::ErrorCode::unit_not_found, "unit_not_found");
}

void test_scenario_e_duplicate_file() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "fileA", 10)).ok, "first upload");
  const auto r = engine.apply(upload(ts(2060, 4, 2), "storage_A1", "fileA", 20));
  expect(!r.ok && r.error == storefee::ErrorCode::duplicate_file, "duplicate_file");
  expect(engine.find_unit("storage_A1")->current_usage_mb() == 10, "state unchanged");
}

// ============================================================================
// StorageUnit rules
// ============================================================================

void test_register_duplicate_unit() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  const auto err = engine.register_unit("storage_A1", flat_plan(1, 1));
  expect(err && err->code == storefee::ErrorCode::duplicate_unit, "duplicate_unit");
  const auto null_plan = engine.register_unit("storage_X", nullptr);
  expect(null_plan && null_plan->code == storefee::ErrorCode::config_invalid, "null plan rejected");
}

void test_out_of_order_rejected() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  expect(engine.apply(upload(ts(2060, 4, 5), "storage_A1", "a", 100)).ok, "upload a");
  const auto r = engine.apply(upload(ts(2060, 4, 1), "storage_A1", "b", 100));
  expect(!r.ok && r.error == storefee::ErrorCode::out_of_order_operation, "out_of_order_operation");
  expect(engine.find_unit("storage_A1")->current_usage_mb() == 100, "rejected op not applied");
  // Equal timestamps are in order.
  expect(engine.apply(upload(ts(2060, 4, 5), "storage_A1", "c", 1)).ok, "same-second op accepted");
}

void test_invalid_size_rejected() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  const auto up = engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", -1));
  expect(!up.ok && up.error == storefee::ErrorCode::invalid_size, "negative upload rejected");
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 0)).ok, "zero size accepted");
  const auto upd = engine.apply(update(ts(2060, 4, 2), "storage_A1", "a", -5));
  expect(!upd.ok && upd.error == storefee::ErrorCode::invalid_size, "negative update rejected");
}

void test_oversized_upload_rejected() {
  storefee::BillingEngine engine;
  register_builtin(engine);
  const auto huge = engine.apply(upload(ts(2060, 4, 1), "storage_A1", "big", 1'000'000'000'000'000));
  expect(!huge.ok && huge.error == storefee::ErrorCode::invalid_size, "fee would overflow");
  expect(engine.find_unit("storage_A1")->current_usage_mb() == 0, "rejected upload not applied");
  expect(engine.find_unit("storage_A1")->months().empty(), "rejected upload records no month");

  // 9e14 MB at 0.01/MB is 9e18 micros, still representable.
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 900'000'000'000'000)).ok,
         "largest billable upload accepted");
  const auto total = engine.apply(upload(ts(2060, 4, 2), "storage_A1", "b",
                                         std::numeric_limits<storefee::SizeMb>::max()));
  expect(!total.ok && total.error == storefee::ErrorCode::invalid_size, "total would overflow");
  const auto grow = engine.apply(update(ts(2060, 4, 3), "storage_A1", "a", 1'000'000'000'000'000));
  expect(!grow.ok && grow.error == storefee::ErrorCode::invalid_size, "update would overflow");
  expect(engine.find_unit("storage_A1")->current_usage_mb() == 900'000'000'000'000, "usage kept");
  const auto r = engine.apply(calc(ts(2060, 4, 30), "storage_A1"));
  expect(r.ok && r.report->storage_fee == 9'000'000'000'000'000'000, "fee computed exactly");
}

void test_missing_file_rejected() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  const auto del = engine.apply(erase(ts(2060, 4, 1), "storage_A1", "ghost"));
  expect(!del.ok && del.error == storefee::ErrorCode::file_not_found, "delete missing file");
  const auto upd = engine.apply(update(ts(2060, 4, 1), "storage_A1", "ghost", 3));
  expect(!upd.ok && upd.error == storefee::ErrorCode::file_not_found, "update missing file");
  expect(engine.find_unit("storage_A1")->months().empty(), "failed ops record no month");
}

void test_no_data_for_month() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  const auto fresh = engine.apply(calc(ts(2060, 4, 1), "storage_A1"));
  expect(!fresh.ok && fresh.error == storefee::ErrorCode::no_data_for_month, "fresh unit");

  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 1)).ok, "upload");
  const auto other = engine.apply(calc(ts(2060, 5, 1), "storage_A1"));
  expect(!other.ok && other.error == storefee::ErrorCode::no_data_for_month, "untouched month");
}

void test_calc_all_units_skips_idle() {
  storefee::BillingEngine engine;
  register_builtin(engine);
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "file123", 5000)).ok, "upload");

  const auto parsed = storefee::parse_line("2060-04-30T23:59 CALC", engine.unit_ids());
  expect(parsed.all_units && parsed.records.size() == 4, "one CALC per unit");
  std::vector<storefee::OperationResult> results;
  for (const auto& record : parsed.records) {
    if (parsed.all_units && !engine.has_calc_data(record)) continue;
    results.push_back(engine.apply(record));
  }
  expect(results.size() == 1 && results[0].ok, "only the active unit is billed");
  expect(results[0].unit_id == "storage_A1", "storage_A1 reported");
  expect(!engine.has_calc_data(calc(ts(2060, 5, 1), "storage_A1")), "untouched month");
  expect(!engine.has_calc_data(calc(ts(2060, 4, 1), "storage_X9")), "unknown unit");
}

void test_calc_idempotent() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 1234)).ok, "upload");
  const auto r1 = engine.apply(calc(ts(2060, 4, 2), "storage_A1"));
  const auto r2 = engine.apply(calc(ts(2060, 4, 3), "storage_A1"));
  expect(r1.ok && r2.ok && *r1.report == *r2.report, "two CALCs agree");
  expect(storefee::report_digest(*r1.report) == storefee::report_digest(*r2.report),
         "report digests agree");
}

void test_calc_does_not_advance_time() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 1)).ok, "upload");
  expect(engine.apply(calc(ts(2060, 4, 30), "storage_A1")).ok, "calc at month end");
  expect(engine.apply(upload(ts(2060, 4, 2), "storage_A1", "b", 1)).ok,
         "mutation after a later CALC is still in order");
}

void test_reupload_after_delete() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 10)).ok, "upload");
  expect(engine.apply(erase(ts(2060, 4, 2), "storage_A1", "a")).ok, "delete");
  expect(engine.apply(upload(ts(2060, 4, 3), "storage_A1", "a", 30)).ok, "re-upload");
  const auto* f = engine.find_unit("storage_A1")->find_file("a");
  expect(f && f->size_mb == 30 && f->created_at == ts(2060, 4, 3), "fresh file record");
}

void test_month_boundaries() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  expect(engine.apply(upload(ts(2060, 4, 30, 23, 59), "storage_A1", "a", 500)).ok, "april");
  expect(engine.apply(upload(ts(2060, 5, 1), "storage_A1", "b", 100)).ok, "may");
  const auto* unit = engine.find_unit("storage_A1");
  expect(unit->month_stat({2060, 4})->max_usage_mb == 500, "april peak");
  // No carry-in: May's max is the max of totals observed in May.
  expect(unit->month_stat({2060, 5})->max_usage_mb == 600, "may peak");
}

// ============================================================================
// Plan policy
// ============================================================================

void test_free_cap_storage() {
  storefee::BillingEngine engine;
  register_builtin(engine);
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 1000)).ok, "upload at cap");
  auto r = engine.apply(calc(ts(2060, 4, 1), "storage_A1"));
  expect(r.report->storage_fee == 0 && r.report->storage_fee_waived, "at cap is free");

  expect(engine.apply(upload(ts(2060, 4, 2), "storage_A1", "b", 1)).ok, "one MB over");
  r = engine.apply(calc(ts(2060, 4, 2), "storage_A1"));
  expect(!r.report->storage_fee_waived, "over cap is billed");
  expect(storefee::format_amount(r.report->storage_fee) == "10.01", "1001 MB * 0.01");
}

void test_free_cap_independent_per_fee() {
  storefee::BillingEngine engine;
  register_builtin(engine);
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 2000)).ok, "upload");
  expect(engine.apply(update(ts(2060, 4, 2), "storage_A1", "a", 2500)).ok, "update +500");
  auto r = engine.apply(calc(ts(2060, 4, 2), "storage_A1"));
  expect(r.report->storage_fee == 25'000'000, "storage billed on 2500 MB");
  expect(r.report->update_fee == 0 && r.report->update_fee_waived, "update under cap is free");

  expect(engine.apply(update(ts(2060, 4, 3), "storage_A1", "a", 1000)).ok, "update -1500");
  r = engine.apply(calc(ts(2060, 4, 3), "storage_A1"));
  expect(r.report->update_volume_mb == 2000, "absolute deltas accumulate");
  expect(storefee::format_amount(r.report->update_fee) == "1.0", "2000 MB * 0.0005");
}

void test_monthly_fee_ceiling() {
  storefee::BillingEngine engine;
  expect(!engine.register_unit("capped", flat_plan(10'000, 0, 5'000'000)), "register");
  expect(engine.apply(upload(ts(2060, 4, 1), "capped", "a", 1000)).ok, "upload");
  const auto r = engine.apply(calc(ts(2060, 4, 1), "capped"));
  expect(r.report->storage_fee == 10'000'000, "raw storage fee kept");
  expect(r.report->usage_fee == 5'000'000 && r.report->ceiling_applied, "usage fee clamped");
}

void test_free_plan_restricted() {
  storefee::EngineOptions opts;
  opts.free_plan = true;
  storefee::BillingEngine engine(opts);
  register_builtin(engine);
  const auto r = engine.apply(upload(ts(2060, 4, 1), "storage_B1", "a", 1));
  expect(!r.ok && r.error == storefee::ErrorCode::plan_restricted, "plan_restricted");
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A2", "a", 1)).ok, "A2 allowed");
}

void test_free_plan_fee_limit() {
  storefee::EngineOptions opts;
  opts.free_plan = true;
  opts.free_plan_fee_limit = storefee::parse_amount("10");
  storefee::BillingEngine engine(opts);
  register_builtin(engine);

  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 1000)).ok, "A1 within cap");
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A2", "b", 5000)).ok, "A2 costs 5.0");
  const auto r = engine.apply(upload(ts(2060, 4, 2), "storage_A1", "c", 600));
  expect(!r.ok && r.error == storefee::ErrorCode::fee_limit_exceeded, "16.0 + 5.0 > 10.0");
  expect(engine.find_unit("storage_A1")->current_usage_mb() == 1000, "rejected upload not applied");
  expect(engine.apply(erase(ts(2060, 4, 3), "storage_A2", "b")).ok, "delete always allowed");
  // Validation errors win over the limit.
  const auto dup = engine.apply(upload(ts(2060, 4, 4), "storage_A1", "a", 99999));
  expect(dup.error == storefee::ErrorCode::duplicate_file, "duplicate reported before limit");
}

void test_calc_previous_month() {
  storefee::EngineOptions opts;
  opts.calc_target = storefee::CalcTarget::previous_month;
  storefee::BillingEngine engine(opts);
  register_scenario_unit(engine);
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 5000)).ok, "upload");
  const auto may = engine.apply(calc(ts(2060, 5, 1), "storage_A1"));
  expect(may.ok && may.report->month == (storefee::MonthKey{2060, 4}), "reports April");
  const auto april = engine.apply(calc(ts(2060, 4, 20), "storage_A1"));
  expect(april.error == storefee::ErrorCode::no_data_for_month, "March has no data");
  expect(storefee::MonthKey{2060, 1}.previous() == (storefee::MonthKey{2059, 12}), "year wrap");
}

void test_finalize_settles_every_month() {
  storefee::BillingEngine engine;
  register_builtin(engine);
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_B1", "a", 100)).ok, "B1 april");
  expect(engine.apply(upload(ts(2060, 5, 1), "storage_B1", "b", 100)).ok, "B1 may");
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A2", "c", 100)).ok, "A2 april");

  const auto statements = engine.finalize();
  expect(statements.size() == 3, "three touched months");
  expect(statements[0].unit_id == "storage_A2", "ordered by unit id");
  expect(statements[1].month == (storefee::MonthKey{2060, 4}) &&
             statements[2].month == (storefee::MonthKey{2060, 5}),
         "ordered by month");
  const auto* b1 = engine.find_unit("storage_B1");
  expect(b1->month_stat({2060, 5})->settled.has_value(), "settlement cached");

  expect(engine.apply(upload(ts(2060, 5, 2), "storage_B1", "c", 1)).ok, "late mutation");
  expect(!b1->month_stat({2060, 5})->settled.has_value(), "mutation clears settlement");
}

// ============================================================================
// Parser and formatter
// ============================================================================

void test_parse_upload_line() {
  const auto p = storefee::parse_line("2060-04-01T00:00 UPLOAD storage_A1 file123 5000", {});
  expect(!p.error && p.records.size() == 1, "one record");
  const auto& r = p.records[0];
  expect(r.timestamp == ts(2060, 4, 1) && r.unit_id == "storage_A1", "timestamp + unit");
  const auto* op = std::get_if<storefee::UploadOp>(&r.op);
  expect(op && op->file_id == "file123" && op->size_mb == 5000, "upload fields");
}

void test_parse_variants() {
  const auto del = storefee::parse_line("2060-04-01T10:20:30 delete storage_A1 f", {});
  expect(!del.error && del.records[0].kind() == storefee::OperationKind::remove, "lower-case kind");
  expect(del.records[0].timestamp == *storefee::make_timestamp(2060, 4, 1, 10, 20, 30), "seconds");

  const auto neg = storefee::parse_line("2060-04-01T00:00 UPDATE u f -5", {});
  expect(!neg.error && std::get<storefee::UpdateOp>(neg.records[0].op).size_mb == -5,
         "negative size reaches the engine");

  const auto all = storefee::parse_line("2060-04-30T00:00 CALC", {"storage_A1", "storage_B1"});
  expect(!all.error && all.records.size() == 2 && all.records[1].unit_id == "storage_B1",
         "unit-less CALC expands");
  expect(all.all_units, "expansion is flagged");
  expect(!storefee::parse_line("2060-04-30T00:00 CALC storage_A1", {}).all_units,
         "named CALC is not an expansion");

  expect(storefee::parse_line("   ", {}).records.empty(), "blank line");
  const auto comment = storefee::parse_line("# setup", {});
  expect(comment.records.empty() && !comment.error, "comment line");
}

void test_parse_errors() {
  const auto fields = storefee::parse_line("2060-04-01T00:00 UPLOAD storage_A1 f", {});
  expect(fields.error && fields.error->code == storefee::ErrorCode::parse_error, "field count");
  expect(fields.label == "UPLOAD", "label keeps the kind");

  const auto kind = storefee::parse_line("2060-04-01T00:00 MOVE u f", {});
  expect(kind.error && kind.label == "PARSE", "unknown kind");

  expect(storefee::parse_line("2060-02-30T00:00 CALC u", {}).error.has_value(), "impossible date");
  expect(storefee::parse_line("2060-04-01 CALC u", {}).error.has_value(), "date without time");
  expect(storefee::parse_line("2060-04-01T00:00 UPLOAD u f 12x", {}).error.has_value(), "bad size");
}

void test_format_lines() {
  storefee::BillingEngine engine;
  register_scenario_unit(engine);
  const auto up = engine.apply(upload(ts(2060, 4, 1), "storage_A1", "file123", 5000));
  expect(storefee::format_result(up) == "UPLOAD: ok storage_A1 5000", "ack line");

  const auto c = engine.apply(calc(ts(2060, 4, 1), "storage_A1"));
  expect(storefee::format_result(c) ==
             "CALC: storage_A1 2060-04 max=5000 updated=0 current=5000 storage=50.0 "
             "update=0.0 usage=50.0",
         "calc line");

  const auto dup = engine.apply(upload(ts(2060, 4, 2), "storage_A1", "file123", 1));
  expect(storefee::format_result(dup).rfind("UPLOAD: error duplicate_file ", 0) == 0, "error line");

  const auto bad = storefee::parse_line("2060-04-01T00:00 MOVE x", {});
  expect(storefee::format_parse_error(bad).rfind("PARSE: error parse_error ", 0) == 0,
         "parse error line");
}

void test_amounts_and_timestamps() {
  expect(storefee::format_amount(0) == "0.0", "zero");
  expect(storefee::format_amount(500) == "0.0005", "sub-unit");
  expect(storefee::format_amount(-1'500'000) == "-1.5", "negative");
  expect(storefee::parse_amount("0.0005") == storefee::Money{500}, "parse fraction");
  expect(storefee::parse_amount("12") == storefee::Money{12'000'000}, "parse whole");
  expect(!storefee::parse_amount("1.2345678"), "too many digits");
  expect(!storefee::parse_amount("abc") && !storefee::parse_amount(""), "malformed");
  expect(!storefee::make_timestamp(2060, 2, 30), "impossible date");
  expect(storefee::format_timestamp(ts(2060, 4, 1, 9, 5)) == "2060-04-01T09:05:00", "format");
}

// ============================================================================
// Config
// ============================================================================

void test_jsonlite_strict() {
  std::optional<storefee::jsonlite::JsonError> err;
  storefee::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");
  err.reset();
  const auto obj = storefee::jsonlite::parse("{\"n\":null,\"x\":1.5,\"s\":\"a\\\"b\"}", &err);
  expect(!err, "valid object");
  expect(storefee::jsonlite::is_null(obj, "n"), "null");
  expect(storefee::jsonlite::get_double(obj, "x") == 1.5, "double");
  expect(storefee::jsonlite::get_string(obj, "s") == "a\"b", "escaped string");
  expect(storefee::jsonlite::escape("a\"b") == "a\\\"b", "escape");
  expect(storefee::jsonlite::validate_strict("{\"a\":1} x").has_value(), "trailing data rejected");
  expect(!storefee::jsonlite::validate_strict("{\"a\":[1,2]}").has_value(), "valid text accepted");
}

void test_catalog_parse() {
  storefee::BillingError err;
  const auto cat = storefee::parse_catalog(
      "{\"format_version\":1,\"units\":[{\"id\":\"u1\",\"plan\":\"P\","
      "\"storage_price_per_mb\":0.01,\"update_price_per_mb\":0.0005,"
      "\"free_monthly_fee_cap_mb\":1000,\"monthly_fee_ceiling\":5.5,"
      "\"free_plan_allowed\":false}]}",
      &err);
  expect(cat.has_value() && cat->units.size() == 1, "catalog parsed");
  const auto& plan = *cat->units[0].plan;
  expect(plan.storage_price_per_mb == 10'000 && plan.update_price_per_mb == 500, "rates");
  expect(plan.free_monthly_fee_cap_mb == storefee::SizeMb{1000}, "cap");
  expect(plan.monthly_fee_ceiling == storefee::Money{5'500'000}, "ceiling");
  expect(!plan.free_plan_allowed && plan.name == "P", "flags");
}

void test_catalog_errors() {
  auto rejects = [](const std::string& json) {
    storefee::BillingError err;
    const auto cat = storefee::parse_catalog(json, &err);
    return !cat && err.code == storefee::ErrorCode::config_invalid;
  };
  expect(rejects("{\"units\":[]}"), "empty units");
  expect(rejects("{\"units\":[{\"id\":\"u\",\"storage_price_per_mb\":-1,"
                 "\"update_price_per_mb\":0}]}"),
         "negative price");
  expect(rejects("{\"units\":[{\"id\":\"u\",\"storage_price_per_mb\":1,\"update_price_per_mb\":1},"
                 "{\"id\":\"u\",\"storage_price_per_mb\":1,\"update_price_per_mb\":1}]}"),
         "duplicate unit id");
  expect(rejects("{\"format_version\":2,\"units\":[{\"id\":\"u\",\"storage_price_per_mb\":1,"
                 "\"update_price_per_mb\":1}]}"),
         "newer format version");
  expect(rejects("{\"units\":[{\"id\":\"u\",\"id\":\"v\"}]}"), "duplicate key");
  expect(rejects("{\"units\":[{\"id\":\"u\",\"storage_price_per_mb\":1e300,"
                 "\"update_price_per_mb\":0}]}"),
         "price beyond int64 micros");
  expect(rejects("{\"units\":[{\"id\":\"u\",\"storage_price_per_mb\":1,"
                 "\"update_price_per_mb\":1,\"free_monthly_fee_cap_mb\":1e300}]}"),
         "free cap beyond int64");
  expect(rejects("{\"units\":[{\"id\":\"u\",\"storage_price_per_mb\":1,"
                 "\"update_price_per_mb\":1,\"monthly_fee_ceiling\":1e300}]}"),
         "ceiling beyond int64 micros");
  expect(!storefee::money_from_double(1e300) && !storefee::money_from_double(-0.5),
         "unrepresentable amounts");
  expect(storefee::money_from_double(0.0005) == storefee::Money{500}, "amount to micros");
  storefee::BillingError err;
  expect(!storefee::load_catalog_file("/nonexistent/plans.json", &err), "missing file");
}

void test_builtin_catalog() {
  const auto cat = storefee::builtin_catalog();
  expect(cat.units.size() == 4, "four units");
  expect(cat.units[0].unit_id == "storage_A1" && cat.units[0].plan->free_plan_allowed, "A1");
  expect(cat.units[3].unit_id == "storage_B2" && !cat.units[3].plan->free_monthly_fee_cap_mb,
         "B2 has no free cap");
  expect(cat.units[0].plan->free_monthly_fee_cap_mb == storefee::kDefaultFreeCapMb &&
             cat.units[1].plan->free_monthly_fee_cap_mb == storefee::kDefaultFreeCapMb,
         "A units carry the default free cap");
  expect(storefee::version::check_catalog_version(1).empty(), "v1 readable");
  expect(!storefee::version::check_catalog_version(2).empty(), "v2 rejected");
}

// ============================================================================
// Ledger and observability
// ============================================================================

std::vector<storefee::OperationEvent> g_events;

void capture_event(const storefee::OperationEvent& ev) {
  g_events.push_back(ev);
}

void test_ledger_chain() {
  const auto path = temp_path("ledger.ndjson");
  fs::remove(path);
  {
    storefee::EngineOptions opts;
    opts.ledger_path = path.string();
    storefee::BillingEngine engine(opts);
    register_scenario_unit(engine);
    expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 5000)).ok, "upload");
    expect(!engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 1)).ok, "failed op");
    expect(engine.apply(calc(ts(2060, 4, 2), "storage_A1")).ok, "calc");
    expect(engine.ledger().entry_count() == 2, "failed ops are not ledgered");
    expect(engine.ledger().failure_count() == 0, "no write failures");
    expect(engine.ledger().head_digest() != std::string(64, '0'), "chain head advanced");
  }
  const auto text = read_file(path);
  expect(storefee::verify_ledger_chain(text).empty(), "chain verifies");
  expect(text.find("\"report_digest\":\"") != std::string::npos, "report entry carries digest");

  std::string tampered = text;
  const auto pos = tampered.find("5000");
  expect(pos != std::string::npos, "size present");
  tampered.replace(pos, 4, "5001");
  expect(!storefee::verify_ledger_chain(tampered).empty(), "tampering detected");

  // The report entry is the chain head: only its digest can catch an edit.
  std::string edited = text;
  const std::string fee_field = "\"usage_fee\":\"50.0\"";
  const auto fee = edited.rfind(fee_field);
  expect(fee != std::string::npos, "usage fee present in report entry");
  edited.replace(fee, fee_field.size(), "\"usage_fee\":\"0.0\"");
  expect(storefee::verify_ledger_chain(edited).find("report digest mismatch") == 0,
         "edited report detected");
  fs::remove(path);
}

void test_ledger_deterministic() {
  const auto p1 = temp_path("ledger1.ndjson");
  const auto p2 = temp_path("ledger2.ndjson");
  for (const auto& p : {p1, p2}) {
    storefee::EngineOptions opts;
    opts.ledger_path = p.string();
    storefee::BillingEngine engine(opts);
    register_builtin(engine);
    expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 2000)).ok, "upload");
    expect(engine.apply(update(ts(2060, 4, 5), "storage_A1", "a", 500)).ok, "update");
    engine.finalize();
  }
  expect(read_file(p1) == read_file(p2), "same input, same ledger bytes");
  fs::remove(p1);
  fs::remove(p2);
}

void test_event_hook_and_stats() {
  g_events.clear();
  storefee::BillingEngine engine;
  engine.events().set_hook(capture_event);
  register_scenario_unit(engine);
  expect(engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 1)).ok, "upload");
  expect(!engine.apply(erase(ts(2060, 4, 1), "storage_A1", "b")).ok, "delete missing");
  expect(engine.apply(calc(ts(2060, 4, 1), "storage_A1")).ok, "calc");

  expect(g_events.size() == 3, "one event per apply");
  expect(g_events[0].sequence == 1 && g_events[2].sequence == 3, "sequence numbers");
  expect(!g_events[1].ok && g_events[1].error_code == "file_not_found", "failure event");
  expect(g_events[0].to_json().find("\"kind\":\"UPLOAD\"") != std::string::npos, "event json");

  const auto& stats = engine.stats();
  expect(stats.total_operations() == 3, "total");
  expect(stats.applied_operations() == 2 && stats.failed_operations() == 1, "applied/failed");
  expect(stats.count_for_kind("DELETE") == 1, "per-kind");
  expect(stats.count_for_error("file_not_found") == 1, "per-error");
  expect(stats.latency().count() == 3, "latency samples");
  expect(stats.to_json().find("\"failed_operations\":1") != std::string::npos, "stats json");
}

void test_event_log_file() {
  const auto path = temp_path("events.jsonl");
  fs::remove(path);
  {
    storefee::EngineOptions opts;
    opts.event_log_path = path.string();
    storefee::BillingEngine engine(opts);
    register_scenario_unit(engine);
    engine.apply(upload(ts(2060, 4, 1), "storage_A1", "a", 1));
    engine.apply(calc(ts(2060, 4, 1), "storage_A1"));
    expect(engine.events().lines_written() == 2, "two lines written");
  }
  const auto text = read_file(path);
  expect(std::count(text.begin(), text.end(), '\n') == 2, "JSONL lines");
  fs::remove(path);
}

void test_sink_open_failure_reported() {
  storefee::BillingLedger ledger("/nonexistent/dir/x");
  expect(ledger.open_failed() && !ledger.enabled(), "ledger open failure recorded");
  storefee::EventLog log("/nonexistent/dir/x");
  expect(log.open_failed() && !log.enabled(), "event log open failure recorded");

  storefee::EngineOptions opts;
  opts.ledger_path = "/nonexistent/dir/ledger.ndjson";
  storefee::BillingEngine engine(opts);
  expect(engine.ledger().open_failed(), "engine exposes the failed ledger");
  expect(!storefee::BillingLedger().open_failed() && !storefee::EventLog().open_failed(),
         "disabled sinks are not failures");
}

// ============================================================================
// Digests
// ============================================================================

void test_blake3_known_vectors() {
  expect(storefee::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(storefee::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "{\"a\":1}";
  expect(storefee::ledger_entry_hash(payload) != storefee::report_json_hash(payload),
         "ledger vs report domain");
  expect(storefee::report_json_hash(payload) != storefee::run_output_hash(payload),
         "report vs run domain");
}

void test_run_digest() {
  storefee::RunDigest a, b, c;
  for (auto* d : {&a, &b}) {
    d->add("UPLOAD: ok storage_A1 5000");
    d->add("CALC: storage_A1 2060-04 max=5000");
  }
  c.add("UPLOAD: ok storage_A1 5001");
  expect(a.digest() == b.digest() && a.digest().size() == 64, "same stream, same digest");
  expect(a.digest() != c.digest(), "different stream, different digest");
  expect(a.line_count() == 2, "line count");
}

}  // namespace

int main() {
  std::cout << "=== storefee tests ===\n";

  std::cout << "\n[Scenarios]\n";
  run_test("A: upload then calc", test_scenario_a_upload_then_calc);
  run_test("B: update adds delta", test_scenario_b_update_adds_delta);
  run_test("C: delete retains peak", test_scenario_c_delete_retains_peak);
  run_test("D: unknown unit", test_scenario_d_unknown_unit);
  run_test("E: duplicate file", test_scenario_e_duplicate_file);

  std::cout << "\n[Storage unit rules]\n";
  run_test("duplicate unit registration", test_register_duplicate_unit);
  run_test("out-of-order operation rejected", test_out_of_order_rejected);
  run_test("invalid size rejected", test_invalid_size_rejected);
  run_test("oversized upload rejected", test_oversized_upload_rejected);
  run_test("missing file rejected", test_missing_file_rejected);
  run_test("no data for month", test_no_data_for_month);
  run_test("unit-less CALC skips idle units", test_calc_all_units_skips_idle);
  run_test("CALC idempotent", test_calc_idempotent);
  run_test("CALC does not advance unit time", test_calc_does_not_advance_time);
  run_test("re-upload after delete", test_reupload_after_delete);
  run_test("month boundaries", test_month_boundaries);

  std::cout << "\n[Plan policy]\n";
  run_test("free cap on storage fee", test_free_cap_storage);
  run_test("free cap per fee type", test_free_cap_independent_per_fee);
  run_test("monthly fee ceiling", test_monthly_fee_ceiling);
  run_test("free plan restricted units", test_free_plan_restricted);
  run_test("free plan fee limit", test_free_plan_fee_limit);
  run_test("CALC previous month", test_calc_previous_month);
  run_test("finalize settles every month", test_finalize_settles_every_month);

  std::cout << "\n[Parser + formatter]\n";
  run_test("parse upload line", test_parse_upload_line);
  run_test("parse variants", test_parse_variants);
  run_test("parse errors", test_parse_errors);
  run_test("format output lines", test_format_lines);
  run_test("amounts and timestamps", test_amounts_and_timestamps);

  std::cout << "\n[Config]\n";
  run_test("jsonlite strict parsing", test_jsonlite_strict);
  run_test("catalog parse", test_catalog_parse);
  run_test("catalog errors", test_catalog_errors);
  run_test("built-in catalog", test_builtin_catalog);

  std::cout << "\n[Ledger + observability]\n";
  run_test("ledger chain + tamper detection", test_ledger_chain);
  run_test("ledger deterministic across replays", test_ledger_deterministic);
  run_test("event hook + engine stats", test_event_hook_and_stats);
  run_test("event log file", test_event_log_file);
  run_test("sink open failure reported", test_sink_open_failure_reported);

  std::cout << "\n[Digests]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("run digest", test_run_digest);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
