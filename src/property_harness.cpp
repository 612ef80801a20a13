// property_harness.cpp — Seeded random operation streams against the engine.
//
// Contract, checked after every apply():
//   - current usage == sum of inventory file sizes
//   - a failed operation leaves the unit's usage and month stats unchanged
//   - month max == running max of post-operation totals in that month
//   - month update volume == sum of |new - old| over applied UPDATEs
//   - CALC is idempotent: two calculate() calls and the CALC result agree
//   - free cap: a fee type is zero exactly when its volume is at or under the cap
//   - replaying the same stream twice gives the same run digest
//
// Produces: artifacts/reports/PROPERTY_REPORT.json

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "storefee/billing_engine.hpp"
#include "storefee/report_format.hpp"

namespace fs = std::filesystem;

namespace {

constexpr int kSeeds = 16;
constexpr int kOpsPerSeed = 400;
constexpr int kFilePool = 6;

void write_file(const std::string& path, const std::string& data) {
  fs::create_directories(fs::path(path).parent_path());
  std::ofstream ofs(path, std::ios::trunc | std::ios::binary);
  ofs << data;
}

struct PropertyResult {
  uint64_t seed{0};
  bool pass{true};
  uint64_t applied{0};
  uint64_t failed{0};
  std::string detail;
};

std::vector<storefee::OperationRecord> generate_stream(uint64_t seed,
                                                       const std::vector<std::string>& units) {
  std::mt19937_64 rng(seed);
  std::vector<storefee::OperationRecord> out;
  auto t = *storefee::make_timestamp(2060, 1, 1);
  for (int i = 0; i < kOpsPerSeed; ++i) {
    // Mostly forward, occasionally backwards to exercise ordering checks.
    const auto step = static_cast<int64_t>(rng() % (36 * 3600));
    t += std::chrono::seconds(rng() % 50 == 0 ? -step : step);

    storefee::OperationRecord r;
    r.timestamp = t;
    r.unit_id = units[rng() % units.size()];
    if (rng() % 40 == 0) r.unit_id = "storage_X9";
    const std::string file = "f" + std::to_string(rng() % kFilePool);
    const auto size = static_cast<storefee::SizeMb>(rng() % 1500) - (rng() % 30 == 0 ? 2000 : 0);
    switch (rng() % 8) {
      case 0: case 1: case 2: r.op = storefee::UploadOp{file, size}; break;
      case 3: case 4:         r.op = storefee::UpdateOp{file, size}; break;
      case 5:                 r.op = storefee::DeleteOp{file}; break;
      default:                r.op = storefee::CalcOp{}; break;
    }
    out.push_back(std::move(r));
  }
  return out;
}

// Independent model of what the engine should hold.
struct ShadowUnit {
  std::map<std::string, storefee::SizeMb> files;
  std::map<storefee::MonthKey, storefee::SizeMb> max_usage;
  std::map<storefee::MonthKey, storefee::SizeMb> update_volume;

  storefee::SizeMb total() const {
    storefee::SizeMb sum = 0;
    for (const auto& [id, size] : files) sum += size;
    return sum;
  }

  void apply(const storefee::OperationRecord& r) {
    const auto m = storefee::month_of(r.timestamp);
    if (const auto* up = std::get_if<storefee::UploadOp>(&r.op)) {
      files[up->file_id] = up->size_mb;
    } else if (const auto* del = std::get_if<storefee::DeleteOp>(&r.op)) {
      files.erase(del->file_id);
    } else if (const auto* upd = std::get_if<storefee::UpdateOp>(&r.op)) {
      const auto old = files[upd->file_id];
      update_volume[m] += upd->size_mb > old ? upd->size_mb - old : old - upd->size_mb;
      files[upd->file_id] = upd->size_mb;
    } else {
      return;
    }
    auto& mx = max_usage[m];
    mx = std::max(mx, total());
    update_volume.try_emplace(m, 0);
  }
};

std::string check_unit(const storefee::StorageUnit& unit, const ShadowUnit& shadow) {
  storefee::SizeMb inventory_sum = 0;
  for (const auto& [id, f] : unit.inventory()) inventory_sum += f.size_mb;
  if (inventory_sum != unit.current_usage_mb()) return unit.id() + ": usage != inventory sum";
  if (inventory_sum != shadow.total()) return unit.id() + ": inventory diverged from model";

  for (const auto& [month, stat] : unit.months()) {
    const auto mx = shadow.max_usage.find(month);
    if (mx == shadow.max_usage.end() || mx->second != stat.max_usage_mb) {
      return unit.id() + " " + month.to_string() + ": max_usage mismatch";
    }
    const auto uv = shadow.update_volume.find(month);
    if (uv == shadow.update_volume.end() || uv->second != stat.update_volume_mb) {
      return unit.id() + " " + month.to_string() + ": update_volume mismatch";
    }

    const auto a = unit.calculate(month);
    const auto b = unit.calculate(month);
    if (!a || !b || !(*a == *b)) return unit.id() + ": calculate not idempotent";

    const auto& cap = unit.plan().free_monthly_fee_cap_mb;
    if (cap) {
      const bool storage_zero = a->storage_fee == 0;
      const bool update_zero = a->update_fee == 0;
      if ((a->max_usage_mb <= *cap) != a->storage_fee_waived ||
          (a->storage_fee_waived && !storage_zero)) {
        return unit.id() + ": storage free cap violated";
      }
      if ((a->update_volume_mb <= *cap) != a->update_fee_waived ||
          (a->update_fee_waived && !update_zero)) {
        return unit.id() + ": update free cap violated";
      }
    } else if (a->storage_fee_waived || a->update_fee_waived) {
      return unit.id() + ": waiver without a free cap";
    }
  }
  if (unit.months().size() != shadow.max_usage.size()) return unit.id() + ": month set mismatch";
  return {};
}

PropertyResult run_seed(uint64_t seed, std::string* digest) {
  PropertyResult res;
  res.seed = seed;

  storefee::BillingEngine engine;
  if (auto err = engine.provision_catalog(storefee::builtin_catalog())) {
    res.pass = false;
    res.detail = err->message;
    return res;
  }
  const auto units = engine.unit_ids();
  std::map<std::string, ShadowUnit> shadow;
  storefee::RunDigest run;

  for (const auto& record : generate_stream(seed, units)) {
    const auto* unit = engine.find_unit(record.unit_id);
    const auto before_usage = unit ? unit->current_usage_mb() : 0;
    const auto before_months = unit ? unit->months().size() : 0;

    const auto result = engine.apply(record);
    run.add(storefee::format_result(result));

    if (!result.ok) {
      ++res.failed;
      if (unit && (unit->current_usage_mb() != before_usage ||
                   unit->months().size() != before_months)) {
        res.pass = false;
        res.detail = "failed " + storefee::to_string(result.kind) + " mutated " + unit->id();
        return res;
      }
      continue;
    }
    ++res.applied;
    shadow[record.unit_id].apply(record);

    if (result.report) {
      const auto again = unit->calculate(result.report->month);
      if (!again || !(*again == *result.report)) {
        res.pass = false;
        res.detail = "CALC result differs from calculate() for " + unit->id();
        return res;
      }
    }
    if (auto msg = check_unit(*unit, shadow[record.unit_id]); !msg.empty()) {
      res.pass = false;
      res.detail = msg;
      return res;
    }
  }
  for (const auto& statement : engine.finalize()) run.add(storefee::format_statement(statement));
  *digest = run.digest();
  return res;
}

}  // namespace

int main() {
  std::vector<PropertyResult> results;
  bool all_pass = true;

  for (int i = 0; i < kSeeds; ++i) {
    const uint64_t seed = 0x5f3759dfULL + static_cast<uint64_t>(i) * 7919ULL;
    std::string d1, d2;
    auto r = run_seed(seed, &d1);
    if (r.pass) {
      const auto replay = run_seed(seed, &d2);
      if (!replay.pass || d1 != d2) {
        r.pass = false;
        r.detail = "replay digest mismatch";
      } else {
        r.detail = "run_digest=" + d1;
      }
    }
    all_pass = all_pass && r.pass;
    results.push_back(std::move(r));
  }

  std::ostringstream report;
  report << "{"
         << "\"schema\":\"property_report_v1\""
         << ",\"pass\":" << (all_pass ? "true" : "false")
         << ",\"ops_per_seed\":" << kOpsPerSeed
         << ",\"seeds\":[";
  for (size_t i = 0; i < results.size(); ++i) {
    if (i > 0) report << ",";
    const auto& r = results[i];
    report << "{"
           << "\"seed\":" << r.seed
           << ",\"pass\":" << (r.pass ? "true" : "false")
           << ",\"applied\":" << r.applied
           << ",\"failed\":" << r.failed
           << ",\"detail\":\"" << r.detail << "\""
           << "}";
  }
  report << "]}";

  const std::string report_path = "artifacts/reports/PROPERTY_REPORT.json";
  write_file(report_path, report.str());
  std::cout << "[property] report written: " << report_path << "\n";

  for (const auto& r : results) {
    std::cout << "  seed " << r.seed << ": " << (r.pass ? "PASS" : "FAIL")
              << "  applied=" << r.applied << " failed=" << r.failed << "  " << r.detail << "\n";
  }
  std::cout << "[property] overall=" << (all_pass ? "PASS" : "FAIL") << "\n";
  return all_pass ? 0 : 1;
}
