#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "storefee/billing_engine.hpp"
#include "storefee/command_parser.hpp"
#include "storefee/hash.hpp"
#include "storefee/jsonlite.hpp"
#include "storefee/plan.hpp"
#include "storefee/report_format.hpp"
#include "storefee/version.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitOperationFailed = 1;
constexpr int kExitUsage = 2;

struct RunOptions {
  std::string input_path;  // "" or "-" = stdin
  std::string plans_path;  // "" = built-in catalog
  bool keep_going{false};
  bool summary{false};
  bool quiet{false};       // suppress per-operation lines (stats command)
  storefee::EngineOptions engine;
};

void print_usage(std::ostream& os) {
  os << "usage: storefee [run|stats] [options] [input|-]\n"
        "       storefee health\n"
        "options:\n"
        "  --plans <catalog.json>   plan catalog (default: built-in units)\n"
        "  --free-plan              reject units not allowed on the free plan\n"
        "  --fee-limit <amount>     free-plan monthly usage fee limit\n"
        "  --calc-previous-month    CALC reports the month before its timestamp\n"
        "  --keep-going             report failed lines and continue\n"
        "  --summary                print end-of-run statements, stats and run digest\n"
        "environment:\n"
        "  STOREFEE_LEDGER          NDJSON billing ledger path\n"
        "  STOREFEE_EVENT_LOG       JSONL operation event log path\n";
}

std::string env_or_empty(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  if (storefee::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262") {
    return false;
  }
  if (storefee::blake3_hex("hello") !=
      "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f") {
    return false;
  }
  return true;
}

int cmd_health() {
  const auto h = storefee::hash_runtime_info();
  const bool vectors_ok = verify_hash_vectors();
  std::cout << "{\"hash_primitive\":\"" << h.primitive
            << "\",\"hash_version\":\"" << storefee::jsonlite::escape(h.version)
            << "\",\"hash_available\":" << (h.blake3_available ? "true" : "false")
            << ",\"hash_vectors_ok\":" << (vectors_ok ? "true" : "false")
            << ",\"version\":" << storefee::version::manifest_to_json(storefee::version::current_manifest())
            << "}\n";
  return vectors_ok ? kExitOk : kExitOperationFailed;
}

// Returns kExitOk, or kExitUsage with a message on stderr.
int parse_run_options(const std::vector<std::string>& args, RunOptions* opts) {
  for (size_t i = 0; i < args.size(); ++i) {
    const auto& a = args[i];
    auto need_value = [&](const char* flag) -> const std::string* {
      if (i + 1 >= args.size()) {
        std::cerr << "storefee: " << flag << " requires a value\n";
        return nullptr;
      }
      return &args[++i];
    };
    if (a == "--plans") {
      const auto* v = need_value("--plans");
      if (!v) return kExitUsage;
      opts->plans_path = *v;
    } else if (a == "--free-plan") {
      opts->engine.free_plan = true;
    } else if (a == "--fee-limit") {
      const auto* v = need_value("--fee-limit");
      if (!v) return kExitUsage;
      const auto amount = storefee::parse_amount(*v);
      if (!amount) {
        std::cerr << "storefee: invalid --fee-limit '" << *v << "'\n";
        return kExitUsage;
      }
      opts->engine.free_plan_fee_limit = *amount;
    } else if (a == "--calc-previous-month") {
      opts->engine.calc_target = storefee::CalcTarget::previous_month;
    } else if (a == "--keep-going") {
      opts->keep_going = true;
    } else if (a == "--summary") {
      opts->summary = true;
    } else if (a == "-h" || a == "--help") {
      print_usage(std::cout);
      std::exit(kExitOk);
    } else if (a.size() > 1 && a.rfind("-", 0) == 0) {
      std::cerr << "storefee: unknown option " << a << "\n";
      return kExitUsage;
    } else if (opts->input_path.empty()) {
      opts->input_path = a;
    } else {
      std::cerr << "storefee: unexpected argument " << a << "\n";
      return kExitUsage;
    }
  }
  if (opts->engine.free_plan_fee_limit && !opts->engine.free_plan) {
    std::cerr << "storefee: --fee-limit requires --free-plan\n";
    return kExitUsage;
  }
  return kExitOk;
}

int cmd_run(RunOptions opts) {
  opts.engine.ledger_path = env_or_empty("STOREFEE_LEDGER");
  opts.engine.event_log_path = env_or_empty("STOREFEE_EVENT_LOG");

  storefee::PlanCatalog catalog;
  if (opts.plans_path.empty()) {
    catalog = storefee::builtin_catalog();
  } else {
    storefee::BillingError err;
    auto loaded = storefee::load_catalog_file(opts.plans_path, &err);
    if (!loaded) {
      std::cerr << "storefee: " << storefee::to_string(err.code) << " " << err.message << "\n";
      return kExitUsage;
    }
    catalog = std::move(*loaded);
  }

  storefee::BillingEngine engine(std::move(opts.engine));
  if (engine.ledger().open_failed()) {
    std::cerr << "storefee: cannot open ledger " << engine.ledger().path() << "\n";
    return kExitUsage;
  }
  if (engine.events().open_failed()) {
    std::cerr << "storefee: cannot open event log " << engine.events().path() << "\n";
    return kExitUsage;
  }
  if (auto err = engine.provision_catalog(catalog)) {
    std::cerr << "storefee: " << storefee::to_string(err->code) << " " << err->message << "\n";
    return kExitUsage;
  }

  std::unique_ptr<std::ifstream> file;
  std::istream* in = &std::cin;
  if (!opts.input_path.empty() && opts.input_path != "-") {
    file = std::make_unique<std::ifstream>(opts.input_path);
    if (!*file) {
      std::cerr << "storefee: cannot open " << opts.input_path << "\n";
      return kExitUsage;
    }
    in = file.get();
  }

  storefee::RunDigest run;
  auto emit = [&](const std::string& line) {
    run.add(line);
    if (!opts.quiet) std::cout << line << "\n";
  };

  const auto unit_ids = engine.unit_ids();
  bool failed = false;
  std::string line;
  while (std::getline(*in, line)) {
    const auto parsed = storefee::parse_line(line, unit_ids);
    if (parsed.error) {
      emit(storefee::format_parse_error(parsed));
      failed = true;
      if (!opts.keep_going) break;
      continue;
    }
    bool stop = false;
    for (const auto& record : parsed.records) {
      if (parsed.all_units && !engine.has_calc_data(record)) continue;
      const auto result = engine.apply(record);
      emit(storefee::format_result(result));
      if (!result.ok) {
        failed = true;
        if (!opts.keep_going) {
          stop = true;
          break;
        }
      }
    }
    if (stop) break;
  }
  if (in->bad()) {
    std::cerr << "storefee: read error on " << (file ? opts.input_path : "stdin") << "\n";
    return kExitUsage;
  }

  if (opts.summary) {
    for (const auto& statement : engine.finalize()) emit(storefee::format_statement(statement));
    if (!opts.quiet) std::cout << "STATS: " << engine.stats().to_json() << "\n";
    std::cout << "RUN_DIGEST: " << run.digest() << "\n";
  }
  if (opts.quiet) std::cout << engine.stats().to_json() << "\n";

  if (engine.ledger().failure_count() > 0) {
    std::cerr << "storefee: " << engine.ledger().failure_count() << " ledger write(s) failed\n";
  }
  return failed ? kExitOperationFailed : kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  std::string cmd = "run";
  if (!args.empty() && (args[0] == "run" || args[0] == "stats" || args[0] == "health")) {
    cmd = args[0];
    args.erase(args.begin());
  }

  try {
    if (cmd == "health") {
      if (!args.empty()) {
        print_usage(std::cerr);
        return kExitUsage;
      }
      return cmd_health();
    }

    RunOptions opts;
    if (const int rc = parse_run_options(args, &opts); rc != kExitOk) {
      print_usage(std::cerr);
      return rc;
    }
    opts.quiet = cmd == "stats";
    return cmd_run(std::move(opts));
  } catch (const std::exception& e) {
    std::cerr << "{\"error\":\"" << storefee::jsonlite::escape(e.what()) << "\"}\n";
    return kExitUsage;
  }
}
