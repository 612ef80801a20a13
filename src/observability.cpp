#include "storefee/observability.hpp"

#include <bit>

#include "storefee/jsonlite.hpp"
#include "storefee/version.hpp"

namespace storefee {

namespace {

// bit_width gives floor(log2(x)) + 1 for x > 0: the bucket index in O(1).
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

}  // namespace

std::string OperationEvent::to_json() const {
  std::string line;
  line.reserve(192);
  line += "{\"v\":";
  line += std::to_string(version::EVENT_LOG_VERSION);
  line += ",\"seq\":";
  line += std::to_string(sequence);
  line += ",\"kind\":\"";
  line += kind;
  line += "\",\"unit_id\":\"";
  line += jsonlite::escape(unit_id);
  line += "\",\"file_id\":\"";
  line += jsonlite::escape(file_id);
  line += "\",\"timestamp\":\"";
  line += timestamp;
  line += "\",\"ok\":";
  line += ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += error_code;
  line += "\",\"duration_ns\":";
  line += std::to_string(duration_ns);
  line += "}";
  return line;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  ++buckets_[bucket_for_us(us)];
  ++count_;
  sum_us_ += us;
}

double LatencyHistogram::mean_us() const {
  if (count_ == 0) return 0.0;
  return static_cast<double>(sum_us_) / static_cast<double>(count_);
}

double LatencyHistogram::percentile(double p) const {
  if (count_ == 0) return 0.0;
  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(count_));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i];
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  out += "{\"count\":";
  out += std::to_string(count_);
  out += ",\"mean_us\":";
  out += jsonlite::format_double(mean_us());
  out += ",\"p50_us\":";
  out += jsonlite::format_double(percentile(0.50));
  out += ",\"p95_us\":";
  out += jsonlite::format_double(percentile(0.95));
  out += ",\"p99_us\":";
  out += jsonlite::format_double(percentile(0.99));
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record(const OperationEvent& ev) {
  ++total_;
  if (ev.ok) {
    ++applied_;
  } else {
    ++failed_;
    ++by_error_[ev.error_code];
  }
  ++by_kind_[ev.kind];
  latency_.record(ev.duration_ns);
}

uint64_t EngineStats::count_for_kind(const std::string& kind) const {
  const auto it = by_kind_.find(kind);
  return it == by_kind_.end() ? 0 : it->second;
}

uint64_t EngineStats::count_for_error(const std::string& error_code) const {
  const auto it = by_error_.find(error_code);
  return it == by_error_.end() ? 0 : it->second;
}

std::string EngineStats::to_json() const {
  auto map_json = [](const std::map<std::string, uint64_t>& m) {
    std::string s = "{";
    bool first = true;
    for (const auto& [k, n] : m) {
      if (!first) s += ",";
      first = false;
      s += "\"" + jsonlite::escape(k) + "\":" + std::to_string(n);
    }
    return s + "}";
  };
  std::string out;
  out.reserve(512);
  out += "{\"total_operations\":";
  out += std::to_string(total_);
  out += ",\"applied_operations\":";
  out += std::to_string(applied_);
  out += ",\"failed_operations\":";
  out += std::to_string(failed_);
  out += ",\"by_kind\":";
  out += map_json(by_kind_);
  out += ",\"by_error\":";
  out += map_json(by_error_);
  out += ",\"latency\":";
  out += latency_.to_json();
  out += "}";
  return out;
}

// ---------------------------------------------------------------------------
// EventLog
// ---------------------------------------------------------------------------

EventLog::EventLog(const std::string& path) : path_(path) {
  if (!path_.empty()) file_ = std::fopen(path_.c_str(), "a");
}

EventLog::~EventLog() {
  if (file_) std::fclose(file_);
}

void EventLog::emit(const OperationEvent& ev) {
  if (hook_) {
    hook_(ev);
    return;
  }
  if (!file_) return;
  const std::string line = ev.to_json() + "\n";
  if (std::fwrite(line.data(), 1, line.size(), file_) == line.size()) {
    ++lines_written_;
  }
  std::fflush(file_);
}

}  // namespace storefee
