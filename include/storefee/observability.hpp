#pragma once

// storefee/observability.hpp — Structured operation observability.
//
// DESIGN:
//   OperationEvent is the canonical observable unit. Every BillingEngine::apply()
//   emits exactly one, which is:
//     - counted into the engine's EngineStats (always),
//     - passed to a registered hook (in-process consumers, tests), else
//     - appended as one JSONL line to the event log file when one is configured
//       (STOREFEE_EVENT_LOG).
//
// INVARIANT:
//   Event emission never changes billing state and never fails an operation.
//   Event lines are not part of any digest; durations are wall-clock.

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <map>
#include <string>

#include "storefee/types.hpp"

namespace storefee {

struct OperationEvent {
  uint64_t    sequence{0};
  std::string kind;          // "UPLOAD" | "DELETE" | "UPDATE" | "CALC"
  std::string unit_id;
  std::string file_id;
  std::string timestamp;     // operation timestamp, ISO-8601
  bool        ok{false};
  std::string error_code;    // empty when ok
  uint64_t    duration_ns{0};

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds; 0.0 if no samples.
  double percentile(double p) const;

  uint64_t count() const { return count_; }
  double mean_us() const;

  std::string to_json() const;

 private:
  std::array<uint64_t, kBuckets> buckets_{};
  uint64_t count_{0};
  uint64_t sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats — per-engine counters
// ---------------------------------------------------------------------------
class EngineStats {
 public:
  void record(const OperationEvent& ev);
  std::string to_json() const;

  uint64_t total_operations() const { return total_; }
  uint64_t applied_operations() const { return applied_; }
  uint64_t failed_operations() const { return failed_; }
  uint64_t count_for_kind(const std::string& kind) const;
  uint64_t count_for_error(const std::string& error_code) const;

  const LatencyHistogram& latency() const { return latency_; }

 private:
  uint64_t total_{0};
  uint64_t applied_{0};
  uint64_t failed_{0};
  std::map<std::string, uint64_t> by_kind_;
  std::map<std::string, uint64_t> by_error_;
  LatencyHistogram latency_;
};

using OperationEventHook = void (*)(const OperationEvent&);

// JSONL event sink. Disabled when constructed with an empty path.
class EventLog {
 public:
  explicit EventLog(const std::string& path = "");
  ~EventLog();
  EventLog(const EventLog&) = delete;
  EventLog& operator=(const EventLog&) = delete;

  void set_hook(OperationEventHook hook) { hook_ = hook; }

  // Hook takes precedence over the file sink.
  void emit(const OperationEvent& ev);

  bool enabled() const { return file_ != nullptr || hook_ != nullptr; }
  // A non-empty path whose file could not be opened for append.
  bool open_failed() const { return !path_.empty() && file_ == nullptr; }
  uint64_t lines_written() const { return lines_written_; }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::FILE* file_{nullptr};
  OperationEventHook hook_{nullptr};
  uint64_t lines_written_{0};
};

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace storefee
