#pragma once

// envcache/observability.hpp: Structured logging and provisioning events.
//
// LOG LINES:
//   One JSON object per line on stderr: {"ts_ms":..,"level":"..","event":"..",...}.
//   Lines below the configured level are dropped. A hook can take over
//   delivery (tests use it to capture lines).
//
// PROVISION EVENTS:
//   Every EnvironmentProvisioner::run() emits exactly one ProvisionEvent. It is
//   folded into the process-wide ProvisionStats and, when an event log path is
//   configured, appended as one JSONL line.
//
// Neither path may fail provisioning: write errors are counted and dropped.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "envcache/types.hpp"

namespace envcache {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

std::string to_string(LogLevel level);
LogLevel parse_log_level(const std::string& s, LogLevel def = LogLevel::info);

struct LogConfig {
  LogLevel min_level{LogLevel::info};
  std::string event_log_path;  // empty = no JSONL event file
};

void init_logging(const LogConfig& config);
const LogConfig& global_log_config();

using LogFields = std::vector<std::pair<std::string, std::string>>;

// Emit one structured log line. Field values are JSON-escaped strings.
void log_event(LogLevel level, const std::string& event, const LogFields& fields = {});

using LogHook = void (*)(const std::string& line);
void set_log_hook(LogHook hook);

// ---------------------------------------------------------------------------
// ProvisionEvent: one per provisioning pass
// ---------------------------------------------------------------------------
struct ProvisionEvent {
  std::string instance_id;
  std::string spec_key;
  std::string fingerprint;
  std::string final_state;   // "ready" | "failed"
  std::string path;          // "restore" | "build" | ""
  bool cache_hit{false};
  bool commit_ok{false};
  bool restore_fell_back{false};
  std::string error_code;

  uint64_t total_ns{0};
  uint64_t fingerprint_ns{0};
  uint64_t restore_ns{0};
  uint64_t build_ns{0};
  uint64_t pack_ns{0};
  uint64_t archive_bytes{0};

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two microsecond buckets
// ---------------------------------------------------------------------------
// Bucket i covers [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 48;  // up to ~4.4 years; builds run minutes

  void record(uint64_t duration_ns);
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// ProvisionStats: process-wide counters
// ---------------------------------------------------------------------------
class ProvisionStats {
 public:
  void record(const ProvisionEvent& ev);
  std::string to_json() const;

  std::atomic<uint64_t> total{0};
  std::atomic<uint64_t> ready{0};
  std::atomic<uint64_t> failed{0};
  std::atomic<uint64_t> cache_hits{0};
  std::atomic<uint64_t> cache_misses{0};
  std::atomic<uint64_t> builds{0};
  std::atomic<uint64_t> restores{0};
  std::atomic<uint64_t> restore_fallbacks{0};
  std::atomic<uint64_t> commit_failures{0};
  std::atomic<uint64_t> log_write_failures{0};

  LatencyHistogram total_latency;
  LatencyHistogram build_latency;
  LatencyHistogram restore_latency;
};

ProvisionStats& global_provision_stats();

void emit_provision_event(const ProvisionEvent& ev);

using ProvisionEventHook = void (*)(const ProvisionEvent&);
void set_provision_event_hook(ProvisionEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
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

}  // namespace envcache
