#include "envcache/observability.hpp"

#include <bit>
#include <cstdio>
#include <iostream>

#include "envcache/jsonlite.hpp"

namespace envcache {

namespace {

// std::bit_width gives floor(log2(x)) + 1 in one instruction.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

LogConfig g_log_config;
std::mutex g_log_mu;
std::atomic<LogHook> g_log_hook{nullptr};
std::atomic<ProvisionEventHook> g_event_hook{nullptr};

uint64_t now_unix_ms() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string fmt2(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
  }
  return "info";
}

LogLevel parse_log_level(const std::string& s, LogLevel def) {
  if (s == "debug") return LogLevel::debug;
  if (s == "info") return LogLevel::info;
  if (s == "warn" || s == "warning") return LogLevel::warn;
  if (s == "error") return LogLevel::error;
  return def;
}

void init_logging(const LogConfig& config) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_log_config = config;
}

const LogConfig& global_log_config() { return g_log_config; }

void set_log_hook(LogHook hook) {
  g_log_hook.store(hook, std::memory_order_release);
}

void log_event(LogLevel level, const std::string& event, const LogFields& fields) {
  if (static_cast<int>(level) < static_cast<int>(g_log_config.min_level)) return;

  std::string line;
  line.reserve(128);
  line += "{\"ts_ms\":";
  line += std::to_string(now_unix_ms());
  line += ",\"level\":\"";
  line += to_string(level);
  line += "\",\"event\":\"";
  line += jsonlite::escape(event);
  line += "\"";
  for (const auto& [k, v] : fields) {
    line += ",\"";
    line += jsonlite::escape(k);
    line += "\":\"";
    line += jsonlite::escape(v);
    line += "\"";
  }
  line += "}";

  LogHook hook = g_log_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(line);
    return;
  }
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::cerr << line << "\n";
}

// ---------------------------------------------------------------------------
// ProvisionEvent
// ---------------------------------------------------------------------------

std::string ProvisionEvent::to_json() const {
  std::string out;
  out.reserve(384);
  out += "{\"instance_id\":\"" + jsonlite::escape(instance_id) + "\"";
  out += ",\"spec_key\":\"" + jsonlite::escape(spec_key) + "\"";
  out += ",\"fingerprint\":\"" + fingerprint + "\"";
  out += ",\"final_state\":\"" + final_state + "\"";
  out += ",\"path\":\"" + path + "\"";
  out += ",\"cache_hit\":";
  out += cache_hit ? "true" : "false";
  out += ",\"commit_ok\":";
  out += commit_ok ? "true" : "false";
  out += ",\"restore_fell_back\":";
  out += restore_fell_back ? "true" : "false";
  out += ",\"error_code\":\"" + error_code + "\"";
  out += ",\"total_ns\":" + std::to_string(total_ns);
  out += ",\"fingerprint_ns\":" + std::to_string(fingerprint_ns);
  out += ",\"restore_ns\":" + std::to_string(restore_ns);
  out += ",\"build_ns\":" + std::to_string(build_ns);
  out += ",\"pack_ns\":" + std::to_string(pack_ns);
  out += ",\"archive_bytes\":" + std::to_string(archive_bytes);
  out += "}";
  return out;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target && cumulative > 0) {
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
  out += "{\"count\":" + std::to_string(count());
  out += ",\"mean_us\":" + fmt2(mean_us());
  out += ",\"p50_us\":" + fmt2(percentile(0.50));
  out += ",\"p95_us\":" + fmt2(percentile(0.95));
  out += ",\"p99_us\":" + fmt2(percentile(0.99));
  out += "}";
  return out;
}

// ---------------------------------------------------------------------------
// ProvisionStats
// ---------------------------------------------------------------------------

void ProvisionStats::record(const ProvisionEvent& ev) {
  total.fetch_add(1, std::memory_order_relaxed);
  if (ev.final_state == "ready") {
    ready.fetch_add(1, std::memory_order_relaxed);
  } else {
    failed.fetch_add(1, std::memory_order_relaxed);
  }
  if (ev.cache_hit) {
    cache_hits.fetch_add(1, std::memory_order_relaxed);
  } else if (!ev.fingerprint.empty()) {
    cache_misses.fetch_add(1, std::memory_order_relaxed);
  }
  if (ev.path == "build") {
    builds.fetch_add(1, std::memory_order_relaxed);
    build_latency.record(ev.build_ns);
    if (!ev.commit_ok) commit_failures.fetch_add(1, std::memory_order_relaxed);
  }
  if (ev.path == "restore") {
    restores.fetch_add(1, std::memory_order_relaxed);
    restore_latency.record(ev.restore_ns);
  }
  if (ev.restore_fell_back) restore_fallbacks.fetch_add(1, std::memory_order_relaxed);
  total_latency.record(ev.total_ns);
}

std::string ProvisionStats::to_json() const {
  const uint64_t hits = cache_hits.load(std::memory_order_relaxed);
  const uint64_t misses = cache_misses.load(std::memory_order_relaxed);
  const double hit_rate = (hits + misses) > 0
      ? static_cast<double>(hits) / static_cast<double>(hits + misses)
      : 0.0;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.6f", hit_rate);

  std::string out;
  out.reserve(512);
  out += "{\"total\":" + std::to_string(total.load(std::memory_order_relaxed));
  out += ",\"ready\":" + std::to_string(ready.load(std::memory_order_relaxed));
  out += ",\"failed\":" + std::to_string(failed.load(std::memory_order_relaxed));
  out += ",\"cache\":{\"hits\":" + std::to_string(hits);
  out += ",\"misses\":" + std::to_string(misses);
  out += ",\"hit_rate\":";
  out += buf;
  out += "},\"builds\":" + std::to_string(builds.load(std::memory_order_relaxed));
  out += ",\"restores\":" + std::to_string(restores.load(std::memory_order_relaxed));
  out += ",\"restore_fallbacks\":" + std::to_string(restore_fallbacks.load(std::memory_order_relaxed));
  out += ",\"commit_failures\":" + std::to_string(commit_failures.load(std::memory_order_relaxed));
  out += ",\"log_write_failures\":" + std::to_string(log_write_failures.load(std::memory_order_relaxed));
  out += ",\"latency\":{\"total\":" + total_latency.to_json();
  out += ",\"build\":" + build_latency.to_json();
  out += ",\"restore\":" + restore_latency.to_json();
  out += "}}";
  return out;
}

ProvisionStats& global_provision_stats() {
  static ProvisionStats inst;
  return inst;
}

void set_provision_event_hook(ProvisionEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_provision_event(const ProvisionEvent& ev) {
  global_provision_stats().record(ev);

  ProvisionEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const std::string& log_path = g_log_config.event_log_path;
  if (log_path.empty()) return;

  const std::string line = ev.to_json() + "\n";
  // O_APPEND keeps concurrent instances on a shared file from interleaving
  // short lines.
  FILE* f = std::fopen(log_path.c_str(), "a");
  if (!f) {
    global_provision_stats().log_write_failures.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  if (std::fwrite(line.data(), 1, line.size(), f) != line.size()) {
    global_provision_stats().log_write_failures.fetch_add(1, std::memory_order_relaxed);
  }
  std::fclose(f);
}

}  // namespace envcache
