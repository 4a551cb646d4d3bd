#pragma once

// envcache/audit.hpp: Append-only job provenance log.
//
// PROPERTIES:
//   1. APPEND-ONLY: entries are written with O_APPEND semantics; existing
//      bytes are never rewritten.
//   2. MONOTONIC: `seq` increases by one per entry, continuing from the last
//      entry in the file at the time of the append.
//   3. CHAINED: `prev` is the BLAKE3 digest (domain "audit:") of the previous
//      line, so a removed or edited line breaks verify_audit_chain().
//   4. NON-FATAL: a write failure is counted and logged. It never changes the
//      job's outcome.
//
// Instances on different nodes may share one log on the cache filesystem.
// Each append holds an exclusive flock() on the file while it reads the chain
// head and writes its line. A last line that cannot be read or parsed fails
// the append; the chain is never restarted.

#include <cstdint>
#include <memory>
#include <string>

namespace envcache {

struct JobProvenance {
  std::uint64_t sequence{0};
  std::string previous_digest;

  std::uint64_t unix_time{0};
  std::string local_time;  // ISO-8601 with offset
  std::string job_id;
  std::string array_job_id;
  std::string array_task_id;
  std::string node_id;
  std::string job_script;
  std::string job_script_hash;  // BLAKE3 hex, empty when unreadable
  std::uint64_t job_script_lines{0};

  std::string spec_key;
  std::string fingerprint;
  std::string final_state;  // "READY" | "FAILED"
  std::string path;         // "restore" | "build" | ""
  std::string error_code;
  int workload_exit_code{-1};  // -1 = workload not started
  std::uint64_t workload_wall_ns{0};

  std::string engine_semver;
  std::uint32_t audit_log_version{0};

  // One line, no trailing newline.
  std::string to_json() const;
  // Human-readable metadata line printed at job start.
  std::string to_line() const;
};

struct AuditLogImpl;

class AuditLog {
 public:
  // Empty path disables the log; append() then succeeds without writing.
  explicit AuditLog(const std::string& path = "");
  ~AuditLog();

  AuditLog(const AuditLog&) = delete;
  AuditLog& operator=(const AuditLog&) = delete;

  // Assigns sequence and previous_digest in place.
  bool append(JobProvenance& record);

  std::uint64_t entry_count() const;
  std::uint64_t failure_count() const;
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::unique_ptr<AuditLogImpl> impl_;
};

struct AuditChainReport {
  bool ok{true};
  std::uint64_t entries{0};
  std::uint64_t first_bad_line{0};  // 1-based, 0 when ok
  std::string detail;
};

AuditChainReport verify_audit_chain(const std::string& path);

}  // namespace envcache
