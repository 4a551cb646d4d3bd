#include "envcache/audit.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <mutex>
#include <sstream>

#include "envcache/hash.hpp"
#include "envcache/jsonlite.hpp"
#include "envcache/observability.hpp"
#include "envcache/version.hpp"

namespace envcache {

namespace {

const std::string kGenesis(64, '0');
constexpr off_t kTailWindow = 64 * 1024;

std::string chain_digest(const std::string& line) { return hash_domain("audit:", line); }

// Last non-empty line of the open file, read from a bounded tail. Returns
// false when the tail cannot be read or the last line does not fit in it.
bool read_last_line(int fd, std::string* out) {
  out->clear();
  struct stat st;
  if (::fstat(fd, &st) != 0)
    return false;
  if (st.st_size == 0)
    return true;
  const off_t start = st.st_size > kTailWindow ? st.st_size - kTailWindow : 0;
  std::string tail(static_cast<size_t>(st.st_size - start), '\0');
  size_t got = 0;
  while (got < tail.size()) {
    const ssize_t n = ::pread(fd, tail.data() + got, tail.size() - got,
                              start + static_cast<off_t>(got));
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      return false;
    got += static_cast<size_t>(n);
  }
  while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r'))
    tail.pop_back();
  const auto nl = tail.rfind('\n');
  if (nl == std::string::npos && start > 0)
    return false;
  *out = nl == std::string::npos ? tail : tail.substr(nl + 1);
  return true;
}

bool write_all(int fd, const std::string& data) {
  size_t done = 0;
  while (done < data.size()) {
    const ssize_t n = ::write(fd, data.data() + done, data.size() - done);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      return false;
    done += static_cast<size_t>(n);
  }
  return true;
}

// Holds an exclusive flock for the lifetime of the guard.
class FileLock {
 public:
  explicit FileLock(int fd) : fd_(fd) {
    int rc;
    do {
      rc = ::flock(fd_, LOCK_EX);
    } while (rc != 0 && errno == EINTR);
    locked_ = rc == 0;
  }
  ~FileLock() {
    if (locked_)
      ::flock(fd_, LOCK_UN);
  }
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  bool locked() const { return locked_; }

 private:
  int fd_;
  bool locked_{false};
};

}  // namespace

std::string JobProvenance::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"seq\":" << sequence << ",\"prev\":\"" << previous_digest << "\""
    << ",\"unix_time\":" << unix_time
    << ",\"local_time\":\"" << jsonlite::escape(local_time) << "\""
    << ",\"job_id\":\"" << jsonlite::escape(job_id) << "\""
    << ",\"array_job_id\":\"" << jsonlite::escape(array_job_id) << "\""
    << ",\"array_task_id\":\"" << jsonlite::escape(array_task_id) << "\""
    << ",\"node_id\":\"" << jsonlite::escape(node_id) << "\""
    << ",\"job_script\":\"" << jsonlite::escape(job_script) << "\""
    << ",\"job_script_hash\":\"" << job_script_hash << "\""
    << ",\"job_script_lines\":" << job_script_lines
    << ",\"spec_key\":\"" << jsonlite::escape(spec_key) << "\""
    << ",\"fingerprint\":\"" << fingerprint << "\""
    << ",\"final_state\":\"" << final_state << "\""
    << ",\"path\":\"" << path << "\""
    << ",\"error_code\":\"" << error_code << "\""
    << ",\"workload_exit_code\":" << workload_exit_code
    << ",\"workload_wall_ns\":" << workload_wall_ns
    << ",\"engine_semver\":\"" << jsonlite::escape(engine_semver) << "\""
    << ",\"audit_log_version\":" << audit_log_version
    << "}";
  return o.str();
}

std::string JobProvenance::to_line() const {
  std::ostringstream o;
  o << "UNIX_TIME " << unix_time
    << " LOCAL_TIME " << local_time
    << " SLURM_JOB_ID " << (job_id.empty() ? "-" : job_id)
    << " SLURM_ARRAY_JOB_ID " << (array_job_id.empty() ? "-" : array_job_id)
    << " SLURM_ARRAY_TASK_ID " << (array_task_id.empty() ? "-" : array_task_id)
    << " NODE " << node_id
    << " JOB_SCRIPT_BLAKE3 " << (job_script_hash.empty() ? "-" : job_script_hash)
    << " JOB_SCRIPT_LINES " << job_script_lines;
  return o.str();
}

// ---------------------------------------------------------------------------
// AuditLog
// ---------------------------------------------------------------------------

struct AuditLogImpl {
  std::mutex mu;
  int fd{-1};
  std::uint64_t entry_count{0};
  std::uint64_t failure_count{0};
};

AuditLog::AuditLog(const std::string& path) : path_(path), impl_(std::make_unique<AuditLogImpl>()) {
  if (path_.empty()) return;
  impl_->fd = ::open(path_.c_str(), O_RDWR | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
  if (impl_->fd < 0)
    log_event(LogLevel::warn, "audit.open_failed", {{"path", path_}, {"detail", std::strerror(errno)}});
}

AuditLog::~AuditLog() {
  if (impl_ && impl_->fd >= 0) {
    ::close(impl_->fd);
    impl_->fd = -1;
  }
}

bool AuditLog::append(JobProvenance& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (path_.empty()) return true;
  auto fail = [&](const char* event, const std::string& detail) {
    ++impl_->failure_count;
    log_event(LogLevel::warn, event, {{"path", path_}, {"detail", detail}});
    return false;
  };
  if (impl_->fd < 0) return fail("audit.write_failed", "log not open");

  // Other instances append to the same file; the chain head is only valid
  // while the lock is held.
  FileLock lock(impl_->fd);
  if (!lock.locked()) return fail("audit.lock_failed", std::strerror(errno));

  std::string last;
  if (!read_last_line(impl_->fd, &last)) return fail("audit.tail_unreadable", "cannot read last entry");
  std::uint64_t seq = 0;
  std::string prev = kGenesis;
  if (!last.empty()) {
    std::optional<jsonlite::JsonError> err;
    const auto obj = jsonlite::parse(last, &err);
    if (err || !obj.contains("seq")) return fail("audit.tail_unreadable", "last entry is not an audit record");
    seq = jsonlite::get_u64(obj, "seq");
    prev = chain_digest(last);
  }

  record.sequence = seq + 1;
  record.previous_digest = prev;
  record.audit_log_version = version::AUDIT_LOG_VERSION;
  if (!write_all(impl_->fd, record.to_json() + "\n"))
    return fail("audit.write_failed", std::strerror(errno));
  ++impl_->entry_count;
  return true;
}

std::uint64_t AuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

std::uint64_t AuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

AuditChainReport verify_audit_chain(const std::string& path) {
  AuditChainReport rep;
  std::ifstream in(path);
  if (!in) {
    rep.ok = false;
    rep.detail = path + ": cannot open";
    return rep;
  }
  std::string expected_prev = kGenesis;
  std::uint64_t expected_seq = 0;
  std::uint64_t lineno = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++lineno;
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const auto obj = jsonlite::parse(line, &err);
    if (err) {
      rep.ok = false;
      rep.first_bad_line = lineno;
      rep.detail = "unparsable entry";
      return rep;
    }
    const std::uint64_t seq = jsonlite::get_u64(obj, "seq");
    const std::string prev = jsonlite::get_string(obj, "prev");
    // The first entry may continue a rotated log, so only its successors
    // are checked against a known predecessor.
    if (rep.entries > 0 && (seq != expected_seq + 1 || prev != expected_prev)) {
      rep.ok = false;
      rep.first_bad_line = lineno;
      rep.detail = seq != expected_seq + 1 ? "sequence gap" : "chain digest mismatch";
      return rep;
    }
    if (rep.entries == 0 && seq == 1 && prev != kGenesis) {
      rep.ok = false;
      rep.first_bad_line = lineno;
      rep.detail = "first entry does not start the chain";
      return rep;
    }
    expected_seq = seq;
    expected_prev = chain_digest(line);
    ++rep.entries;
  }
  return rep;
}

}  // namespace envcache
