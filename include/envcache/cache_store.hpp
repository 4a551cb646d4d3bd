#pragma once

// envcache/cache_store.hpp: Shared durable cache of environment archives.
//
// LAYOUT (LocalCacheStore, one directory on a shared filesystem):
//   <root>/archives/<fp[0:2]>/<fp>.envpack   "ENVCACHE-ARCHIVE1 " + header JSON
//                                            + "\n" + archive bytes
//   <root>/records/<spec_key>.json           fingerprint record (JSON)
//
// WRITE ORDER:
//   put() publishes header and archive bytes with a single rename. The packer
//   calls publish_record() only after put() succeeded, so a record always
//   names a fingerprint whose archive file is complete, or missing after
//   retention, but never partial.
//
// CONCURRENCY:
//   No locks. Instances building the same fingerprint under different scratch
//   prefixes produce different bytes. Each archive file is self-describing,
//   so whichever rename lands last leaves a consistent file that restores to
//   the same environment. The record's archive_hash then names the writer it
//   came from and is informational only.
//
// INTEGRITY:
//   fetch() hashes the archive bytes and compares them with the header in the
//   same file. Any mismatch is a permanent cache_read_error.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "envcache/types.hpp"

namespace envcache {

struct CacheRecord {
  std::string spec_key;
  std::string fingerprint;
  std::string archive_hash;      // BLAKE3 of the archive bytes
  std::uint64_t archive_size{0};
  std::string writer_instance;   // job/node that committed the entry
  std::uint64_t created_at_unix_ts{0};
  std::uint32_t record_format{0};
  std::uint32_t hash_algorithm{0};

  std::string to_json() const;
};

// Parse a record file. Returns nullopt on malformed JSON or missing fields.
std::optional<CacheRecord> parse_cache_record(const std::string& text);

// Header stored in front of every archive file.
struct ArchiveInfo {
  std::string fingerprint;
  std::string archive_hash;
  std::uint64_t size{0};
  std::uint64_t created_at_unix_ts{0};
  std::uint32_t archive_format{0};
};

struct FetchResult {
  std::string blob;
  ArchiveInfo info;
  ProvisionError error;  // none, cache_miss or cache_read_error

  bool ok() const { return error.ok(); }
  bool miss() const { return error.code == ErrorCode::cache_miss; }
};

// ---------------------------------------------------------------------------
// ICacheStore: storage capability used by the provisioner and the packer
// ---------------------------------------------------------------------------
class ICacheStore {
 public:
  virtual ~ICacheStore() = default;

  // True when the record for spec_key names this fingerprint under the
  // current record and hash versions. Reads only the record.
  virtual bool has(const std::string& spec_key, const std::string& fingerprint) const = 0;

  virtual std::optional<CacheRecord> record(const std::string& spec_key) const = 0;

  // Verified archive bytes, cache_miss, or cache_read_error{transient}.
  virtual FetchResult fetch(const std::string& fingerprint) const = 0;

  // Store the archive under its fingerprint. Failure is cache_commit_failed.
  virtual ProvisionError put(const std::string& fingerprint, const std::string& blob) = 0;

  // Atomically replace the record for rec.spec_key. Failure is
  // cache_commit_failed.
  virtual ProvisionError publish_record(const CacheRecord& rec) = 0;

  virtual std::string backend_id() const = 0;
};

struct CacheVerifyReport {
  std::string spec_key;
  bool record_present{false};
  bool fingerprint_current{false};  // record matches the given fingerprint
  bool archive_present{false};
  bool archive_intact{false};
  bool archive_matches_record{false};  // stored archive is the one the record names
  ProvisionError error;

  std::string to_json() const;
};

struct PruneReport {
  std::vector<std::string> removed;  // fingerprints
  std::size_t kept{0};
  std::uint64_t bytes_freed{0};
  bool dry_run{false};

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// LocalCacheStore: directory-backed implementation
// ---------------------------------------------------------------------------
class LocalCacheStore : public ICacheStore {
 public:
  explicit LocalCacheStore(std::string root);

  bool has(const std::string& spec_key, const std::string& fingerprint) const override;
  std::optional<CacheRecord> record(const std::string& spec_key) const override;
  FetchResult fetch(const std::string& fingerprint) const override;
  ProvisionError put(const std::string& fingerprint, const std::string& blob) override;
  ProvisionError publish_record(const CacheRecord& rec) override;
  std::string backend_id() const override { return "local_fs"; }

  std::string archive_path(const std::string& fingerprint) const;
  std::string record_path(const std::string& spec_key) const;

  std::vector<CacheRecord> list_records() const;
  std::vector<ArchiveInfo> list_archives() const;

  // Record + archive integrity check for one spec key. `fingerprint` may be
  // empty, in which case only the recorded archive is checked.
  CacheVerifyReport verify(const std::string& spec_key, const std::string& fingerprint) const;

  // Remove archives older than max_age that no record references.
  PruneReport prune(std::chrono::seconds max_age, bool dry_run = false);

  const std::string& root() const { return root_; }

 private:
  std::string root_;
};

// Spec keys become file names: no separators, no "..", not empty.
bool valid_spec_key(const std::string& key);

// errno values that a retry at the scheduler level may clear.
bool is_transient_io_errno(int err);

std::uint64_t unix_now_seconds();

}  // namespace envcache
