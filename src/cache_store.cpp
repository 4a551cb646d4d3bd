#include "envcache/cache_store.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <set>
#include <sstream>

#include "envcache/hash.hpp"
#include "envcache/jsonlite.hpp"
#include "envcache/observability.hpp"
#include "envcache/spec.hpp"
#include "envcache/version.hpp"

namespace fs = std::filesystem;

namespace envcache {

namespace {

constexpr const char* kArchiveExt = ".envpack";

// First line of every stored archive file; the JSON describes the bytes after
// the newline.
constexpr char kHeaderTag[] = "ENVCACHE-ARCHIVE1 ";
constexpr size_t kHeaderTagLen = sizeof(kHeaderTag) - 1;
constexpr size_t kMaxHeaderLen = 4096;

// Unique temporary name in the target directory, so the final rename stays on
// one filesystem.
std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Write to a temp file, then rename into place. Returns "" or an error text.
std::string atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec)
    return target.parent_path().string() + ": " + ec.message();
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs)
      return tmp + ": " + std::strerror(errno);
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      const std::string msg = tmp + ": short write";
      std::remove(tmp.c_str());
      return msg;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return target.string() + ": " + ec.message();
  }
  return {};
}

std::optional<ArchiveInfo> parse_header_json(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(text, &err);
  if (err)
    return std::nullopt;
  ArchiveInfo info;
  info.fingerprint = jsonlite::get_string(obj, "fingerprint");
  info.archive_hash = jsonlite::get_string(obj, "archive_hash");
  info.size = jsonlite::get_u64(obj, "size");
  info.created_at_unix_ts = jsonlite::get_u64(obj, "created_at");
  info.archive_format = static_cast<uint32_t>(jsonlite::get_u64(obj, "archive_format"));
  if (!valid_digest(info.fingerprint) || !valid_digest(info.archive_hash))
    return std::nullopt;
  return info;
}

// Splits "<tag><json>\n<blob>". Returns the header and sets *body_offset.
std::optional<ArchiveInfo> parse_archive_header(const std::string& file, size_t* body_offset) {
  if (file.compare(0, kHeaderTagLen, kHeaderTag) != 0)
    return std::nullopt;
  const size_t nl = file.find('\n', kHeaderTagLen);
  if (nl == std::string::npos || nl > kMaxHeaderLen)
    return std::nullopt;
  *body_offset = nl + 1;
  return parse_header_json(file.substr(kHeaderTagLen, nl - kHeaderTagLen));
}

// Header only, without reading the archive body.
std::optional<ArchiveInfo> read_archive_header(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return std::nullopt;
  std::string line;
  if (!std::getline(in, line) || line.size() > kMaxHeaderLen)
    return std::nullopt;
  line += '\n';
  size_t off = 0;
  return parse_archive_header(line, &off);
}

std::string header_to_json(const ArchiveInfo& info) {
  std::ostringstream o;
  o << "{\"archive_format\":" << info.archive_format
    << ",\"archive_hash\":\"" << info.archive_hash << "\""
    << ",\"created_at\":" << info.created_at_unix_ts
    << ",\"fingerprint\":\"" << info.fingerprint << "\""
    << ",\"size\":" << info.size << "}";
  return o.str();
}

ProvisionError read_error(const std::string& detail, int err) {
  return make_error(ErrorCode::cache_read_error, "restore", detail, is_transient_io_errno(err));
}

uint64_t file_mtime_seconds(const std::string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0)
    return 0;
  return static_cast<uint64_t>(st.st_mtime);
}

}  // namespace

// ---------------------------------------------------------------------------
// Free helpers
// ---------------------------------------------------------------------------

bool valid_spec_key(const std::string& key) {
  if (key.empty() || key.size() > 200)
    return false;
  if (key == "." || key.find("..") != std::string::npos)
    return false;
  for (char c : key) {
    if (c == '/' || c == '\\' || c == '\0')
      return false;
  }
  return key[0] != '.';
}

bool is_transient_io_errno(int err) {
  switch (err) {
    case EIO:
    case EAGAIN:
    case EINTR:
    case ESTALE:
    case ETIMEDOUT:
    case EBUSY:
    case ENOLCK:
      return true;
    default:
      return false;
  }
}

uint64_t unix_now_seconds() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string CacheRecord::to_json() const {
  std::ostringstream o;
  o << "{\"archive_hash\":\"" << archive_hash << "\""
    << ",\"archive_size\":" << archive_size
    << ",\"created_at\":" << created_at_unix_ts
    << ",\"fingerprint\":\"" << fingerprint << "\""
    << ",\"hash_algorithm\":" << hash_algorithm
    << ",\"record_format\":" << record_format
    << ",\"spec_key\":\"" << jsonlite::escape(spec_key) << "\""
    << ",\"writer_instance\":\"" << jsonlite::escape(writer_instance) << "\""
    << "}";
  return o.str();
}

std::optional<CacheRecord> parse_cache_record(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(text, &err);
  if (err)
    return std::nullopt;
  CacheRecord r;
  r.spec_key = jsonlite::get_string(obj, "spec_key");
  r.fingerprint = jsonlite::get_string(obj, "fingerprint");
  r.archive_hash = jsonlite::get_string(obj, "archive_hash");
  r.archive_size = jsonlite::get_u64(obj, "archive_size");
  r.writer_instance = jsonlite::get_string(obj, "writer_instance");
  r.created_at_unix_ts = jsonlite::get_u64(obj, "created_at");
  r.record_format = static_cast<uint32_t>(jsonlite::get_u64(obj, "record_format"));
  r.hash_algorithm = static_cast<uint32_t>(jsonlite::get_u64(obj, "hash_algorithm"));
  if (r.spec_key.empty() || r.fingerprint.empty())
    return std::nullopt;
  return r;
}

std::string CacheVerifyReport::to_json() const {
  std::ostringstream o;
  o << "{\"spec_key\":\"" << jsonlite::escape(spec_key) << "\""
    << ",\"record_present\":" << (record_present ? "true" : "false")
    << ",\"fingerprint_current\":" << (fingerprint_current ? "true" : "false")
    << ",\"archive_present\":" << (archive_present ? "true" : "false")
    << ",\"archive_intact\":" << (archive_intact ? "true" : "false")
    << ",\"archive_matches_record\":" << (archive_matches_record ? "true" : "false");
  if (!error.ok())
    o << ",\"error\":" << error.to_json();
  o << "}";
  return o.str();
}

std::string PruneReport::to_json() const {
  std::ostringstream o;
  o << "{\"dry_run\":" << (dry_run ? "true" : "false")
    << ",\"kept\":" << kept
    << ",\"bytes_freed\":" << bytes_freed
    << ",\"removed\":[";
  for (size_t i = 0; i < removed.size(); ++i) {
    if (i)
      o << ",";
    o << "\"" << removed[i] << "\"";
  }
  o << "]}";
  return o.str();
}

// ---------------------------------------------------------------------------
// LocalCacheStore
// ---------------------------------------------------------------------------

LocalCacheStore::LocalCacheStore(std::string root) : root_(std::move(root)) {}

std::string LocalCacheStore::archive_path(const std::string& fingerprint) const {
  return (fs::path(root_) / "archives" / fingerprint.substr(0, 2) /
          (fingerprint + kArchiveExt)).string();
}

std::string LocalCacheStore::record_path(const std::string& spec_key) const {
  return (fs::path(root_) / "records" / (spec_key + ".json")).string();
}

std::optional<CacheRecord> LocalCacheStore::record(const std::string& spec_key) const {
  if (!valid_spec_key(spec_key))
    return std::nullopt;
  std::string text;
  if (!read_file_bytes(record_path(spec_key), &text))
    return std::nullopt;
  return parse_cache_record(text);
}

bool LocalCacheStore::has(const std::string& spec_key, const std::string& fingerprint) const {
  if (!valid_digest(fingerprint))
    return false;
  const auto rec = record(spec_key);
  if (!rec)
    return false;
  // A record from another format or hash generation is a miss, never a hit.
  if (rec->record_format != version::RECORD_FORMAT_VERSION ||
      rec->hash_algorithm != version::HASH_ALGORITHM_VERSION)
    return false;
  return rec->spec_key == spec_key && rec->fingerprint == fingerprint;
}

FetchResult LocalCacheStore::fetch(const std::string& fingerprint) const {
  FetchResult r;
  if (!valid_digest(fingerprint)) {
    r.error = make_error(ErrorCode::cache_read_error, "restore",
                         "malformed fingerprint: " + fingerprint);
    return r;
  }

  const std::string apath = archive_path(fingerprint);
  std::string blob;
  errno = 0;
  if (!read_file_bytes(apath, &blob)) {
    const int err = errno;
    if (err == ENOENT) {
      r.error = make_error(ErrorCode::cache_miss, "restore", apath + ": no such archive");
    } else {
      r.error = read_error(apath + ": " + std::strerror(err), err);
    }
    return r;
  }

  size_t body = 0;
  const auto info = parse_archive_header(blob, &body);
  if (!info) {
    r.error = make_error(ErrorCode::cache_read_error, "restore", apath + ": malformed archive header");
    return r;
  }
  if (info->fingerprint != fingerprint) {
    r.error = make_error(ErrorCode::cache_read_error, "restore",
                         apath + ": header names fingerprint " + info->fingerprint);
    return r;
  }
  blob.erase(0, body);

  const std::string actual = archive_content_hash(blob);
  if (actual != info->archive_hash || blob.size() != info->size) {
    r.error = make_error(ErrorCode::cache_read_error, "restore",
                         apath + ": integrity check failed (expected " + info->archive_hash +
                             ", got " + actual + ")");
    return r;
  }

  r.blob = std::move(blob);
  r.info = *info;
  return r;
}

ProvisionError LocalCacheStore::put(const std::string& fingerprint, const std::string& blob) {
  if (!valid_digest(fingerprint)) {
    return make_error(ErrorCode::cache_commit_failed, "pack",
                      "malformed fingerprint: " + fingerprint);
  }

  ArchiveInfo info;
  info.fingerprint = fingerprint;
  info.archive_hash = archive_content_hash(blob);
  info.size = blob.size();
  info.created_at_unix_ts = unix_now_seconds();
  info.archive_format = version::ARCHIVE_FORMAT_VERSION;

  // Header and body go out in one rename, so a reader never pairs one
  // writer's header with another writer's bytes.
  std::string file;
  file.reserve(kHeaderTagLen + 256 + blob.size());
  file.append(kHeaderTag, kHeaderTagLen);
  file += header_to_json(info);
  file += '\n';
  file += blob;
  const std::string err = atomic_write(archive_path(fingerprint), file);
  if (!err.empty())
    return make_error(ErrorCode::cache_commit_failed, "pack", err);

  log_event(LogLevel::debug, "cache.put", {{"fingerprint", fingerprint},
                                           {"bytes", std::to_string(blob.size())}});
  return {};
}

ProvisionError LocalCacheStore::publish_record(const CacheRecord& rec) {
  if (!valid_spec_key(rec.spec_key)) {
    return make_error(ErrorCode::cache_commit_failed, "pack",
                      "invalid spec key: " + rec.spec_key);
  }
  if (!valid_digest(rec.fingerprint)) {
    return make_error(ErrorCode::cache_commit_failed, "pack",
                      "malformed fingerprint: " + rec.fingerprint);
  }
  const std::string err = atomic_write(record_path(rec.spec_key), rec.to_json());
  if (!err.empty())
    return make_error(ErrorCode::cache_commit_failed, "pack", err);
  return {};
}

std::vector<CacheRecord> LocalCacheStore::list_records() const {
  std::vector<CacheRecord> out;
  const fs::path dir = fs::path(root_) / "records";
  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    return out;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const fs::path p = it->path();
    if (p.extension() != ".json" || p.filename().string()[0] == '.')
      continue;
    std::string text;
    if (!read_file_bytes(p.string(), &text))
      continue;
    if (auto rec = parse_cache_record(text))
      out.push_back(std::move(*rec));
  }
  std::sort(out.begin(), out.end(),
            [](const CacheRecord& a, const CacheRecord& b) { return a.spec_key < b.spec_key; });
  return out;
}

std::vector<ArchiveInfo> LocalCacheStore::list_archives() const {
  std::vector<ArchiveInfo> out;
  const fs::path dir = fs::path(root_) / "archives";
  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    return out;
  for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    const std::string ext = kArchiveExt;
    if (name.size() != 64 + ext.size() || name.compare(64, ext.size(), ext) != 0)
      continue;
    const std::string fp = name.substr(0, 64);
    if (!valid_digest(fp))
      continue;
    ArchiveInfo info;
    if (auto parsed = read_archive_header(it->path().string()))
      info = *parsed;
    info.fingerprint = fp;
    if (info.created_at_unix_ts == 0)
      info.created_at_unix_ts = file_mtime_seconds(it->path().string());
    if (info.size == 0) {
      std::error_code sec;
      const auto sz = fs::file_size(it->path(), sec);
      if (!sec)
        info.size = sz;
    }
    out.push_back(std::move(info));
  }
  std::sort(out.begin(), out.end(),
            [](const ArchiveInfo& a, const ArchiveInfo& b) { return a.fingerprint < b.fingerprint; });
  return out;
}

CacheVerifyReport LocalCacheStore::verify(const std::string& spec_key,
                                          const std::string& fingerprint) const {
  CacheVerifyReport rep;
  rep.spec_key = spec_key;
  const auto rec = record(spec_key);
  if (!rec) {
    rep.error = make_error(ErrorCode::cache_miss, "verify", "no record for " + spec_key);
    return rep;
  }
  rep.record_present = true;
  rep.fingerprint_current = fingerprint.empty() ? true : has(spec_key, fingerprint);

  std::error_code ec;
  rep.archive_present = fs::exists(archive_path(rec->fingerprint), ec);
  FetchResult fr = fetch(rec->fingerprint);
  if (!fr.ok()) {
    rep.error = fr.error;
    rep.error.stage = "verify";
    return rep;
  }
  // Another writer may have replaced the archive with its own build of the
  // same fingerprint after this record was published.
  rep.archive_matches_record = fr.info.archive_hash == rec->archive_hash;
  rep.archive_intact = true;
  return rep;
}

PruneReport LocalCacheStore::prune(std::chrono::seconds max_age, bool dry_run) {
  PruneReport rep;
  rep.dry_run = dry_run;

  std::set<std::string> referenced;
  for (const auto& rec : list_records())
    referenced.insert(rec.fingerprint);

  const uint64_t now = unix_now_seconds();
  const uint64_t age_limit = static_cast<uint64_t>(max_age.count());

  for (const auto& info : list_archives()) {
    const uint64_t age = now > info.created_at_unix_ts ? now - info.created_at_unix_ts : 0;
    if (referenced.count(info.fingerprint) != 0 || age < age_limit) {
      ++rep.kept;
      continue;
    }
    if (!dry_run) {
      std::error_code ec;
      fs::remove(archive_path(info.fingerprint), ec);
      if (ec) {
        log_event(LogLevel::warn, "cache.prune_failed",
                  {{"fingerprint", info.fingerprint}, {"detail", ec.message()}});
        ++rep.kept;
        continue;
      }
    }
    rep.removed.push_back(info.fingerprint);
    rep.bytes_freed += info.size;
  }
  log_event(LogLevel::info, "cache.prune",
            {{"removed", std::to_string(rep.removed.size())},
             {"kept", std::to_string(rep.kept)},
             {"dry_run", dry_run ? "true" : "false"}});
  return rep;
}

}  // namespace envcache
