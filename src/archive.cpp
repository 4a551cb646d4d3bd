#include "envcache/archive.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>

#include <zstd.h>

#include "envcache/spec.hpp"
#include "envcache/version.hpp"

namespace fs = std::filesystem;

namespace envcache {

namespace {

constexpr char kMagic[] = "ENVPACK1";
constexpr size_t kMagicLen = 8;

// Upper bound on a decompressed payload; a corrupt frame header must not make
// us allocate the whole address space.
constexpr unsigned long long kMaxPayload = 64ULL * 1024 * 1024 * 1024;

enum class EntryKind : uint8_t { directory = 0, file = 1, symlink = 2 };

struct Entry {
  EntryKind kind{EntryKind::file};
  uint32_t mode{0};
  std::string path;
  std::string data;
};

void put_u8(std::string& out, uint8_t v) { out.push_back(static_cast<char>(v)); }

void put_u32(std::string& out, uint32_t v) {
  for (int i = 0; i < 4; ++i)
    out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
}

void put_u64(std::string& out, uint64_t v) {
  for (int i = 0; i < 8; ++i)
    out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
}

void put_bytes32(std::string& out, const std::string& s) {
  put_u32(out, static_cast<uint32_t>(s.size()));
  out += s;
}

void put_bytes64(std::string& out, const std::string& s) {
  put_u64(out, s.size());
  out += s;
}

struct Reader {
  const std::string& s;
  size_t i{0};
  bool bad{false};

  bool need(size_t n) {
    if (bad || s.size() - i < n) {
      bad = true;
      return false;
    }
    return true;
  }
  uint8_t u8() {
    if (!need(1)) return 0;
    return static_cast<uint8_t>(s[i++]);
  }
  uint32_t u32() {
    if (!need(4)) return 0;
    uint32_t v = 0;
    for (int k = 0; k < 4; ++k)
      v |= static_cast<uint32_t>(static_cast<unsigned char>(s[i++])) << (8 * k);
    return v;
  }
  uint64_t u64() {
    if (!need(8)) return 0;
    uint64_t v = 0;
    for (int k = 0; k < 8; ++k)
      v |= static_cast<uint64_t>(static_cast<unsigned char>(s[i++])) << (8 * k);
    return v;
  }
  std::string bytes(uint64_t n) {
    if (n > s.size() || !need(static_cast<size_t>(n))) {
      bad = true;
      return {};
    }
    std::string out = s.substr(i, static_cast<size_t>(n));
    i += static_cast<size_t>(n);
    return out;
  }
};

ProvisionError pack_error(const std::string& detail) {
  return make_error(ErrorCode::pack_failed, "pack", detail);
}

ProvisionError unpack_error(const std::string& detail) {
  return make_error(ErrorCode::unpack_failed, "restore", detail);
}

// True when no ancestor of `rel` under `root` is a symlink.
bool parents_are_real_dirs(const fs::path& root, const std::string& rel) {
  fs::path cur = root;
  const fs::path relp(rel);
  const fs::path parent = relp.parent_path();
  for (const auto& part : parent) {
    cur /= part;
    std::error_code ec;
    const auto st = fs::symlink_status(cur, ec);
    if (ec)
      return true;  // does not exist yet; create_directories will make a real dir
    if (fs::is_symlink(st))
      return false;
  }
  return true;
}

}  // namespace

bool safe_relative_path(const std::string& rel) {
  if (rel.empty() || rel[0] == '/')
    return false;
  size_t start = 0;
  while (start <= rel.size()) {
    size_t end = rel.find('/', start);
    if (end == std::string::npos)
      end = rel.size();
    const std::string part = rel.substr(start, end - start);
    if (part.empty() || part == "." || part == "..")
      return false;
    start = end + 1;
  }
  return true;
}

PackResult EnvPackArchiver::pack(const std::string& root) const {
  PackResult r;
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    r.error = pack_error(root + ": not a directory");
    return r;
  }

  std::vector<Entry> entries;
  const fs::path base(root);
  for (fs::recursive_directory_iterator it(base, fs::directory_options::none, ec), end;
       it != end; it.increment(ec)) {
    if (ec)
      break;
    const fs::path p = it->path();
    const auto st = fs::symlink_status(p, ec);
    if (ec)
      break;
    Entry e;
    e.path = fs::relative(p, base, ec).generic_string();
    if (ec)
      break;
    struct stat sb;
    if (::lstat(p.c_str(), &sb) != 0) {
      r.error = pack_error(p.string() + ": " + std::strerror(errno));
      return r;
    }
    e.mode = static_cast<uint32_t>(sb.st_mode & 07777);
    if (fs::is_symlink(st)) {
      e.kind = EntryKind::symlink;
      e.data = fs::read_symlink(p, ec).string();
      if (ec)
        break;
    } else if (fs::is_directory(st)) {
      e.kind = EntryKind::directory;
    } else if (fs::is_regular_file(st)) {
      e.kind = EntryKind::file;
      if (!read_file_bytes(p.string(), &e.data)) {
        r.error = pack_error(p.string() + ": " + std::strerror(errno));
        return r;
      }
    } else {
      // Sockets, fifos and devices have no meaning in a relocated prefix.
      continue;
    }
    entries.push_back(std::move(e));
  }
  if (ec) {
    r.error = pack_error(root + ": " + ec.message());
    return r;
  }

  std::sort(entries.begin(), entries.end(),
            [](const Entry& a, const Entry& b) { return a.path < b.path; });

  std::string payload;
  put_u32(payload, version::ARCHIVE_FORMAT_VERSION);
  std::string prefix = base.lexically_normal().string();
  while (prefix.size() > 1 && prefix.back() == '/')
    prefix.pop_back();
  put_bytes32(payload, prefix);
  put_u64(payload, entries.size());
  for (const auto& e : entries) {
    put_u8(payload, static_cast<uint8_t>(e.kind));
    put_u32(payload, e.mode);
    put_bytes32(payload, e.path);
    put_bytes64(payload, e.data);
  }

  std::string compressed;
  compressed.resize(ZSTD_compressBound(payload.size()));
  const size_t n = ZSTD_compress(compressed.data(), compressed.size(),
                                 payload.data(), payload.size(), level_);
  if (ZSTD_isError(n)) {
    r.error = pack_error(std::string("zstd: ") + ZSTD_getErrorName(n));
    return r;
  }
  compressed.resize(n);

  r.blob.reserve(kMagicLen + compressed.size());
  r.blob.append(kMagic, kMagicLen);
  r.blob += compressed;
  r.entries = entries.size();
  return r;
}

UnpackResult EnvPackArchiver::unpack(const std::string& blob, const std::string& target) const {
  UnpackResult r;
  if (blob.size() < kMagicLen || blob.compare(0, kMagicLen, kMagic, kMagicLen) != 0) {
    r.error = unpack_error("not an envpack archive");
    return r;
  }
  const char* frame = blob.data() + kMagicLen;
  const size_t frame_len = blob.size() - kMagicLen;
  const unsigned long long content = ZSTD_getFrameContentSize(frame, frame_len);
  if (content == ZSTD_CONTENTSIZE_ERROR || content == ZSTD_CONTENTSIZE_UNKNOWN ||
      content > kMaxPayload) {
    r.error = unpack_error("bad zstd frame header");
    return r;
  }
  std::string payload;
  payload.resize(static_cast<size_t>(content));
  const size_t n = ZSTD_decompress(payload.data(), payload.size(), frame, frame_len);
  if (ZSTD_isError(n) || n != payload.size()) {
    r.error = unpack_error(std::string("zstd: ") +
                           (ZSTD_isError(n) ? ZSTD_getErrorName(n) : "short frame"));
    return r;
  }

  Reader rd{payload};
  const uint32_t fmt = rd.u32();
  if (rd.bad || fmt != version::ARCHIVE_FORMAT_VERSION) {
    r.error = unpack_error("unsupported archive format " + std::to_string(fmt));
    return r;
  }
  r.build_prefix = rd.bytes(rd.u32());
  const uint64_t count = rd.u64();
  if (rd.bad) {
    r.error = unpack_error("truncated archive header");
    return r;
  }

  std::error_code ec;
  const fs::path root(target);
  fs::create_directories(root, ec);
  if (ec) {
    r.error = unpack_error(target + ": " + ec.message());
    return r;
  }

  for (uint64_t k = 0; k < count; ++k) {
    Entry e;
    e.kind = static_cast<EntryKind>(rd.u8());
    e.mode = rd.u32();
    e.path = rd.bytes(rd.u32());
    e.data = rd.bytes(rd.u64());
    if (rd.bad) {
      r.error = unpack_error("truncated entry " + std::to_string(k));
      return r;
    }
    if (!safe_relative_path(e.path)) {
      r.error = unpack_error("unsafe path in archive: " + e.path);
      return r;
    }
    if (!parents_are_real_dirs(root, e.path)) {
      r.error = unpack_error("path escapes through symlink: " + e.path);
      return r;
    }
    const fs::path dest = root / e.path;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
      r.error = unpack_error(dest.parent_path().string() + ": " + ec.message());
      return r;
    }

    switch (e.kind) {
      case EntryKind::directory:
        fs::create_directories(dest, ec);
        if (ec) {
          r.error = unpack_error(dest.string() + ": " + ec.message());
          return r;
        }
        ::chmod(dest.c_str(), static_cast<mode_t>(e.mode | 0700));
        break;
      case EntryKind::file: {
        std::ofstream ofs(dest, std::ios::binary | std::ios::trunc);
        if (!ofs) {
          r.error = unpack_error(dest.string() + ": " + std::strerror(errno));
          return r;
        }
        ofs.write(e.data.data(), static_cast<std::streamsize>(e.data.size()));
        ofs.close();
        if (!ofs) {
          r.error = unpack_error(dest.string() + ": write failed");
          return r;
        }
        ::chmod(dest.c_str(), static_cast<mode_t>(e.mode | 0200));
        break;
      }
      case EntryKind::symlink:
        fs::create_symlink(e.data, dest, ec);
        if (ec) {
          r.error = unpack_error(dest.string() + ": " + ec.message());
          return r;
        }
        break;
      default:
        r.error = unpack_error("unknown entry kind " + std::to_string(static_cast<int>(e.kind)));
        return r;
    }
  }
  if (rd.i != payload.size()) {
    r.error = unpack_error("trailing data after last entry");
    return r;
  }
  r.entries = count;
  return r;
}

}  // namespace envcache
