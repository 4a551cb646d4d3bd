#pragma once

// envcache/archive.hpp: Portable archive format of an installed prefix.
//
// FORMAT (version::ARCHIVE_FORMAT_VERSION = 1):
//   "ENVPACK1" magic, then one zstd frame whose payload is
//     u32 format_version
//     u32 prefix_len, prefix bytes         build prefix the tree was packed from
//     u64 entry_count
//     entry_count x {
//       u8  kind                           0 = directory, 1 = file, 2 = symlink
//       u32 mode                           permission bits
//       u32 path_len, path bytes           relative, '/'-separated
//       u64 data_len, data bytes           file contents or symlink target
//     }
//   All integers little-endian. Entries are sorted by path, so packing the
//   same tree twice yields identical bytes.
//
// Unpacking rejects absolute paths, ".." components and writes through a
// symlink extracted earlier in the same archive.

#include <cstdint>
#include <string>

#include "envcache/types.hpp"

namespace envcache {

struct PackResult {
  std::string blob;
  std::uint64_t entries{0};
  ProvisionError error;  // pack_failed

  bool ok() const { return error.ok(); }
};

struct UnpackResult {
  std::string build_prefix;  // prefix recorded at pack time
  std::uint64_t entries{0};
  ProvisionError error;      // unpack_failed

  bool ok() const { return error.ok(); }
};

// ---------------------------------------------------------------------------
// IArchiver: archive capability used by the packer and the unpacker
// ---------------------------------------------------------------------------
class IArchiver {
 public:
  virtual ~IArchiver() = default;

  // Pack the tree under `root`, recording `root` as the build prefix.
  virtual PackResult pack(const std::string& root) const = 0;

  // Extract into `target` (created if missing, must be empty).
  virtual UnpackResult unpack(const std::string& blob, const std::string& target) const = 0;

  virtual std::string format_id() const = 0;
};

class EnvPackArchiver : public IArchiver {
 public:
  explicit EnvPackArchiver(int compression_level = 3) : level_(compression_level) {}

  PackResult pack(const std::string& root) const override;
  UnpackResult unpack(const std::string& blob, const std::string& target) const override;
  std::string format_id() const override { return "envpack-v1+zstd"; }

 private:
  int level_;
};

// True for a relative path with no empty, "." or ".." components.
bool safe_relative_path(const std::string& rel);

}  // namespace envcache
