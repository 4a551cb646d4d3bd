#pragma once

// envcache/hash.hpp: BLAKE3 hashing primitives.
//
// BLAKE3-256 is the only hash primitive. Fingerprints, archive integrity
// hashes and audit chain digests all use it, each under its own domain prefix
// so equal payloads in different contexts never share a digest.

#include <string>
#include <string_view>

namespace envcache {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
  bool blake3_available{false};
};

HashRuntimeInfo hash_runtime_info();

// 64-char lowercase hex digest of the payload.
std::string blake3_hex(std::string_view payload);

// Domain-separated hashing.
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string spec_content_hash(std::string_view spec_bytes);     // "envspec:"
std::string archive_content_hash(std::string_view archive_bytes);  // plain BLAKE3

// Validate a 64-char lowercase hex digest.
bool valid_digest(std::string_view d);

// ---------------------------------------------------------------------------
// IHasher: hashing capability handed to SpecFingerprinter
// ---------------------------------------------------------------------------
class IHasher {
 public:
  virtual ~IHasher() = default;
  virtual std::string hex_digest(std::string_view payload) const = 0;
  virtual std::string algorithm() const = 0;
};

class Blake3Hasher : public IHasher {
 public:
  std::string hex_digest(std::string_view payload) const override {
    return spec_content_hash(payload);
  }
  std::string algorithm() const override { return "blake3"; }
};

}  // namespace envcache
