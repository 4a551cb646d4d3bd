#include "envcache/hash.hpp"

// Domain prefixes are part of the cache-key contract: changing "envspec:"
// invalidates every published fingerprint record. Bump
// version::HASH_ALGORITHM_VERSION together with any change here.

extern "C" {
#include <blake3.h>
}

namespace envcache {
namespace {

// Lowercase hex of the 32-byte BLAKE3 output.
std::string finish_hex(blake3_hasher& h) {
  static constexpr char kDigits[] = "0123456789abcdef";
  unsigned char raw[BLAKE3_OUT_LEN];
  blake3_hasher_finalize(&h, raw, BLAKE3_OUT_LEN);
  std::string hex(2 * BLAKE3_OUT_LEN, '0');
  for (size_t i = 0; i < BLAKE3_OUT_LEN; ++i) {
    hex[2 * i] = kDigits[raw[i] >> 4];
    hex[2 * i + 1] = kDigits[raw[i] & 0x0f];
  }
  return hex;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  info.blake3_available = !info.version.empty();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  return hash_domain({}, payload);
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher h;
  blake3_hasher_init(&h);
  if (!domain.empty())
    blake3_hasher_update(&h, domain.data(), domain.size());
  blake3_hasher_update(&h, payload.data(), payload.size());
  return finish_hex(h);
}

std::string spec_content_hash(std::string_view spec_bytes) {
  return hash_domain("envspec:", spec_bytes);
}

std::string archive_content_hash(std::string_view archive_bytes) {
  return blake3_hex(archive_bytes);
}

bool valid_digest(std::string_view d) {
  return d.size() == 2 * BLAKE3_OUT_LEN &&
         d.find_first_not_of("0123456789abcdef") == std::string_view::npos;
}

}  // namespace envcache
