#pragma once

// envcache/version.hpp: Version constants for every on-disk format.
//
// Every reader of a versioned file checks the matching constant before it
// trusts the content. A fingerprint record written with a different
// RECORD_FORMAT_VERSION or HASH_ALGORITHM_VERSION counts as a cache miss, never
// as a hit.

#include <cstdint>
#include <string>

namespace envcache {
namespace version {

// Version 1 = BLAKE3-256 over "envspec:" + raw spec bytes, hex-encoded.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// Version 1 = "ENVPACK1" magic + zstd frame of little-endian entry records.
constexpr uint32_t ARCHIVE_FORMAT_VERSION = 1;

// Version 1 = JSON record files under <root>/records; archive files under
// <root>/archives/<fp[0:2]>/ begin with an "ENVCACHE-ARCHIVE1 " JSON header.
constexpr uint32_t RECORD_FORMAT_VERSION = 1;

// Version 1 = NDJSON job provenance entries with a BLAKE3 chain.
constexpr uint32_t AUDIT_LOG_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t archive_format{ARCHIVE_FORMAT_VERSION};
  uint32_t record_format{RECORD_FORMAT_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  std::string semver;
  std::string hash_primitive;
  std::string compression;
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& semver = "");

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace envcache
