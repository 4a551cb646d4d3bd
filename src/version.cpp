#include "envcache/version.hpp"

#include <sstream>

#include <zstd.h>

#ifndef ENVCACHE_VERSION
#define ENVCACHE_VERSION "0.3.0"
#endif

namespace envcache {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver          = semver.empty() ? ENVCACHE_VERSION : semver;
  m.hash_primitive  = "blake3";
  m.compression     = std::string("zstd-") + ZSTD_versionString();
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"hash_algorithm\":" << m.hash_algorithm
    << ",\"archive_format\":" << m.archive_format
    << ",\"record_format\":" << m.record_format
    << ",\"audit_log\":" << m.audit_log
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"compression\":\"" << m.compression << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace envcache
