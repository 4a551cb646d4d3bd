#pragma once

// envcache/fingerprint.hpp: Content hash of an environment specification.
//
// The fingerprint covers the raw bytes of the spec file and nothing else:
// not its path, its mtime or its parsed form. Whitespace and comment edits
// therefore produce a new fingerprint (and a rebuild). That is the price of a
// key that never misses a semantic change.

#include <memory>
#include <string>
#include <string_view>

#include "envcache/hash.hpp"
#include "envcache/types.hpp"

namespace envcache {

struct FingerprintResult {
  EnvironmentSpec spec;
  std::string fingerprint;
  ProvisionError error;

  bool ok() const { return error.ok(); }
};

class SpecFingerprinter {
 public:
  explicit SpecFingerprinter(std::shared_ptr<const IHasher> hasher);

  // Pure function of the bytes.
  std::string fingerprint(std::string_view spec_bytes) const;

  // Read, parse and fingerprint a spec file. Failure is spec_unavailable.
  FingerprintResult fingerprint_file(const std::string& path) const;

  const IHasher& hasher() const { return *hasher_; }

 private:
  std::shared_ptr<const IHasher> hasher_;
};

}  // namespace envcache
