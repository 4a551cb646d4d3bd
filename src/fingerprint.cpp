#include "envcache/fingerprint.hpp"

#include "envcache/spec.hpp"

namespace envcache {

SpecFingerprinter::SpecFingerprinter(std::shared_ptr<const IHasher> hasher)
    : hasher_(std::move(hasher)) {
  if (!hasher_)
    hasher_ = std::make_shared<Blake3Hasher>();
}

std::string SpecFingerprinter::fingerprint(std::string_view spec_bytes) const {
  return hasher_->hex_digest(spec_bytes);
}

FingerprintResult SpecFingerprinter::fingerprint_file(const std::string& path) const {
  FingerprintResult r;
  SpecLoadResult loaded = load_environment_spec(path);
  r.spec = std::move(loaded.spec);
  if (!loaded.ok()) {
    r.error = std::move(loaded.error);
    return r;
  }
  r.fingerprint = fingerprint(r.spec.content);
  if (r.fingerprint.empty()) {
    r.error = make_error(ErrorCode::spec_unavailable, "fingerprint",
                         hasher_->algorithm() + " produced an empty digest");
  }
  return r;
}

}  // namespace envcache
