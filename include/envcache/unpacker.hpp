#pragma once

// envcache/unpacker.hpp: Restore a cached archive into a local prefix.
//
// unpack() extracts through the IArchiver, then rewrites the recorded build
// prefix to the target directory (see relocate.hpp). On any failure the
// partially restored directory is removed before the error is returned.

#include <memory>
#include <string>

#include "envcache/archive.hpp"
#include "envcache/relocate.hpp"
#include "envcache/types.hpp"

namespace envcache {

struct RestoreResult {
  MaterializedEnvironment environment;
  RelocationReport relocation;
  ProvisionError error;  // unpack_failed or relocation_failed

  bool ok() const { return error.ok(); }
};

class EnvironmentUnpacker {
 public:
  explicit EnvironmentUnpacker(std::shared_ptr<IArchiver> archiver);

  RestoreResult unpack(const std::string& blob, const std::string& target_dir,
                       const std::string& name, const std::string& fingerprint) const;

 private:
  std::shared_ptr<IArchiver> archiver_;
};

}  // namespace envcache
