#pragma once

// envcache/packer.hpp: Pack a freshly built environment and commit it.
//
// Commit order is put(fingerprint, blob) then publish_record(). Both steps
// only influence the next instance's hit rate, so every failure here is
// reported as a warning and the current instance proceeds on its local build.

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "envcache/archive.hpp"
#include "envcache/cache_store.hpp"
#include "envcache/types.hpp"

namespace envcache {

struct CommitResult {
  std::string archive_hash;
  std::uint64_t archive_bytes{0};
  ProvisionError error;  // cache_commit_failed

  bool ok() const { return error.ok(); }
};

class EnvironmentPacker {
 public:
  EnvironmentPacker(std::shared_ptr<IArchiver> archiver, std::shared_ptr<ICacheStore> store);

  PackResult pack(const MaterializedEnvironment& env) const;

  CommitResult commit(const std::string& spec_key, const std::string& fingerprint,
                      const std::string& blob, const std::string& writer_instance);

  // Write <prefix>/etc/envcache/activate.sh. Returns "" or an error text.
  std::string activate(const MaterializedEnvironment& env,
                       const std::map<std::string, std::string>& extra_env) const;

 private:
  std::shared_ptr<IArchiver> archiver_;
  std::shared_ptr<ICacheStore> store_;
};

// Path of the activation script inside a prefix.
std::string activation_script_path(const std::string& prefix);

}  // namespace envcache
