#pragma once

// envcache/provisioner.hpp: Per-instance provisioning state machine.
//
//   START -> FINGERPRINT -> CACHE_HIT  -> RESTORE ------------> READY
//                        \                   | (policy=rebuild)
//                         -> CACHE_MISS -> BUILD -> PACK -----> READY
//   any fatal error -----------------------------------------> FAILED
//
// INVARIANT:
//   A READY result's environment was either restored from an archive whose
//   fingerprint equals the fingerprint computed in this pass, or built from
//   exactly the spec bytes that were fingerprinted. The decision uses only
//   has(); a stale archive is never restored under a new fingerprint.
//
// PACK never fails the instance: pack and commit errors become warnings.
//
// All collaborators are injected. run() performs exactly one pass and emits
// exactly one ProvisionEvent.

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "envcache/archive.hpp"
#include "envcache/builder.hpp"
#include "envcache/cache_store.hpp"
#include "envcache/config.hpp"
#include "envcache/hash.hpp"
#include "envcache/types.hpp"

namespace envcache {

enum class ProvisionState {
  start,
  fingerprint,
  cache_hit,
  cache_miss,
  restore,
  build,
  pack,
  ready,
  failed,
};

std::string to_string(ProvisionState state);

struct ProvisionTimings {
  std::uint64_t fingerprint_ns{0};
  std::uint64_t restore_ns{0};
  std::uint64_t build_ns{0};
  std::uint64_t pack_ns{0};
  std::uint64_t total_ns{0};
};

struct ProvisionResult {
  ProvisionState state{ProvisionState::start};
  MaterializedEnvironment environment;
  std::string fingerprint;
  std::string spec_key;
  std::string path_taken;  // "restore" | "build" | ""
  bool cache_hit{false};
  bool commit_ok{false};
  bool restore_fell_back{false};
  std::uint64_t archive_bytes{0};
  ProvisionError error;                  // set iff state == failed
  std::vector<ProvisionError> warnings;  // non-fatal pack/commit/restore errors
  std::vector<ProvisionState> transitions;
  ProvisionTimings timings;

  bool ok() const { return state == ProvisionState::ready; }
  std::string to_json() const;
};

struct ProvisionerDeps {
  std::shared_ptr<const IHasher> hasher;
  std::shared_ptr<ICacheStore> store;
  std::shared_ptr<IInstaller> installer;
  std::shared_ptr<IArchiver> archiver;
};

// Production wiring: Blake3Hasher, LocalCacheStore(cache_root),
// CommandInstaller(installer config), EnvPackArchiver.
ProvisionerDeps make_default_deps(const ProvisionerConfig& config);

class EnvironmentProvisioner {
 public:
  EnvironmentProvisioner(ProvisionerConfig config, ProvisionerDeps deps);

  ProvisionResult run();

  const ProvisionerConfig& config() const { return config_; }

 private:
  void enter(ProvisionResult& r, ProvisionState s) const;
  void fail(ProvisionResult& r, ProvisionError e) const;
  bool restore(ProvisionResult& r, const EnvironmentSpec& spec, const std::string& target);
  void build_and_pack(ProvisionResult& r, const EnvironmentSpec& spec, const std::string& target);
  void finish(ProvisionResult& r) const;

  ProvisionerConfig config_;
  ProvisionerDeps deps_;
};

}  // namespace envcache
