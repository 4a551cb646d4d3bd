#pragma once

// envcache/types.hpp: Core data structures for the environment provisioning cache.
//
// ERROR MODEL:
//   Every component returns its failure as a ProvisionError value. Nothing
//   throws across a component boundary and nothing inspects process exit status
//   to decide which branch to take. ErrorCode::none means success.
//
// OWNERSHIP:
//   All types here are value types. String members are value-owned; no
//   borrowed references escape a call.
//
// FAIL-CLOSED:
//   Any error that could leave the workload running against an unverified or
//   partially built environment is fatal for the instance. Only
//   cache_commit_failed and pack_failed are downgraded to warnings, since they
//   only affect the next instance's hit rate.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace envcache {

enum class ErrorCode {
  none,
  spec_unavailable,
  cache_miss,
  cache_read_error,
  download_failed,
  dependency_resolution_failed,
  install_failed,
  pack_failed,
  unpack_failed,
  relocation_failed,
  cache_commit_failed,
  config_invalid,
  spawn_failed,
};

std::string to_string(ErrorCode code);

struct ProvisionError {
  ErrorCode code{ErrorCode::none};
  std::string stage;    // state-machine stage that produced the error
  std::string detail;   // underlying I/O, solver or install message
  bool transient{false};  // only meaningful for cache_read_error

  bool ok() const { return code == ErrorCode::none; }
  std::string to_json() const;
};

ProvisionError make_error(ErrorCode code, std::string stage, std::string detail,
                          bool transient = false);

// ---------------------------------------------------------------------------
// EnvironmentSpec: declarative environment description (read-only input)
// ---------------------------------------------------------------------------
struct EnvironmentSpec {
  std::string path;     // canonical absolute path of the spec file
  std::string name;     // top-level "name:" value
  std::vector<std::string> channels;
  std::vector<std::string> dependencies;
  std::vector<std::string> pip_dependencies;
  std::string content;  // raw bytes; the fingerprint covers exactly these
};

// ---------------------------------------------------------------------------
// MaterializedEnvironment: installed prefix owned by one job instance
// ---------------------------------------------------------------------------
struct MaterializedEnvironment {
  std::string prefix;       // absolute path on instance-local storage
  std::string name;
  std::string fingerprint;  // fingerprint of the spec it was produced from
  std::string origin;       // "restored" or "built"

  bool empty() const { return prefix.empty(); }
};

// Variables exported to a workload running inside the environment.
std::map<std::string, std::string> activation_env(
    const MaterializedEnvironment& env,
    const std::map<std::string, std::string>& base_env,
    const std::map<std::string, std::string>& extra_env);

}  // namespace envcache
