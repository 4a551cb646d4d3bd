#pragma once

// envcache/config.hpp: Explicit provisioning configuration.
//
// PRECEDENCE (lowest to highest):
//   1. built-in defaults derived from the scheduler environment
//        scratch_dir  /scratch/$USER/job_$SLURM_JOB_ID
//        cache_root   $SLURM_SUBMIT_DIR
//   2. JSON config file (--config)
//   3. ENVCACHE_* environment variables
//   4. command-line flags (applied by the CLI)
//
// The provisioner receives the finished struct and never reads the process
// environment itself; base_env carries the variables installer commands and
// the workload inherit.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "envcache/builder.hpp"
#include "envcache/types.hpp"
#include "envcache/worker.hpp"

namespace envcache {

enum class RestoreFailurePolicy {
  fail_closed,  // a hit that cannot be restored fails the instance
  rebuild,      // fall through to a fresh build
};

std::string to_string(RestoreFailurePolicy policy);
bool parse_restore_policy(const std::string& s, RestoreFailurePolicy* out);

struct ProvisionerConfig {
  std::string spec_path;
  std::string scratch_dir;
  std::string cache_root;
  std::string spec_key;  // empty = the spec's name
  InstanceIdentity identity;
  RestoreFailurePolicy restore_policy{RestoreFailurePolicy::fail_closed};
  InstallerConfig installer;
  std::map<std::string, std::string> base_env;      // inherited by children
  std::map<std::string, std::string> workload_env;  // exported to the workload only
  std::string workload_cwd;                         // empty = submit dir
  std::uint64_t retention_days{30};

  std::string log_level{"info"};
  std::string event_log_path;
  std::string audit_log_path;

  std::string envs_dir() const;   // <scratch>/envs
  std::string base_dir() const;   // <scratch>/miniconda3
  std::string to_json() const;
};

// Longest accepted retention window (about a century).
constexpr std::uint64_t kMaxRetentionDays = 36500;

struct ConfigValidationResult {
  bool ok{true};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  std::string to_json() const;
};

struct ConfigLoadResult {
  ProvisionerConfig config;
  ProvisionError error;  // config_invalid

  bool ok() const { return error.ok(); }
};

ProvisionerConfig default_config(const std::map<std::string, std::string>& env);

// Overlay the fields present in a JSON config file. Unknown keys are ignored
// with a warning log line.
ProvisionError apply_config_file(const std::string& path, ProvisionerConfig* config);
ProvisionError apply_config_json(const std::string& text, ProvisionerConfig* config);

// Overlay ENVCACHE_* variables.
ProvisionError apply_env_overrides(const std::map<std::string, std::string>& env,
                                   ProvisionerConfig* config);

// defaults -> file (if non-empty) -> env.
ConfigLoadResult load_config(const std::string& file, const std::map<std::string, std::string>& env);

ConfigValidationResult validate_config(const ProvisionerConfig& config);

}  // namespace envcache
