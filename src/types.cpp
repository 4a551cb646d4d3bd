#include "envcache/types.hpp"

#include <sstream>

#include "envcache/jsonlite.hpp"

namespace envcache {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::spec_unavailable: return "spec_unavailable";
    case ErrorCode::cache_miss: return "cache_miss";
    case ErrorCode::cache_read_error: return "cache_read_error";
    case ErrorCode::download_failed: return "download_failed";
    case ErrorCode::dependency_resolution_failed: return "dependency_resolution_failed";
    case ErrorCode::install_failed: return "install_failed";
    case ErrorCode::pack_failed: return "pack_failed";
    case ErrorCode::unpack_failed: return "unpack_failed";
    case ErrorCode::relocation_failed: return "relocation_failed";
    case ErrorCode::cache_commit_failed: return "cache_commit_failed";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::spawn_failed: return "spawn_failed";
  }
  return "";
}

ProvisionError make_error(ErrorCode code, std::string stage, std::string detail,
                          bool transient) {
  ProvisionError e;
  e.code = code;
  e.stage = std::move(stage);
  e.detail = std::move(detail);
  e.transient = transient;
  return e;
}

std::string ProvisionError::to_json() const {
  std::ostringstream oss;
  oss << "{\"code\":\"" << to_string(code) << "\""
      << ",\"stage\":\"" << jsonlite::escape(stage) << "\""
      << ",\"detail\":\"" << jsonlite::escape(detail) << "\"";
  if (code == ErrorCode::cache_read_error) {
    oss << ",\"transient\":" << (transient ? "true" : "false");
  }
  oss << "}";
  return oss.str();
}

std::map<std::string, std::string> activation_env(
    const MaterializedEnvironment& env,
    const std::map<std::string, std::string>& base_env,
    const std::map<std::string, std::string>& extra_env) {
  std::map<std::string, std::string> out = base_env;
  const std::string bin = env.prefix + "/bin";
  auto it = out.find("PATH");
  if (it == out.end() || it->second.empty()) {
    out["PATH"] = bin + ":/usr/local/bin:/usr/bin:/bin";
  } else {
    it->second = bin + ":" + it->second;
  }
  out["CONDA_PREFIX"] = env.prefix;
  out["CONDA_DEFAULT_ENV"] = env.name;
  out["ENVCACHE_FINGERPRINT"] = env.fingerprint;
  out["ENVCACHE_ORIGIN"] = env.origin;
  // Configured variables win over everything, matching the job script's
  // final "export" block.
  for (const auto& [k, v] : extra_env) out[k] = v;
  return out;
}

}  // namespace envcache
