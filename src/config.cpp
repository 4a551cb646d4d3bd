#include "envcache/config.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <limits>
#include <set>
#include <sstream>

#include "envcache/cache_store.hpp"
#include "envcache/jsonlite.hpp"
#include "envcache/observability.hpp"
#include "envcache/spec.hpp"

namespace fs = std::filesystem;

namespace envcache {

namespace {

std::string env_or(const std::map<std::string, std::string>& env, const char* key,
                   const std::string& def = "") {
  auto it = env.find(key);
  return (it != env.end() && !it->second.empty()) ? it->second : def;
}

ProvisionError config_error(const std::string& detail) {
  return make_error(ErrorCode::config_invalid, "start", detail);
}

bool parse_u64(const std::string& s, std::uint64_t* out) {
  if (s.empty()) return false;
  std::uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    const auto digit = static_cast<std::uint64_t>(c - '0');
    if (v > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) return false;
    v = v * 10 + digit;
  }
  *out = v;
  return true;
}

bool is_under(const std::string& child, const std::string& parent) {
  if (parent.empty() || child.empty()) return false;
  const auto c = fs::path(child).lexically_normal().string();
  auto p = fs::path(parent).lexically_normal().string();
  if (!p.empty() && p.back() != '/') p += '/';
  return (c + "/").compare(0, p.size(), p) == 0;
}

void json_string_array(std::ostringstream& o, const std::vector<std::string>& v) {
  o << "[";
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) o << ",";
    o << "\"" << jsonlite::escape(v[i]) << "\"";
  }
  o << "]";
}

const std::set<std::string> kKnownKeys = {
    "spec", "scratch_dir", "cache_root", "spec_key", "restore_policy", "installer",
    "workload_env", "workload_cwd", "retention_days", "log_level", "event_log", "audit_log",
};

}  // namespace

std::string to_string(RestoreFailurePolicy policy) {
  switch (policy) {
    case RestoreFailurePolicy::fail_closed: return "fail_closed";
    case RestoreFailurePolicy::rebuild: return "rebuild";
  }
  return "fail_closed";
}

bool parse_restore_policy(const std::string& s, RestoreFailurePolicy* out) {
  if (s == "fail_closed" || s == "fail-closed") {
    *out = RestoreFailurePolicy::fail_closed;
    return true;
  }
  if (s == "rebuild") {
    *out = RestoreFailurePolicy::rebuild;
    return true;
  }
  return false;
}

std::string ProvisionerConfig::envs_dir() const {
  return (fs::path(scratch_dir) / "envs").string();
}

std::string ProvisionerConfig::base_dir() const {
  return (fs::path(scratch_dir) / "miniconda3").string();
}

std::string ProvisionerConfig::to_json() const {
  std::ostringstream o;
  o << "{\"spec\":\"" << jsonlite::escape(spec_path) << "\""
    << ",\"scratch_dir\":\"" << jsonlite::escape(scratch_dir) << "\""
    << ",\"cache_root\":\"" << jsonlite::escape(cache_root) << "\""
    << ",\"spec_key\":\"" << jsonlite::escape(spec_key) << "\""
    << ",\"restore_policy\":\"" << to_string(restore_policy) << "\""
    << ",\"instance_id\":\"" << jsonlite::escape(identity.instance_id()) << "\""
    << ",\"workload_cwd\":\"" << jsonlite::escape(workload_cwd) << "\""
    << ",\"retention_days\":" << retention_days
    << ",\"log_level\":\"" << jsonlite::escape(log_level) << "\""
    << "}";
  return o.str();
}

std::string ConfigValidationResult::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok ? "true" : "false") << ",\"errors\":";
  json_string_array(o, errors);
  o << ",\"warnings\":";
  json_string_array(o, warnings);
  o << "}";
  return o.str();
}

ProvisionerConfig default_config(const std::map<std::string, std::string>& env) {
  ProvisionerConfig c;
  c.identity = resolve_instance_identity(env);
  c.base_env = env;
  c.scratch_dir = "/scratch/" + c.identity.user + "/job_" + c.identity.job_id;
  c.cache_root = c.identity.submit_dir;
  return c;
}

ProvisionError apply_config_json(const std::string& text, ProvisionerConfig* c) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(text, &err);
  if (err) return config_error("config: " + err->message);

  for (const auto& member : obj) {
    if (!kKnownKeys.contains(member.first))
      log_event(LogLevel::warn, "config.unknown_key", {{"key", member.first}});
  }

  if (obj.contains("spec")) c->spec_path = jsonlite::get_string(obj, "spec");
  if (obj.contains("scratch_dir")) c->scratch_dir = jsonlite::get_string(obj, "scratch_dir");
  if (obj.contains("cache_root")) c->cache_root = jsonlite::get_string(obj, "cache_root");
  if (obj.contains("spec_key")) c->spec_key = jsonlite::get_string(obj, "spec_key");
  if (obj.contains("workload_cwd")) c->workload_cwd = jsonlite::get_string(obj, "workload_cwd");
  if (obj.contains("log_level")) c->log_level = jsonlite::get_string(obj, "log_level");
  if (obj.contains("event_log")) c->event_log_path = jsonlite::get_string(obj, "event_log");
  if (obj.contains("audit_log")) c->audit_log_path = jsonlite::get_string(obj, "audit_log");
  if (obj.contains("retention_days"))
    c->retention_days = jsonlite::get_u64(obj, "retention_days", c->retention_days);
  if (obj.contains("restore_policy")) {
    const std::string p = jsonlite::get_string(obj, "restore_policy");
    if (!parse_restore_policy(p, &c->restore_policy))
      return config_error("config: unknown restore_policy '" + p + "'");
  }
  for (const auto& [k, v] : jsonlite::get_string_map(obj, "workload_env"))
    c->workload_env[k] = v;

  auto it = obj.find("installer");
  if (it != obj.end()) {
    if (!std::holds_alternative<jsonlite::Object>(it->second.v))
      return config_error("config: installer must be an object");
    const auto& inst = std::get<jsonlite::Object>(it->second.v);
    if (inst.contains("download")) c->installer.download_command = jsonlite::get_string(inst, "download");
    if (inst.contains("install")) c->installer.install_command = jsonlite::get_string(inst, "install");
    if (inst.contains("bootstrap")) c->installer.bootstrap_command = jsonlite::get_string(inst, "bootstrap");
    if (inst.contains("create")) c->installer.create_command = jsonlite::get_string(inst, "create");
    c->installer.reuse_existing_base =
        jsonlite::get_bool(inst, "reuse_existing_base", c->installer.reuse_existing_base);
  }
  return {};
}

ProvisionError apply_config_file(const std::string& path, ProvisionerConfig* c) {
  std::string text;
  if (!read_file_bytes(path, &text))
    return config_error(path + ": " + std::strerror(errno));
  ProvisionError e = apply_config_json(text, c);
  if (!e.ok()) e.detail = path + ": " + e.detail;
  return e;
}

ProvisionError apply_env_overrides(const std::map<std::string, std::string>& env,
                                   ProvisionerConfig* c) {
  c->spec_path = env_or(env, "ENVCACHE_SPEC", c->spec_path);
  c->scratch_dir = env_or(env, "ENVCACHE_SCRATCH", c->scratch_dir);
  c->cache_root = env_or(env, "ENVCACHE_CACHE_ROOT", c->cache_root);
  c->spec_key = env_or(env, "ENVCACHE_SPEC_KEY", c->spec_key);
  c->workload_cwd = env_or(env, "ENVCACHE_WORKDIR", c->workload_cwd);
  c->log_level = env_or(env, "ENVCACHE_LOG_LEVEL", c->log_level);
  c->event_log_path = env_or(env, "ENVCACHE_EVENT_LOG", c->event_log_path);
  c->audit_log_path = env_or(env, "ENVCACHE_AUDIT_LOG", c->audit_log_path);

  const std::string policy = env_or(env, "ENVCACHE_RESTORE_POLICY");
  if (!policy.empty() && !parse_restore_policy(policy, &c->restore_policy))
    return config_error("ENVCACHE_RESTORE_POLICY: unknown policy '" + policy + "'");

  const std::string days = env_or(env, "ENVCACHE_RETENTION_DAYS");
  if (!days.empty() && !parse_u64(days, &c->retention_days))
    return config_error("ENVCACHE_RETENTION_DAYS: not a number '" + days + "'");
  return {};
}

ConfigLoadResult load_config(const std::string& file, const std::map<std::string, std::string>& env) {
  ConfigLoadResult r;
  r.config = default_config(env);
  if (!file.empty()) {
    r.error = apply_config_file(file, &r.config);
    if (!r.error.ok()) return r;
  }
  r.error = apply_env_overrides(env, &r.config);
  return r;
}

ConfigValidationResult validate_config(const ProvisionerConfig& c) {
  ConfigValidationResult v;
  auto error = [&](std::string msg) { v.ok = false; v.errors.push_back(std::move(msg)); };

  if (c.spec_path.empty()) error("spec path is not set");
  if (c.scratch_dir.empty()) {
    error("scratch_dir is not set");
  } else if (!fs::path(c.scratch_dir).is_absolute()) {
    error("scratch_dir must be absolute: " + c.scratch_dir);
  }
  if (c.cache_root.empty()) {
    error("cache_root is not set (no SLURM_SUBMIT_DIR and no ENVCACHE_CACHE_ROOT)");
  } else if (!fs::path(c.cache_root).is_absolute()) {
    error("cache_root must be absolute: " + c.cache_root);
  }
  if (!c.spec_key.empty() && !valid_spec_key(c.spec_key))
    error("spec_key is not usable as a file name: " + c.spec_key);
  if (c.installer.create_command.empty())
    error("installer.create command is empty");

  if (!c.scratch_dir.empty() && !c.cache_root.empty()) {
    if (is_under(c.cache_root, c.scratch_dir))
      error("cache_root lies inside scratch_dir and would not outlive the job");
    else if (is_under(c.scratch_dir, c.cache_root))
      v.warnings.push_back("scratch_dir lies inside cache_root; builds will land on shared storage");
  }
  if (parse_log_level(c.log_level, LogLevel::debug) == LogLevel::debug && c.log_level != "debug")
    v.warnings.push_back("unknown log_level '" + c.log_level + "', using info");
  if (c.installer.create_command.find("{prefix}") == std::string::npos)
    v.warnings.push_back("installer.create does not reference {prefix}");
  if (c.retention_days > kMaxRetentionDays)
    error("retention_days exceeds " + std::to_string(kMaxRetentionDays));
  if (c.retention_days == 0)
    v.warnings.push_back("retention_days is 0; cache prune removes every unreferenced archive");
  return v;
}

}  // namespace envcache
