#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "envcache/audit.hpp"
#include "envcache/cache_store.hpp"
#include "envcache/config.hpp"
#include "envcache/fingerprint.hpp"
#include "envcache/hash.hpp"
#include "envcache/job.hpp"
#include "envcache/jsonlite.hpp"
#include "envcache/observability.hpp"
#include "envcache/process.hpp"
#include "envcache/provisioner.hpp"
#include "envcache/version.hpp"

#include <zstd.h>

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;

struct Flags {
  std::map<std::string, std::string> values;
  std::vector<std::string> positional;
  std::vector<std::string> workload;  // everything after "--"
  bool dry_run{false};

  bool has(const std::string& k) const { return values.contains(k); }
  std::string get(const std::string& k, const std::string& def = "") const {
    auto it = values.find(k);
    return it == values.end() ? def : it->second;
  }
};

Flags parse_flags(int argc, char** argv, int start) {
  Flags f;
  for (int i = start; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--") {
      for (int j = i + 1; j < argc; ++j) f.workload.push_back(argv[j]);
      break;
    }
    if (a == "--dry-run") {
      f.dry_run = true;
    } else if (a.rfind("--", 0) == 0 && i + 1 < argc) {
      f.values[a.substr(2)] = argv[++i];
    } else {
      f.positional.push_back(a);
    }
  }
  return f;
}

void usage() {
  std::cerr
      << "usage: envcache <command> [options]\n"
      << "  fingerprint --spec F\n"
      << "  provision [--config F] [--spec F] [--scratch D] [--cache D] [--policy P]\n"
      << "  run [provision options] [--job-script F] -- <workload argv>\n"
      << "  cache ls [--cache D]\n"
      << "  cache verify [--cache D] --spec F [--spec-key K]\n"
      << "  cache prune [--cache D] [--max-age-days N] [--dry-run]\n"
      << "  audit verify --log F\n"
      << "  health | version\n";
}

// Known BLAKE3 test vectors.
bool verify_hash_vectors() {
  if (envcache::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262") {
    return false;
  }
  if (envcache::blake3_hex("hello") !=
      "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f") {
    return false;
  }
  return true;
}

void configure_logging(const envcache::ProvisionerConfig& c) {
  envcache::LogConfig lc;
  lc.min_level = envcache::parse_log_level(c.log_level);
  lc.event_log_path = c.event_log_path;
  envcache::init_logging(lc);
}

// defaults -> --config file -> ENVCACHE_* -> flags.
bool load_effective_config(const Flags& f, const std::map<std::string, std::string>& env,
                           envcache::ProvisionerConfig* out) {
  auto loaded = envcache::load_config(f.get("config"), env);
  if (!loaded.ok()) {
    std::cerr << loaded.error.to_json() << "\n";
    return false;
  }
  auto& c = loaded.config;
  if (f.has("spec")) c.spec_path = f.get("spec");
  if (f.has("scratch")) c.scratch_dir = f.get("scratch");
  if (f.has("cache")) c.cache_root = f.get("cache");
  if (f.has("spec-key")) c.spec_key = f.get("spec-key");
  if (f.has("workdir")) c.workload_cwd = f.get("workdir");
  if (f.has("log-level")) c.log_level = f.get("log-level");
  if (f.has("event-log")) c.event_log_path = f.get("event-log");
  if (f.has("audit-log")) c.audit_log_path = f.get("audit-log");
  if (f.has("job-script")) c.identity.job_script = f.get("job-script");
  if (f.has("policy") && !envcache::parse_restore_policy(f.get("policy"), &c.restore_policy)) {
    std::cerr << envcache::make_error(envcache::ErrorCode::config_invalid, "start",
                                      "unknown --policy '" + f.get("policy") + "'").to_json()
              << "\n";
    return false;
  }
  *out = std::move(c);
  configure_logging(*out);
  return true;
}

int cmd_fingerprint(const Flags& f) {
  const std::string spec = f.get("spec", f.positional.empty() ? "" : f.positional.front());
  envcache::SpecFingerprinter fp(std::make_shared<envcache::Blake3Hasher>());
  const auto r = fp.fingerprint_file(spec);
  if (!r.ok()) {
    std::cout << "{\"ok\":false,\"error\":" << r.error.to_json() << "}\n";
    return kExitFailed;
  }
  std::cout << "{\"ok\":true"
            << ",\"spec\":\"" << envcache::jsonlite::escape(r.spec.path) << "\""
            << ",\"name\":\"" << envcache::jsonlite::escape(r.spec.name) << "\""
            << ",\"algorithm\":\"" << fp.hasher().algorithm() << "\""
            << ",\"hash_algorithm_version\":" << envcache::version::HASH_ALGORITHM_VERSION
            << ",\"fingerprint\":\"" << r.fingerprint << "\"}\n";
  return 0;
}

int cmd_provision(const Flags& f, const std::map<std::string, std::string>& env) {
  envcache::ProvisionerConfig config;
  if (!load_effective_config(f, env, &config)) return kExitFailed;
  envcache::EnvironmentProvisioner prov(config, envcache::make_default_deps(config));
  const auto result = prov.run();
  std::cout << result.to_json() << "\n";
  return result.ok() ? 0 : kExitFailed;
}

int cmd_run(const Flags& f, const std::map<std::string, std::string>& env) {
  envcache::ProvisionerConfig config;
  if (!load_effective_config(f, env, &config)) return envcache::kExitProvisionFailed;

  envcache::JobRunner runner(config, std::cout, std::cerr);
  envcache::JobProvenance prov = runner.begin();

  envcache::EnvironmentProvisioner provisioner(config, envcache::make_default_deps(config));
  const auto result = provisioner.run();
  envcache::log_event(envcache::LogLevel::info, "job.provisioned",
                      {{"state", envcache::to_string(result.state)},
                       {"path", result.path_taken},
                       {"prefix", result.environment.prefix}});
  return runner.run(result, f.workload, prov);
}

int cmd_cache(const Flags& f, const std::map<std::string, std::string>& env) {
  if (f.positional.empty()) {
    usage();
    return kExitUsage;
  }
  envcache::ProvisionerConfig config;
  if (!load_effective_config(f, env, &config)) return kExitFailed;
  if (config.cache_root.empty()) {
    std::cerr << "envcache: no cache root (use --cache or ENVCACHE_CACHE_ROOT)\n";
    return kExitUsage;
  }
  envcache::LocalCacheStore store(config.cache_root);
  const std::string sub = f.positional.front();

  if (sub == "ls") {
    std::ostringstream o;
    o << "{\"cache_root\":\"" << envcache::jsonlite::escape(store.root()) << "\",\"records\":[";
    const auto records = store.list_records();
    for (size_t i = 0; i < records.size(); ++i) {
      if (i) o << ",";
      o << records[i].to_json();
    }
    o << "],\"archives\":[";
    const auto archives = store.list_archives();
    for (size_t i = 0; i < archives.size(); ++i) {
      if (i) o << ",";
      o << "{\"fingerprint\":\"" << archives[i].fingerprint << "\""
        << ",\"size\":" << archives[i].size
        << ",\"created_at\":" << archives[i].created_at_unix_ts << "}";
    }
    o << "]}";
    std::cout << o.str() << "\n";
    return 0;
  }

  if (sub == "verify") {
    std::string fingerprint;
    std::string key = config.spec_key;
    if (!config.spec_path.empty()) {
      envcache::SpecFingerprinter fp(std::make_shared<envcache::Blake3Hasher>());
      const auto r = fp.fingerprint_file(config.spec_path);
      if (!r.ok()) {
        std::cout << "{\"ok\":false,\"error\":" << r.error.to_json() << "}\n";
        return kExitFailed;
      }
      fingerprint = r.fingerprint;
      if (key.empty()) key = r.spec.name;
    }
    if (key.empty()) {
      std::cerr << "envcache: cache verify needs --spec or --spec-key\n";
      return kExitUsage;
    }
    const auto rep = store.verify(key, fingerprint);
    std::cout << rep.to_json() << "\n";
    return (rep.archive_intact && rep.fingerprint_current) ? 0 : kExitFailed;
  }

  if (sub == "prune") {
    std::uint64_t days = config.retention_days;
    if (f.has("max-age-days")) {
      try {
        days = std::stoull(f.get("max-age-days"));
      } catch (const std::exception&) {
        std::cerr << "envcache: --max-age-days must be a number\n";
        return kExitUsage;
      }
    }
    if (days > envcache::kMaxRetentionDays) {
      std::cerr << "envcache: --max-age-days must be at most " << envcache::kMaxRetentionDays << "\n";
      return kExitUsage;
    }
    const auto rep = store.prune(std::chrono::hours(24 * days), f.dry_run);
    std::cout << rep.to_json() << "\n";
    return 0;
  }

  usage();
  return kExitUsage;
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd;
  int cmd_index = 0;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0) continue;
    cmd = argv[i];
    cmd_index = i;
    break;
  }
  if (cmd.empty()) {
    usage();
    return kExitUsage;
  }

  const auto env = envcache::current_environment();
  {
    envcache::LogConfig lc;
    auto it = env.find("ENVCACHE_LOG_LEVEL");
    if (it != env.end()) lc.min_level = envcache::parse_log_level(it->second);
    it = env.find("ENVCACHE_EVENT_LOG");
    if (it != env.end()) lc.event_log_path = it->second;
    envcache::init_logging(lc);
  }
  const Flags flags = parse_flags(argc, argv, cmd_index + 1);

  if (cmd == "health") {
    const auto h = envcache::hash_runtime_info();
    const bool vectors_ok = verify_hash_vectors();
    std::cout << "{\"ok\":" << (h.blake3_available && vectors_ok ? "true" : "false")
              << ",\"hash_primitive\":\"" << h.primitive << "\""
              << ",\"hash_version\":\"" << h.version << "\""
              << ",\"hash_vectors_ok\":" << (vectors_ok ? "true" : "false")
              << ",\"compression\":\"zstd\""
              << ",\"zstd_version\":\"" << ZSTD_versionString() << "\""
              << ",\"archive_format_version\":" << envcache::version::ARCHIVE_FORMAT_VERSION
              << ",\"stats\":" << envcache::global_provision_stats().to_json()
              << "}\n";
    return vectors_ok ? 0 : kExitFailed;
  }

  if (cmd == "version") {
    std::cout << envcache::version::manifest_to_json(envcache::version::current_manifest())
              << "\n";
    return 0;
  }

  if (cmd == "fingerprint") return cmd_fingerprint(flags);
  if (cmd == "provision") return cmd_provision(flags, env);
  if (cmd == "run") return cmd_run(flags, env);
  if (cmd == "cache") return cmd_cache(flags, env);

  if (cmd == "audit" && !flags.positional.empty() && flags.positional.front() == "verify") {
    std::string log = flags.get("log");
    if (log.empty()) {
      auto it = env.find("ENVCACHE_AUDIT_LOG");
      if (it != env.end()) log = it->second;
    }
    const auto rep = envcache::verify_audit_chain(log);
    std::cout << "{\"ok\":" << (rep.ok ? "true" : "false")
              << ",\"entries\":" << rep.entries
              << ",\"first_bad_line\":" << rep.first_bad_line
              << ",\"detail\":\"" << envcache::jsonlite::escape(rep.detail) << "\"}\n";
    return rep.ok ? 0 : kExitFailed;
  }

  usage();
  return kExitUsage;
}
