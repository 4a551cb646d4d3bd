#include "envcache/provisioner.hpp"

#include <chrono>
#include <filesystem>
#include <sstream>

#include "envcache/fingerprint.hpp"
#include "envcache/jsonlite.hpp"
#include "envcache/observability.hpp"
#include "envcache/packer.hpp"
#include "envcache/unpacker.hpp"

namespace fs = std::filesystem;

namespace envcache {

std::string to_string(ProvisionState state) {
  switch (state) {
    case ProvisionState::start: return "START";
    case ProvisionState::fingerprint: return "FINGERPRINT";
    case ProvisionState::cache_hit: return "CACHE_HIT";
    case ProvisionState::cache_miss: return "CACHE_MISS";
    case ProvisionState::restore: return "RESTORE";
    case ProvisionState::build: return "BUILD";
    case ProvisionState::pack: return "PACK";
    case ProvisionState::ready: return "READY";
    case ProvisionState::failed: return "FAILED";
  }
  return "UNKNOWN";
}

std::string ProvisionResult::to_json() const {
  std::ostringstream o;
  o << "{\"state\":\"" << to_string(state) << "\""
    << ",\"ok\":" << (ok() ? "true" : "false")
    << ",\"fingerprint\":\"" << fingerprint << "\""
    << ",\"spec_key\":\"" << jsonlite::escape(spec_key) << "\""
    << ",\"path\":\"" << path_taken << "\""
    << ",\"cache_hit\":" << (cache_hit ? "true" : "false")
    << ",\"commit_ok\":" << (commit_ok ? "true" : "false")
    << ",\"restore_fell_back\":" << (restore_fell_back ? "true" : "false");
  if (!environment.empty()) {
    o << ",\"environment\":{\"prefix\":\"" << jsonlite::escape(environment.prefix) << "\""
      << ",\"name\":\"" << jsonlite::escape(environment.name) << "\""
      << ",\"origin\":\"" << environment.origin << "\"}";
  }
  if (!error.ok()) o << ",\"error\":" << error.to_json();
  o << ",\"warnings\":[";
  for (size_t i = 0; i < warnings.size(); ++i) {
    if (i) o << ",";
    o << warnings[i].to_json();
  }
  o << "],\"transitions\":[";
  for (size_t i = 0; i < transitions.size(); ++i) {
    if (i) o << ",";
    o << "\"" << to_string(transitions[i]) << "\"";
  }
  o << "],\"timings_ns\":{\"fingerprint\":" << timings.fingerprint_ns
    << ",\"restore\":" << timings.restore_ns
    << ",\"build\":" << timings.build_ns
    << ",\"pack\":" << timings.pack_ns
    << ",\"total\":" << timings.total_ns << "}"
    << ",\"archive_bytes\":" << archive_bytes
    << "}";
  return o.str();
}

ProvisionerDeps make_default_deps(const ProvisionerConfig& config) {
  ProvisionerDeps d;
  d.hasher = std::make_shared<Blake3Hasher>();
  d.store = std::make_shared<LocalCacheStore>(config.cache_root);
  d.installer = std::make_shared<CommandInstaller>(config.installer);
  d.archiver = std::make_shared<EnvPackArchiver>();
  return d;
}

EnvironmentProvisioner::EnvironmentProvisioner(ProvisionerConfig config, ProvisionerDeps deps)
    : config_(std::move(config)), deps_(std::move(deps)) {
  if (!deps_.hasher) deps_.hasher = std::make_shared<Blake3Hasher>();
}

void EnvironmentProvisioner::enter(ProvisionResult& r, ProvisionState s) const {
  r.state = s;
  r.transitions.push_back(s);
  log_event(LogLevel::debug, "provision.state",
            {{"state", to_string(s)}, {"instance", config_.identity.instance_id()}});
}

void EnvironmentProvisioner::fail(ProvisionResult& r, ProvisionError e) const {
  r.error = std::move(e);
  r.environment = {};
  enter(r, ProvisionState::failed);
}

bool EnvironmentProvisioner::restore(ProvisionResult& r, const EnvironmentSpec& spec,
                                     const std::string& target) {
  enter(r, ProvisionState::restore);
  ProvisionError err;
  {
    ScopeTimer t(r.timings.restore_ns);
    FetchResult fr = deps_.store->fetch(r.fingerprint);
    if (fr.miss()) {
      // The record said this fingerprint is cached; an absent archive is a
      // broken entry, not a miss.
      err = make_error(ErrorCode::cache_read_error, "restore",
                       "record for " + r.spec_key + " names " + r.fingerprint +
                           " but the archive is missing: " + fr.error.detail);
    } else if (!fr.ok()) {
      err = fr.error;
    } else {
      r.archive_bytes = fr.blob.size();
      EnvironmentUnpacker unpacker(deps_.archiver);
      RestoreResult rr = unpacker.unpack(fr.blob, target, spec.name, r.fingerprint);
      if (rr.ok()) {
        r.environment = std::move(rr.environment);
      } else {
        err = std::move(rr.error);
      }
    }
  }
  if (err.ok()) {
    r.path_taken = "restore";
    return true;
  }

  log_event(LogLevel::error, "provision.restore_failed",
            {{"code", to_string(err.code)}, {"detail", err.detail},
             {"transient", err.transient ? "true" : "false"},
             {"policy", to_string(config_.restore_policy)}});
  if (config_.restore_policy == RestoreFailurePolicy::rebuild) {
    std::error_code ec;
    fs::remove_all(target, ec);
    r.warnings.push_back(std::move(err));
    r.restore_fell_back = true;
    return false;
  }
  fail(r, std::move(err));
  return false;
}

void EnvironmentProvisioner::build_and_pack(ProvisionResult& r, const EnvironmentSpec& spec,
                                            const std::string& target) {
  enter(r, ProvisionState::build);
  InstallContext ctx;
  ctx.scratch_dir = config_.scratch_dir;
  ctx.base_dir = config_.base_dir();
  ctx.prefix = target;
  ctx.spec_path = spec.path;
  ctx.name = spec.name;
  ctx.env = config_.base_env;

  BuildResult br;
  {
    ScopeTimer t(r.timings.build_ns);
    EnvironmentBuilder builder(deps_.installer);
    br = builder.build(spec, r.fingerprint, ctx);
  }
  if (!br.ok()) {
    log_event(LogLevel::error, "provision.build_failed",
              {{"code", to_string(br.error.code)}, {"detail", br.error.detail}});
    fail(r, std::move(br.error));
    return;
  }
  r.environment = std::move(br.environment);
  r.path_taken = "build";

  enter(r, ProvisionState::pack);
  ScopeTimer t(r.timings.pack_ns);
  EnvironmentPacker packer(deps_.archiver, deps_.store);
  PackResult pr = packer.pack(r.environment);
  if (!pr.ok()) {
    r.warnings.push_back(std::move(pr.error));
    return;
  }
  CommitResult cr = packer.commit(r.spec_key, r.fingerprint, pr.blob, config_.identity.instance_id());
  r.archive_bytes = cr.archive_bytes;
  if (!cr.ok()) {
    r.warnings.push_back(std::move(cr.error));
    return;
  }
  r.commit_ok = true;
}

void EnvironmentProvisioner::finish(ProvisionResult& r) const {
  ProvisionEvent ev;
  ev.instance_id = config_.identity.instance_id();
  ev.spec_key = r.spec_key;
  ev.fingerprint = r.fingerprint;
  ev.final_state = r.ok() ? "ready" : "failed";
  ev.path = r.path_taken;
  ev.cache_hit = r.cache_hit;
  ev.commit_ok = r.commit_ok;
  ev.restore_fell_back = r.restore_fell_back;
  ev.error_code = to_string(r.error.code);
  ev.total_ns = r.timings.total_ns;
  ev.fingerprint_ns = r.timings.fingerprint_ns;
  ev.restore_ns = r.timings.restore_ns;
  ev.build_ns = r.timings.build_ns;
  ev.pack_ns = r.timings.pack_ns;
  ev.archive_bytes = r.archive_bytes;
  emit_provision_event(ev);

  if (r.ok()) {
    log_event(LogLevel::info, "provision.ready",
              {{"path", r.path_taken}, {"prefix", r.environment.prefix},
               {"fingerprint", r.fingerprint},
               {"warnings", std::to_string(r.warnings.size())}});
  } else {
    log_event(LogLevel::error, "provision.failed",
              {{"code", to_string(r.error.code)}, {"stage", r.error.stage},
               {"detail", r.error.detail}});
  }
}

ProvisionResult EnvironmentProvisioner::run() {
  ProvisionResult r;
  const auto started = std::chrono::steady_clock::now();
  auto stamp_total = [&]() {
    r.timings.total_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - started).count());
  };

  enter(r, ProvisionState::start);

  const ConfigValidationResult cv = validate_config(config_);
  if (!cv.ok) {
    std::string detail;
    for (const auto& e : cv.errors) detail += (detail.empty() ? "" : "; ") + e;
    fail(r, make_error(ErrorCode::config_invalid, "start", detail));
    stamp_total();
    finish(r);
    return r;
  }
  if (!deps_.store || !deps_.installer || !deps_.archiver) {
    fail(r, make_error(ErrorCode::config_invalid, "start", "provisioner is missing a collaborator"));
    stamp_total();
    finish(r);
    return r;
  }

  enter(r, ProvisionState::fingerprint);
  FingerprintResult fp;
  {
    ScopeTimer t(r.timings.fingerprint_ns);
    SpecFingerprinter fingerprinter(deps_.hasher);
    fp = fingerprinter.fingerprint_file(config_.spec_path);
  }
  if (!fp.ok()) {
    fail(r, std::move(fp.error));
    stamp_total();
    finish(r);
    return r;
  }
  r.fingerprint = fp.fingerprint;
  r.spec_key = config_.spec_key.empty() ? fp.spec.name : config_.spec_key;
  if (!valid_spec_key(r.spec_key) || !valid_spec_key(fp.spec.name)) {
    fail(r, make_error(ErrorCode::spec_unavailable, "fingerprint",
                       "spec name '" + fp.spec.name + "' is not usable as a file name"));
    stamp_total();
    finish(r);
    return r;
  }
  const std::string target = (fs::path(config_.envs_dir()) / fp.spec.name).string();

  log_event(LogLevel::info, "provision.fingerprint",
            {{"spec", fp.spec.path}, {"spec_key", r.spec_key}, {"fingerprint", r.fingerprint}});

  if (deps_.store->has(r.spec_key, r.fingerprint)) {
    r.cache_hit = true;
    enter(r, ProvisionState::cache_hit);
    if (!restore(r, fp.spec, target) && r.state == ProvisionState::failed) {
      stamp_total();
      finish(r);
      return r;
    }
  } else {
    enter(r, ProvisionState::cache_miss);
  }

  if (r.path_taken.empty()) {
    build_and_pack(r, fp.spec, target);
    if (r.state == ProvisionState::failed) {
      stamp_total();
      finish(r);
      return r;
    }
  }

  EnvironmentPacker activator(deps_.archiver, deps_.store);
  const std::string act_err = activator.activate(r.environment, config_.workload_env);
  if (!act_err.empty()) {
    log_event(LogLevel::warn, "provision.activate_failed", {{"detail", act_err}});
  }

  enter(r, ProvisionState::ready);
  stamp_total();
  finish(r);
  return r;
}

}  // namespace envcache
