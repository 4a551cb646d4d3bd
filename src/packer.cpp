#include "envcache/packer.hpp"

#include <filesystem>
#include <fstream>

#include "envcache/builder.hpp"
#include "envcache/hash.hpp"
#include "envcache/observability.hpp"
#include "envcache/version.hpp"

namespace fs = std::filesystem;

namespace envcache {

std::string activation_script_path(const std::string& prefix) {
  return (fs::path(prefix) / "etc" / "envcache" / "activate.sh").string();
}

EnvironmentPacker::EnvironmentPacker(std::shared_ptr<IArchiver> archiver,
                                     std::shared_ptr<ICacheStore> store)
    : archiver_(std::move(archiver)), store_(std::move(store)) {}

PackResult EnvironmentPacker::pack(const MaterializedEnvironment& env) const {
  PackResult r = archiver_->pack(env.prefix);
  if (!r.ok()) {
    log_event(LogLevel::warn, "pack.failed",
              {{"prefix", env.prefix}, {"detail", r.error.detail}});
  }
  return r;
}

CommitResult EnvironmentPacker::commit(const std::string& spec_key, const std::string& fingerprint,
                                       const std::string& blob, const std::string& writer_instance) {
  CommitResult r;
  r.archive_hash = archive_content_hash(blob);
  r.archive_bytes = blob.size();

  r.error = store_->put(fingerprint, blob);
  if (r.error.ok()) {
    CacheRecord rec;
    rec.spec_key = spec_key;
    rec.fingerprint = fingerprint;
    rec.archive_hash = r.archive_hash;
    rec.archive_size = blob.size();
    rec.writer_instance = writer_instance;
    rec.created_at_unix_ts = unix_now_seconds();
    rec.record_format = version::RECORD_FORMAT_VERSION;
    rec.hash_algorithm = version::HASH_ALGORITHM_VERSION;
    r.error = store_->publish_record(rec);
  }

  if (!r.error.ok()) {
    r.error.code = ErrorCode::cache_commit_failed;
    r.error.stage = "pack";
    log_event(LogLevel::warn, "cache.commit_failed",
              {{"spec_key", spec_key}, {"fingerprint", fingerprint},
               {"backend", store_->backend_id()}, {"detail", r.error.detail}});
    return r;
  }
  log_event(LogLevel::info, "cache.committed",
            {{"spec_key", spec_key}, {"fingerprint", fingerprint},
             {"bytes", std::to_string(r.archive_bytes)}});
  return r;
}

std::string EnvironmentPacker::activate(const MaterializedEnvironment& env,
                                        const std::map<std::string, std::string>& extra_env) const {
  const fs::path script(activation_script_path(env.prefix));
  std::error_code ec;
  fs::create_directories(script.parent_path(), ec);
  if (ec)
    return script.parent_path().string() + ": " + ec.message();

  std::ofstream ofs(script, std::ios::trunc);
  if (!ofs)
    return script.string() + ": cannot open";
  ofs << "# generated by envcache; source this file to enter the environment\n";
  ofs << "export PATH=" << shell_quote(env.prefix + "/bin") << ":\"$PATH\"\n";
  ofs << "export CONDA_PREFIX=" << shell_quote(env.prefix) << "\n";
  ofs << "export CONDA_DEFAULT_ENV=" << shell_quote(env.name) << "\n";
  ofs << "export ENVCACHE_FINGERPRINT=" << shell_quote(env.fingerprint) << "\n";
  for (const auto& [k, v] : extra_env)
    ofs << "export " << k << "=" << shell_quote(v) << "\n";
  ofs.close();
  if (!ofs)
    return script.string() + ": write failed";
  return {};
}

}  // namespace envcache
