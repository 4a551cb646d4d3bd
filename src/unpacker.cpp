#include "envcache/unpacker.hpp"

#include <filesystem>

#include "envcache/observability.hpp"

namespace fs = std::filesystem;

namespace envcache {

EnvironmentUnpacker::EnvironmentUnpacker(std::shared_ptr<IArchiver> archiver)
    : archiver_(std::move(archiver)) {}

RestoreResult EnvironmentUnpacker::unpack(const std::string& blob, const std::string& target_dir,
                                          const std::string& name,
                                          const std::string& fingerprint) const {
  RestoreResult r;
  std::error_code ec;

  auto discard = [&]() {
    std::error_code rm_ec;
    fs::remove_all(target_dir, rm_ec);
    if (rm_ec) {
      log_event(LogLevel::warn, "restore.cleanup_failed",
                {{"target", target_dir}, {"detail", rm_ec.message()}});
    }
  };

  fs::remove_all(target_dir, ec);
  if (ec) {
    r.error = make_error(ErrorCode::unpack_failed, "restore", target_dir + ": " + ec.message());
    return r;
  }

  UnpackResult ur = archiver_->unpack(blob, target_dir);
  if (!ur.ok()) {
    discard();
    r.error = std::move(ur.error);
    r.error.stage = "restore";
    return r;
  }

  std::string target = fs::path(target_dir).lexically_normal().string();
  while (target.size() > 1 && target.back() == '/')
    target.pop_back();

  r.relocation = relocate_prefix(target, ur.build_prefix, target);
  if (!r.relocation.ok()) {
    discard();
    r.error = r.relocation.error;
    return r;
  }
  log_event(LogLevel::debug, "restore.relocated",
            {{"from", ur.build_prefix}, {"to", target},
             {"text_files", std::to_string(r.relocation.text_files)},
             {"binary_files", std::to_string(r.relocation.binary_files)},
             {"symlinks", std::to_string(r.relocation.symlinks)}});

  r.environment.prefix = target;
  r.environment.name = name;
  r.environment.fingerprint = fingerprint;
  r.environment.origin = "restored";
  return r;
}

}  // namespace envcache
