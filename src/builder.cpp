#include "envcache/builder.hpp"

#include <filesystem>

#include "envcache/observability.hpp"
#include "envcache/process.hpp"

namespace fs = std::filesystem;

namespace envcache {

namespace {

// Solver messages from conda, mamba and libsolv.
constexpr const char* kSolverMarkers[] = {
    "ResolvePackageNotFound",
    "PackagesNotFoundError",
    "UnsatisfiableError",
    "conflicts",
    "Could not solve",
    "nothing provides",
};

std::string tail_of(const ProcessResult& pr) {
  std::string out = pr.stderr_text.empty() ? pr.stdout_text : pr.stderr_text;
  if (!pr.error_message.empty())
    out = pr.error_message;
  constexpr size_t kMax = 2048;
  if (out.size() > kMax)
    out.erase(0, out.size() - kMax);
  return out;
}

ProcessResult run_step(const std::string& step, const std::string& command_line,
                       const InstallContext& ctx) {
  log_event(LogLevel::info, "build.step", {{"step", step}, {"command", command_line}});
  ProcessSpec ps = shell_process(command_line, ctx.env, ctx.scratch_dir);
  ProcessResult pr = run_process(ps);
  if (!pr.ok()) {
    log_event(LogLevel::error, "build.step_failed",
              {{"step", step}, {"exit_code", std::to_string(pr.exit_code)},
               {"output", tail_of(pr)}});
  }
  return pr;
}

std::string describe(const std::string& step, const ProcessResult& pr) {
  return step + " exited with " + std::to_string(pr.exit_code) + ": " + tail_of(pr);
}

}  // namespace

std::string shell_quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += "'";
  return out;
}

std::string expand_command_template(const std::string& tpl, const InstallContext& ctx) {
  const std::pair<const char*, const std::string*> vars[] = {
      {"{scratch}", &ctx.scratch_dir}, {"{base}", &ctx.base_dir},
      {"{prefix}", &ctx.prefix},       {"{spec}", &ctx.spec_path},
      {"{name}", &ctx.name},
  };
  std::string out;
  out.reserve(tpl.size() + 64);
  size_t i = 0;
  while (i < tpl.size()) {
    bool matched = false;
    if (tpl[i] == '{') {
      for (const auto& [key, value] : vars) {
        const size_t len = std::char_traits<char>::length(key);
        if (tpl.compare(i, len, key) == 0) {
          out += shell_quote(*value);
          i += len;
          matched = true;
          break;
        }
      }
    }
    if (!matched)
      out += tpl[i++];
  }
  return out;
}

ErrorCode classify_install_failure(const std::string& output) {
  for (const char* marker : kSolverMarkers) {
    if (output.find(marker) != std::string::npos)
      return ErrorCode::dependency_resolution_failed;
  }
  return ErrorCode::install_failed;
}

// ---------------------------------------------------------------------------
// CommandInstaller
// ---------------------------------------------------------------------------

CommandInstaller::CommandInstaller(InstallerConfig config) : config_(std::move(config)) {}

ProvisionError CommandInstaller::install_base_runtime(const InstallContext& ctx) {
  std::error_code ec;
  const bool have_base = fs::is_directory(fs::path(ctx.base_dir) / "bin", ec);
  if (!(config_.reuse_existing_base && have_base)) {
    if (!config_.download_command.empty()) {
      const auto pr = run_step("download", expand_command_template(config_.download_command, ctx), ctx);
      if (!pr.ok())
        return make_error(ErrorCode::download_failed, "build", describe("download", pr));
    }
    if (!config_.install_command.empty()) {
      const auto pr = run_step("install_base", expand_command_template(config_.install_command, ctx), ctx);
      if (!pr.ok())
        return make_error(ErrorCode::install_failed, "build", describe("install_base", pr));
    }
  } else {
    log_event(LogLevel::info, "build.base_reused", {{"base", ctx.base_dir}});
  }
  if (!config_.bootstrap_command.empty()) {
    const auto pr = run_step("bootstrap", expand_command_template(config_.bootstrap_command, ctx), ctx);
    if (!pr.ok())
      return make_error(ErrorCode::install_failed, "build", describe("bootstrap", pr));
  }
  return {};
}

ProvisionError CommandInstaller::install_environment(const EnvironmentSpec& /*spec*/,
                                                     const InstallContext& ctx) {
  if (config_.create_command.empty())
    return make_error(ErrorCode::install_failed, "build", "no environment create command configured");
  const auto pr = run_step("create", expand_command_template(config_.create_command, ctx), ctx);
  if (pr.ok())
    return {};
  const ErrorCode code = pr.error_message.empty()
      ? classify_install_failure(pr.stdout_text + "\n" + pr.stderr_text)
      : ErrorCode::install_failed;
  return make_error(code, "build", describe("create", pr));
}

// ---------------------------------------------------------------------------
// EnvironmentBuilder
// ---------------------------------------------------------------------------

EnvironmentBuilder::EnvironmentBuilder(std::shared_ptr<IInstaller> installer)
    : installer_(std::move(installer)) {}

BuildResult EnvironmentBuilder::build(const EnvironmentSpec& spec, const std::string& fingerprint,
                                      const InstallContext& ctx) {
  BuildResult r;
  std::error_code ec;

  auto discard_prefix = [&]() {
    std::error_code rm_ec;
    fs::remove_all(ctx.prefix, rm_ec);
    if (rm_ec) {
      log_event(LogLevel::warn, "build.cleanup_failed",
                {{"prefix", ctx.prefix}, {"detail", rm_ec.message()}});
    }
  };

  fs::create_directories(ctx.scratch_dir, ec);
  if (ec) {
    r.error = make_error(ErrorCode::install_failed, "build", ctx.scratch_dir + ": " + ec.message());
    return r;
  }
  fs::remove_all(ctx.prefix, ec);
  if (ec) {
    r.error = make_error(ErrorCode::install_failed, "build", ctx.prefix + ": " + ec.message());
    return r;
  }
  fs::create_directories(fs::path(ctx.prefix).parent_path(), ec);

  ProvisionError err = installer_->install_base_runtime(ctx);
  if (!err.ok()) {
    discard_prefix();
    r.error = std::move(err);
    return r;
  }
  err = installer_->install_environment(spec, ctx);
  if (!err.ok()) {
    discard_prefix();
    r.error = std::move(err);
    return r;
  }
  if (!fs::is_directory(ctx.prefix, ec)) {
    discard_prefix();
    r.error = make_error(ErrorCode::install_failed, "build",
                         ctx.prefix + ": installer reported success but prefix is missing");
    return r;
  }

  r.environment.prefix = ctx.prefix;
  r.environment.name = spec.name;
  r.environment.fingerprint = fingerprint;
  r.environment.origin = "built";
  return r;
}

}  // namespace envcache
