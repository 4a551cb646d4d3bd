#pragma once

// envcache/builder.hpp: Fresh environment build on a cache miss.
//
// The build has two steps, both delegated to an IInstaller:
//   1. install_base_runtime   download + silent install of the base runtime,
//                             then the solver bootstrap.
//   2. install_environment    resolve and install the spec into the prefix.
//
// Every failure is fatal for the instance and nothing is retried. The target
// prefix is removed on failure so no half-installed environment survives.

#include <map>
#include <memory>
#include <string>

#include "envcache/types.hpp"

namespace envcache {

struct InstallContext {
  std::string scratch_dir;  // instance-local working directory
  std::string base_dir;     // base runtime install location
  std::string prefix;       // environment target prefix
  std::string spec_path;
  std::string name;
  std::map<std::string, std::string> env;  // environment for installer commands
};

// ---------------------------------------------------------------------------
// IInstaller: package-installer capability
// ---------------------------------------------------------------------------
class IInstaller {
 public:
  virtual ~IInstaller() = default;

  // download_failed or install_failed.
  virtual ProvisionError install_base_runtime(const InstallContext& ctx) = 0;

  // dependency_resolution_failed or install_failed.
  virtual ProvisionError install_environment(const EnvironmentSpec& spec,
                                             const InstallContext& ctx) = 0;
};

// Shell command templates. Placeholders: {scratch} {base} {prefix} {spec}
// {name}, substituted shell-quoted. An empty template skips its step.
struct InstallerConfig {
  std::string download_command{
      "wget -q -O {scratch}/miniconda.sh "
      "https://repo.anaconda.com/miniconda/Miniconda3-latest-Linux-x86_64.sh"};
  std::string install_command{"bash {scratch}/miniconda.sh -b -p {base}"};
  std::string bootstrap_command{"{base}/bin/conda install -y -n base mamba -c conda-forge"};
  std::string create_command{"{base}/bin/mamba env create --yes --file {spec} --prefix {prefix}"};
  bool reuse_existing_base{true};  // skip download/install when {base}/bin exists
};

class CommandInstaller : public IInstaller {
 public:
  explicit CommandInstaller(InstallerConfig config = {});

  ProvisionError install_base_runtime(const InstallContext& ctx) override;
  ProvisionError install_environment(const EnvironmentSpec& spec,
                                     const InstallContext& ctx) override;

  const InstallerConfig& config() const { return config_; }

 private:
  InstallerConfig config_;
};

std::string shell_quote(const std::string& s);
std::string expand_command_template(const std::string& tpl, const InstallContext& ctx);

// dependency_resolution_failed when the installer output names a solver
// failure, install_failed otherwise.
ErrorCode classify_install_failure(const std::string& output);

struct BuildResult {
  MaterializedEnvironment environment;
  ProvisionError error;

  bool ok() const { return error.ok(); }
};

class EnvironmentBuilder {
 public:
  explicit EnvironmentBuilder(std::shared_ptr<IInstaller> installer);

  // Build `spec` into ctx.prefix. Any previous content of the prefix is
  // removed first.
  BuildResult build(const EnvironmentSpec& spec, const std::string& fingerprint,
                    const InstallContext& ctx);

 private:
  std::shared_ptr<IInstaller> installer_;
};

}  // namespace envcache
