#pragma once

// envcache/job.hpp: Job instance entry point: provenance and workload exec.
//
// A job instance runs begin() (provenance line), provisions, then run(). On
// FAILED the workload is never started and the instance exits with
// kExitProvisionFailed. On READY the workload replaces nothing: it runs as a
// child with the activation environment and inherited stdio, and its exit
// code becomes the instance's exit code.

#include <cstdint>
#include <ctime>
#include <ostream>
#include <string>
#include <vector>

#include "envcache/audit.hpp"
#include "envcache/config.hpp"
#include "envcache/provisioner.hpp"

namespace envcache {

constexpr int kExitProvisionFailed = 3;

std::string format_local_time(std::time_t t);
std::uint64_t count_lines(const std::string& data);

// Job metadata for the identity: times, scheduler ids, job script digest.
JobProvenance make_job_provenance(const InstanceIdentity& id, const std::string& semver = "");

class JobRunner {
 public:
  JobRunner(ProvisionerConfig config, std::ostream& out, std::ostream& err);

  // Build and print the provenance line.
  JobProvenance begin();

  // Run the workload if `result` is READY. Fills the outcome fields of
  // `prov` and appends it to the audit log when one is configured.
  int run(const ProvisionResult& result, const std::vector<std::string>& workload_argv,
          JobProvenance& prov);

 private:
  ProvisionerConfig config_;
  std::ostream& out_;
  std::ostream& err_;
};

}  // namespace envcache
