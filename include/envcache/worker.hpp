#pragma once

// envcache/worker.hpp: Identity of one job instance.
//
// Populated once per process from explicit values, else from the batch
// scheduler's environment:
//
//   job_id          SLURM_JOB_ID
//   array_job_id    SLURM_ARRAY_JOB_ID
//   array_task_id   SLURM_ARRAY_TASK_ID
//   node_id         SLURMD_NODENAME, else gethostname()
//   submit_dir      SLURM_SUBMIT_DIR
//
// Outside the scheduler job_id falls back to "local-<pid>", so two interactive
// runs on one node never share a scratch directory.

#include <map>
#include <string>

namespace envcache {

struct InstanceIdentity {
  std::string job_id;
  std::string array_job_id;
  std::string array_task_id;
  std::string node_id;
  std::string submit_dir;
  std::string job_script;  // path of the batch script, if known
  std::string user;

  // "<job>[_<task>]@<node>", used as writer_instance in cache records.
  std::string instance_id() const;
  bool under_scheduler() const;
};

// Fill every empty field of `overrides` from `env`.
InstanceIdentity resolve_instance_identity(const std::map<std::string, std::string>& env,
                                           InstanceIdentity overrides = {});

std::string local_hostname();

}  // namespace envcache
