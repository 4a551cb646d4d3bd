#include "envcache/worker.hpp"

#include <unistd.h>  // getpid, gethostname

namespace envcache {

namespace {

std::string env_or(const std::map<std::string, std::string>& env, const char* key,
                   const std::string& def = "") {
  auto it = env.find(key);
  return (it != env.end() && !it->second.empty()) ? it->second : def;
}

}  // namespace

std::string local_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0]) return buf;
  return "unknown-host";
}

std::string InstanceIdentity::instance_id() const {
  std::string out = array_job_id.empty() ? job_id : array_job_id;
  if (!array_task_id.empty()) out += "_" + array_task_id;
  out += "@" + node_id;
  return out;
}

bool InstanceIdentity::under_scheduler() const {
  return job_id.rfind("local-", 0) != 0;
}

InstanceIdentity resolve_instance_identity(const std::map<std::string, std::string>& env,
                                           InstanceIdentity id) {
  if (id.job_id.empty())
    id.job_id = env_or(env, "SLURM_JOB_ID", "local-" + std::to_string(static_cast<long>(::getpid())));
  if (id.array_job_id.empty()) id.array_job_id = env_or(env, "SLURM_ARRAY_JOB_ID");
  if (id.array_task_id.empty()) id.array_task_id = env_or(env, "SLURM_ARRAY_TASK_ID");
  if (id.node_id.empty()) id.node_id = env_or(env, "SLURMD_NODENAME", local_hostname());
  if (id.submit_dir.empty()) id.submit_dir = env_or(env, "SLURM_SUBMIT_DIR");
  if (id.user.empty()) id.user = env_or(env, "USER", env_or(env, "LOGNAME", "nobody"));
  return id;
}

}  // namespace envcache
