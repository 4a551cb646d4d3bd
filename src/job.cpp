#include "envcache/job.hpp"

#include <chrono>
#include <cstdio>

#include "envcache/hash.hpp"
#include "envcache/observability.hpp"
#include "envcache/process.hpp"
#include "envcache/spec.hpp"
#include "envcache/version.hpp"

namespace envcache {

std::string format_local_time(std::time_t t) {
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[64];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S%z", &tm) == 0) return {};
  return buf;
}

std::uint64_t count_lines(const std::string& data) {
  std::uint64_t n = 0;
  for (char c : data)
    if (c == '\n') ++n;
  return n;
}

JobProvenance make_job_provenance(const InstanceIdentity& id, const std::string& semver) {
  JobProvenance p;
  const std::time_t now = std::time(nullptr);
  p.unix_time = static_cast<std::uint64_t>(now);
  p.local_time = format_local_time(now);
  p.job_id = id.job_id;
  p.array_job_id = id.array_job_id;
  p.array_task_id = id.array_task_id;
  p.node_id = id.node_id;
  p.job_script = id.job_script;
  p.engine_semver = version::current_manifest(semver).semver;
  if (!id.job_script.empty()) {
    std::string script;
    if (read_file_bytes(id.job_script, &script)) {
      p.job_script_hash = blake3_hex(script);
      p.job_script_lines = count_lines(script);
    } else {
      log_event(LogLevel::warn, "job.script_unreadable", {{"path", id.job_script}});
    }
  }
  return p;
}

JobRunner::JobRunner(ProvisionerConfig config, std::ostream& out, std::ostream& err)
    : config_(std::move(config)), out_(out), err_(err) {}

JobProvenance JobRunner::begin() {
  JobProvenance p = make_job_provenance(config_.identity);
  if (!config_.identity.under_scheduler())
    log_event(LogLevel::info, "job.outside_scheduler", {{"job_id", p.job_id}});
  out_ << p.to_line() << std::endl;
  return p;
}

int JobRunner::run(const ProvisionResult& result, const std::vector<std::string>& workload_argv,
                   JobProvenance& prov) {
  prov.spec_key = result.spec_key;
  prov.fingerprint = result.fingerprint;
  prov.final_state = to_string(result.state);
  prov.path = result.path_taken;
  prov.error_code = to_string(result.error.code);

  AuditLog audit(config_.audit_log_path);
  auto record = [&](int exit_code) {
    prov.workload_exit_code = exit_code;
    if (!audit.append(prov)) {
      log_event(LogLevel::warn, "job.audit_failed", {{"path", config_.audit_log_path}});
    }
    return exit_code;
  };

  if (!result.ok()) {
    err_ << "envcache: environment provisioning failed at " << result.error.stage << ": "
         << to_string(result.error.code) << ": " << result.error.detail << std::endl;
    log_event(LogLevel::error, "job.aborted",
              {{"code", to_string(result.error.code)}, {"stage", result.error.stage}});
    prov.workload_exit_code = -1;
    if (!audit.append(prov)) {
      log_event(LogLevel::warn, "job.audit_failed", {{"path", config_.audit_log_path}});
    }
    return kExitProvisionFailed;
  }

  if (workload_argv.empty()) {
    log_event(LogLevel::info, "job.no_workload", {{"prefix", result.environment.prefix}});
    return record(0);
  }

  ProcessSpec ps;
  ps.command = workload_argv.front();
  ps.argv.assign(workload_argv.begin() + 1, workload_argv.end());
  ps.env = activation_env(result.environment, config_.base_env, config_.workload_env);
  ps.cwd = config_.workload_cwd.empty() ? config_.identity.submit_dir : config_.workload_cwd;
  ps.capture_output = false;
  ps.timeout_ms = 0;

  log_event(LogLevel::info, "job.workload_start",
            {{"command", ps.command}, {"cwd", ps.cwd}, {"prefix", result.environment.prefix}});
  out_.flush();
  err_.flush();

  ProcessResult pr = run_process(ps);
  prov.workload_wall_ns = pr.wall_ns;
  if (!pr.error_message.empty()) {
    err_ << "envcache: cannot start workload: " << pr.error_message << std::endl;
    log_event(LogLevel::error, "job.workload_spawn_failed",
              {{"code", to_string(ErrorCode::spawn_failed)}, {"detail", pr.error_message}});
    return record(pr.exit_code != 0 ? pr.exit_code : 127);
  }

  char real[64];
  std::snprintf(real, sizeof(real), "real %.2f",
                static_cast<double>(pr.wall_ns) / 1e9);
  err_ << real << std::endl;
  log_event(LogLevel::info, "job.workload_done",
            {{"exit_code", std::to_string(pr.exit_code)},
             {"wall_ns", std::to_string(pr.wall_ns)}});
  out_ << "Job completed" << std::endl;
  return record(pr.exit_code);
}

}  // namespace envcache
