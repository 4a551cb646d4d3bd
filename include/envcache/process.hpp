#pragma once

// envcache/process.hpp: POSIX child-process execution.
//
// Installer commands and the workload both run through run_process(). The
// provisioning core has no timeout authority of its own (the scheduler's
// wall-clock limit is the only one), so timeout_ms defaults to 0 = unlimited.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace envcache {

struct ProcessSpec {
  std::string command;                     // absolute path, or a name looked up on env PATH
  std::vector<std::string> argv;           // arguments after argv[0]
  std::map<std::string, std::string> env;  // full child environment
  std::string cwd;
  std::uint64_t timeout_ms{0};             // 0 = no timeout
  bool capture_output{true};               // false = inherit the parent's stdout/stderr
  std::size_t max_output_bytes{64 * 1024}; // tail kept per stream when capturing
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;  // non-empty when the child could not be started
  std::uint64_t wall_ns{0};

  bool ok() const { return error_message.empty() && !timed_out && exit_code == 0; }
};

ProcessResult run_process(const ProcessSpec& spec);

// Convenience: /bin/sh -c <command_line>.
ProcessSpec shell_process(const std::string& command_line,
                          const std::map<std::string, std::string>& env,
                          const std::string& cwd = "");

// Resolve a bare command name against a PATH value. Names containing '/'
// are returned unchanged. Returns "" when nothing executable is found.
std::string resolve_executable(const std::string& command, const std::string& path_value);

// Snapshot of the current process environment.
std::map<std::string, std::string> current_environment();

}  // namespace envcache
