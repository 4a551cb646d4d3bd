#include "envcache/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>

extern char** environ;

namespace envcache {

namespace {

// Keep the last `limit` bytes: install failures print the useful part of
// their diagnostics at the end.
void append_tail(std::string& dst, const char* src, ssize_t n,
                 std::size_t limit, bool& truncated) {
  if (n <= 0)
    return;
  dst.append(src, static_cast<std::size_t>(n));
  if (dst.size() > limit) {
    dst.erase(0, dst.size() - limit);
    truncated = true;
  }
}

bool is_executable_file(const std::string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0)
    return false;
  return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

}  // namespace

std::string resolve_executable(const std::string& command, const std::string& path_value) {
  if (command.empty())
    return {};
  if (command.find('/') != std::string::npos)
    return command;
  size_t start = 0;
  while (start <= path_value.size()) {
    size_t end = path_value.find(':', start);
    if (end == std::string::npos)
      end = path_value.size();
    std::string dir = path_value.substr(start, end - start);
    if (dir.empty())
      dir = ".";
    const std::string candidate = dir + "/" + command;
    if (is_executable_file(candidate))
      return candidate;
    start = end + 1;
  }
  return {};
}

std::map<std::string, std::string> current_environment() {
  std::map<std::string, std::string> out;
  for (char** e = environ; e && *e; ++e) {
    const std::string kv(*e);
    const auto eq = kv.find('=');
    if (eq == std::string::npos || eq == 0)
      continue;
    out[kv.substr(0, eq)] = kv.substr(eq + 1);
  }
  return out;
}

ProcessSpec shell_process(const std::string& command_line,
                          const std::map<std::string, std::string>& env,
                          const std::string& cwd) {
  ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", command_line};
  spec.env = env;
  spec.cwd = cwd;
  return spec;
}

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  const auto started = std::chrono::steady_clock::now();

  auto path_it = spec.env.find("PATH");
  const std::string exe = resolve_executable(
      spec.command, path_it != spec.env.end() ? path_it->second : std::string("/usr/bin:/bin"));
  if (exe.empty()) {
    result.error_message = "command not found: " + spec.command;
    result.exit_code = 127;
    return result;
  }

  // Build argv/envp before fork: only async-signal-safe calls in the child.
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all)
    argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  envs.reserve(spec.env.size());
  for (const auto& [k, v] : spec.env)
    envs.push_back(k + "=" + v);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs)
    envp.push_back(e.data());
  envp.push_back(nullptr);

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (spec.capture_output) {
    if (pipe(out_pipe) != 0) {
      result.error_message = std::string("pipe failed: ") + std::strerror(errno);
      return result;
    }
    if (pipe(err_pipe) != 0) {
      result.error_message = std::string("pipe failed: ") + std::strerror(errno);
      close(out_pipe[0]);
      close(out_pipe[1]);
      return result;
    }
  }

  pid_t pid = fork();
  if (pid < 0) {
    result.error_message = std::string("fork failed: ") + std::strerror(errno);
    if (spec.capture_output) {
      close(out_pipe[0]); close(out_pipe[1]);
      close(err_pipe[0]); close(err_pipe[1]);
    }
    return result;
  }

  if (pid == 0) {
    setpgid(0, 0);
    if (spec.capture_output) {
      dup2(out_pipe[1], STDOUT_FILENO);
      dup2(err_pipe[1], STDERR_FILENO);
      close(out_pipe[0]);
      close(out_pipe[1]);
      close(err_pipe[0]);
      close(err_pipe[1]);
    }
    if (!spec.cwd.empty()) {
      if (chdir(spec.cwd.c_str()) != 0)
        _exit(126);
    }
    execve(exe.c_str(), argv.data(), envp.data());
    _exit(127);
  }

  const bool has_deadline = spec.timeout_ms > 0;
  const auto deadline = started + std::chrono::milliseconds(spec.timeout_ms);
  int status = 0;

  if (spec.capture_output) {
    close(out_pipe[1]);
    close(err_pipe[1]);
    struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    int open_fds = 2;
    char buf[4096];
    while (open_fds > 0) {
      int wait_ms = -1;
      if (has_deadline) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) {
          kill(-pid, SIGKILL);
          kill(pid, SIGKILL);
          result.timed_out = true;
          break;
        }
        wait_ms = static_cast<int>(left);
      }
      const int rc = poll(fds, 2, wait_ms);
      if (rc < 0) {
        if (errno == EINTR)
          continue;
        break;
      }
      for (int k = 0; k < 2; ++k) {
        if (fds[k].fd < 0 || (fds[k].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
          continue;
        const ssize_t n = read(fds[k].fd, buf, sizeof(buf));
        if (n <= 0) {
          close(fds[k].fd);
          fds[k].fd = -1;
          --open_fds;
          continue;
        }
        if (k == 0)
          append_tail(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
        else
          append_tail(result.stderr_text, buf, n, spec.max_output_bytes, result.stderr_truncated);
      }
    }
    for (auto& f : fds) {
      if (f.fd >= 0)
        close(f.fd);
    }
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
  } else {
    while (true) {
      const pid_t w = waitpid(pid, &status, has_deadline ? WNOHANG : 0);
      if (w == pid)
        break;
      if (w < 0 && errno != EINTR)
        break;
      if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        result.timed_out = true;
        break;
      }
      if (has_deadline)
        usleep(2000);
    }
  }

  result.wall_ns = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - started).count());

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

}  // namespace envcache
