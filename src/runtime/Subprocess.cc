#include "runtime/Subprocess.hh"

#include <cerrno>
#include <ctime>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "runtime/Cancellation.hh"
#include "util/Environment.hh"
#include "util/constants.hh"
#include "util/log.hh"
#include "util/wrappers.hh"

using std::string;
using std::vector;

namespace {
  /// Split captured output into lines. A trailing partial line is kept.
  vector<string> split_lines(const string& output) {
    vector<string> lines;
    size_t start = 0;
    while (start < output.size()) {
      size_t end = output.find('\n', start);
      if (end == string::npos) {
        lines.push_back(output.substr(start));
        break;
      }
      lines.push_back(output.substr(start, end - start));
      start = end + 1;
    }
    return lines;
  }

  /// Convert a wait status to the exit status convention used for step results
  int decode_status(int wstatus) {
    if (WIFEXITED(wstatus)) return WEXITSTATUS(wstatus);
    if (WIFSIGNALED(wstatus)) return 128 + WTERMSIG(wstatus);
    return 1;
  }
}

StepResult run_log(const string& command, const Environment& env, const fs::path& cwd) noexcept {
  StepResult result;

  LOG(exec) << (cwd.empty() ? "" : "(cd " + cwd.string() + ") ") << command;

  int pipe_fds[2];
  if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
    WARN << "Failed to create output pipe for `" << command << "`: " << ERR;
    result.status = 1;
    result.log.push_back("failed to create output pipe: " + string(ERR));
    return result;
  }

  // Build argv and envp before forking
  auto env_entries = env.entries();
  vector<char*> envp;
  for (auto& e : env_entries) envp.push_back(e.data());
  envp.push_back(nullptr);

  string shell = "/bin/sh";
  string dash_c = "-c";
  string cmd = command;
  char* argv[] = {shell.data(), dash_c.data(), cmd.data(), nullptr};

  pid_t child = fork();
  if (child == -1) {
    WARN << "Failed to fork for `" << command << "`: " << ERR;
    ::close(pipe_fds[0]);
    ::close(pipe_fds[1]);
    result.status = 1;
    result.log.push_back("failed to fork: " + string(ERR));
    return result;
  }

  if (child == 0) {
    // Running in the child. Give the command its own process group so cancellation reaches every
    // process it starts.
    ::setpgid(0, 0);

    // Signal dispositions set to handlers reset on exec, but ignored signals stay ignored
    signal(SIGPIPE, SIG_DFL);

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(pipe_fds[1], STDOUT_FILENO);
    ::dup2(pipe_fds[1], STDERR_FILENO);

    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      string msg = "cannot change directory to " + cwd.string() + ": " + ERR + "\n";
      ssize_t rc = ::write(STDERR_FILENO, msg.data(), msg.size());
      (void)rc;
      _exit(127);
    }

    ::execve(argv[0], argv, envp.data());

    // This is unreachable, unless execve fails
    _exit(127);
  }

  // Running in the parent. Set the group here too so there is no window where signals miss it.
  ::setpgid(child, child);
  ::close(pipe_fds[1]);

  string output;
  char buffer[4096];
  bool terminated = false;
  std::time_t terminated_at = 0;
  bool killed = false;

  while (true) {
    if (cancellation::requested() && !terminated) {
      LOGF(exec, "Cancelling `{}` on {}", command, getSignalName(cancellation::signal()));
      ::kill(-child, SIGTERM);
      terminated = true;
      terminated_at = std::time(nullptr);
    }

    if (terminated && !killed &&
        std::time(nullptr) - terminated_at >= constants::KillGraceSeconds) {
      ::kill(-child, SIGKILL);
      killed = true;
    }

    struct pollfd pfd = {pipe_fds[0], POLLIN, 0};
    int rc = ::poll(&pfd, 1, 1000);
    if (rc == -1) {
      if (errno == EINTR) continue;
      break;
    }
    if (rc == 0) continue;

    ssize_t n = ::read(pipe_fds[0], buffer, sizeof(buffer));
    if (n > 0) {
      output.append(buffer, n);
    } else if (n == 0) {
      break;
    } else if (errno != EINTR) {
      break;
    }
  }
  ::close(pipe_fds[0]);

  // The output pipe is closed, but the child may not have exited yet. Keep forwarding
  // cancellation and escalating to SIGKILL while it runs on.
  int wstatus = 0;
  bool reaped = false;
  while (true) {
    pid_t rc = ::waitpid(child, &wstatus, WNOHANG);
    if (rc == child) {
      reaped = true;
      break;
    }
    if (rc == -1 && errno != EINTR) {
      WARN << "Failed to wait for `" << command << "`: " << ERR;
      break;
    }

    if (cancellation::requested() && !terminated) {
      LOGF(exec, "Cancelling `{}` on {}", command, getSignalName(cancellation::signal()));
      ::kill(-child, SIGTERM);
      terminated = true;
      terminated_at = std::time(nullptr);
    }

    if (terminated && !killed &&
        std::time(nullptr) - terminated_at >= constants::KillGraceSeconds) {
      ::kill(-child, SIGKILL);
      killed = true;
    }

    struct timespec interval = {0, 50 * 1000 * 1000};
    ::nanosleep(&interval, nullptr);
  }

  result.status = reaped ? decode_status(wstatus) : 1;
  result.log = split_lines(output);
  return result;
}

int run_quiet(const string& command, const Environment& env, const fs::path& cwd) noexcept {
  return run_log(command, env, cwd).status;
}
