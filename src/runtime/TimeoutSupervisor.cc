#include "runtime/TimeoutSupervisor.hh"

#include <cerrno>
#include <csignal>
#include <ctime>

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "util/log.hh"

namespace {
  /// Sleep for the full interval, even if signals interrupt the sleep
  void sleep_fully(unsigned seconds) noexcept {
    struct timespec remaining = {static_cast<time_t>(seconds), 0};
    while (::nanosleep(&remaining, &remaining) == -1 && errno == EINTR) {
    }
  }

  void silent_terminate(int) { _exit(0); }

  /// Fork a watchdog child. In the child, `prepare` sets the signal dispositions, the child sleeps
  /// until the deadline, then `expire` runs. The parent gets a handle.
  template <class Prepare, class Expire>
  TimeoutHandle spawn(unsigned seconds, Prepare prepare, Expire expire) noexcept {
    std::time_t deadline = std::time(nullptr) + seconds;

    // A disarm that arrives before the child has its own dispositions stays pending until then
    sigset_t blocked, saved;
    sigemptyset(&blocked);
    for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGQUIT}) sigaddset(&blocked, sig);
    sigprocmask(SIG_BLOCK, &blocked, &saved);

    pid_t pid = fork();
    if (pid == -1) {
      WARN << "Failed to start watchdog: " << ERR;
      sigprocmask(SIG_SETMASK, &saved, nullptr);
      return TimeoutHandle();
    }

    if (pid == 0) {
      // Running in the watchdog. Never return into the caller's code, and never run its exit
      // handlers.
      prepare();
      sigprocmask(SIG_UNBLOCK, &blocked, nullptr);
      sleep_fully(seconds);
      expire();
      _exit(0);
    }

    sigprocmask(SIG_SETMASK, &saved, nullptr);

    LOGF(watchdog, "Armed watchdog {} for {} seconds", pid, seconds);
    return TimeoutHandle(pid, deadline);
  }
}

TimeoutHandle& TimeoutHandle::operator=(TimeoutHandle&& other) noexcept {
  if (this != &other) {
    disarm();
    _pid = other._pid;
    _deadline = other._deadline;
    other._pid = -1;
  }
  return *this;
}

void TimeoutHandle::disarm() noexcept {
  if (_pid <= 0) return;

  // Don't kill me, I finished in time. Reap the watchdog so it cannot linger as a zombie.
  if (::kill(_pid, SIGTERM) == 0 || errno == ESRCH) {
    int status;
    while (::waitpid(_pid, &status, 0) == -1 && errno == EINTR) {
    }
  }

  LOGF(watchdog, "Disarmed watchdog {}", _pid);
  _pid = -1;
}

namespace TimeoutSupervisor {
  TimeoutHandle armGroupTimeout(unsigned seconds) noexcept {
    pid_t group = getpgrp();

    return spawn(
        seconds,
        [] {
          // Default handling so the watchdog itself can be cancelled
          for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGQUIT}) {
            std::signal(sig, SIG_DFL);
          }
        },
        [group] {
          // The watchdog is in the group too; it is exiting anyway
          std::signal(SIGTERM, SIG_IGN);
          if (::kill(-group, SIGTERM) != 0) {
            WARN << "Checkout timeout kill failed: " << ERR;
          }
        });
  }

  TimeoutHandle armWaitTimeout(unsigned seconds, pid_t target) noexcept {
    return spawn(
        seconds,
        [] {
          for (int sig : {SIGINT, SIGHUP, SIGQUIT}) {
            std::signal(sig, SIG_DFL);
          }

          // Being terminated before the deadline is the normal case
          std::signal(SIGTERM, silent_terminate);
        },
        [target] { ::kill(target, SIGTERM); });
  }
}
