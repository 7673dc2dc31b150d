#pragma once

#include <ctime>

#include <sys/types.h>

/**
 * A watchdog is a forked child process whose only job is to deliver a termination signal once a
 * deadline passes. The handle owns the child: disarming it (explicitly or on destruction)
 * terminates and reaps the watchdog, so a stale watchdog can never fire against a later run.
 */
class TimeoutHandle {
 public:
  TimeoutHandle() noexcept = default;
  TimeoutHandle(pid_t pid, std::time_t deadline) noexcept : _pid(pid), _deadline(deadline) {}

  // Disallow Copy
  TimeoutHandle(const TimeoutHandle&) = delete;
  TimeoutHandle& operator=(const TimeoutHandle&) = delete;

  // Allow Move
  TimeoutHandle(TimeoutHandle&& other) noexcept : _pid(other._pid), _deadline(other._deadline) {
    other._pid = -1;
  }
  TimeoutHandle& operator=(TimeoutHandle&& other) noexcept;

  ~TimeoutHandle() noexcept { disarm(); }

  /// Is a watchdog process still armed?
  bool armed() const noexcept { return _pid > 0; }

  /// Get the watchdog's process ID, or -1 if not armed
  pid_t getPID() const noexcept { return _pid; }

  /// Get the deadline the watchdog enforces
  std::time_t getDeadline() const noexcept { return _deadline; }

  /// Terminate and reap the watchdog. Disarming a handle twice does nothing.
  void disarm() noexcept;

 private:
  pid_t _pid = -1;
  std::time_t _deadline = 0;
};

namespace TimeoutSupervisor {
  /**
   * Arm a watchdog that sends SIGTERM to the whole process group of the caller after `seconds`.
   * Used to bound the checkout phase, where a wedged network operation could otherwise hang the
   * run forever.
   */
  TimeoutHandle armGroupTimeout(unsigned seconds) noexcept;

  /**
   * Arm a watchdog that sends SIGTERM to `target` after `seconds`. Used to bound a whole run; the
   * target is normally the main run process. The watchdog exits quietly if it receives SIGTERM
   * itself before the deadline.
   */
  TimeoutHandle armWaitTimeout(unsigned seconds, pid_t target) noexcept;

  /// Disarm a watchdog. Provided for symmetry with arm; equivalent to handle.disarm().
  inline void disarm(TimeoutHandle& handle) noexcept { handle.disarm(); }
}
