#pragma once

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include <experimental/source_location>

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <fmt/ostream.h>

#include "util/options.hh"

using std::cerr;
using std::experimental::source_location;

#define NORMAL "\033[00;"
#define BOLD "\033[01;"
#define FAINT "\033[02;"

#define GREEN "32m"
#define BLUE "34m"
#define YELLOW "33m"
#define RED "31m"
#define WHITE "38m"

#define END_COLOR "\033[01;0m"

/// Specify log categories, and indicate each with a distinct bit
enum class LogCategory : int {
  error = 1,
  warning = 2,
  phase = 4,
  exec = 8,
  lock = 16,
  snapshot = 32,
  step = 64,
  report = 128,
  watchdog = 256
};

constexpr const char* getLogCategoryName(LogCategory category) {
  if (category == LogCategory::error) return "error";
  if (category == LogCategory::warning) return "warning";
  if (category == LogCategory::phase) return "phase";
  if (category == LogCategory::exec) return "exec";
  if (category == LogCategory::lock) return "lock";
  if (category == LogCategory::snapshot) return "snapshot";
  if (category == LogCategory::step) return "step";
  if (category == LogCategory::report) return "report";
  if (category == LogCategory::watchdog) return "watchdog";
  return "unknown";
}

/// Format a time stamp the way progress lines are prefixed
inline std::string time_str(std::time_t t = std::time(nullptr)) noexcept {
  return fmt::format("[{:%H:%M:%S}] ", fmt::localtime(t));
}

/// Format a time stamp as a GMT date, as used in reports
inline std::string gmt_str(std::time_t t) noexcept {
  return fmt::format("{:%a %b %d %H:%M:%S %Y}", fmt::gmtime(t));
}

/**
 * This class is used for logging to the console. The macros defined below return an instance of
 * this class, which they can then print through using the << operator. The logger will
 * automatically insert a newline at the end of the output. An error logger terminates the process
 * with a failure status once its output is finished.
 */
template <LogCategory category>
class logger {
 public:
  /// Is this logger enabled? By default, error and warning are enabled, while others are disabled.
  inline static bool enabled = (category == LogCategory::error || category == LogCategory::warning);

  inline static constexpr const char* name = getLogCategoryName(category);

 private:
  bool _done;  // Is this the final command in the log output?

 public:
  logger(source_location location = source_location::current()) noexcept : _done(true) {
    // Stop immediately if this logger is not enabled
    if (!enabled) return;

    // Set the color for the log category text
    if (!options::disable_color) {
      if (category == LogCategory::error) {
        cerr << FAINT RED;
      } else if (category == LogCategory::warning) {
        cerr << FAINT YELLOW;
      } else {
        cerr << FAINT GREEN;
      }
    }

    // Phase messages carry a wall-clock prefix instead of the category name
    if (category == LogCategory::phase) {
      cerr << time_str();
    } else {
      cerr << "(" << name << ") ";
    }

    // Print source information, if enabled
    if (options::debug) {
      if (!options::disable_color) cerr << NORMAL BLUE;
      cerr << "[" << location.file_name() << ":" << location.line() << "] ";
    }

    // Set the log color for the actual message
    if (!options::disable_color) {
      if (category == LogCategory::error) {
        cerr << NORMAL RED;
      } else if (category == LogCategory::warning) {
        cerr << NORMAL YELLOW;
      } else {
        cerr << NORMAL GREEN;
      }
    }
  }

  logger(logger&& other) noexcept {
    _done = other._done;
    other._done = false;
  }

  ~logger() noexcept {
    if (!enabled) return;

    if (_done) {
      // End color output and print a newline
      if (!options::disable_color) cerr << END_COLOR;
      cerr << "\n";
      cerr << std::dec;

      // If this log is a fatal
      if (category == LogCategory::error) {
        // In debug mode, call abort() so we can run a backtrace. Otherwise exit with failure.
        // exit() runs the registered cleanup hooks, so a fatal error still releases the lock.
        if (options::debug)
          abort();
        else
          exit(EXIT_FAILURE);
      }
    }
  }

  void operator=(logger&& other) noexcept {
    _done = other._done;
    other._done = false;
  }

  template <typename T>
  logger&& operator<<(const T& t) noexcept {
    if (enabled) cerr << t;
    return std::move(*this);
  }

  using StreamType = decltype(std::cerr);
  using EndlType = StreamType& (*)(StreamType&);

  logger&& operator<<(EndlType e) { return std::move(*this); }
};

#define LOG(type) \
  if (logger<LogCategory::type>::enabled) logger<LogCategory::type>()

#define LOGF(type, format_str, ...) LOG(type) << fmt::format(format_str, __VA_ARGS__)

// Define shorthand macros for specific log types
#define WARN LOG(warning)
#define FAIL LOG(error)

// Define conditional warning
#define WARN_IF(cond) \
  if (cond) WARN

// Define conditional failure macros
#define FAIL_IF(cond) \
  if (cond) FAIL
#define FAIL_UNLESS(cond) \
  if (!(cond)) FAIL

// Define a shortcut for printing the error message corresponding to the current errno
#define ERR strerror(errno)

/// Enable log categories according to a verbosity level
inline void set_verbosity(int level) noexcept {
  options::verbose = level;
  if (level >= 1) logger<LogCategory::phase>::enabled = true;
  if (level >= 2) {
    logger<LogCategory::exec>::enabled = true;
    logger<LogCategory::step>::enabled = true;
  }
}
