#pragma once

#include <filesystem>
#include <set>
#include <string>

#include "runtime/StepResult.hh"

namespace fs = std::filesystem;

class RunContext;

/**
 * The test database clusters created under the install tree, one per locale. Tracks which
 * clusters are running so cleanup can stop every one of them after an interrupted run.
 */
class DbCluster {
 public:
  DbCluster(RunContext& ctx) noexcept : _ctx(ctx) {}

  // Disallow Copy
  DbCluster(const DbCluster&) = delete;
  DbCluster& operator=(const DbCluster&) = delete;

  /// Create the data directory for a locale and append the run's server settings to it
  StepResult initdb(const std::string& locale) noexcept;

  /// Start the server for a locale, waiting until it accepts connections
  StepResult start(const std::string& locale) noexcept;

  /// Stop the server for a locale. The log contains the server log written since the stop began.
  StepResult stop(const std::string& locale) noexcept;

  /// Stop every server still running, ignoring failures. Used during cleanup.
  void stopAll() noexcept;

  /// Is any server running?
  bool running() const noexcept { return !_running.empty(); }

  /// How many times has a server been started for the current locale?
  int getStartCount() const noexcept { return _started_times; }

  /// Get the data directory for a locale
  fs::path dataDir(const std::string& locale) const noexcept;

  /// Get the server log file
  fs::path logFile() const noexcept;

 private:
  RunContext& _ctx;
  std::set<std::string> _running;
  int _started_times = 0;
};
