#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "pipeline/SourceVersion.hh"
#include "pipeline/Step.hh"
#include "runtime/Config.hh"
#include "util/Environment.hh"

namespace fs = std::filesystem;

/**
 * The state of one run. It belongs to the run controller and lives for one process invocation.
 */
struct BuildRun {
  std::string branch;
  std::time_t start_time = 0;
  bool lock_held = false;

  /// Names of steps that ran and succeeded, in order
  std::vector<std::string> steps_completed;

  /// Latest modification time seen in the tracked source tree during this run
  std::time_t snapshot_current = 0;
  std::optional<std::time_t> snapshot_last_run;
  std::optional<std::time_t> snapshot_last_success;

  /// The recorded start time of the previous run, exactly as stored
  std::optional<std::time_t> last_status_recorded;

  /// The previous start time as used for decisions; zero means this is a from-scratch run
  std::time_t last_status = 0;

  /// Files changed since the last run and since the last success
  std::vector<std::string> changed_files;
  std::vector<std::string> changed_since_success;
};

/**
 * The explicit context passed to every component of a run: configuration, derived paths, the
 * environment for subprocesses, and the run state. Nothing about a run lives in global variables.
 */
class RunContext {
 public:
  RunContext(Config config) noexcept;

  // Disallow Copy
  RunContext(const RunContext&) = delete;
  RunContext& operator=(const RunContext&) = delete;

  /// The validated configuration
  const Config config;

  /// The skip/only filter for this run
  const FilterSet filters;

  /// Mutable state of the run
  BuildRun run;

  /// Environment handed to every subprocess
  Environment env;

  /********** Paths **********/

  /// build_root/<branch>
  fs::path branch_root;

  /// Persistent source tree kept by the SCM, or the explicit source tree
  fs::path source_dir;

  /// Directory where configure and make run
  fs::path build_dir;

  /// Install prefix
  fs::path install_dir;

  /// Directory holding step logs and the report transaction
  fs::path log_dir;

  /// Private temporary directory for the extra config file and server sockets
  fs::path tmp_dir;

  /// File name prefix for state files, "<animal>."
  std::string st_prefix;

  /********** Build facts discovered during the run **********/

  SourceVersion version;
  int build_port;
  std::vector<std::string> locales;

  /// Number of temporary installs made by test steps so far
  int temp_installs = 0;

  /// Did the pipeline run to completion?
  bool succeeded = false;

  /// Configuration summary saved before the build tree is removed on success
  std::string saved_config_summary;

  /// Path for a state file in the branch root
  fs::path statePath(const std::string& name) const { return branch_root / (st_prefix + name); }

  /// Path for a step log
  fs::path logPath(const std::string& name) const { return log_dir / (name + ".log"); }

  /// Is the named step wanted by the skip/only filter?
  bool stepWanted(const std::string& name) const noexcept { return filters.wanted(name); }

  /// Does the configure line enable a feature (matched as a whole option)?
  bool configured(const std::string& option) const noexcept;

  /// Does any configure option start with the given prefix?
  bool configuredPrefix(const std::string& prefix) const noexcept;
};
