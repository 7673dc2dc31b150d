#pragma once

#include <ctime>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pipeline/Step.hh"

namespace fs = std::filesystem;

/**
 * Gates for an optional step, parsed from `NAME[:key=value,...]`. A step only runs on the listed
 * branches, inside the hour window, outside the excluded weekdays, and no sooner than
 * min_hours_since after it last ran.
 */
struct OptionalStepSpec {
  std::string name;
  std::vector<std::string> branches;
  std::optional<int> min_hour;
  std::optional<int> max_hour;
  std::vector<int> dow;
  std::optional<double> min_hours_since;

  /// Parse a spec. On failure, returns nullopt and sets `error`.
  static std::optional<OptionalStepSpec> parse(const std::string& text, std::string& error);

  /**
   * Check the static gates (branch, hour, weekday) against a local time. The min_hours_since gate
   * needs the step's fact and is checked by the caller.
   */
  bool allows(const std::string& branch, const std::tm& local) const noexcept;
};

/// A shell command attached to a module lifecycle event, parsed from `EVENT:COMMAND`
struct HookSpec {
  std::string event;
  std::string command;

  static std::optional<HookSpec> parse(const std::string& text, std::string& error);
};

/**
 * The complete configuration for one run, as loaded from the config file and command line. Values
 * are plain data; derived settings are computed by the accessor methods.
 */
struct Config {
  /********** Identity and destinations **********/
  std::string branch = "HEAD";
  std::string animal;
  std::string secret;
  std::string target;
  std::string web_txn_command;
  std::string scm_url;
  fs::path build_root;
  fs::path config_file;

  /********** Run triggering **********/
  std::optional<std::string> trigger_exclude;
  std::optional<std::string> trigger_include;
  std::vector<std::string> force_every;

  /********** Work tree retention **********/
  bool keep_error_builds = false;
  bool keepall = false;
  bool rm_worktrees = false;
  bool use_vpath = false;
  bool use_accache = true;

  /********** Build settings **********/
  std::string make = "make";
  unsigned make_jobs = 1;
  std::string core_file_glob = "core*";
  std::string tar_log_cmd;
  std::vector<std::string> config_opts;
  std::vector<std::string> config_env;
  std::vector<std::string> build_env;
  std::vector<std::string> extra_config;
  std::vector<std::string> locales;
  std::optional<int> base_port;

  /********** Timeouts **********/
  unsigned scm_timeout_secs = 0;
  unsigned wait_timeout = 0;

  /********** Optional steps and modules **********/
  std::vector<std::string> optional_steps;
  std::vector<std::string> modules;
  std::vector<std::string> hooks;
  fs::path ccache_dir;
  bool use_default_ccache_dir = false;
  bool ccache_failure_remove = false;

  /********** Run flags **********/
  bool nosend = false;
  bool nostatus = false;
  bool force = false;
  bool find_typedefs = false;
  bool testmode = false;
  std::optional<fs::path> from_source;
  std::optional<fs::path> from_source_clean;
  std::string skip_steps;
  std::string only_steps;

  /// The command line as given, for reporting
  std::vector<std::string> invocation_args;

  /// Apply implied settings: test mode, explicit-source mode, absolute paths, defaults
  void normalize() noexcept;

  /// Check the configuration. Returns an error message for the first problem found.
  std::optional<std::string> validate() const noexcept;

  /// Refuse to run with superuser privileges
  std::optional<std::string> checkPrivileges() const noexcept;

  /// Is the run building an existing source tree instead of a checkout?
  bool explicitSource() const noexcept { return from_source.has_value(); }

  /// Get the skip/only filter. Only valid after validate() succeeded.
  FilterSet filters() const noexcept;

  /// Get the heartbeat interval for this branch, in hours
  std::optional<double> forceEveryHours() const noexcept;

  /// Get the port the build's test servers listen on
  int buildPort() const noexcept;

  /// Get the extra server configuration lines for this branch: DEFAULT lines first
  std::vector<std::string> extraConfigLines() const noexcept;

  /// Get the parsed optional step gates
  std::vector<OptionalStepSpec> optionalSteps() const noexcept;

  /// Get the parsed hook commands
  std::vector<HookSpec> hookSpecs() const noexcept;

  /// Produce the configuration dump included in reports. The secret is never included.
  std::map<std::string, std::string> dump() const noexcept;
};
