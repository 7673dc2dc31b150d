#include <cstdio>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include <CLI/CLI.hpp>

#include "runtime/Config.hh"
#include "ui/commands.hh"
#include "util/log.hh"
#include "util/options.hh"

namespace fs = std::filesystem;

using std::set;
using std::string;
using std::vector;

/**
 * Check if the current terminal supports color output.
 */
static bool stderr_supports_colors() noexcept {
  return isatty(STDERR_FILENO) && getenv("TERM") != nullptr;
}

/**
 * Get the default build root: a buildroot directory beside the executable
 */
static fs::path default_build_root() noexcept {
  std::error_code ec;
  auto exe = fs::read_symlink("/proc/self/exe", ec);
  if (ec) return fs::current_path(ec) / "buildroot";
  return exe.parent_path() / "buildroot";
}

/**
 * Add the configuration keys as options. Every key can be set in the config file or on the
 * command line.
 */
static void add_config_options(CLI::App& app, Config& config) noexcept {
  /************* Identity and destinations *************/
  app.add_option("--build-root,--build_root", config.build_root,
                 "Directory holding the per-branch work areas")
      ->type_name("DIR");
  app.add_option("--animal", config.animal, "Name of this buildfarm member");
  app.add_option("--secret", config.secret, "Shared secret used to authenticate reports");
  app.add_option("--target", config.target, "URL of the report collector");
  app.add_option("--web-txn-command,--web_txn_command", config.web_txn_command,
                 "Command run to deliver a report; receives the log directory")
      ->type_name("CMD");
  app.add_option("--scm-url,--scm_url", config.scm_url, "Repository to clone")->type_name("URL");

  /************* Run triggering *************/
  app.add_option("--trigger-exclude,--trigger_exclude", config.trigger_exclude,
                 "Changed files matching this pattern never trigger a run")
      ->type_name("REGEX");
  app.add_option("--trigger-include,--trigger_include", config.trigger_include,
                 "Only changed files matching this pattern trigger a run")
      ->type_name("REGEX");
  app.add_option("--force-every,--force_every", config.force_every,
                 "Force a run after this many hours, as HOURS or BRANCH=HOURS")
      ->type_name("SPEC");

  /************* Work tree retention *************/
  app.add_flag("--keep-error-builds,--keep_error_builds", config.keep_error_builds,
               "Keep the build and install trees of failed runs");
  app.add_flag("--keepall", config.keepall, "Never remove the build and install trees");
  app.add_flag("--rm-worktrees,--rm_worktrees", config.rm_worktrees,
               "Remove the persistent source tree after a run");
  app.add_flag("--use-vpath,--use_vpath", config.use_vpath,
               "Build in a separate directory instead of a copy of the source");
  app.add_flag("--use-accache,--use_accache", config.use_accache,
               "Keep an autoconf cache between runs");

  /************* Build settings *************/
  app.add_option("--make", config.make, "The GNU make command")->type_name("CMD");
  app.add_option("--make-jobs,--make_jobs", config.make_jobs, "Parallel make jobs")
      ->type_name("N");
  app.add_option("--core-file-glob,--core_file_glob", config.core_file_glob,
                 "Pattern matching core files in a data directory")
      ->type_name("GLOB");
  app.add_option("--tar-log-cmd,--tar_log_cmd", config.tar_log_cmd,
                 "Command that archives the step logs")
      ->type_name("CMD");
  app.add_option("--config-opts,--config_opts", config.config_opts, "Options for configure")
      ->type_name("OPT");
  app.add_option("--config-env,--config_env", config.config_env,
                 "Environment settings for configure, as KEY=VALUE")
      ->type_name("KEY=VALUE");
  app.add_option("--build-env,--build_env", config.build_env,
                 "Environment settings for every command, as KEY=VALUE")
      ->type_name("KEY=VALUE");
  app.add_option("--extra-config,--extra_config", config.extra_config,
                 "Extra server configuration lines, optionally prefixed BRANCH::")
      ->type_name("LINE");
  app.add_option("--locales", config.locales, "Locales for the installed checks")
      ->type_name("LOCALE");
  app.add_option("--base-port,--base_port", config.base_port,
                 "Base port for the test servers")
      ->type_name("PORT");

  /************* Timeouts *************/
  app.add_option("--scm-timeout-secs,--scm_timeout_secs", config.scm_timeout_secs,
                 "Time limit for the checkout, in seconds")
      ->type_name("SECONDS");
  app.add_option("--wait-timeout,--wait_timeout", config.wait_timeout,
                 "Time limit for the whole run, in seconds")
      ->type_name("SECONDS");

  /************* Optional steps and modules *************/
  app.add_option("--optional-steps,--optional_steps", config.optional_steps,
                 "Optional steps, as NAME[:key=value,...]")
      ->type_name("SPEC");
  app.add_option("--modules", config.modules, "Lifecycle modules to use")->type_name("NAME");
  app.add_option("--hooks", config.hooks, "Commands run at module events, as EVENT:COMMAND")
      ->type_name("HOOK");
  app.add_option("--ccache-dir,--ccache_dir", config.ccache_dir, "Directory for ccache")
      ->type_name("DIR");
  app.add_flag("--use-default-ccache-dir,--use_default_ccache_dir",
               config.use_default_ccache_dir, "Use a ccache directory in the build root");
  app.add_flag("--ccache-failure-remove,--ccache_failure_remove", config.ccache_failure_remove,
               "Remove the ccache directory after a failed run");
}

/**
 * This is the entry point for the farmhand command line tool
 */
int main(int argc, char* argv[]) noexcept {
  // Set color output based on TERM setting (can be overridden with command line option)
  if (!stderr_supports_colors()) options::disable_color = true;

  Config config;
  int exit_status = 0;

  // Keep the command line as given, for the report
  for (int i = 1; i < argc; i++) {
    config.invocation_args.push_back(argv[i]);
  }

  // Set up a CLI app for command line parsing
  CLI::App app{"Continuous build client for a buildfarm member"};

  // We require at least one subcommand
  app.require_subcommand();

  // Option fallthrough allows users to specify global options after a subcommand
  app.fallthrough();

  /************* Global Options *************/
  app.set_config("--config", "build-farm.conf", "Read configuration from FILE");

  app.add_flag("--debug", options::debug, "Print source locations with log messages");
  app.add_flag("--no-color", options::disable_color, "Disable color terminal output");

  int verbose = 0;
  app.add_flag("-v,--verbose", verbose, "Show progress; give twice to also show every step log");
  app.add_flag("-q,--quiet", options::quiet, "Do not print a message after a failure is reported");

  app.add_option_function<set<string>>(
         "--log",
         [&](set<string> categories) {
           for (auto category : categories) {
             if (category == "phase" || category == "all") {
               logger<LogCategory::phase>::enabled = true;
             }
             if (category == "exec" || category == "all") {
               logger<LogCategory::exec>::enabled = true;
             }
             if (category == "lock" || category == "all") {
               logger<LogCategory::lock>::enabled = true;
             }
             if (category == "snapshot" || category == "all") {
               logger<LogCategory::snapshot>::enabled = true;
             }
             if (category == "step" || category == "all") {
               logger<LogCategory::step>::enabled = true;
             }
             if (category == "report" || category == "all") {
               logger<LogCategory::report>::enabled = true;
             }
             if (category == "watchdog" || category == "all") {
               logger<LogCategory::watchdog>::enabled = true;
             }
           }
         },
         "Display log messages from one or more categories")
      ->type_name("CATEGORY")
      ->transform(CLI::IsMember({"phase", "exec", "lock", "snapshot", "step", "report",
                                 "watchdog", "all"},
                                CLI::ignore_case)
                      .description("{phase, exec, lock, snapshot, step, report, watchdog, all}"))
      ->delimiter(',');

  add_config_options(app, config);

  /************* Run Subcommand *************/
  auto run = app.add_subcommand("run", "Perform a build run (default)");

  run->add_flag("--nosend", config.nosend, "Do not send the results");
  run->add_flag("--nostatus", config.nostatus, "Do not record the run's status or snapshots");
  run->add_flag("--force", config.force, "Run even if nothing changed");
  run->add_flag("--find-typedefs", config.find_typedefs, "Extract typedefs after the build");
  run->add_flag("--test", config.testmode, "Same as --nosend --nostatus --force --verbose");
  run->add_option("--from-source", config.from_source, "Build an existing source tree")
      ->type_name("DIR");
  run->add_option("--from-source-clean", config.from_source_clean,
                  "Build an existing source tree after cleaning it")
      ->type_name("DIR");
  run->add_option("--skip-steps", config.skip_steps, "Steps not to run")->type_name("LIST");
  run->add_option("--only-steps", config.only_steps, "Run only these steps")->type_name("LIST");
  run->add_option("branch", config.branch, "Branch to build (default: HEAD)");

  /************* Show Status Subcommand *************/
  auto show_status =
      app.add_subcommand("show-status", "Print the snapshot facts recorded for a branch");
  show_status->add_option("branch", config.branch, "Branch to show (default: HEAD)");

  /************* Register Callbacks ***********/
  // Settings that depend on several options are only applied once parsing is complete
  auto finish_options = [&] {
    if (verbose > 0) set_verbosity(verbose);
    if (config.build_root.empty()) config.build_root = default_build_root();
    config.config_file = app.get_config_ptr()->as<string>();
    std::error_code ec;
    if (!config.config_file.empty()) config.config_file = fs::absolute(config.config_file, ec);
  };

  run->final_callback([&] {
    finish_options();
    exit_status = do_run(config);
  });
  show_status->final_callback([&] {
    finish_options();
    exit_status = do_show_status(config);
  });

  /************* Argument Parsing *************/

  try {
    // Try to parse the arguments as-is
    app.parse(argc, argv);
  } catch (const CLI::CallForHelp& e) {
    // When the options requested help, just print it and exit
    return app.exit(e);
  } catch (const CLI::ParseError& e) {
    // If the option parse failed, retry with the run subcommand set by default
    // Only do this if we did NOT receive a subcommand already
    if (app.get_subcommands().size() == 0) {
      // Reset the command line parse
      app.clear();

      vector<const char*> new_argv;
      new_argv.push_back(argv[0]);
      new_argv.push_back("run");
      for (int i = 1; i < argc; i++) {
        new_argv.push_back(argv[i]);
      }

      try {
        app.parse(new_argv.size(), new_argv.data());
      } catch (const CLI::ParseError& e) {
        return app.exit(e);
      }
    } else {
      // An error occurred with a subcommand specified. Handle the error in the normal way.
      return app.exit(e);
    }
  }

  return exit_status;
}
