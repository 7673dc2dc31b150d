#include <iostream>
#include <string>
#include <utility>

#include "modules/ModuleRegistry.hh"
#include "runtime/Cancellation.hh"
#include "runtime/RunController.hh"
#include "runtime/Subprocess.hh"
#include "ui/commands.hh"
#include "util/Environment.hh"
#include "util/log.hh"
#include "util/options.hh"

using std::string;

namespace {
  /// Is the configured make GNU make?
  bool check_make(const string& make) noexcept {
    auto result = run_log(make + " -v", Environment::inherited());
    if (!result.ok()) return false;
    for (const auto& line : result.log) {
      if (line.find("GNU Make") != string::npos) return true;
    }
    return false;
  }
}

/**
 * Run the `run` subcommand
 */
int do_run(Config config) noexcept {
  // Every configuration problem is fatal before the lock is taken
  auto error = config.checkPrivileges();
  FAIL_IF(error.has_value()) << *error;

  error = config.validate();
  FAIL_IF(error.has_value()) << *error;

  for (const auto& name : config.modules) {
    FAIL_UNLESS(ModuleRegistry::known(name)) << "unknown module `" << name << "`";
  }

  config.normalize();

  // Test mode and explicit source builds always show progress
  if ((config.testmode || config.explicitSource()) && options::verbose == 0) set_verbosity(1);

  if (config.explicitSource() && config.branch == "HEAD" &&
      config.from_source->string().find("/HEAD/") == string::npos) {
    std::cout << "branch not specified, locks, logs, build artefacts etc will go in HEAD"
              << std::endl;
  }

  FAIL_UNLESS(check_make(config.make)) << "Error: make '" << config.make << "' not GNU Make";

  cancellation::install();

  RunController controller(std::move(config));
  return controller.run();
}
