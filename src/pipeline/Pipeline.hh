#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "pipeline/Step.hh"
#include "runtime/StepResult.hh"

namespace fs = std::filesystem;

class DbCluster;
class ModuleRegistry;
class RunContext;

/**
 * The fixed build pipeline: configure, build, the test suites, install, the per-locale installed
 * checks, and the optional extras. The step names are the vocabulary accepted by --skip-steps
 * and --only-steps.
 */
class Pipeline {
 public:
  Pipeline(RunContext& ctx, DbCluster& db, ModuleRegistry& modules) noexcept :
      _ctx(ctx), _db(db), _modules(modules) {}

  /// Get the steps of the pipeline, in order
  std::vector<StepSpec> steps() noexcept;

  /**
   * Decide whether an optional step runs now. A step runs only if it is listed in optional_steps
   * and its gates allow it; a step that runs has its fact stamped with the current time.
   */
  bool optionalStepDue(const std::string& name) noexcept;

  /// Extract typedef names from the installed binaries' debug information
  StepResult findTypedefs() noexcept;

 private:
  /********** Step actions **********/
  StepResult distclean() noexcept;
  StepResult configure() noexcept;
  StepResult build() noexcept;
  StepResult check() noexcept;
  StepResult contrib() noexcept;
  StepResult contribCheck() noexcept;
  StepResult testmodules() noexcept;
  StepResult plCheck() noexcept;
  StepResult buildDocs() noexcept;
  StepResult install() noexcept;
  StepResult contribInstall() noexcept;
  StepResult testmodulesInstall() noexcept;
  StepResult ecpgCheck() noexcept;

  /// Run the TAP suites found under the given test directories as a nested pipeline
  StepResult tapSuites(const std::vector<fs::path>& dirs) noexcept;

  /// Run one TAP suite
  StepResult tapSuite(const fs::path& dir, const std::string& testname) noexcept;

  /// Run the installed checks for every locale
  StepResult locales() noexcept;

  /// Get the nested pipeline for one locale
  std::vector<StepSpec> localeSteps(const std::string& locale) noexcept;

  /********** Installed checks, run against a locale's server **********/
  StepResult installCheck(const std::string& locale) noexcept;
  StepResult isolationCheck(const std::string& locale) noexcept;
  StepResult plInstallCheck(const std::string& locale) noexcept;
  StepResult contribInstallCheck(const std::string& locale) noexcept;
  StepResult testmodulesInstallCheck(const std::string& locale) noexcept;

  /// Get a step that restarts a locale's server, so a check starts with a clean server log
  std::vector<StepSpec> restart(const std::string& locale) noexcept;

  /********** Helpers **********/

  /// Run a make command in a directory of the build tree
  StepResult make(const std::string& args, const fs::path& subdir = fs::path()) noexcept;

  /// Get the make command with a -j flag when parallel builds apply
  std::string parallelMake() const noexcept;

  /// Append every existing file matching the patterns to a step log
  void appendSideFiles(StepResult& result, const std::string& patterns) const noexcept;

  /// Append backtraces from core files under a data directory pattern
  void appendStackTraces(StepResult& result,
                         const fs::path& bindir,
                         const std::string& datadir) const noexcept;

  /// Get the bin directory of a temporary install rooted at `root`
  fs::path tempInstallBin(const fs::path& root) const noexcept;

  /// Does the configuration enable one of the procedural languages?
  bool plConfigured() const noexcept;

  /// Get NO_TEMP_INSTALL=yes once enough temporary installs have been made
  std::string tempInstallFlags() const noexcept;

 private:
  RunContext& _ctx;
  DbCluster& _db;
  ModuleRegistry& _modules;
};
