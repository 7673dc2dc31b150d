#pragma once

#include <string>
#include <vector>

#include "runtime/StepResult.hh"

class RunContext;

/// The lifecycle points at which modules are called
enum class ModuleEvent {
  Checkout,
  NeedRun,
  SetupTarget,
  Configure,
  Build,
  Check,
  Install,
  InstallCheck,
  LocaleEnd,
  Cleanup
};

constexpr const char* getModuleEventName(ModuleEvent event) {
  if (event == ModuleEvent::Checkout) return "checkout";
  if (event == ModuleEvent::NeedRun) return "need-run";
  if (event == ModuleEvent::SetupTarget) return "setup-target";
  if (event == ModuleEvent::Configure) return "configure";
  if (event == ModuleEvent::Build) return "build";
  if (event == ModuleEvent::Check) return "check";
  if (event == ModuleEvent::Install) return "install";
  if (event == ModuleEvent::InstallCheck) return "installcheck";
  if (event == ModuleEvent::LocaleEnd) return "locale-end";
  if (event == ModuleEvent::Cleanup) return "cleanup";
  return "unknown";
}

/**
 * A module extends a run at fixed lifecycle points. Every hook has a default that does nothing,
 * so a module only overrides the events it cares about.
 */
class Module {
 public:
  virtual ~Module() noexcept = default;

  /// Get the name used to select this module in the configuration
  virtual std::string getName() const noexcept = 0;

  /// Called after checkout. Lines added to `log` become part of the checkout log.
  virtual void checkout(RunContext& ctx, std::vector<std::string>& log) noexcept {}

  /// Does this module need a run even if no tracked file changed?
  virtual bool needRun(RunContext& ctx) noexcept { return false; }

  /// Called once the build tree is ready, before configure
  virtual void setupTarget(RunContext& ctx) noexcept {}

  /**
   * Called for the step-like events: configure, build, check and install after the base install,
   * and installcheck once per locale while that locale's server is running. A failed result ends
   * the pipeline like any failed step.
   */
  virtual StepResult step(ModuleEvent event, RunContext& ctx, const std::string& locale) noexcept {
    StepResult result;
    result.attempted = false;
    return result;
  }

  /// Called after a locale's server has stopped
  virtual void localeEnd(RunContext& ctx, const std::string& locale) noexcept {}

  /// Called during cleanup on every exit path
  virtual void cleanup(RunContext& ctx) noexcept {}
};
