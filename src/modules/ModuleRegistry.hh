#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "modules/Module.hh"
#include "runtime/StepResult.hh"

class RunContext;
struct Config;

/**
 * The fixed set of modules a run can use, and the instances selected for one run. A run calls the
 * registry at each lifecycle point and the registry calls each selected module in the order the
 * configuration lists them.
 */
class ModuleRegistry {
 public:
  using Factory = std::function<std::unique_ptr<Module>(const Config&)>;

  ModuleRegistry() noexcept = default;

  // Disallow Copy
  ModuleRegistry(const ModuleRegistry&) = delete;
  ModuleRegistry& operator=(const ModuleRegistry&) = delete;

  // Allow Move
  ModuleRegistry(ModuleRegistry&&) noexcept = default;
  ModuleRegistry& operator=(ModuleRegistry&&) noexcept = default;

  /// Is there a module with this name?
  static bool known(const std::string& name) noexcept;

  /// Get the names of every available module
  static std::vector<std::string> available() noexcept;

  /// Instantiate the modules named in the configuration. Unknown names must already be rejected.
  static ModuleRegistry create(const Config& config) noexcept;

  /// Add a module instance
  void add(std::unique_ptr<Module> module) noexcept { _modules.push_back(std::move(module)); }

  /// Get the selected modules
  const std::vector<std::unique_ptr<Module>>& getModules() const noexcept { return _modules; }

  /********** Lifecycle events **********/

  void checkout(RunContext& ctx, std::vector<std::string>& log) noexcept;

  /// Does any module need a run?
  bool needRun(RunContext& ctx) noexcept;

  void setupTarget(RunContext& ctx) noexcept;

  /// Run a step-like event on every module, stopping at the first failure
  StepResult step(ModuleEvent event, RunContext& ctx, const std::string& locale = "") noexcept;

  void localeEnd(RunContext& ctx, const std::string& locale) noexcept;

  void cleanup(RunContext& ctx) noexcept;

 private:
  static const std::map<std::string, Factory>& factories() noexcept;

 private:
  std::vector<std::unique_ptr<Module>> _modules;
};
