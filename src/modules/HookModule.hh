#pragma once

#include <string>
#include <utility>
#include <vector>

#include "modules/Module.hh"
#include "runtime/Config.hh"

/**
 * Runs configured shell commands at lifecycle events. Commands run in the branch root with the
 * run's environment; `FARMHAND_EVENT`, `FARMHAND_BRANCH` and, where it applies, `FARMHAND_LOCALE`
 * describe the event.
 *
 * A need-run command that exits 0 demands a run. A failed command at a step-like event fails the
 * pipeline with stage `hook-<event>`. Failures at other events only produce a warning.
 */
class HookModule final : public Module {
 public:
  HookModule(std::vector<HookSpec> hooks) noexcept : _hooks(std::move(hooks)) {}

  std::string getName() const noexcept override { return "hooks"; }

  void checkout(RunContext& ctx, std::vector<std::string>& log) noexcept override;

  bool needRun(RunContext& ctx) noexcept override;

  void setupTarget(RunContext& ctx) noexcept override;

  StepResult step(ModuleEvent event, RunContext& ctx, const std::string& locale) noexcept override;

  void localeEnd(RunContext& ctx, const std::string& locale) noexcept override;

  void cleanup(RunContext& ctx) noexcept override;

 private:
  /// Run every command hooked to an event, stopping at the first failure
  StepResult fire(ModuleEvent event, RunContext& ctx, const std::string& locale = "") noexcept;

 private:
  std::vector<HookSpec> _hooks;
};
