#include "modules/HookModule.hh"

#include <string>
#include <vector>

#include "runtime/RunContext.hh"
#include "runtime/Subprocess.hh"
#include "util/Environment.hh"
#include "util/log.hh"

using std::string;
using std::vector;

StepResult HookModule::fire(ModuleEvent event, RunContext& ctx, const string& locale) noexcept {
  StepResult result;
  result.attempted = false;
  result.stage = string("hook-") + getModuleEventName(event);

  Environment env = ctx.env;
  env.set("FARMHAND_EVENT", getModuleEventName(event));
  env.set("FARMHAND_BRANCH", ctx.config.branch);
  if (!locale.empty()) env.set("FARMHAND_LOCALE", locale);

  for (const auto& hook : _hooks) {
    if (hook.event != getModuleEventName(event)) continue;

    LOG(phase) << "running " << hook.event << " hook: " << hook.command;
    auto r = run_log(hook.command, env, ctx.branch_root);
    result.attempted = true;
    result.append(r.log);
    if (!r.ok()) {
      result.status = r.status;
      return result;
    }
  }

  return result;
}

void HookModule::checkout(RunContext& ctx, vector<string>& log) noexcept {
  auto r = fire(ModuleEvent::Checkout, ctx);
  log.insert(log.end(), r.log.begin(), r.log.end());
  WARN_IF(!r.ok()) << "checkout hook failed with status " << r.status;
}

bool HookModule::needRun(RunContext& ctx) noexcept {
  auto r = fire(ModuleEvent::NeedRun, ctx);
  return r.attempted && r.ok();
}

void HookModule::setupTarget(RunContext& ctx) noexcept {
  auto r = fire(ModuleEvent::SetupTarget, ctx);
  WARN_IF(!r.ok()) << "setup-target hook failed with status " << r.status;
}

StepResult HookModule::step(ModuleEvent event, RunContext& ctx, const string& locale) noexcept {
  return fire(event, ctx, locale);
}

void HookModule::localeEnd(RunContext& ctx, const string& locale) noexcept {
  auto r = fire(ModuleEvent::LocaleEnd, ctx, locale);
  WARN_IF(!r.ok()) << "locale-end hook failed with status " << r.status;
}

void HookModule::cleanup(RunContext& ctx) noexcept {
  auto r = fire(ModuleEvent::Cleanup, ctx);
  WARN_IF(!r.ok()) << "cleanup hook failed with status " << r.status;
}
