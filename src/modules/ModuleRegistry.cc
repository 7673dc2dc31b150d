#include "modules/ModuleRegistry.hh"

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "modules/CCacheModule.hh"
#include "modules/HookModule.hh"
#include "runtime/Config.hh"
#include "util/log.hh"

using std::make_unique;
using std::map;
using std::string;
using std::unique_ptr;
using std::vector;

const map<string, ModuleRegistry::Factory>& ModuleRegistry::factories() noexcept {
  static const map<string, Factory> registry = {
      {"ccache",
       [](const Config& config) -> unique_ptr<Module> {
         return make_unique<CCacheModule>(config);
       }},
      {"hooks",
       [](const Config& config) -> unique_ptr<Module> {
         return make_unique<HookModule>(config.hookSpecs());
       }},
  };
  return registry;
}

bool ModuleRegistry::known(const string& name) noexcept {
  return factories().count(name) > 0;
}

vector<string> ModuleRegistry::available() noexcept {
  vector<string> names;
  for (const auto& [name, factory] : factories()) {
    names.push_back(name);
  }
  return names;
}

ModuleRegistry ModuleRegistry::create(const Config& config) noexcept {
  ModuleRegistry registry;
  for (const auto& name : config.modules) {
    auto iter = factories().find(name);
    if (iter == factories().end()) continue;
    registry.add(iter->second(config));
  }

  // Configured hooks are useless without the hooks module, so select it implicitly
  if (!config.hooks.empty()) {
    bool selected = false;
    for (const auto& m : registry._modules) {
      if (m->getName() == "hooks") selected = true;
    }
    if (!selected) registry.add(make_unique<HookModule>(config.hookSpecs()));
  }

  return registry;
}

void ModuleRegistry::checkout(RunContext& ctx, vector<string>& log) noexcept {
  for (auto& m : _modules) m->checkout(ctx, log);
}

bool ModuleRegistry::needRun(RunContext& ctx) noexcept {
  bool needed = false;
  for (auto& m : _modules) {
    if (m->needRun(ctx)) {
      LOG(snapshot) << "Module " << m->getName() << " requests a run";
      needed = true;
    }
  }
  return needed;
}

void ModuleRegistry::setupTarget(RunContext& ctx) noexcept {
  for (auto& m : _modules) m->setupTarget(ctx);
}

StepResult ModuleRegistry::step(ModuleEvent event, RunContext& ctx, const string& locale) noexcept {
  StepResult combined;
  combined.attempted = false;

  for (auto& m : _modules) {
    auto r = m->step(event, ctx, locale);
    if (r.attempted) combined.attempted = true;
    combined.append(r.log);
    if (!r.ok()) {
      combined.status = r.status;
      combined.stage = r.stage;
      return combined;
    }
  }
  return combined;
}

void ModuleRegistry::localeEnd(RunContext& ctx, const string& locale) noexcept {
  for (auto& m : _modules) m->localeEnd(ctx, locale);
}

void ModuleRegistry::cleanup(RunContext& ctx) noexcept {
  for (auto& m : _modules) m->cleanup(ctx);
}
