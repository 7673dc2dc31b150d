#include "runtime/RunContext.hh"

#include <string>
#include <utility>

#include "util/constants.hh"

using std::string;

RunContext::RunContext(Config c) noexcept :
    config(std::move(c)),
    filters(config.filters()),
    env(Environment::inherited()),
    build_port(config.buildPort()) {
  run.branch = config.branch;
  st_prefix = config.animal + ".";

  branch_root = config.build_root / config.branch;

  if (config.from_source.has_value()) {
    source_dir = *config.from_source;
    build_dir = config.use_vpath ? branch_root / constants::BuildDirname : source_dir;
    log_dir = branch_root / (st_prefix + constants::FromSourceLogDirname);
  } else {
    source_dir = branch_root / constants::SourceDirname;
    build_dir = branch_root / constants::BuildDirname;
    log_dir = branch_root / (st_prefix + constants::RunLogDirname);
  }

  install_dir = branch_root / constants::InstallDirname;
}

bool RunContext::configured(const string& option) const noexcept {
  for (const auto& opt : config.config_opts) {
    if (opt == option) return true;
  }
  return false;
}

bool RunContext::configuredPrefix(const string& prefix) const noexcept {
  for (const auto& opt : config.config_opts) {
    if (opt.compare(0, prefix.size(), prefix) == 0) return true;
  }
  return false;
}
