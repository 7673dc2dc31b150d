#include "modules/CCacheModule.hh"

#include <filesystem>
#include <system_error>

#include "runtime/Config.hh"
#include "runtime/RunContext.hh"
#include "util/log.hh"
#include "util/wrappers.hh"

CCacheModule::CCacheModule(const Config& config) noexcept :
    _remove_on_failure(config.ccache_failure_remove) {
  if (!config.ccache_dir.empty()) {
    _dir = config.ccache_dir;
  } else if (config.use_default_ccache_dir) {
    _dir = config.build_root / ("ccache-" + config.animal);
  }
}

void CCacheModule::setupTarget(RunContext& ctx) noexcept {
  if (_dir.empty()) return;

  std::error_code ec;
  fs::create_directories(_dir, ec);
  WARN_IF(ec) << "Unable to create ccache directory " << _dir << ": " << ec.message();

  ctx.env.set("CCACHE_DIR", _dir.string());
  LOG(phase) << "using ccache directory " << _dir;
}

void CCacheModule::cleanup(RunContext& ctx) noexcept {
  if (_dir.empty() || !_remove_on_failure || ctx.succeeded) return;

  LOG(phase) << "removing ccache directory " << _dir;
  WARN_IF(!removeTree(_dir)) << "Unable to remove ccache directory " << _dir;
}
