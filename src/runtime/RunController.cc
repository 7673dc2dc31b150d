#include "runtime/RunController.hh"

#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/resource.h>
#include <unistd.h>

#include "pipeline/Pipeline.hh"
#include "pipeline/StepScheduler.hh"
#include "report/ConfigSummary.hh"
#include "report/ResultReporter.hh"
#include "report/Transport.hh"
#include "runtime/Cancellation.hh"
#include "scm/GitSCM.hh"
#include "util/constants.hh"
#include "util/log.hh"
#include "util/options.hh"
#include "util/wrappers.hh"

using std::cout;
using std::make_unique;
using std::optional;
using std::string;
using std::vector;

namespace {
  /// The controller whose cleanup runs if the process exits through FAIL
  RunController* active_controller = nullptr;
  bool exit_hook_registered = false;

  void exit_hook() noexcept {
    if (active_controller != nullptr) active_controller->cleanup();
  }
}

RunController::RunController(Config config) noexcept :
    _ctx(std::move(config)),
    _facts(_ctx.branch_root, _ctx.st_prefix),
    _tracker(_facts,
             TriggerFilter(_ctx.config.trigger_exclude, _ctx.config.trigger_include),
             _ctx.config.nostatus),
    _db(_ctx),
    _modules(ModuleRegistry::create(_ctx.config)),
    _main_pid(::getpid()) {
  _scm_factory = [](const RunContext& ctx) { return make_unique<GitSCM>(ctx); };

  _transport_factory = [](const RunContext& ctx) -> std::unique_ptr<Transport> {
    if (ctx.config.nosend) return nullptr;
    return make_unique<CommandTransport>(ctx.config.web_txn_command, ctx.env);
  };
}

RunController::~RunController() noexcept {
  cleanup();
  if (active_controller == this) active_controller = nullptr;
}

int RunController::run() noexcept {
  if (options::verbose) {
    cout << fmt::format("{}: buildfarm run for {}:{} starting",
                        fmt::format("{:%c}", fmt::localtime(std::time(nullptr))),
                        _ctx.config.animal,
                        _ctx.config.branch)
         << std::endl;
  }

  std::error_code ec;
  fs::create_directories(_ctx.branch_root, ec);
  FAIL_IF(ec) << "Unable to create branch root " << _ctx.branch_root << ": " << ec.message();

  if (!lock()) return 0;

  int status = execute();
  cleanup();
  return status;
}

bool RunController::lock() noexcept {
  auto lock_path = _ctx.branch_root / constants::LockFilename;
  _lock = LockManager::acquire(lock_path);

  if (!_lock.has_value()) {
    FAIL_IF(_ctx.config.explicitSource()) << "Another process holds the lock on " << lock_path;

    LOG(lock) << "Another process holds the lock on " << lock_path << ". Exiting.";
    if (options::verbose) cout << "Another process holds the lock. Exiting." << std::endl;
    return false;
  }

  _ctx.run.lock_held = true;

  // From here on, every exit must run the cleanup contract
  active_controller = this;
  if (!exit_hook_registered) {
    exit_hook_registered = std::atexit(exit_hook) == 0;
    WARN_IF(!exit_hook_registered) << "Unable to register the cleanup handler";
  }

  return true;
}

int RunController::execute() noexcept {
  auto now = std::time(nullptr);
  _ctx.run.start_time = now;

  removeStaleTrees();

  // A marker file forces exactly one run
  auto force_file = _ctx.statePath(constants::ForceFilename);
  bool force = _ctx.config.force;
  if (fileExists(force_file)) {
    LOG(snapshot) << "Found " << force_file << ", forcing a run";
    force = true;
    std::error_code ec;
    fs::remove(force_file, ec);
    WARN_IF(ec) << "Unable to remove " << force_file << ": " << ec.message();
  }

  if (_ctx.config.wait_timeout > 0) {
    _wait_watchdog = TimeoutSupervisor::armWaitTimeout(_ctx.config.wait_timeout, ::getpid());
  }

  // Allow the test servers to leave core files for the backtrace collection
  struct rlimit core_limit = {RLIM_INFINITY, RLIM_INFINITY};
  if (::setrlimit(RLIMIT_CORE, &core_limit) != 0 && options::verbose > 1) {
    WARN << "Unable to raise the core file size limit: " << ERR;
  }

  makeTempDir();
  prepareEnvironment();

  _scm = _scm_factory(_ctx);
  _transport = _transport_factory(_ctx);

  if (!_ctx.config.explicitSource()) {
    // Load the facts before checking out, so a forced run is known up front
    bool forced = _tracker.load(_ctx.run, force, _ctx.config.forceEveryHours(), now);

    auto stop = checkout();
    if (stop.has_value()) return *stop;

    auto triggers = _tracker.applyChanges(
        _ctx.run,
        _scm->findChanged(_ctx.run.snapshot_last_run, _ctx.run.snapshot_last_success));

    bool module_signal = _modules.needRun(_ctx);

    if (!SnapshotTracker::needsRun(_ctx.run.last_status,
                                   _ctx.config.forceEveryHours(),
                                   forced,
                                   triggers,
                                   module_signal,
                                   now)) {
      LOG(snapshot) << "No changed files after filtering";
      if (options::verbose) cout << time_str() << "No build required: last status = "
                                 << gmt_str(_ctx.run.last_status) << " GMT" << std::endl;
      removeTree(_ctx.build_dir);
      return 0;
    }

    _scm->getVersions(_ctx.run.changed_files);
    _scm->getVersions(_ctx.run.changed_since_success);
  }

  cleanLogs();

  if (!_ctx.config.explicitSource()) {
    WARN_IF(!writeLines(_ctx.logPath("SCM-checkout"), _checkout_log))
        << "Unable to write the checkout log to " << _ctx.logPath("SCM-checkout");
  }

  auto stop = prepareBuildTree();
  if (stop.has_value()) return *stop;

  _modules.setupTarget(_ctx);

  _tracker.recordRunStart(_ctx.run, now);

  detectVersion();

  vector<StepSpec> steps;
  if (_pipeline_factory) {
    steps = _pipeline_factory(_ctx, _db, _modules);
  } else {
    _pipeline = make_unique<Pipeline>(_ctx, _db, _modules);
    steps = _pipeline->steps();
  }

  StepScheduler scheduler(_ctx);
  auto outcome = scheduler.run(steps);

  if (outcome.cancelled) return cancelled();

  if (outcome.failure.has_value()) {
    auto& failure = *outcome.failure;
    return report(failure.stage, failure.status, std::move(failure.log));
  }

  // Keep the configuration summary; the trees it is read from are removed next
  _ctx.saved_config_summary = config_summary(_ctx);

  removeTree(_ctx.install_dir);
  if (!(_ctx.config.explicitSource() && !_ctx.config.use_vpath)) removeTree(_ctx.build_dir);

  _ctx.succeeded = true;

  if (options::verbose) cout << time_str() << "OK" << std::endl;

  return report(ResultReporter::OK, 0, {});
}

void RunController::removeStaleTrees() noexcept {
  WARN_IF(!removeTree(_ctx.install_dir)) << "Unable to remove " << _ctx.install_dir;

  // An in-place explicit source build uses the source tree itself as its build tree
  if (_ctx.config.explicitSource() && !_ctx.config.use_vpath) return;
  WARN_IF(!removeTree(_ctx.build_dir)) << "Unable to remove " << _ctx.build_dir;
}

void RunController::makeTempDir() noexcept {
  auto base = _ctx.env.get("TMPDIR").value_or("/tmp");
  auto templ = (fs::path(base) / "farmhand-XXXXXX").string();

  vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');

  // mkdtemp creates the directory with mode 0700
  FAIL_IF(::mkdtemp(buf.data()) == nullptr)
      << "Unable to create a temporary directory under " << base << ": " << ERR;

  _ctx.tmp_dir = buf.data();
  LOG(phase) << "Using temporary directory " << _ctx.tmp_dir;
}

void RunController::prepareEnvironment() noexcept {
  auto& env = _ctx.env;

  // Entries were checked during validation
  env.apply(_ctx.config.build_env);

  env.set("PGUSER", "buildfarm");
  env.setDefault("PGCTLTIMEOUT", "120");
  env.set("EXTRA_REGRESS_OPTS", fmt::format("--port={}", _ctx.build_port));

  auto extra = _ctx.config.extraConfigLines();
  if (!extra.empty()) {
    auto path = _ctx.tmp_dir / "bfextra.conf";
    vector<string> contents{"# Configuration added by farmhand"};
    contents.insert(contents.end(), extra.begin(), extra.end());
    FAIL_UNLESS(writeLines(path, contents)) << "Unable to write " << path;
    env.set("TEMP_CONFIG", path.string());
  }
}

optional<int> RunController::checkout() noexcept {
  LOG(phase) << "Checking out " << _ctx.config.branch;

  if (_ctx.config.scm_timeout_secs > 0) {
    _scm_watchdog = TimeoutSupervisor::armGroupTimeout(_ctx.config.scm_timeout_secs);
  }

  auto result = _scm->checkout(_ctx.config.branch);
  _modules.checkout(_ctx, result.log);

  _scm_watchdog.disarm();

  if (cancellation::requested()) return cancelled();

  if (!result.ok()) {
    return report(result.stage.empty() ? "SCM-checkout" : result.stage,
                  result.status,
                  std::move(result.log));
  }

  _checkout_log = std::move(result.log);
  _ctx.run.steps_completed.push_back("SCM-checkout");
  return std::nullopt;
}

void RunController::cleanLogs() noexcept {
  removeTree(_ctx.log_dir);

  std::error_code ec;
  fs::create_directories(_ctx.log_dir, ec);
  FAIL_IF(ec) << "Unable to create log directory " << _ctx.log_dir << ": " << ec.message();
}

optional<int> RunController::prepareBuildTree() noexcept {
  if (_ctx.config.use_vpath) {
    std::error_code ec;
    fs::create_directories(_ctx.build_dir, ec);
    FAIL_IF(ec) << "Unable to create build directory " << _ctx.build_dir << ": " << ec.message();
    return std::nullopt;
  }

  if (_ctx.config.explicitSource() || !_scm->copySourceRequired()) return std::nullopt;

  LOG(phase) << "Copying source to " << _ctx.build_dir;
  auto result = _scm->copySource();
  if (!result.ok()) {
    return report(result.stage.empty() ? "SCM-checkout" : result.stage,
                  result.status,
                  std::move(result.log));
  }
  return std::nullopt;
}

void RunController::detectVersion() noexcept {
  auto version = SourceVersion::detect(_ctx.source_dir);
  FAIL_UNLESS(version.has_value()) << "Unable to determine the source version in "
                                   << _ctx.source_dir;
  _ctx.version = *version;
  LOG(phase) << "Building version " << _ctx.version.str();

  // Multiple locales are only tested from 8.4 on; C always comes first
  _ctx.locales = {"C"};
  if (_ctx.version.atLeast(8, 4)) {
    for (const auto& locale : _ctx.config.locales) {
      if (locale != "C") _ctx.locales.push_back(locale);
    }
  }
}

int RunController::report(const string& stage, int status, vector<string> log) noexcept {
  ResultReporter reporter(_ctx, _tracker, _transport.get());
  return reporter.report(stage, status, std::move(log));
}

int RunController::cancelled() noexcept {
  int sig = cancellation::signal();
  cout << "Exiting on signal " << getSignalName(sig) << std::endl;

  // Cleanup commands run to completion unless another signal arrives
  cancellation::reset();
  cleanup();
  return 128 + sig;
}

void RunController::keepErrorBuilds() noexcept {
  if (options::verbose) cout << "moving kept error trees" << std::endl;

  auto stamp = fmt::format("{:%Y-%m-%d_%H-%M-%S}", fmt::localtime(_ctx.run.start_time));

  std::error_code ec;
  auto kept_build = _ctx.branch_root / ("pgsqlkeep." + stamp);
  fs::rename(_ctx.build_dir, kept_build, ec);
  WARN_IF(ec) << "Error renaming " << _ctx.build_dir << " to " << kept_build << ": "
              << ec.message();

  if (dirExists(_ctx.install_dir)) {
    auto kept_inst = _ctx.branch_root / ("instkeep." + stamp);
    fs::rename(_ctx.install_dir, kept_inst, ec);
    WARN_IF(ec) << "Error renaming " << _ctx.install_dir << " to " << kept_inst << ": "
                << ec.message();
  }
}

void RunController::cleanup() noexcept {
  // Children forked by the run inherit the controller but never clean up
  if (_cleaned || ::getpid() != _main_pid) return;
  _cleaned = true;

  _scm_watchdog.disarm();
  _wait_watchdog.disarm();

  if (!_lock.has_value() || !_lock->held()) return;

  const auto& config = _ctx.config;
  bool explicit_source = config.explicitSource();

  // No build tree left means the run succeeded or never got that far
  if (!dirExists(_ctx.build_dir) && config.rm_worktrees && !explicit_source && _scm) {
    LOG(phase) << "Removing the persistent work tree";
    _scm->removeWorktree();
  }

  _db.stopAll();

  if (dirExists(_ctx.build_dir)) {
    if (!explicit_source && config.keep_error_builds) {
      keepErrorBuilds();
    } else if (!config.keepall) {
      removeTree(_ctx.install_dir);
      if (!(explicit_source && !config.use_vpath)) removeTree(_ctx.build_dir);
    }
  }

  _modules.cleanup(_ctx);

  if (config.use_vpath && !explicit_source && _scm) _scm->cleanup();

  if (!_ctx.tmp_dir.empty()) {
    WARN_IF(!removeTree(_ctx.tmp_dir)) << "Unable to remove " << _ctx.tmp_dir;
  }

  // Another run may start as soon as the lock is released, so this comes last
  _lock->release();
  _ctx.run.lock_held = false;

  if (active_controller == this) active_controller = nullptr;
}
