#include "pipeline/Pipeline.hh"

#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "modules/ModuleRegistry.hh"
#include "pipeline/DbCluster.hh"
#include "pipeline/StepScheduler.hh"
#include "runtime/RunContext.hh"
#include "runtime/Subprocess.hh"
#include "state/FactStore.hh"
#include "util/Environment.hh"
#include "util/constants.hh"
#include "util/log.hh"
#include "util/shell.hh"
#include "util/wrappers.hh"

using std::set;
using std::string;
using std::vector;

namespace {
  /// Create a step filtered by its own name
  StepSpec step(string name,
                StepAction action,
                StepPredicate predicate = nullptr,
                set<string> requires_steps = {}) {
    StepSpec spec;
    spec.name = std::move(name);
    spec.action = std::move(action);
    spec.predicate = std::move(predicate);
    spec.requires_steps = std::move(requires_steps);
    return spec;
  }

  /// Create a step that always runs when its enclosing step does
  StepSpec internal_step(string name, StepAction action, StepPredicate predicate = nullptr) {
    auto spec = step(std::move(name), std::move(action), std::move(predicate));
    spec.filterable = false;
    return spec;
  }

  StepPredicate since(int major, int minor) {
    return [major, minor](const RunContext& ctx) { return ctx.version.atLeast(major, minor); };
  }

  bool tap_enabled(const RunContext& ctx) {
    return ctx.configured("--enable-tap-tests");
  }

  /// Did a procedural language test run actually run any tests?
  bool pl_tests_ran(const vector<string>& log) {
    for (const auto& line : log) {
      if (line.find("pg_regress") != string::npos || line.find("Checking pl") != string::npos) {
        return true;
      }
    }
    return false;
  }

  /// Remove C block comments, leaving string and character literals intact
  string strip_comments(const string& src) {
    string out;
    out.reserve(src.size());

    for (size_t i = 0; i < src.size(); i++) {
      char c = src[i];
      if (c == '/' && i + 1 < src.size() && src[i + 1] == '*') {
        auto end = src.find("*/", i + 2);
        if (end == string::npos) break;
        i = end + 1;
        out += ' ';
      } else if (c == '"' || c == '\'') {
        out += c;
        for (i++; i < src.size() && src[i] != c; i++) {
          out += src[i];
          if (src[i] == '\\' && i + 1 < src.size()) out += src[++i];
        }
        if (i < src.size()) out += c;
      } else {
        out += c;
      }
    }
    return out;
  }

  /// Add every identifier-like word of a source file to a set
  void collect_words(const fs::path& p, set<string>& words) {
    std::ifstream in(p);
    if (!in) return;
    std::stringstream buffer;
    buffer << in.rdbuf();

    string word;
    for (char c : strip_comments(buffer.str())) {
      if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
        word += c;
      } else if (!word.empty()) {
        words.insert(word);
        word.clear();
      }
    }
    if (!word.empty()) words.insert(word);
  }

  bool is_c_source(const fs::path& p) {
    auto ext = p.extension();
    return ext == ".c" || ext == ".h" || ext == ".l" || ext == ".y";
  }
}

vector<StepSpec> Pipeline::steps() noexcept {
  vector<StepSpec> pipeline;

  pipeline.push_back(step(
      "distclean", [this](RunContext&) { return distclean(); },
      [](const RunContext& ctx) { return ctx.config.from_source_clean.has_value(); }));

  pipeline.push_back(step("configure", [this](RunContext&) { return configure(); }));
  pipeline.push_back(step("build", [this](RunContext&) { return build(); }));
  pipeline.push_back(step("check", [this](RunContext&) { return check(); }, nullptr, {"build"}));
  pipeline.push_back(
      step("contrib", [this](RunContext&) { return contrib(); }, nullptr, {"build"}));
  pipeline.push_back(step(
      "contrib-check", [this](RunContext&) { return contribCheck(); }, nullptr, {"contrib"}));
  pipeline.push_back(
      step("testmodules", [this](RunContext&) { return testmodules(); }, since(9, 5), {"build"}));
  pipeline.push_back(step(
      "pl-check", [this](RunContext&) { return plCheck(); },
      [this](const RunContext&) { return plConfigured(); }));
  pipeline.push_back(step(
      "build-docs", [this](RunContext&) { return buildDocs(); },
      [this](const RunContext&) { return optionalStepDue("build-docs"); }));

  pipeline.push_back(
      step("install", [this](RunContext&) { return install(); }, nullptr, {"build"}));
  pipeline.push_back(step(
      "contrib-install", [this](RunContext&) { return contribInstall(); }, nullptr,
      {"contrib", "install"}));
  pipeline.push_back(step(
      "testmodules-install", [this](RunContext&) { return testmodulesInstall(); }, since(9, 5),
      {"testmodules", "install"}));

  // Module step hooks wait until the base system is built and installed
  for (auto event : {ModuleEvent::Configure, ModuleEvent::Build, ModuleEvent::Check,
                     ModuleEvent::Install}) {
    pipeline.push_back(internal_step(
        string("hook-") + getModuleEventName(event),
        [this, event](RunContext& ctx) { return _modules.step(event, ctx); },
        [this](const RunContext&) { return !_modules.getModules().empty(); }));
  }

  auto bin_check = step(
      "bin-check",
      [this](RunContext& ctx) {
        LOG(phase) << "running bin checks";
        vector<fs::path> dirs;
        for (const auto& dir : globPaths((ctx.source_dir / "src/bin/*").string())) {
          if (dirExists(dir / "t")) dirs.push_back(dir);
        }
        return tapSuites(dirs);
      },
      [](const RunContext& ctx) {
        return tap_enabled(ctx) && (ctx.config.branch == "HEAD" || ctx.version.atLeast(9, 4));
      });
  bin_check.listed = false;
  pipeline.push_back(std::move(bin_check));

  auto misc_check = step(
      "misc-check",
      [this](RunContext& ctx) {
        LOG(phase) << "running misc checks";
        vector<fs::path> dirs;
        for (const char* test : {"recovery", "subscription", "authentication"}) {
          auto dir = ctx.source_dir / "src/test" / test;
          if (dirExists(dir / "t")) dirs.push_back(dir);
        }
        return tapSuites(dirs);
      },
      [](const RunContext& ctx) { return tap_enabled(ctx) && ctx.version.atLeast(9, 4); });
  misc_check.listed = false;
  pipeline.push_back(std::move(misc_check));

  // The installed checks need the install; the loop is filtered by the install step's name
  auto locale_loop = step("install", [this](RunContext&) { return locales(); });
  locale_loop.label = "locales";
  locale_loop.listed = false;
  pipeline.push_back(std::move(locale_loop));

  pipeline.push_back(step("ecpg-check", [this](RunContext&) { return ecpgCheck(); }, since(8, 2)));

  pipeline.push_back(step(
      "find-typedefs", [this](RunContext&) { return findTypedefs(); },
      [this](const RunContext& ctx) {
        return optionalStepDue("find-typedefs") || ctx.config.find_typedefs;
      }));

  return pipeline;
}

bool Pipeline::optionalStepDue(const string& name) noexcept {
  for (const auto& spec : _ctx.config.optionalSteps()) {
    if (spec.name != name) continue;

    std::time_t now = std::time(nullptr);
    std::tm local;
    ::localtime_r(&now, &local);
    if (!spec.allows(_ctx.config.branch, local)) return false;

    FactStore facts(_ctx.branch_root, _ctx.st_prefix);
    if (spec.min_hours_since.has_value()) {
      auto last = facts.read(name).value_or(0);
      if (now < last + static_cast<std::time_t>(3600 * *spec.min_hours_since)) return false;
    }

    if (!_ctx.config.nostatus) {
      WARN_IF(!facts.write(name, now)) << "Unable to record last run of optional step " << name;
    }
    return true;
  }
  return false;
}

/********** Helpers **********/

StepResult Pipeline::make(const string& args, const fs::path& subdir) noexcept {
  return run_log(_ctx.config.make + " " + args, _ctx.env, _ctx.build_dir / subdir);
}

string Pipeline::parallelMake() const noexcept {
  if (_ctx.config.make_jobs > 1 && _ctx.version.atLeast(9, 1)) {
    return "-j " + std::to_string(_ctx.config.make_jobs);
  }
  return "";
}

void Pipeline::appendSideFiles(StepResult& result, const string& patterns) const noexcept {
  for (const auto& file : globPaths(patterns)) {
    if (!fileExists(file)) continue;
    result.appendFile(file.string(), fileLines(file));
  }
}

void Pipeline::appendStackTraces(StepResult& result,
                                 const fs::path& bindir,
                                 const string& datadir) const noexcept {
  auto cores = globPaths(datadir + "/" + _ctx.config.core_file_glob);
  if (cores.empty()) return;

  if (run_quiet("command -v gdb", _ctx.env) != 0) {
    result.log.push_back("core files found in " + datadir + " but gdb is not available");
    return;
  }

  for (const auto& core : cores) {
    auto trace = run_log("gdb -batch -ex bt " + shell_escaped((bindir / "postgres").string()) +
                             " " + shell_escaped(core.string()),
                         _ctx.env);
    result.appendFile("stack trace: " + core.string(), trace.log);
  }
}

fs::path Pipeline::tempInstallBin(const fs::path& root) const noexcept {
  return fs::path(root.string() + _ctx.install_dir.string()) / "bin";
}

bool Pipeline::plConfigured() const noexcept {
  static const std::regex pl_option("--with-(perl|python|tcl)");
  for (const auto& opt : _ctx.config.config_opts) {
    if (std::regex_search(opt, pl_option)) return true;
  }
  return false;
}

string Pipeline::tempInstallFlags() const noexcept {
  return _ctx.temp_installs >= constants::TempInstallReuseThreshold ? "NO_TEMP_INSTALL=yes" : "";
}

/********** Build steps **********/

StepResult Pipeline::distclean() noexcept {
  StepResult result;
  if (!fileExists(_ctx.source_dir / "GNUmakefile")) {
    result.attempted = false;
    return result;
  }

  LOG(phase) << "cleaning source in " << _ctx.source_dir;
  return run_log(_ctx.config.make + " distclean", _ctx.env, _ctx.source_dir);
}

StepResult Pipeline::configure() noexcept {
  LOG(phase) << "running configure";

  vector<string> words;
  for (const auto& opt : _ctx.config.config_opts) {
    // Options already carrying quotes are passed as written
    if (opt.find_first_of("'\"") != string::npos) {
      words.push_back(opt);
    } else {
      words.push_back("'" + opt + "'");
    }
  }
  words.push_back(shell_escaped("--prefix=" + _ctx.install_dir.string()));
  words.push_back("--with-pgport=" + std::to_string(_ctx.build_port));

  if (_ctx.config.use_accache) {
    auto dir = _ctx.config.build_root / ("accache-" + _ctx.config.animal);
    std::error_code ec;
    fs::create_directories(dir, ec);
    WARN_IF(ec) << "Unable to create autoconf cache directory " << dir << ": " << ec.message();

    auto cache = dir / ("config-" + _ctx.config.branch + ".cache");
    if (auto cache_mod = fileMTime(cache); cache_mod.has_value()) {
      bool obsolete = false;
      if (_ctx.config.explicitSource()) {
        auto conf_mod = fileMTime(_ctx.source_dir / "configure");
        obsolete = conf_mod.has_value() && *conf_mod > *cache_mod;
      } else {
        obsolete = _ctx.run.last_status == 0;
        for (const auto& file : _ctx.run.changed_files) {
          if (file == "configure" || file.compare(0, 10, "configure ") == 0) obsolete = true;
        }
      }

      if (!_ctx.config.config_file.empty()) {
        auto conf_file_mod = fileMTime(_ctx.config.config_file);
        if (conf_file_mod.has_value() && *conf_file_mod > *cache_mod) obsolete = true;
      }

      if (obsolete) {
        LOG(phase) << "removing obsolete autoconf cache " << cache;
        fs::remove(cache, ec);
      }
    }
    words.push_back(shell_escaped("--cache-file=" + cache.string()));
  }

  fs::path conf_path =
      _ctx.config.use_vpath ? _ctx.source_dir / "configure" : fs::path("./configure");

  Environment env = _ctx.env;
  env.apply(_ctx.config.config_env);

  auto result =
      run_log(shell_escaped(conf_path.string()) + " " + joinWords(words, " "), env, _ctx.build_dir);

  auto config_log = fileLines(_ctx.build_dir / "config.log");
  if (!config_log.empty()) {
    WARN_IF(!writeLines(_ctx.logPath("config"), config_log)) << "Unable to save config.log";
  }
  if (!result.ok()) result.appendFile("config.log", config_log);

  return result;
}

StepResult Pipeline::build() noexcept {
  LOG(phase) << "running make";
  return make(parallelMake());
}

StepResult Pipeline::check() noexcept {
  LOG(phase) << "running make check";
  auto result = make("NO_LOCALE=1 check", "src/test/regress");

  auto regress = _ctx.build_dir / "src/test/regress";
  appendSideFiles(result, (regress / "regression.diffs").string() + " " +
                              (regress / "log/*.log").string() + " " +
                              (_ctx.build_dir / "tmp_install/log/*").string());

  auto base = regress / "tmp_check";
  if (!result.ok()) {
    auto binloc = dirExists(_ctx.build_dir / "tmp_install") ? _ctx.build_dir / "tmp_install"
                                                             : base / "install";
    appendStackTraces(result, tempInstallBin(binloc), (base / "data").string());
  } else if (!_ctx.config.keepall) {
    removeTree(base);
  }

  _ctx.temp_installs++;
  return result;
}

StepResult Pipeline::contrib() noexcept {
  LOG(phase) << "running make contrib";
  return make(parallelMake(), "contrib");
}

StepResult Pipeline::contribCheck() noexcept {
  LOG(phase) << "running make contrib check";
  auto result = make("NO_LOCALE=1 check", "contrib");

  auto contrib = _ctx.build_dir / "contrib";
  appendSideFiles(result, (contrib / "*/regression.diffs").string() + " " +
                              (contrib / "*/*/regression.diffs").string() + " " +
                              (contrib / "*/log/*.log").string() + " " +
                              (contrib / "*/tmp_check/log/*").string());

  if (!result.ok()) {
    auto binloc = dirExists(_ctx.build_dir / "tmp_install") ? _ctx.build_dir / "tmp_install"
                                                             : contrib / "install";
    for (const auto& tmp_check : globPaths((contrib / "*/tmp_check").string())) {
      appendStackTraces(result, tempInstallBin(binloc), (tmp_check / "data").string());
    }
  }

  return result;
}

StepResult Pipeline::testmodules() noexcept {
  LOG(phase) << "running make testmodules";
  return make(parallelMake(), "src/test/modules");
}

StepResult Pipeline::plCheck() noexcept {
  LOG(phase) << "running make pl check";
  auto result = make("check", "src/pl");

  auto pl = _ctx.build_dir / "src/pl";
  appendSideFiles(result, (pl / "*/regression.diffs").string() + " " +
                              (pl / "*/*/regression.diffs").string());

  if (!result.ok()) {
    appendStackTraces(result, tempInstallBin(_ctx.build_dir / "tmp_install"),
                      (pl / "*/*").string());
  }

  result.attempted = pl_tests_ran(result.log);
  return result;
}

StepResult Pipeline::buildDocs() noexcept {
  LOG(phase) << "running make doc";
  return make("", "doc");
}

StepResult Pipeline::install() noexcept {
  LOG(phase) << "running make install";
  auto result = make("install");
  if (!result.ok()) return result;

  // The installed libraries and programs come first for everything that follows
  auto lib = (_ctx.install_dir / "lib").string();
  _ctx.env.prepend("LD_LIBRARY_PATH", lib);
  _ctx.env.prepend("DYLD_LIBRARY_PATH", lib);
  _ctx.env.prepend("PATH", (_ctx.install_dir / "bin").string());

  return result;
}

StepResult Pipeline::contribInstall() noexcept {
  LOG(phase) << "running make contrib install";
  auto tmp_inst = shell_escaped((_ctx.build_dir / "tmp_install").string());
  auto result = make("install && " + _ctx.config.make + " DESTDIR=" + tmp_inst + " install",
                     "contrib");
  _ctx.temp_installs++;
  return result;
}

StepResult Pipeline::testmodulesInstall() noexcept {
  LOG(phase) << "running make testmodules install";
  auto tmp_inst = shell_escaped((_ctx.build_dir / "tmp_install").string());
  auto result = make("install && " + _ctx.config.make + " DESTDIR=" + tmp_inst + " install",
                     "src/test/modules");
  _ctx.temp_installs++;
  return result;
}

StepResult Pipeline::ecpgCheck() noexcept {
  LOG(phase) << "running make ecpg check";
  auto result = make("NO_LOCALE=1 " + tempInstallFlags() + " check", "src/interfaces/ecpg");

  auto ecpg = _ctx.build_dir / "src/interfaces/ecpg";
  appendSideFiles(result, (ecpg / "test/regression.diffs").string() + " " +
                              (ecpg / "test/log/*.log").string());

  if (!result.ok()) {
    auto base = ecpg / "test/regress/tmp_check";
    appendStackTraces(result, tempInstallBin(base / "install"), (base / "data").string());
  }
  return result;
}

/********** TAP suites **********/

StepResult Pipeline::tapSuites(const vector<fs::path>& dirs) noexcept {
  vector<StepSpec> suites;
  for (const auto& dir : dirs) {
    auto testname = dir.filename().string();
    suites.push_back(
        step(testname + "-check", [this, dir, testname](RunContext&) {
          return tapSuite(dir, testname);
        }));
  }
  return StepScheduler::nested(_ctx, suites);
}

StepResult Pipeline::tapSuite(const fs::path& dir, const string& testname) noexcept {
  LOG(phase) << " -- " << testname;

  string prove_flags = "PROVE_FLAGS=--timer";
  if (auto flags = _ctx.env.get("PROVE_FLAGS"); flags.has_value()) {
    prove_flags = flags->empty() ? "" : "PROVE_FLAGS=" + shell_escaped(*flags);
  }

  auto subdir = dir.lexically_relative(_ctx.source_dir);
  auto result = make("NO_LOCALE=1 " + prove_flags + " " + tempInstallFlags() + " check", subdir);
  appendSideFiles(result, (_ctx.build_dir / subdir / "tmp_check/log/*").string());
  return result;
}

/********** Installed checks **********/

StepResult Pipeline::locales() noexcept {
  StepResult result;
  result.attempted = false;

  for (const auto& locale : _ctx.locales) {
    LOG(phase) << "setting up db cluster (" << locale << ")";

    // The servers listen only on a socket in the private temporary directory
    Environment saved = _ctx.env;
    _ctx.env.set("PGHOST", _ctx.tmp_dir.string());

    auto r = StepScheduler::nested(_ctx, localeSteps(locale));
    _ctx.env = std::move(saved);
    if (!r.ok()) return r;

    _modules.localeEnd(_ctx, locale);

    if (!_ctx.config.keepall) removeTree(_db.dataDir(locale));
  }

  return result;
}

vector<StepSpec> Pipeline::restart(const string& locale) noexcept {
  vector<StepSpec> steps;

  auto stop = internal_step("stopdb-" + locale,
                            [this, locale](RunContext&) { return _db.stop(locale); });
  stop.listed = false;
  steps.push_back(std::move(stop));

  auto start = internal_step("startdb-" + locale,
                             [this, locale](RunContext&) { return _db.start(locale); });
  start.listed = false;
  steps.push_back(std::move(start));

  return steps;
}

vector<StepSpec> Pipeline::localeSteps(const string& locale) noexcept {
  vector<StepSpec> steps;

  steps.push_back(
      internal_step("initdb-" + locale,
                    [this, locale](RunContext&) { return _db.initdb(locale); }));

  auto start = internal_step("startdb-" + locale, [this, locale](RunContext&) {
    LOG(phase) << "starting db (" << locale << ")";
    return _db.start(locale);
  });
  start.listed = false;
  steps.push_back(std::move(start));

  auto install_check =
      step("install-check", [this, locale](RunContext&) { return installCheck(locale); });
  install_check.label = "install-check-" + locale;
  steps.push_back(std::move(install_check));

  auto hook = internal_step(
      "hook-installcheck-" + locale,
      [this, locale](RunContext& ctx) {
        return _modules.step(ModuleEvent::InstallCheck, ctx, locale);
      },
      [this](const RunContext&) { return !_modules.getModules().empty(); });
  steps.push_back(std::move(hook));

  // Each further check restarts the server so its log only covers that check
  auto restarted = [this, locale](const string& label, StepAction check) {
    auto inner = restart(locale);
    inner.push_back(internal_step(label, std::move(check)));
    return [this, inner](RunContext& ctx) { return StepScheduler::nested(ctx, inner); };
  };

  auto isolation = step(
      "isolation-check",
      restarted("isolation-check",
                [this, locale](RunContext&) { return isolationCheck(locale); }),
      [locale](const RunContext& ctx) {
        return locale == "C" && dirExists(ctx.source_dir / "src/test/isolation");
      });
  isolation.listed = false;
  steps.push_back(std::move(isolation));

  auto pl = step(
      "pl-install-check",
      restarted("pl-install-check-" + locale,
                [this, locale](RunContext&) { return plInstallCheck(locale); }),
      [this](const RunContext&) { return plConfigured(); });
  pl.listed = false;
  steps.push_back(std::move(pl));

  auto contrib = step(
      "contrib-install-check",
      restarted("contrib-install-check-" + locale,
                [this, locale](RunContext&) { return contribInstallCheck(locale); }));
  contrib.listed = false;
  steps.push_back(std::move(contrib));

  auto modules = step(
      "testmodules-install-check",
      restarted("testmodules-install-check-" + locale,
                [this, locale](RunContext&) { return testmodulesInstallCheck(locale); }),
      since(9, 5));
  modules.listed = false;
  steps.push_back(std::move(modules));

  auto stop = internal_step("stopdb-" + locale, [this, locale](RunContext&) {
    LOG(phase) << "stopping db (" << locale << ")";
    return _db.stop(locale);
  });
  stop.listed = false;
  steps.push_back(std::move(stop));

  return steps;
}

StepResult Pipeline::installCheck(const string& locale) noexcept {
  LOG(phase) << "running make installcheck (" << locale << ")";
  auto result = make("installcheck", "src/test/regress");

  appendSideFiles(result, (_ctx.build_dir / "src/test/regress/regression.diffs").string() + " " +
                              _db.logFile().string());
  if (!result.ok()) {
    appendStackTraces(result, _ctx.install_dir / "bin", _db.dataDir(locale).string());
  }
  return result;
}

StepResult Pipeline::isolationCheck(const string& locale) noexcept {
  LOG(phase) << "running make isolation check";
  auto result = make("NO_LOCALE=1 installcheck", "src/test/isolation");

  auto iso = _ctx.build_dir / "src/test/isolation";
  appendSideFiles(result, (iso / "output_iso/regression.diffs").string() + " " +
                              (iso / "regression.diffs").string() + " " +
                              (iso / "log/*.log").string() + " " + _db.logFile().string());
  if (!result.ok()) {
    appendStackTraces(result, _ctx.install_dir / "bin", _db.dataDir(locale).string());
  }
  return result;
}

StepResult Pipeline::plInstallCheck(const string& locale) noexcept {
  LOG(phase) << "running make PL installcheck (" << locale << ")";
  auto result = make("installcheck", "src/pl");

  auto pl = _ctx.build_dir / "src/pl";
  appendSideFiles(result, (pl / "*/regression.diffs").string() + " " +
                              (pl / "*/*/regression.diffs").string() + " " +
                              _db.logFile().string());
  if (!result.ok()) {
    appendStackTraces(result, _ctx.install_dir / "bin", _db.dataDir(locale).string());
  }

  result.attempted = pl_tests_ran(result.log);
  return result;
}

StepResult Pipeline::contribInstallCheck(const string& locale) noexcept {
  LOG(phase) << "running make contrib installcheck (" << locale << ")";
  auto result = make("USE_MODULE_DB=1 installcheck", "contrib");

  auto contrib = _ctx.build_dir / "contrib";
  appendSideFiles(result, (contrib / "*/regression.diffs").string() + " " +
                              (contrib / "*/*/regression.diffs").string() + " " +
                              _db.logFile().string());
  if (!result.ok()) {
    appendStackTraces(result, _ctx.install_dir / "bin", _db.dataDir(locale).string());
  }
  return result;
}

StepResult Pipeline::testmodulesInstallCheck(const string& locale) noexcept {
  LOG(phase) << "running make test-modules installcheck (" << locale << ")";
  auto result = make("USE_MODULE_DB=1 installcheck", "src/test/modules");

  appendSideFiles(result, (_ctx.build_dir / "src/test/modules/*/regression.diffs").string() + " " +
                              _db.logFile().string());
  if (!result.ok()) {
    appendStackTraces(result, _ctx.install_dir / "bin", _db.dataDir(locale).string());
  }
  return result;
}

/********** Typedefs **********/

StepResult Pipeline::findTypedefs() noexcept {
  LOG(phase) << "running find_typedefs";
  StepResult result;

  // A cross build's binaries need the host toolchain's objdump, if the native one is missing
  string objdump = "objdump";
  for (const auto& opt : _ctx.config.config_opts) {
    if (opt.compare(0, 7, "--host=") != 0) continue;
    auto host_objdump = opt.substr(7) + "-objdump";
    if (run_quiet("command -v objdump", _ctx.env) != 0 &&
        run_quiet("command -v " + shell_escaped(host_objdump), _ctx.env) == 0) {
      objdump = host_objdump;
    }
  }

  set<string> symbols;
  auto binaries = globPaths((_ctx.install_dir / "bin/*").string() + " " +
                            (_ctx.install_dir / "lib/*").string() + " " +
                            (_ctx.install_dir / "lib/postgresql/*").string());
  for (const auto& bin : binaries) {
    auto name = bin.filename().string();
    if (name.compare(0, 8, "ipcclean") == 0 || name.compare(0, 6, "pltcl_") == 0) continue;

    std::error_code ec;
    if (!fs::is_regular_file(bin, ec)) continue;

    auto dump = run_log(objdump + " -W " + shell_escaped(bin.string()) +
                            " 2>/dev/null | grep -E -A3 DW_TAG_typedef",
                        _ctx.env);
    for (const auto& line : dump.log) {
      auto fields = splitWords(line, " \t");
      if (fields.size() < 2) continue;
      if (fields[0] != "DW_AT_name" && fields[1] != "DW_AT_name") continue;
      if (fields.back().compare(0, 11, "DW_FORM_str") == 0) continue;
      symbols.insert(fields.back());
    }
  }

  for (const char* bad : {"date", "interval", "timestamp", "ANY"}) {
    symbols.erase(bad);
  }

  // Only keep names the source tree actually uses
  set<string> words;
  std::error_code ec;
  for (auto iter = fs::recursive_directory_iterator(
           _ctx.source_dir, fs::directory_options::skip_permission_denied, ec);
       !ec && iter != fs::recursive_directory_iterator(); iter.increment(ec)) {
    if (iter->path().filename() == ".git") {
      iter.disable_recursion_pending();
      continue;
    }
    if (iter->is_regular_file(ec) && is_c_source(iter->path())) {
      collect_words(iter->path(), words);
    }
  }

  for (const auto& sym : symbols) {
    if (words.count(sym) > 0) result.log.push_back(sym);
  }

  return result;
}
