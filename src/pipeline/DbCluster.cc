#include "pipeline/DbCluster.hh"

#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include "runtime/RunContext.hh"
#include "runtime/Subprocess.hh"
#include "util/log.hh"
#include "util/shell.hh"
#include "util/wrappers.hh"

using std::string;
using std::vector;

fs::path DbCluster::dataDir(const string& locale) const noexcept {
  return _ctx.install_dir / ("data-" + locale);
}

fs::path DbCluster::logFile() const noexcept {
  return _ctx.install_dir / "logfile";
}

StepResult DbCluster::initdb(const string& locale) noexcept {
  _started_times = 0;

  auto result = run_log("bin/initdb -U buildfarm -E UTF8 --locale=" + shell_escaped(locale) +
                            " " + shell_escaped("data-" + locale),
                        _ctx.env, _ctx.install_dir);
  result.stage = "initdb-" + locale;
  if (!result.ok()) return result;

  std::ofstream conf(dataDir(locale) / "postgresql.conf", std::ios::app);
  if (!conf) {
    result.status = 1;
    result.log.push_back("cannot append to " + (dataDir(locale) / "postgresql.conf").string());
    return result;
  }

  conf << "unix_socket_directories = '" << _ctx.tmp_dir.string() << "'\n";
  conf << "listen_addresses = ''\n";
  for (const auto& line : _ctx.config.extraConfigLines()) {
    conf << line << "\n";
  }

  return result;
}

StepResult DbCluster::start(const string& locale) noexcept {
  _started_times++;

  // Each start gets a fresh server log
  std::error_code ec;
  fs::remove(logFile(), ec);

  auto result = run_log("bin/pg_ctl -D " + shell_escaped("data-" + locale) + " -l logfile -w start",
                        _ctx.env, _ctx.install_dir);
  result.stage = "startdb-" + locale + ":" + std::to_string(_started_times);

  if (fileLength(logFile()) > 0) {
    result.log.push_back("=========== db log file ==========");
    result.append(fileLines(logFile()));
  }

  if (!result.ok()) {
    // A server that failed to report ready may still be running
    run_quiet("bin/pg_ctl -D " + shell_escaped("data-" + locale) + " stop", _ctx.env,
              _ctx.install_dir);
    return result;
  }

  _running.insert(locale);
  return result;
}

StepResult DbCluster::stop(const string& locale) noexcept {
  off_t logpos = std::max<off_t>(fileLength(logFile()), 0);

  auto result = run_log("bin/pg_ctl -D " + shell_escaped("data-" + locale) + " stop", _ctx.env,
                        _ctx.install_dir);
  result.stage = "stopdb-" + locale + ":" + std::to_string(_started_times);
  _running.erase(locale);

  if (fileLength(logFile()) > 0) {
    result.log.push_back("=========== db log file ==========");
    result.append(fileLines(logFile(), logpos));
  }

  return result;
}

void DbCluster::stopAll() noexcept {
  for (const auto& locale : _running) {
    if (!dirExists(dataDir(locale))) continue;

    LOG(phase) << "stopping db (" << locale << ")";
    int status = run_quiet("bin/pg_ctl -D " + shell_escaped("data-" + locale) + " stop", _ctx.env,
                           _ctx.install_dir);
    WARN_IF(status != 0) << "Unable to stop database for locale " << locale;
  }
  _running.clear();
}
