#include "report/ResultReporter.hh"

#include <algorithm>
#include <ctime>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "report/ConfigSummary.hh"
#include "report/Transport.hh"
#include "runtime/RunContext.hh"
#include "runtime/Subprocess.hh"
#include "state/SnapshotTracker.hh"
#include "util/constants.hh"
#include "util/log.hh"
#include "util/options.hh"
#include "util/shell.hh"
#include "util/wrappers.hh"

using std::cout;
using std::string;
using std::vector;

bool ResultReporter::exclusionStage(const string& stage) noexcept {
  return stage.find("SCM") != string::npos || stage.find("Git") != string::npos ||
         stage.find("lock") != string::npos;
}

ReportRecord ResultReporter::assemble(const string& stage, int status, vector<string> log) const
    noexcept {
  if (!_ctx.config.explicitSource() && _ctx.run.snapshot_current != 0) {
    log.insert(log.begin(),
               {"Last file mtime in snapshot: " + gmt_str(_ctx.run.snapshot_current) + " GMT",
                "==================================================="});
  }

  ReportRecord record;
  record.changed_this_run = joinWords(_ctx.run.changed_files, "!");
  if (stage != OK) record.changed_since_success = joinWords(_ctx.run.changed_since_success, "!");
  record.branch = _ctx.config.branch;
  record.status = status;
  record.stage = stage;
  record.animal = _ctx.config.animal;
  record.ts = _ctx.run.start_time != 0 ? _ctx.run.start_time : std::time(nullptr);
  record.log_data = joinWords(log, "\n");
  if (!log.empty()) record.log_data += "\n";
  record.target = _ctx.config.target;
  record.verbose = options::verbose;
  record.secret = _ctx.config.secret;
  record.script_version = constants::ScriptVersion;
  record.steps_completed = _ctx.run.steps_completed;

  if (stage == OK) {
    record.confsum = _ctx.saved_config_summary;
  } else if (exclusionStage(stage)) {
    record.confsum = script_config_dump(_ctx);
  } else {
    record.confsum = config_summary(_ctx);
  }

  return record;
}

void ResultReporter::archiveLogs() noexcept {
  auto archive = _ctx.log_dir / constants::ArchiveFilename;

  std::error_code ec;
  fs::remove(archive, ec);

  // Oldest log first, so the archive reads in the order the run produced it
  auto logs = globPaths((_ctx.log_dir / "*.log").string());
  std::stable_sort(logs.begin(), logs.end(), [](const fs::path& a, const fs::path& b) {
    return fileMTime(a).value_or(0) < fileMTime(b).value_or(0);
  });

  vector<string> names;
  for (const auto& log : logs) {
    names.push_back(shell_escaped(log.filename().string()));
  }

  string command = _ctx.config.tar_log_cmd;
  auto pattern = command.find("*.log");
  if (pattern != string::npos) command.replace(pattern, 5, joinWords(names, " "));

  auto result = run_log(command, _ctx.env, _ctx.log_dir);
  WARN_IF(!result.ok()) << "Log archive command failed with status " << result.status;
}

int ResultReporter::report(const string& stage, int status, vector<string> log) noexcept {
  if (options::verbose > 1) {
    cout << "======== log passed to send_result ===========\n";
    for (const auto& line : log) cout << line << "\n";
  }

  auto record = assemble(stage, status, std::move(log));

  // The transaction is persisted before anything else can go wrong
  std::error_code ec;
  fs::create_directories(_ctx.log_dir, ec);
  auto txn = _ctx.log_dir / constants::TxnFilename;
  FAIL_UNLESS(save_report(txn, record)) << "Unable to write report transaction " << txn;

  if (_ctx.config.nosend || _transport == nullptr) {
    cout << "Branch: " << _ctx.config.branch << "\n";
    if (stage == OK) {
      cout << "All stages succeeded\n";
      _tracker.recordSuccess(_ctx.run);
      return 0;
    }
    cout << "Stage " << stage << " failed with status " << status << "\n";
    return 1;
  }

  if (!exclusionStage(stage)) {
    archiveLogs();
  } else {
    fs::remove(_ctx.log_dir / constants::ArchiveFilename, ec);
  }

  int txstatus = _transport->send(_ctx.log_dir);
  if (txstatus != 0) {
    cout << "Web txn failed with status: " << txstatus << "\n";
    _tracker.rollback(_ctx.run);
    return txstatus;
  }

  if (stage != OK) {
    if (!options::quiet) {
      cout << "Buildfarm member " << _ctx.config.animal << " failed on " << _ctx.config.branch
           << " stage " << stage << "\n";
    }
    return 1;
  }

  _tracker.recordSuccess(_ctx.run);
  return 0;
}
