#include "state/SnapshotTracker.hh"

#include <algorithm>
#include <ctime>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "runtime/RunContext.hh"
#include "util/log.hh"

using std::optional;
using std::string;
using std::vector;

/********** TriggerFilter **********/

TriggerFilter::TriggerFilter(const optional<string>& exclude, const optional<string>& include) {
  if (exclude.has_value()) _exclude.emplace(*exclude);
  if (include.has_value()) _include.emplace(*include);
}

vector<string> TriggerFilter::apply(const vector<string>& files) const noexcept {
  vector<string> result;
  for (const auto& f : files) {
    // Ignore changes to files matching the exclude filter
    if (_exclude.has_value() && std::regex_search(f, *_exclude)) continue;

    // Ignore changes to files NOT matching the include filter
    if (_include.has_value() && !std::regex_search(f, *_include)) continue;

    result.push_back(f);
  }
  return result;
}

/********** SnapshotTracker **********/

optional<std::time_t> SnapshotTracker::readSnapshot(SnapshotKind kind) const noexcept {
  return _facts.read(getSnapshotName(kind));
}

void SnapshotTracker::recordSnapshot(SnapshotKind kind, std::time_t value) noexcept {
  if (_nostatus) return;
  FAIL_UNLESS(_facts.write(getSnapshotName(kind), value))
      << "Failed to record " << getSnapshotName(kind) << " in "
      << _facts.path(getSnapshotName(kind));
}

void SnapshotTracker::restoreSnapshot(SnapshotKind kind, optional<std::time_t> value) noexcept {
  if (_nostatus) return;
  if (value.has_value()) {
    recordSnapshot(kind, *value);
  } else {
    WARN_IF(!_facts.remove(getSnapshotName(kind))) << "Failed to remove " << getSnapshotName(kind);
  }
}

bool SnapshotTracker::load(BuildRun& run,
                           bool force,
                           optional<double> force_every,
                           std::time_t now) noexcept {
  run.last_status_recorded = readSnapshot(SnapshotKind::Status);
  run.snapshot_last_run = readSnapshot(SnapshotKind::RunSnap);
  run.snapshot_last_success = readSnapshot(SnapshotKind::SuccessSnap);
  run.last_status = run.last_status_recorded.value_or(0);

  bool forced = force || !run.snapshot_last_run.has_value();

  // The heartbeat forces a run when the last one started too long ago
  if (run.last_status != 0 && force_every.has_value() &&
      run.last_status + static_cast<std::time_t>(*force_every * 3600) < now) {
    LOGF(snapshot, "Heartbeat of {} hours expired", *force_every);
    forced = true;
  }

  if (forced) run.last_status = 0;
  return forced;
}

bool SnapshotTracker::needsRun(std::time_t last_status,
                               optional<double> force_every,
                               bool force,
                               const vector<string>& changed_files,
                               bool module_signal,
                               std::time_t now) noexcept {
  if (force) return true;
  if (last_status == 0) return true;
  if (force_every.has_value() &&
      last_status + static_cast<std::time_t>(*force_every * 3600) < now) {
    return true;
  }
  return !changed_files.empty() || module_signal;
}

vector<string> SnapshotTracker::applyChanges(BuildRun& run, ChangeSet changes) const noexcept {
  // Snapshots never move backwards, even if the newest file was deleted
  run.snapshot_current = std::max(changes.snapshot, run.snapshot_last_run.value_or(0));
  run.changed_files = std::move(changes.changed);
  run.changed_since_success = std::move(changes.changed_since_success);
  return _filter.apply(run.changed_files);
}

void SnapshotTracker::recordRunStart(const BuildRun& run, std::time_t now) noexcept {
  recordSnapshot(SnapshotKind::Status, now);
  recordSnapshot(SnapshotKind::RunSnap, run.snapshot_current);
}

void SnapshotTracker::recordSuccess(const BuildRun& run) noexcept {
  recordSnapshot(SnapshotKind::SuccessSnap, run.snapshot_current);
}

void SnapshotTracker::rollback(const BuildRun& run) noexcept {
  LOG(snapshot) << "Rolling back status and run snapshot";
  restoreSnapshot(SnapshotKind::Status, run.last_status_recorded);
  restoreSnapshot(SnapshotKind::RunSnap, run.snapshot_last_run);
}
