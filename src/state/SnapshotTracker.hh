#pragma once

#include <ctime>
#include <optional>
#include <regex>
#include <utility>
#include <string>
#include <vector>

#include "state/FactStore.hh"

struct BuildRun;

/// The three snapshot facts kept for every branch
enum class SnapshotKind { Status, RunSnap, SuccessSnap };

/// Get the persisted name of a snapshot fact
constexpr const char* getSnapshotName(SnapshotKind kind) {
  if (kind == SnapshotKind::Status) return "status";
  if (kind == SnapshotKind::RunSnap) return "run.snap";
  if (kind == SnapshotKind::SuccessSnap) return "success.snap";
  return "unknown";
}

/// What the SCM reports about the tracked tree
struct ChangeSet {
  /// Latest modification time among tracked files
  std::time_t snapshot = 0;

  /// Files modified since the last attempted run
  std::vector<std::string> changed;

  /// Files modified since the last successful run
  std::vector<std::string> changed_since_success;
};

/**
 * Allow-list and deny-list regular expressions over changed file paths. Filtering only affects
 * whether a change triggers a run; reports still list every changed file.
 */
class TriggerFilter {
 public:
  TriggerFilter() noexcept = default;

  /// Create a filter. Patterns must already have been validated.
  TriggerFilter(const std::optional<std::string>& exclude,
                const std::optional<std::string>& include);

  /// Return the files that count towards triggering a run
  std::vector<std::string> apply(const std::vector<std::string>& files) const noexcept;

 private:
  std::optional<std::regex> _exclude;
  std::optional<std::regex> _include;
};

/**
 * Decides whether a run is needed by comparing the tracked tree against the snapshots recorded by
 * earlier runs, and maintains those snapshots.
 *
 * The run snapshot advances as soon as a run starts, so a run that fails part way does not retry
 * the same snapshot forever. The success snapshot only advances when the whole pipeline succeeds.
 */
class SnapshotTracker {
 public:
  SnapshotTracker(FactStore& facts, TriggerFilter filter, bool nostatus) noexcept :
      _facts(facts), _filter(std::move(filter)), _nostatus(nostatus) {}

  /// Read a snapshot fact
  std::optional<std::time_t> readSnapshot(SnapshotKind kind) const noexcept;

  /// Record a snapshot fact. Does nothing when status recording is disabled.
  void recordSnapshot(SnapshotKind kind, std::time_t value) noexcept;

  /// Put a snapshot fact back to a previous value; an absent value removes the fact
  void restoreSnapshot(SnapshotKind kind, std::optional<std::time_t> value) noexcept;

  /**
   * Load the previous snapshots into the run. A run with no previous run snapshot is forced; a
   * forced run (explicitly, by the heartbeat, or for lack of history) starts from scratch, which
   * shows as a zero last_status.
   *
   * \returns true if the run is forced
   */
  bool load(BuildRun& run, bool force, std::optional<double> force_every, std::time_t now) noexcept;

  /**
   * Decide whether a run is needed.
   *
   * \param last_status   Start time of the previous run, or zero for a from-scratch run
   * \param force_every   Heartbeat interval in hours, if any
   * \param force         Explicit force flag
   * \param changed_files Changed files, after trigger filtering
   * \param module_signal Does any module independently need a run?
   * \param now           The current time
   */
  static bool needsRun(std::time_t last_status,
                       std::optional<double> force_every,
                       bool force,
                       const std::vector<std::string>& changed_files,
                       bool module_signal,
                       std::time_t now) noexcept;

  /// Store the SCM's view of the tree in the run and return the files that count as triggers
  std::vector<std::string> applyChanges(BuildRun& run, ChangeSet changes) const noexcept;

  /// Record that a run is starting: status becomes now, run snapshot becomes the current snapshot
  void recordRunStart(const BuildRun& run, std::time_t now) noexcept;

  /// Record a fully successful run
  void recordSuccess(const BuildRun& run) noexcept;

  /// Undo recordRunStart, restoring the values the run started with
  void rollback(const BuildRun& run) noexcept;

 private:
  FactStore& _facts;
  TriggerFilter _filter;
  bool _nostatus;
};
