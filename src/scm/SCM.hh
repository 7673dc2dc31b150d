#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>

#include "runtime/StepResult.hh"
#include "state/SnapshotTracker.hh"

/**
 * The source control collaborator. A run asks it to bring the persistent source tree up to date,
 * to describe what changed, and to produce the tree the build runs in.
 */
class SCM {
 public:
  virtual ~SCM() noexcept = default;

  /// Update the persistent source tree to the head of a branch
  virtual StepResult checkout(const std::string& branch) noexcept = 0;

  /**
   * Compute the current snapshot and the files modified since two earlier snapshots. Either
   * baseline may be absent, in which case the matching list is empty.
   */
  virtual ChangeSet findChanged(std::optional<std::time_t> since,
                                std::optional<std::time_t> since_success) noexcept = 0;

  /// Does the build need its own copy of the source tree?
  virtual bool copySourceRequired() const noexcept = 0;

  /// Copy the persistent tree to the build tree
  virtual StepResult copySource() noexcept = 0;

  /// Annotate each changed file with the revision that last touched it
  virtual void getVersions(std::vector<std::string>& files) noexcept = 0;

  /// Tidy the persistent tree after a run
  virtual void cleanup() noexcept = 0;

  /// Remove the persistent tree entirely
  virtual void removeWorktree() noexcept = 0;

  /// Get the revision checked out, if known
  virtual std::string getHeadRef() const noexcept = 0;
};
