#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "modules/ModuleRegistry.hh"
#include "pipeline/DbCluster.hh"
#include "pipeline/Step.hh"
#include "runtime/Config.hh"
#include "runtime/LockManager.hh"
#include "runtime/RunContext.hh"
#include "runtime/TimeoutSupervisor.hh"
#include "state/FactStore.hh"
#include "state/SnapshotTracker.hh"

class Pipeline;
class SCM;
class Transport;

/**
 * A RunController performs one run for one branch: it takes the branch lock, decides whether a
 * run is needed, prepares the build tree, runs the pipeline and reports the outcome.
 *
 * Every exit path goes through cleanup(), which stops the test servers, removes or keeps the
 * work trees, calls the module cleanup hooks and releases the lock last. Cleanup only runs in the
 * process that took the lock, and only once. A fatal error after the lock is taken exits the
 * process; an at-exit hook runs the cleanup for the active controller in that case.
 */
class RunController {
 public:
  using SCMFactory = std::function<std::unique_ptr<SCM>(const RunContext&)>;
  using TransportFactory = std::function<std::unique_ptr<Transport>(const RunContext&)>;
  using PipelineFactory =
      std::function<std::vector<StepSpec>(RunContext&, DbCluster&, ModuleRegistry&)>;

  /// Create a controller for a validated, normalized configuration
  RunController(Config config) noexcept;

  // Disallow Copy
  RunController(const RunController&) = delete;
  RunController& operator=(const RunController&) = delete;

  /// Destroying the controller runs the cleanup contract if it has not run yet
  ~RunController() noexcept;

  /// Replace the source control collaborator. The default is a GitSCM.
  void setSCMFactory(SCMFactory f) noexcept { _scm_factory = std::move(f); }

  /// Replace the report transport. The default runs web_txn_command.
  void setTransportFactory(TransportFactory f) noexcept { _transport_factory = std::move(f); }

  /// Replace the pipeline definition. The default is the full build pipeline.
  void setPipelineFactory(PipelineFactory f) noexcept { _pipeline_factory = std::move(f); }

  /**
   * Perform the run.
   *
   * \returns the exit status for the process: 0 for success or a skipped run, 1 for a failure,
   *          the transport's status if a report could not be delivered, or 128 plus the signal
   *          number if the run was cancelled.
   */
  int run() noexcept;

  /// Run the cleanup contract. Calling it more than once does nothing.
  void cleanup() noexcept;

  /// Get the context for this run
  RunContext& getContext() noexcept { return _ctx; }

  /// Has the cleanup contract run?
  bool cleanedUp() const noexcept { return _cleaned; }

 private:
  /// Take the branch lock. Returns false if another run holds it.
  bool lock() noexcept;

  /// Everything the run does while holding the lock
  int execute() noexcept;

  /// Remove inst/ and the build tree left by an earlier run
  void removeStaleTrees() noexcept;

  /// Create the private temporary directory
  void makeTempDir() noexcept;

  /// Set up the subprocess environment for the run
  void prepareEnvironment() noexcept;

  /**
   * Check out the source and decide whether a run is needed.
   *
   * \returns an exit status if the run should stop here, or nullopt to continue
   */
  std::optional<int> checkout() noexcept;

  /// Empty the log directory, keeping the directory itself
  void cleanLogs() noexcept;

  /// Produce the build tree from the persistent source tree
  std::optional<int> prepareBuildTree() noexcept;

  /// Read the source version and choose the locales to test
  void detectVersion() noexcept;

  /// Report a failure or success through a ResultReporter
  int report(const std::string& stage, int status, std::vector<std::string> log) noexcept;

  /// Print the cancellation message and get the exit status for a cancelled run
  int cancelled() noexcept;

  /// Move the build and install trees aside so a failed build can be inspected
  void keepErrorBuilds() noexcept;

 private:
  RunContext _ctx;
  FactStore _facts;
  SnapshotTracker _tracker;
  DbCluster _db;
  ModuleRegistry _modules;

  std::unique_ptr<SCM> _scm;
  std::unique_ptr<Transport> _transport;
  std::unique_ptr<Pipeline> _pipeline;

  SCMFactory _scm_factory;
  TransportFactory _transport_factory;
  PipelineFactory _pipeline_factory;

  /// Output of the checkout, written to the log directory once it has been cleaned
  std::vector<std::string> _checkout_log;

  std::optional<LockToken> _lock;
  TimeoutHandle _scm_watchdog;
  TimeoutHandle _wait_watchdog;

  /// The process that created the controller; forked children never clean up
  pid_t _main_pid;

  bool _cleaned = false;
};
