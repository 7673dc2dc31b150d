#pragma once

#include <optional>
#include <string>
#include <vector>

#include "pipeline/Step.hh"
#include "runtime/StepResult.hh"

class RunContext;

/// The first failing step of a pipeline
struct StepFailure {
  std::string stage;
  int status;
  std::vector<std::string> log;
};

/// The result of running a pipeline
struct ScheduleOutcome {
  /// Set if a step failed; no later step ran
  std::optional<StepFailure> failure;

  /// Set if cancellation was requested; no later step ran
  bool cancelled = false;

  bool ok() const noexcept { return !failure.has_value() && !cancelled; }
};

/**
 * Runs an ordered pipeline of steps. A step runs only if the skip/only filter wants it (and every
 * step it requires) and its predicate holds. The first step to fail ends the pipeline.
 */
class StepScheduler {
 public:
  StepScheduler(RunContext& ctx) noexcept : _ctx(ctx) {}

  /// Run steps in order. Steps that ran and succeeded are added to the run's completed list.
  ScheduleOutcome run(const std::vector<StepSpec>& pipeline) noexcept;

  /**
   * Run a nested pipeline from inside a step's action. A failure becomes the returned result,
   * carrying the failing step's stage; a cancellation becomes a failed result.
   */
  static StepResult nested(RunContext& ctx, const std::vector<StepSpec>& pipeline) noexcept;

  /// Get the labels of every step that was executed, successful or not
  const std::vector<std::string>& getExecuted() const noexcept { return _executed; }

 private:
  /// Does the filter allow this step?
  bool selected(const StepSpec& spec) const noexcept;

 private:
  RunContext& _ctx;
  std::vector<std::string> _executed;
};
