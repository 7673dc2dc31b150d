#include "pipeline/StepScheduler.hh"

#include <string>
#include <vector>

#include "runtime/Cancellation.hh"
#include "runtime/RunContext.hh"
#include "util/log.hh"
#include "util/options.hh"
#include "util/wrappers.hh"

using std::string;
using std::vector;

bool StepScheduler::selected(const StepSpec& spec) const noexcept {
  if (spec.filterable && !_ctx.stepWanted(spec.name)) return false;
  for (const auto& other : spec.requires_steps) {
    if (!_ctx.stepWanted(other)) return false;
  }
  return true;
}

ScheduleOutcome StepScheduler::run(const vector<StepSpec>& pipeline) noexcept {
  ScheduleOutcome outcome;

  for (const auto& spec : pipeline) {
    if (cancellation::requested()) {
      LOG(step) << "Cancelled before " << spec.getLabel();
      outcome.cancelled = true;
      return outcome;
    }

    if (!selected(spec)) {
      LOG(step) << "Skipping " << spec.getLabel() << " (filtered)";
      continue;
    }

    if (spec.predicate && !spec.predicate(_ctx)) {
      LOG(step) << "Skipping " << spec.getLabel() << " (not applicable)";
      continue;
    }

    LOG(step) << "Running " << spec.getLabel();
    _executed.push_back(spec.getLabel());

    StepResult result = spec.action(_ctx);
    const string label = result.stage.empty() ? spec.getLabel() : result.stage;

    if (!result.log.empty()) {
      WARN_IF(!writeLines(_ctx.logPath(label), result.log))
          << "Unable to write log for " << label << " in " << _ctx.log_dir;
    }

    if (options::verbose >= 2 && !result.log.empty()) {
      std::cerr << "======== " << label << " log ===========\n";
      for (const auto& line : result.log) std::cerr << line << "\n";
    }

    if (!result.ok() && cancellation::requested()) {
      LOG(step) << label << " interrupted";
      outcome.cancelled = true;
      return outcome;
    }

    if (!result.ok()) {
      LOG(step) << label << " failed with status " << result.status;
      outcome.failure = StepFailure{label, result.status, std::move(result.log)};
      return outcome;
    }

    if (spec.listed && result.attempted) _ctx.run.steps_completed.push_back(label);

    if (cancellation::requested()) {
      LOG(step) << "Cancelled after " << label;
      outcome.cancelled = true;
      return outcome;
    }
  }

  return outcome;
}

StepResult StepScheduler::nested(RunContext& ctx, const vector<StepSpec>& pipeline) noexcept {
  StepScheduler inner(ctx);
  auto outcome = inner.run(pipeline);

  StepResult result;
  result.attempted = !inner.getExecuted().empty();

  if (outcome.failure.has_value()) {
    result.status = outcome.failure->status;
    result.stage = outcome.failure->stage;
    result.log = std::move(outcome.failure->log);
  } else if (outcome.cancelled) {
    result.status = 128 + cancellation::signal();
    result.log.push_back("cancelled");
  }
  return result;
}
