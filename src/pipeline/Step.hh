#pragma once

#include <functional>
#include <optional>
#include <set>
#include <string>

#include "runtime/StepResult.hh"

class RunContext;

/**
 * The skip/only filter over step names. At most one of the two sets may be non-empty. Names that
 * match no step are accepted and simply never match.
 */
class FilterSet {
 public:
  /// An empty filter: every step is wanted
  FilterSet() noexcept = default;

  /// Create a filter, or nullopt if both sets are non-empty
  static std::optional<FilterSet> create(std::set<std::string> skip,
                                         std::set<std::string> only) noexcept;

  /// Should the named step run, as far as the filter is concerned?
  bool wanted(const std::string& step) const noexcept;

  const std::set<std::string>& getSkip() const noexcept { return _skip; }
  const std::set<std::string>& getOnly() const noexcept { return _only; }

 private:
  std::set<std::string> _skip;
  std::set<std::string> _only;
};

/// A step predicate decides whether the step applies to this run at all
using StepPredicate = std::function<bool(const RunContext&)>;

/// A step action performs the work and returns its result
using StepAction = std::function<StepResult(RunContext&)>;

/**
 * One named step of a pipeline. The name is used for skip/only filtering, for the completed-steps
 * list, and as the reported stage when the step fails.
 */
struct StepSpec {
  std::string name;
  StepPredicate predicate;
  StepAction action;

  /// The name used for the step's log, the completed list and the failure stage, if not `name`
  std::string label;

  /// Steps that group other steps are not themselves listed as completed
  bool listed = true;

  /// Other step names that must also pass the filter for this step to run
  std::set<std::string> requires_steps;

  /// Steps that are part of another step (starting a server, module hooks) ignore skip/only
  bool filterable = true;

  const std::string& getLabel() const noexcept { return label.empty() ? name : label; }
};
