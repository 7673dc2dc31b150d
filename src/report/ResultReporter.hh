#pragma once

#include <string>
#include <vector>

#include "report/Report.hh"

class RunContext;
class SnapshotTracker;
class Transport;

/**
 * Assembles the outcome of a run into a report transaction, persists it, and delivers it.
 *
 * A successful run advances the success snapshot. If delivery fails, the status and run snapshot
 * advanced at the start of the run are put back, so the next invocation re-evaluates the same
 * window of changes.
 */
class ResultReporter {
 public:
  /// The stage reported by a fully successful run
  static constexpr const char* OK = "OK";

  ResultReporter(RunContext& ctx, SnapshotTracker& tracker, Transport* transport) noexcept :
      _ctx(ctx), _tracker(tracker), _transport(transport) {}

  /**
   * Report the outcome of the run and return the exit status for the process: 0 for a reported
   * success, 1 for a failure (reported or not), or the transport's status if delivery failed.
   */
  int report(const std::string& stage, int status, std::vector<std::string> log) noexcept;

  /// Build the report record for an outcome
  ReportRecord assemble(const std::string& stage, int status, std::vector<std::string> log) const
      noexcept;

  /// Is this an early stage at which the pipeline never started?
  static bool exclusionStage(const std::string& stage) noexcept;

 private:
  /// Pack the step logs into the archive sent with the report
  void archiveLogs() noexcept;

 private:
  RunContext& _ctx;
  SnapshotTracker& _tracker;
  Transport* _transport;
};
