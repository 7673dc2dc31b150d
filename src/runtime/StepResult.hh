#pragma once

#include <string>
#include <vector>

/**
 * The outcome of one unit of work: an exit status and the complete captured text output, one
 * entry per line. A result is handed to the reporter at most once.
 */
struct StepResult {
  /// Exit status. Zero is success; a process killed by a signal reports 128 + the signal number.
  int status = 0;

  /// The captured output, without line terminators
  std::vector<std::string> log;

  /// The name the step is logged, listed and reported under, when it differs from the step's label
  std::string stage;

  /// Set to false by a step that found nothing to do, so it is not listed as completed
  bool attempted = true;

  bool ok() const noexcept { return status == 0; }

  /// Append a side file (a diff or a log) under a banner line
  void appendFile(const std::string& path, const std::vector<std::string>& lines) {
    log.push_back("");
    log.push_back("");
    log.push_back("================== " + path + " ===================");
    log.insert(log.end(), lines.begin(), lines.end());
  }

  /// Append the lines of another result
  void append(const std::vector<std::string>& lines) {
    log.insert(log.end(), lines.begin(), lines.end());
  }
};
