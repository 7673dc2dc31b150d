#pragma once

// Namespace to contain global flags that control console output
namespace options {
  /// When set, disable color terminal output
  inline bool disable_color = false;

  /// When set, include source locations in log messages
  inline bool debug = false;

  /// Verbosity level: 0 is silent, 1 prints progress, 2 or more also dumps every step log
  inline int verbose = 0;

  /// Suppress the message printed after a failure has been reported
  inline bool quiet = false;
}
