#pragma once

#include <filesystem>

namespace fs = std::filesystem;

// Namespace to contain file names and fixed settings used by every run
namespace constants {
  /// The release this client reports as its script version
  constexpr const char* ScriptVersion = "REL_5";

  /// Name of the lock file in each branch root
  const fs::path LockFilename = "builder.LCK";

  /// Per-branch persistent source tree maintained by the SCM
  const fs::path SourceDirname = "pgsql";

  /// Build tree, copied from the persistent source tree or used as the vpath build directory
  const fs::path BuildDirname = "pgsql.build";

  /// Install prefix for the build
  const fs::path InstallDirname = "inst";

  /// Log directory suffixes (prefixed with "<animal>.")
  constexpr const char* RunLogDirname = "lastrun-logs";
  constexpr const char* FromSourceLogDirname = "fromsource-logs";

  /// The persisted report transaction
  const fs::path TxnFilename = "web-txn.data";

  /// The compressed log archive sent with the report
  const fs::path ArchiveFilename = "runlogs.tgz";

  /// Marker file (prefixed with "<animal>.") that forces one run
  constexpr const char* ForceFilename = "force-one-run";

  /// Default command used to archive logs
  constexpr const char* DefaultTarLogCmd = "tar -z -cf runlogs.tgz *.log";

  /// Port used when no base port is configured
  constexpr int DefaultPort = 5999;

  /// Grace period between a cooperative termination request and a hard kill, in seconds
  constexpr int KillGraceSeconds = 10;

  /// Number of temporary installs after which tests may reuse the last one
  constexpr int TempInstallReuseThreshold = 3;
}
