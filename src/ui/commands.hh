#pragma once

#include "runtime/Config.hh"

/// Perform a run. Returns the exit status for the process.
int do_run(Config config) noexcept;

/// Print the snapshot facts recorded for a branch
int do_show_status(Config config) noexcept;
