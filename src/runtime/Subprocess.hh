#pragma once

#include <filesystem>
#include <string>

#include "runtime/StepResult.hh"

namespace fs = std::filesystem;

class Environment;

/**
 * Run a shell command to completion and capture its combined stdout and stderr.
 *
 * The command runs under /bin/sh in its own process group, with exactly the variables in `env`
 * and stdin redirected from /dev/null. If cancellation is requested while it runs, the whole
 * group receives SIGTERM, then SIGKILL if it is still alive after a grace period.
 *
 * \param command The shell command line
 * \param env     The environment for the command
 * \param cwd     Working directory for the command, or empty to inherit ours
 * \returns the exit status and the captured output
 */
StepResult run_log(const std::string& command,
                   const Environment& env,
                   const fs::path& cwd = fs::path()) noexcept;

/// Run a shell command, discarding its output. Returns the exit status.
int run_quiet(const std::string& command,
              const Environment& env,
              const fs::path& cwd = fs::path()) noexcept;
