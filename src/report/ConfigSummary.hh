#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

class RunContext;

/**
 * Produce the configuration summary sent with a report: the interesting part of configure's
 * config.log, followed by the script configuration dump.
 */
std::string config_summary(const RunContext& ctx) noexcept;

/**
 * Produce the script configuration dump: the configuration without the secret, the script
 * version, the invocation arguments, the completed steps and the masked environment.
 */
std::string script_config_dump(const RunContext& ctx) noexcept;

/// Extract the summary part of a config.log file. Missing files produce an empty string.
std::string config_log_excerpt(const fs::path& config_log) noexcept;
