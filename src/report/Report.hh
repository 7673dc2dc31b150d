#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

#include "util/serializer.hh"

namespace fs = std::filesystem;

/**
 * The report transaction handed to the collector. It is written to the log directory before any
 * delivery is attempted, so the transport reads it from there.
 */
struct ReportRecord {
  std::string changed_this_run;
  std::string changed_since_success;
  std::string branch;
  int status = 0;
  std::string stage;
  std::string animal;
  std::int64_t ts = 0;
  std::string log_data;
  std::string confsum;
  std::string target;
  int verbose = 0;
  std::string secret;
  std::string script_version;
  std::vector<std::string> steps_completed;

  SERIALIZE(FIELD(changed_this_run),
            FIELD(changed_since_success),
            FIELD(branch),
            FIELD(status),
            FIELD(stage),
            FIELD(animal),
            FIELD(ts),
            FIELD(log_data),
            FIELD(confsum),
            FIELD(target),
            FIELD(verbose),
            FIELD(secret),
            FIELD(script_version),
            FIELD(steps_completed));
};

CEREAL_CLASS_VERSION(ReportRecord, 1);

/// Write a report record to a file. Returns false if the file could not be written.
bool save_report(const fs::path& path, const ReportRecord& record) noexcept;

/// Read a report record, or nullopt if the file is missing or malformed
std::optional<ReportRecord> load_report(const fs::path& path) noexcept;
