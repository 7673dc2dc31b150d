#pragma once

#include <ctime>
#include <filesystem>
#include <optional>

#include "state/SnapshotTracker.hh"

namespace fs = std::filesystem;

/**
 * Walk a source tree and compare file modification times against two baselines. The snapshot is
 * the newest modification time found. Paths in the result are relative to `root`; version control
 * metadata directories are not part of the tree.
 */
ChangeSet scan_changes(const fs::path& root,
                       std::optional<std::time_t> since,
                       std::optional<std::time_t> since_success) noexcept;
