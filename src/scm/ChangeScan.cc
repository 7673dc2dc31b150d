#include "scm/ChangeScan.hh"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <optional>
#include <system_error>

#include <sys/stat.h>

#include "util/log.hh"

ChangeSet scan_changes(const fs::path& root,
                       std::optional<std::time_t> since,
                       std::optional<std::time_t> since_success) noexcept {
  ChangeSet changes;

  std::error_code ec;
  auto iter = fs::recursive_directory_iterator(
      root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    WARN << "Unable to scan " << root << ": " << ec.message();
    return changes;
  }

  for (auto end = fs::recursive_directory_iterator(); iter != end; iter.increment(ec)) {
    if (ec) {
      WARN << "Error scanning " << root << ": " << ec.message();
      break;
    }

    const auto& entry = *iter;
    auto name = entry.path().filename();
    if (name == ".git" || name == "CVS" || name == ".svn") {
      iter.disable_recursion_pending();
      continue;
    }

    struct stat statbuf;
    if (::lstat(entry.path().c_str(), &statbuf) != 0 || S_ISDIR(statbuf.st_mode)) continue;

    std::time_t mtime = statbuf.st_mtime;
    changes.snapshot = std::max(changes.snapshot, mtime);

    auto relative = entry.path().lexically_relative(root).string();
    if (since.has_value() && mtime > *since) changes.changed.push_back(relative);
    if (since_success.has_value() && mtime > *since_success) {
      changes.changed_since_success.push_back(relative);
    }
  }

  std::sort(changes.changed.begin(), changes.changed.end());
  std::sort(changes.changed_since_success.begin(), changes.changed_since_success.end());
  return changes;
}
