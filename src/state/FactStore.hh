#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace fs = std::filesystem;

/**
 * Named timestamp facts persisted one per small file, e.g. `<animal>.last.run.snap`. Writes replace
 * the file atomically, so a crash never leaves a half-written fact.
 */
class FactStore {
 public:
  FactStore(fs::path dir, std::string prefix) noexcept :
      _dir(std::move(dir)), _prefix(std::move(prefix)) {}

  /// Read a fact, if it has been recorded
  std::optional<std::time_t> read(const std::string& fact) const noexcept;

  /// Record a fact. Returns false if the file could not be written.
  bool write(const std::string& fact, std::time_t value) noexcept;

  /// Forget a fact. Forgetting a missing fact is not an error.
  bool remove(const std::string& fact) noexcept;

  /// Get the file that holds a fact
  fs::path path(const std::string& fact) const noexcept {
    return _dir / (_prefix + "last." + fact);
  }

 private:
  fs::path _dir;
  std::string _prefix;
};
