#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * The release number of the source tree being built, read from the AC_INIT line of its configure
 * input. Several steps only exist from a given release on.
 */
class SourceVersion {
 public:
  SourceVersion() noexcept = default;

  /// Parse a dotted release number such as "9.5.3". Suffixes like "devel" or "rc1" are dropped.
  static std::optional<SourceVersion> parse(const std::string& text) noexcept;

  /// Read the version from configure.in or configure.ac in a source directory
  static std::optional<SourceVersion> detect(const fs::path& source_dir) noexcept;

  /// Is this release at least the given one?
  bool atLeast(int major, int minor = 0, int patch = 0) const noexcept;

  /// Get the version as originally written
  const std::string& str() const noexcept { return _text; }

 private:
  std::vector<int> _parts;
  std::string _text;
};
