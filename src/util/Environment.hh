#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * An explicit set of environment variables passed to every subprocess a run launches. The
 * process environment is only read once, when the inherited environment is captured; changes made
 * during a run live here and are never written back to the process.
 *
 * Copying an Environment is how a run makes a scoped overlay: take a copy, modify it for the
 * duration of a phase, then assign the saved copy back.
 */
class Environment {
 public:
  Environment() noexcept = default;

  /// Capture the environment this process was started with
  static Environment inherited() noexcept;

  /// Look up a variable
  std::optional<std::string> get(const std::string& key) const noexcept;

  /// Does the environment define a variable?
  bool has(const std::string& key) const noexcept { return _vars.find(key) != _vars.end(); }

  /// Set a variable, replacing any previous value
  void set(const std::string& key, const std::string& value) noexcept { _vars[key] = value; }

  /// Set a variable only if it is not already defined
  void setDefault(const std::string& key, const std::string& value) noexcept {
    _vars.emplace(key, value);
  }

  /// Remove a variable
  void unset(const std::string& key) noexcept { _vars.erase(key); }

  /// Prepend a path element to a search-path variable
  void prepend(const std::string& key, const std::string& value, char sep = ':') noexcept;

  /// Apply a list of KEY=VALUE assignments. Returns false if any entry is malformed.
  bool apply(const std::vector<std::string>& assignments) noexcept;

  /// Produce KEY=VALUE strings suitable for execve
  std::vector<std::string> entries() const noexcept;

  /// Produce a copy with the value of every variable not on the reporting whitelist masked
  std::map<std::string, std::string> reportable() const noexcept;

  /// Get the underlying map
  const std::map<std::string, std::string>& vars() const noexcept { return _vars; }

  bool operator==(const Environment& other) const noexcept { return _vars == other._vars; }

 private:
  std::map<std::string, std::string> _vars;
};
