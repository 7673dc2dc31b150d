#include "runtime/Config.hh"

#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <map>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include <unistd.h>

#include <fmt/core.h>

#include "util/constants.hh"
#include "util/wrappers.hh"

using std::map;
using std::optional;
using std::set;
using std::string;
using std::vector;

namespace {
  /// Parse a non-negative number, rejecting trailing garbage
  optional<double> parse_number(const string& s) noexcept {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || !std::isfinite(value) || value < 0) {
      return std::nullopt;
    }
    return value;
  }

  optional<int> parse_int(const string& s) noexcept {
    auto value = parse_number(s);
    if (!value.has_value() || *value > INT_MAX) return std::nullopt;
    if (*value != static_cast<int>(*value)) return std::nullopt;
    return static_cast<int>(*value);
  }

  bool valid_regex(const string& pattern) noexcept {
    try {
      std::regex re(pattern);
      return true;
    } catch (const std::regex_error&) {
      return false;
    }
  }

  bool valid_assignments(const vector<string>& entries) noexcept {
    for (const auto& e : entries) {
      auto eq = e.find('=');
      if (eq == string::npos || eq == 0) return false;
    }
    return true;
  }

  string join_path_list(const vector<string>& v) { return joinWords(v, " "); }
}

/********** OptionalStepSpec **********/

optional<OptionalStepSpec> OptionalStepSpec::parse(const string& text, string& error) {
  OptionalStepSpec spec;

  auto colon = text.find(':');
  spec.name = text.substr(0, colon);
  if (spec.name.empty()) {
    error = fmt::format("optional step `{}` has no name", text);
    return std::nullopt;
  }
  if (colon == string::npos) return spec;

  for (const auto& setting : splitWords(text.substr(colon + 1), ",")) {
    auto eq = setting.find('=');
    if (eq == string::npos) {
      error = fmt::format("optional step `{}`: expected key=value, found `{}`", spec.name, setting);
      return std::nullopt;
    }
    auto key = setting.substr(0, eq);
    auto value = setting.substr(eq + 1);

    if (key == "branches") {
      spec.branches = splitWords(value, "|");
    } else if (key == "min_hour" || key == "max_hour") {
      auto hour = parse_int(value);
      if (!hour.has_value() || *hour > 23) {
        error = fmt::format("optional step `{}`: bad hour `{}`", spec.name, value);
        return std::nullopt;
      }
      (key == "min_hour" ? spec.min_hour : spec.max_hour) = hour;
    } else if (key == "dow") {
      for (const auto& day : splitWords(value, "|")) {
        auto d = parse_int(day);
        if (!d.has_value() || *d > 6) {
          error = fmt::format("optional step `{}`: bad weekday `{}`", spec.name, day);
          return std::nullopt;
        }
        spec.dow.push_back(*d);
      }
    } else if (key == "min_hours_since") {
      spec.min_hours_since = parse_number(value);
      if (!spec.min_hours_since.has_value()) {
        error = fmt::format("optional step `{}`: bad interval `{}`", spec.name, value);
        return std::nullopt;
      }
    } else {
      error = fmt::format("optional step `{}`: unknown setting `{}`", spec.name, key);
      return std::nullopt;
    }
  }

  return spec;
}

bool OptionalStepSpec::allows(const string& branch, const std::tm& local) const noexcept {
  if (!branches.empty()) {
    bool listed = false;
    for (const auto& b : branches) {
      if (b == branch) listed = true;
    }
    if (!listed) return false;
  }

  if (min_hour.has_value() && local.tm_hour < *min_hour) return false;
  if (max_hour.has_value() && local.tm_hour > *max_hour) return false;

  for (int day : dow) {
    if (day == local.tm_wday) return false;
  }

  return true;
}

/********** HookSpec **********/

optional<HookSpec> HookSpec::parse(const string& text, string& error) {
  static const set<string> events = {"checkout",  "need-run",     "setup-target", "configure",
                                     "build",     "check",        "install",      "installcheck",
                                     "locale-end", "cleanup"};

  auto colon = text.find(':');
  if (colon == string::npos || colon + 1 >= text.size()) {
    error = fmt::format("hook `{}` must have the form EVENT:COMMAND", text);
    return std::nullopt;
  }

  HookSpec hook{text.substr(0, colon), text.substr(colon + 1)};
  if (events.count(hook.event) == 0) {
    error = fmt::format("hook `{}` names unknown event `{}`", text, hook.event);
    return std::nullopt;
  }
  return hook;
}

/********** Config **********/

void Config::normalize() noexcept {
  if (testmode) {
    force = true;
    nostatus = true;
    nosend = true;
  }

  if (from_source_clean.has_value() && !from_source.has_value()) {
    from_source = from_source_clean;
  }

  if (from_source.has_value()) {
    std::error_code ec;
    if (from_source->is_relative()) from_source = fs::absolute(*from_source, ec);
    if (from_source_clean.has_value()) from_source_clean = from_source;
    nosend = true;
    nostatus = true;
  }

  if (tar_log_cmd.empty()) tar_log_cmd = constants::DefaultTarLogCmd;
  if (make_jobs == 0) make_jobs = 1;
}

optional<string> Config::validate() const noexcept {
  if (from_source.has_value() && from_source_clean.has_value() &&
      *from_source != *from_source_clean) {
    return "only one of --from-source and --from-source-clean allowed";
  }

  auto skip = splitWords(skip_steps);
  auto only = splitWords(only_steps);
  if (!FilterSet::create({skip.begin(), skip.end()}, {only.begin(), only.end()}).has_value()) {
    return "only one of --skip-steps and --only-steps allowed";
  }

  if (build_root.empty()) return "no build_root";
  if (!build_root.is_absolute()) {
    return fmt::format("build_root {} not absolute", build_root.string());
  }

  if (animal.empty()) return "no animal name configured";

  bool sending = !(nosend || testmode || from_source.has_value() || from_source_clean.has_value());
  if (sending && web_txn_command.empty()) return "no web_txn_command configured to send results";
  if (sending && target.empty()) return "no target configured to send results";

  if (trigger_exclude.has_value() && !valid_regex(*trigger_exclude)) {
    return fmt::format("invalid trigger_exclude pattern `{}`", *trigger_exclude);
  }
  if (trigger_include.has_value() && !valid_regex(*trigger_include)) {
    return fmt::format("invalid trigger_include pattern `{}`", *trigger_include);
  }

  for (const auto& entry : force_every) {
    auto eq = entry.find('=');
    auto hours = eq == string::npos ? entry : entry.substr(eq + 1);
    if (eq == 0 || !parse_number(hours).has_value()) {
      return fmt::format("invalid force_every entry `{}`", entry);
    }
  }

  if (!valid_assignments(build_env)) return "build_env entries must have the form KEY=VALUE";
  if (!valid_assignments(config_env)) return "config_env entries must have the form KEY=VALUE";

  string error;
  for (const auto& text : optional_steps) {
    if (!OptionalStepSpec::parse(text, error).has_value()) return error;
  }
  for (const auto& text : hooks) {
    if (!HookSpec::parse(text, error).has_value()) return error;
  }

  return std::nullopt;
}

optional<string> Config::checkPrivileges() const noexcept {
  if (::geteuid() == 0) return "cannot run as root";
  return std::nullopt;
}

FilterSet Config::filters() const noexcept {
  auto skip = splitWords(skip_steps);
  auto only = splitWords(only_steps);
  auto filters = FilterSet::create({skip.begin(), skip.end()}, {only.begin(), only.end()});
  return filters.value_or(FilterSet());
}

optional<double> Config::forceEveryHours() const noexcept {
  optional<double> fallback;
  for (const auto& entry : force_every) {
    auto eq = entry.find('=');
    if (eq == string::npos) {
      fallback = parse_number(entry);
    } else if (entry.substr(0, eq) == branch) {
      return parse_number(entry.substr(eq + 1));
    } else if (entry.substr(0, eq) == "default") {
      fallback = parse_number(entry.substr(eq + 1));
    }
  }
  return fallback;
}

int Config::buildPort() const noexcept {
  if (!base_port.has_value()) return constants::DefaultPort;

  // Fold the branch name into a number so branches on one machine get different ports. The
  // modulus keeps clear of the VNC range above the default base port.
  uint16_t j = 0;
  for (size_t i = 0; i + 1 < branch.size(); i += 2) {
    j ^= static_cast<uint16_t>(static_cast<unsigned char>(branch[i]) |
                               (static_cast<unsigned char>(branch[i + 1]) << 8));
  }
  return *base_port + j % 220;
}

vector<string> Config::extraConfigLines() const noexcept {
  vector<string> defaults;
  vector<string> specific;
  for (const auto& line : extra_config) {
    auto sep = line.find("::");
    if (sep == string::npos) {
      defaults.push_back(line);
    } else if (line.substr(0, sep) == branch) {
      specific.push_back(line.substr(sep + 2));
    } else if (line.substr(0, sep) == "DEFAULT") {
      defaults.push_back(line.substr(sep + 2));
    }
  }
  defaults.insert(defaults.end(), specific.begin(), specific.end());
  return defaults;
}

vector<OptionalStepSpec> Config::optionalSteps() const noexcept {
  vector<OptionalStepSpec> result;
  string error;
  for (const auto& text : optional_steps) {
    if (auto spec = OptionalStepSpec::parse(text, error); spec.has_value()) {
      result.push_back(std::move(*spec));
    }
  }
  return result;
}

vector<HookSpec> Config::hookSpecs() const noexcept {
  vector<HookSpec> result;
  string error;
  for (const auto& text : hooks) {
    if (auto hook = HookSpec::parse(text, error); hook.has_value()) {
      result.push_back(std::move(*hook));
    }
  }
  return result;
}

map<string, string> Config::dump() const noexcept {
  map<string, string> d;
  d["branch"] = branch;
  d["animal"] = animal;
  d["target"] = target;
  d["scm_url"] = scm_url;
  d["build_root"] = build_root.string();
  d["trigger_exclude"] = trigger_exclude.value_or("");
  d["trigger_include"] = trigger_include.value_or("");
  d["force_every"] = join_path_list(force_every);
  d["keep_error_builds"] = keep_error_builds ? "1" : "0";
  d["rm_worktrees"] = rm_worktrees ? "1" : "0";
  d["use_vpath"] = use_vpath ? "1" : "0";
  d["use_accache"] = use_accache ? "1" : "0";
  d["make"] = make;
  d["make_jobs"] = std::to_string(make_jobs);
  d["core_file_glob"] = core_file_glob;
  d["config_opts"] = join_path_list(config_opts);
  d["config_env"] = join_path_list(config_env);
  d["build_env"] = join_path_list(build_env);
  d["extra_config"] = joinWords(extra_config, "\n");
  d["locales"] = join_path_list(locales);
  d["base_port"] = base_port.has_value() ? std::to_string(*base_port) : "";
  d["scm_timeout_secs"] = std::to_string(scm_timeout_secs);
  d["wait_timeout"] = std::to_string(wait_timeout);
  d["optional_steps"] = join_path_list(optional_steps);
  d["modules"] = join_path_list(modules);
  d["skip_steps"] = skip_steps;
  d["only_steps"] = only_steps;
  return d;
}
