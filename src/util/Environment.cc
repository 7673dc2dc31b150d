#include "util/Environment.hh"

#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

using std::map;
using std::optional;
using std::string;
using std::vector;

extern char** environ;

Environment Environment::inherited() noexcept {
  Environment env;
  for (int i = 0; environ[i] != nullptr; i++) {
    string variable(environ[i]);
    auto eq = variable.find('=');
    if (eq == string::npos) continue;
    env._vars.emplace(variable.substr(0, eq), variable.substr(eq + 1));
  }
  return env;
}

optional<string> Environment::get(const string& key) const noexcept {
  auto iter = _vars.find(key);
  if (iter == _vars.end()) return std::nullopt;
  return iter->second;
}

void Environment::prepend(const string& key, const string& value, char sep) noexcept {
  auto iter = _vars.find(key);
  if (iter == _vars.end() || iter->second.empty()) {
    _vars[key] = value;
  } else {
    iter->second = value + sep + iter->second;
  }
}

bool Environment::apply(const vector<string>& assignments) noexcept {
  bool ok = true;
  for (const auto& a : assignments) {
    auto eq = a.find('=');
    if (eq == string::npos || eq == 0) {
      ok = false;
      continue;
    }
    _vars[a.substr(0, eq)] = a.substr(eq + 1);
  }
  return ok;
}

vector<string> Environment::entries() const noexcept {
  vector<string> result;
  result.reserve(_vars.size());
  for (const auto& [key, value] : _vars) {
    result.push_back(key + "=" + value);
  }
  return result;
}

map<string, string> Environment::reportable() const noexcept {
  // Only values of these variables are reported; everything else might hold credentials
  static const std::regex prefix_whitelist("^(PG(?!PASSWORD)|MAKE|CC|CPP|CXX|LD|LIBRAR|INCLUDE)");
  static const std::regex exact_whitelist("^(HOME|LOGNAME|USER|PATH|SHELL)$");

  map<string, string> result;
  for (const auto& [key, value] : _vars) {
    if (std::regex_search(key, prefix_whitelist) || std::regex_match(key, exact_whitelist)) {
      result[key] = value;
    } else {
      result[key] = "xxxxxx";
    }
  }
  return result;
}
