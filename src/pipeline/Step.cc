#include "pipeline/Step.hh"

#include <optional>
#include <set>
#include <string>

using std::optional;
using std::set;
using std::string;

optional<FilterSet> FilterSet::create(set<string> skip, set<string> only) noexcept {
  if (!skip.empty() && !only.empty()) return std::nullopt;

  FilterSet filters;
  filters._skip = std::move(skip);
  filters._only = std::move(only);
  return filters;
}

bool FilterSet::wanted(const string& step) const noexcept {
  if (!_only.empty()) return _only.count(step) > 0;
  return _skip.count(step) == 0;
}
