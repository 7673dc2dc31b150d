#include "pipeline/SourceVersion.hh"

#include <cctype>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "util/wrappers.hh"

using std::optional;
using std::string;

optional<SourceVersion> SourceVersion::parse(const string& text) noexcept {
  SourceVersion v;
  size_t pos = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    size_t end = pos;
    while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) end++;
    v._parts.push_back(std::stoi(text.substr(pos, end - pos)));
    v._text = text.substr(0, end);
    if (end >= text.size() || text[end] != '.') break;
    pos = end + 1;
  }

  if (v._parts.empty()) return std::nullopt;
  return v;
}

optional<SourceVersion> SourceVersion::detect(const fs::path& source_dir) noexcept {
  static const std::regex ac_init(R"(AC_INIT\(\[\S+\],\s*\[([\d.]+)(?:rc\d+|devel|beta\d+)?\],)");

  for (const char* name : {"configure.in", "configure.ac"}) {
    for (const auto& line : fileLines(source_dir / name)) {
      std::smatch m;
      if (std::regex_search(line, m, ac_init)) return parse(m[1].str());
    }
  }
  return std::nullopt;
}

bool SourceVersion::atLeast(int major, int minor, int patch) const noexcept {
  const int wanted[] = {major, minor, patch};
  for (size_t i = 0; i < 3; i++) {
    int have = i < _parts.size() ? _parts[i] : 0;
    if (have != wanted[i]) return have > wanted[i];
  }
  return true;
}
