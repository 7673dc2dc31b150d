#pragma once

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <glob.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace fs = std::filesystem;

inline std::string getSignalName(int sig) {
  static std::map<int, std::string> signals{
      {SIGHUP, "SIGHUP"},       {SIGINT, "SIGINT"},       {SIGQUIT, "SIGQUIT"},
      {SIGILL, "SIGILL"},       {SIGTRAP, "SIGTRAP"},     {SIGABRT, "SIGABRT"},
      {SIGBUS, "SIGBUS"},       {SIGFPE, "SIGFPE"},       {SIGKILL, "SIGKILL"},
      {SIGUSR1, "SIGUSR1"},     {SIGSEGV, "SIGSEGV"},     {SIGUSR2, "SIGUSR2"},
      {SIGPIPE, "SIGPIPE"},     {SIGALRM, "SIGALRM"},     {SIGTERM, "SIGTERM"},
      {SIGCHLD, "SIGCHLD"},     {SIGCONT, "SIGCONT"},     {SIGSTOP, "SIGSTOP"},
      {SIGTSTP, "SIGTSTP"},     {SIGXCPU, "SIGXCPU"},     {SIGXFSZ, "SIGXFSZ"},
      {SIGSYS, "SIGSYS"}};

  auto iter = signals.find(sig);
  if (iter == signals.end()) {
    return "UNKNOWN (" + std::to_string(sig) + ")";
  } else {
    return iter->second;
  }
}

/// Check whether a file exists
inline bool fileExists(const fs::path& p) noexcept {
  struct stat statbuf;
  return ::lstat(p.c_str(), &statbuf) == 0;
}

/// Check whether a path names a directory
inline bool dirExists(const fs::path& p) noexcept {
  struct stat statbuf;
  return ::stat(p.c_str(), &statbuf) == 0 && S_ISDIR(statbuf.st_mode);
}

/// Obtain the length of a file in bytes, or -1 if it cannot be stat'ed
inline off_t fileLength(const fs::path& p) noexcept {
  struct stat statbuf;
  if (::stat(p.c_str(), &statbuf) == -1) return -1;
  return statbuf.st_size;
}

/// Get the modification time of a file, if it exists
inline std::optional<std::time_t> fileMTime(const fs::path& p) noexcept {
  struct stat statbuf;
  if (::stat(p.c_str(), &statbuf) == -1) return std::nullopt;
  return statbuf.st_mtime;
}

/// Read the lines of a file, starting at a byte offset. Missing files produce no lines.
inline std::vector<std::string> fileLines(const fs::path& p, off_t offset = 0) noexcept {
  std::vector<std::string> lines;
  std::ifstream in(p);
  if (!in) return lines;
  if (offset > 0) in.seekg(offset);

  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

/// Expand one or more whitespace-separated shell glob patterns. Results are sorted per pattern.
inline std::vector<fs::path> globPaths(const std::string& patterns) noexcept {
  std::vector<fs::path> result;

  glob_t g;
  int flags = 0;
  size_t start = 0;
  bool any = false;
  while (start < patterns.size()) {
    size_t end = patterns.find_first_of(" \t", start);
    if (end == std::string::npos) end = patterns.size();
    if (end > start) {
      auto pattern = patterns.substr(start, end - start);
      int rc = ::glob(pattern.c_str(), flags, nullptr, &g);
      if (rc == 0 || rc == GLOB_NOMATCH) {
        flags |= GLOB_APPEND;
        any = true;
      }
    }
    start = end + 1;
  }

  if (!any) return result;

  for (size_t i = 0; i < g.gl_pathc; i++) {
    result.emplace_back(g.gl_pathv[i]);
  }
  ::globfree(&g);
  return result;
}

/// Remove a directory tree, ignoring errors. Returns true if nothing remains at the path.
inline bool removeTree(const fs::path& p) noexcept {
  std::error_code ec;
  fs::remove_all(p, ec);
  return !fileExists(p);
}

/// Replace a file's contents by writing a temporary file and renaming it over the original
inline bool writeFileAtomic(const fs::path& p, const std::string& contents) noexcept {
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) return false;
    out << contents;
    out.flush();
    if (!out) return false;
  }
  return ::rename(tmp.c_str(), p.c_str()) == 0;
}

/// Write a sequence of lines to a file
inline bool writeLines(const fs::path& p, const std::vector<std::string>& lines) noexcept {
  std::ofstream out(p, std::ios::trunc);
  if (!out) return false;
  for (const auto& line : lines) {
    out << line << '\n';
  }
  return static_cast<bool>(out);
}

/// Split a string on any of the given separator characters, dropping empty fields
inline std::vector<std::string> splitWords(const std::string& s,
                                           const std::string& separators = " \t\n,") noexcept {
  std::vector<std::string> words;
  size_t start = 0;
  while (start <= s.size()) {
    size_t end = s.find_first_of(separators, start);
    if (end == std::string::npos) end = s.size();
    if (end > start) words.push_back(s.substr(start, end - start));
    start = end + 1;
  }
  return words;
}

/// Join strings with a separator
inline std::string joinWords(const std::vector<std::string>& words, const std::string& sep) {
  std::string result;
  for (size_t i = 0; i < words.size(); i++) {
    if (i > 0) result += sep;
    result += words[i];
  }
  return result;
}
