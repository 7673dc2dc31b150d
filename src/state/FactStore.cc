#include "state/FactStore.hh"

#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <optional>
#include <string>

#include <unistd.h>

#include "util/log.hh"
#include "util/wrappers.hh"

using std::optional;
using std::string;

optional<std::time_t> FactStore::read(const string& fact) const noexcept {
  auto lines = fileLines(path(fact));
  if (lines.empty()) return std::nullopt;

  const auto& text = lines.front();
  char* end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (end == text.c_str()) {
    WARN << "Ignoring unreadable fact " << path(fact);
    return std::nullopt;
  }
  return static_cast<std::time_t>(value);
}

bool FactStore::write(const string& fact, std::time_t value) noexcept {
  LOGF(snapshot, "Recording {} = {}", fact, value);
  return writeFileAtomic(path(fact), std::to_string(value) + "\n");
}

bool FactStore::remove(const string& fact) noexcept {
  LOGF(snapshot, "Forgetting {}", fact);
  return ::unlink(path(fact).c_str()) == 0 || errno == ENOENT;
}
