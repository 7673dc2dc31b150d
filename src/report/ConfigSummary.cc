#include "report/ConfigSummary.hh"

#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <cereal/archives/json.hpp>
#include <cereal/types/map.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

#include "runtime/RunContext.hh"
#include "util/constants.hh"
#include "util/log.hh"
#include "util/serializer.hh"
#include "util/wrappers.hh"

using std::map;
using std::string;
using std::vector;

namespace {
  /// The script configuration, as dumped into reports
  struct ScriptConfig {
    map<string, string> config;
    string script_version;
    vector<string> invocation_args;
    vector<string> steps_completed;
    map<string, string> orig_env;

    SERIALIZE(FIELD(config),
              FIELD(script_version),
              FIELD(invocation_args),
              FIELD(steps_completed),
              FIELD(orig_env));
  };

  /// Break the long configure command line so the summary stays readable
  string wrap_configure_line(string line) {
    for (size_t pos : {420, 350, 280, 210, 140, 70}) {
      auto space = line.find(' ', pos);
      if (space != string::npos) line.insert(space + 1, "\\\n        ");
    }
    return line;
  }
}

string config_log_excerpt(const fs::path& config_log) noexcept {
  string excerpt;
  bool started = false;

  for (auto line : fileLines(config_log)) {
    if (!started && line.find("created by PostgreSQL configure") != string::npos) {
      started = true;
      auto it_was = line.find("It was");
      if (it_was != string::npos) line.replace(it_was, 6, "This file was");
    }
    if (!started) continue;
    if (line.find("Core tests") != string::npos) break;
    if (!line.empty() && line[0] == '#') continue;
    if (line.find("= unknown") != string::npos || line.find("= <unknown>") != string::npos) {
      continue;
    }

    if (line.find('$') != string::npos && line.find("configure") != string::npos &&
        line.find("--with") != string::npos) {
      line = wrap_configure_line(line);
    }
    excerpt += line + "\n";
  }

  return excerpt;
}

string script_config_dump(const RunContext& ctx) noexcept {
  ScriptConfig dump;
  dump.config = ctx.config.dump();
  dump.script_version = constants::ScriptVersion;
  dump.invocation_args = ctx.config.invocation_args;
  dump.steps_completed = ctx.run.steps_completed;
  dump.orig_env = ctx.env.reportable();

  std::ostringstream out;
  try {
    cereal::JSONOutputArchive archive(out);
    archive(cereal::make_nvp("script_config", dump));
  } catch (cereal::Exception& e) {
    WARN << "Failed to produce configuration dump: " << e.what();
  }
  return out.str() + "\n";
}

string config_summary(const RunContext& ctx) noexcept {
  string summary;

  // If configure failed badly there may be no log at all
  auto excerpt = config_log_excerpt(ctx.build_dir / "config.log");
  if (!excerpt.empty()) {
    summary += excerpt;
    summary += "\n========================================================\n";
  }

  return summary + script_config_dump(ctx);
}
