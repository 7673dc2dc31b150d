#include "report/Transport.hh"

#include "runtime/Subprocess.hh"
#include "util/Environment.hh"
#include "util/log.hh"
#include "util/shell.hh"

int CommandTransport::send(const fs::path& txn_dir) noexcept {
  LOG(report) << "Sending report from " << txn_dir;

  auto result = run_log(_command + " " + shell_escaped(txn_dir.string()), _env);
  for (const auto& line : result.log) {
    LOG(report) << line;
  }

  return result.status;
}
