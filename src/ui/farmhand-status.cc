#include <ctime>
#include <iostream>
#include <optional>
#include <string>

#include <fmt/core.h>

#include "state/FactStore.hh"
#include "state/SnapshotTracker.hh"
#include "ui/commands.hh"
#include "util/log.hh"

using std::cout;
using std::endl;

/**
 * Run the `show-status` subcommand. The facts are only read, so no lock is taken.
 */
int do_show_status(Config config) noexcept {
  FAIL_IF(config.animal.empty()) << "no animal name configured";
  FAIL_IF(config.build_root.empty()) << "no build_root";

  auto branch_root = config.build_root / config.branch;
  FactStore facts(branch_root, config.animal + ".");
  SnapshotTracker tracker(facts, TriggerFilter(), true);

  cout << config.animal << ":" << config.branch << " in " << branch_root.string() << endl;

  for (auto kind : {SnapshotKind::Status, SnapshotKind::RunSnap, SnapshotKind::SuccessSnap}) {
    auto value = tracker.readSnapshot(kind);
    if (value.has_value()) {
      cout << fmt::format("  {:<14}{} GMT ({})", getSnapshotName(kind), gmt_str(*value), *value)
           << endl;
    } else {
      cout << fmt::format("  {:<14}never recorded", getSnapshotName(kind)) << endl;
    }
  }

  return 0;
}
