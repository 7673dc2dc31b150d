#include "TestSupport.hh"

#include "modules/ModuleRegistry.hh"
#include "pipeline/DbCluster.hh"
#include "report/Report.hh"
#include "runtime/Cancellation.hh"
#include "runtime/LockManager.hh"
#include "runtime/RunContext.hh"
#include "runtime/RunController.hh"
#include "state/SnapshotTracker.hh"
#include "util/constants.hh"
#include "util/wrappers.hh"

#include "gtest/gtest.h"

#include <csignal>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace {

using std::optional;
using std::string;
using std::vector;

/// Use the fake source control and a three-step pipeline of recording steps
void use_fakes(RunController& controller,
               vector<string>& trace,
               int build_status = 0,
               int checkout_status = 0) {
  controller.setSCMFactory([checkout_status](const RunContext& ctx) -> std::unique_ptr<SCM> {
    return std::make_unique<FakeSCM>(ctx, checkout_status);
  });
  controller.setPipelineFactory([&trace, build_status](RunContext&, DbCluster&, ModuleRegistry&) {
    return vector<StepSpec>{recording_step("configure", 0, trace),
                            recording_step("build", build_status, trace),
                            recording_step("check", 0, trace)};
  });
}

/// Read a snapshot fact the way a later run would
optional<std::time_t> snapshot(const Config& config, SnapshotKind kind) {
  FactStore facts(config.build_root / config.branch, config.animal + ".");
  return facts.read(getSnapshotName(kind));
}

fs::path branch_root(const Config& config) {
  return config.build_root / config.branch;
}

TEST(RunControllerTest, lockBusyExitsQuietly) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());
  fs::create_directories(branch_root(config));

  auto held = LockManager::acquire(branch_root(config) / constants::LockFilename);
  ASSERT_TRUE(held.has_value());

  vector<string> trace;
  RunController controller(config);
  use_fakes(controller, trace);
  EXPECT_EQ(controller.run(), 0);
  EXPECT_TRUE(trace.empty());

  // The other holder keeps its lock, and no state was recorded
  EXPECT_TRUE(held->held());
  EXPECT_FALSE(snapshot(config, SnapshotKind::Status).has_value());
}

TEST(RunControllerDeathTest, explicitSourceLockBusyIsFatal) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());
  config.from_source = dir.path() / "source";
  write_configure_ac(*config.from_source);
  fs::create_directories(branch_root(config));

  auto held = LockManager::acquire(branch_root(config) / constants::LockFilename);
  ASSERT_TRUE(held.has_value());

  vector<string> trace;
  RunController controller(config);
  use_fakes(controller, trace);
  EXPECT_EXIT(controller.run(), ::testing::ExitedWithCode(1), "holds the lock");

  EXPECT_TRUE(trace.empty());
  EXPECT_TRUE(held->held());
}

TEST(RunControllerTest, firstRunIsForcedAndSucceeds) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());

  vector<string> trace;
  RunController controller(config);
  use_fakes(controller, trace);
  EXPECT_EQ(controller.run(), 0);
  EXPECT_EQ(trace, vector<string>({"configure", "build", "check"}));

  auto& run = controller.getContext().run;
  EXPECT_EQ(run.steps_completed, vector<string>({"SCM-checkout", "configure", "build", "check"}));
  EXPECT_TRUE(controller.getContext().succeeded);
  EXPECT_FALSE(run.lock_held);
  EXPECT_TRUE(controller.cleanedUp());

  auto run_snap = snapshot(config, SnapshotKind::RunSnap);
  auto success_snap = snapshot(config, SnapshotKind::SuccessSnap);
  ASSERT_TRUE(run_snap.has_value());
  ASSERT_TRUE(success_snap.has_value());
  EXPECT_EQ(*run_snap, run.snapshot_current);
  EXPECT_EQ(*success_snap, run.snapshot_current);
  EXPECT_EQ(snapshot(config, SnapshotKind::Status), optional<std::time_t>(run.start_time));

  // Successful runs leave no build or install tree behind
  EXPECT_FALSE(fs::exists(controller.getContext().build_dir));
  EXPECT_FALSE(fs::exists(controller.getContext().install_dir));

  // The checkout log is written into the freshly cleaned log directory
  EXPECT_TRUE(fs::exists(controller.getContext().logPath("SCM-checkout")));

  // The private temporary directory is gone
  EXPECT_FALSE(controller.getContext().tmp_dir.empty());
  EXPECT_FALSE(fs::exists(controller.getContext().tmp_dir));
}

TEST(RunControllerTest, unchangedTreeSkipsRun) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());

  vector<string> first;
  {
    RunController controller(config);
    use_fakes(controller, first);
    ASSERT_EQ(controller.run(), 0);
  }
  auto status = snapshot(config, SnapshotKind::Status);

  vector<string> second;
  RunController controller(config);
  use_fakes(controller, second);
  EXPECT_EQ(controller.run(), 0);
  EXPECT_TRUE(second.empty());

  // A skipped run records nothing
  EXPECT_EQ(snapshot(config, SnapshotKind::Status), status);
  EXPECT_TRUE(controller.cleanedUp());
}

TEST(RunControllerTest, changedFileTriggersRun) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());
  auto source = branch_root(config) / constants::SourceDirname;
  auto t0 = std::time(nullptr) - 3600;
  auto t1 = std::time(nullptr) + 3600;

  touch(source / "src" / "backend" / "main.c", t0, "int main;\n");
  write_configure_ac(source);
  touch(source / "configure.ac", t0);

  vector<string> first;
  {
    RunController controller(config);
    use_fakes(controller, first);
    ASSERT_EQ(controller.run(), 0);
  }
  EXPECT_EQ(snapshot(config, SnapshotKind::SuccessSnap), optional<std::time_t>(t0));

  touch(source / "src" / "backend" / "main.c", t1);

  vector<string> second;
  RunController controller(config);
  use_fakes(controller, second);
  EXPECT_EQ(controller.run(), 0);
  EXPECT_EQ(second, vector<string>({"configure", "build", "check"}));
  EXPECT_EQ(controller.getContext().run.changed_files, vector<string>({"src/backend/main.c"}));
  EXPECT_EQ(snapshot(config, SnapshotKind::RunSnap), optional<std::time_t>(t1));
  EXPECT_EQ(snapshot(config, SnapshotKind::SuccessSnap), optional<std::time_t>(t1));
}

TEST(RunControllerTest, excludedChangeDoesNotTrigger) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());
  config.trigger_exclude = "^doc/";
  auto source = branch_root(config) / constants::SourceDirname;
  auto t0 = std::time(nullptr) - 3600;

  write_configure_ac(source);
  touch(source / "configure.ac", t0);

  vector<string> first;
  {
    RunController controller(config);
    use_fakes(controller, first);
    ASSERT_EQ(controller.run(), 0);
  }

  touch(source / "doc" / "src" / "sgml" / "intro.sgml", t0 + 60, "<para>\n");

  vector<string> second;
  RunController controller(config);
  use_fakes(controller, second);
  EXPECT_EQ(controller.run(), 0);
  EXPECT_TRUE(second.empty());

  // The change is seen, but the run snapshot does not advance past it
  EXPECT_EQ(controller.getContext().run.changed_files,
            vector<string>({"doc/src/sgml/intro.sgml"}));
  EXPECT_EQ(snapshot(config, SnapshotKind::RunSnap), optional<std::time_t>(t0));
}

TEST(RunControllerTest, forceFileForcesOneRun) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());

  vector<string> first;
  {
    RunController controller(config);
    use_fakes(controller, first);
    ASSERT_EQ(controller.run(), 0);
  }

  auto force_file = branch_root(config) / (config.animal + "." + constants::ForceFilename);
  touch(force_file, std::time(nullptr));

  vector<string> second;
  RunController controller(config);
  use_fakes(controller, second);
  EXPECT_EQ(controller.run(), 0);
  EXPECT_EQ(second.size(), 3u);
  EXPECT_FALSE(fs::exists(force_file));
}

TEST(RunControllerTest, stepFailureIsReported) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());

  vector<string> trace;
  RunController controller(config);
  use_fakes(controller, trace, 2);
  EXPECT_EQ(controller.run(), 1);
  EXPECT_EQ(trace, vector<string>({"configure", "build"}));
  EXPECT_FALSE(controller.getContext().succeeded);

  auto record = load_report(controller.getContext().log_dir / constants::TxnFilename);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->stage, "build");
  EXPECT_EQ(record->status, 2);
  EXPECT_EQ(record->steps_completed, vector<string>({"SCM-checkout", "configure"}));
  EXPECT_NE(record->log_data.find("build output"), string::npos);

  // The run snapshot advanced, the success snapshot did not
  EXPECT_TRUE(snapshot(config, SnapshotKind::RunSnap).has_value());
  EXPECT_FALSE(snapshot(config, SnapshotKind::SuccessSnap).has_value());
}

TEST(RunControllerTest, checkoutFailureIsReported) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());

  vector<string> trace;
  RunController controller(config);
  use_fakes(controller, trace, 0, 128);
  EXPECT_EQ(controller.run(), 1);
  EXPECT_TRUE(trace.empty());
  EXPECT_TRUE(controller.getContext().run.steps_completed.empty());

  auto record = load_report(controller.getContext().log_dir / constants::TxnFilename);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->stage, "SCM-checkout");
  EXPECT_EQ(record->status, 128);

  // A failed checkout never starts the run
  EXPECT_FALSE(snapshot(config, SnapshotKind::Status).has_value());
}

TEST(RunControllerTest, lockReleasedAfterRun) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());

  vector<string> trace;
  RunController controller(config);
  use_fakes(controller, trace, 2);
  EXPECT_EQ(controller.run(), 1);

  auto lock = LockManager::acquire(branch_root(config) / constants::LockFilename);
  EXPECT_TRUE(lock.has_value());
}

TEST(RunControllerTest, cleanupRunsOnce) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());

  vector<string> trace;
  RunController controller(config);
  use_fakes(controller, trace);
  EXPECT_EQ(controller.run(), 0);
  EXPECT_TRUE(controller.cleanedUp());

  // Another process may take the lock once the run is done; a repeated cleanup must not disturb it
  auto lock = LockManager::acquire(branch_root(config) / constants::LockFilename);
  ASSERT_TRUE(lock.has_value());
  controller.cleanup();
  controller.cleanup();
  EXPECT_TRUE(lock->held());
}

/// Steps that leave a build and install tree behind before failing
vector<StepSpec> failing_with_trees() {
  StepSpec spec;
  spec.name = "make";
  spec.action = [](RunContext& ctx) {
    touch(ctx.build_dir / "src" / "backend" / "postgres", std::time(nullptr));
    touch(ctx.install_dir / "bin" / "postgres", std::time(nullptr));
    StepResult result;
    result.status = 2;
    result.log.push_back("make: *** [all] Error 2");
    return result;
  };
  return {spec};
}

TEST(RunControllerTest, errorTreesRemovedByDefault) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());

  vector<string> trace;
  RunController controller(config);
  use_fakes(controller, trace);
  controller.setPipelineFactory(
      [](RunContext&, DbCluster&, ModuleRegistry&) { return failing_with_trees(); });
  EXPECT_EQ(controller.run(), 1);
  EXPECT_FALSE(fs::exists(controller.getContext().build_dir));
  EXPECT_FALSE(fs::exists(controller.getContext().install_dir));
}

TEST(RunControllerTest, keepErrorBuildsRenamesTrees) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());
  config.keep_error_builds = true;

  vector<string> trace;
  RunController controller(config);
  use_fakes(controller, trace);
  controller.setPipelineFactory(
      [](RunContext&, DbCluster&, ModuleRegistry&) { return failing_with_trees(); });
  EXPECT_EQ(controller.run(), 1);
  EXPECT_FALSE(fs::exists(controller.getContext().build_dir));
  EXPECT_FALSE(fs::exists(controller.getContext().install_dir));

  int kept_builds = 0;
  int kept_installs = 0;
  for (const auto& entry : fs::directory_iterator(branch_root(config))) {
    auto name = entry.path().filename().string();
    if (name.rfind("pgsqlkeep.", 0) == 0) kept_builds++;
    if (name.rfind("instkeep.", 0) == 0) kept_installs++;
  }
  EXPECT_EQ(kept_builds, 1);
  EXPECT_EQ(kept_installs, 1);
}

TEST(RunControllerTest, keepallLeavesTrees) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());
  config.keepall = true;

  vector<string> trace;
  RunController controller(config);
  use_fakes(controller, trace);
  controller.setPipelineFactory(
      [](RunContext&, DbCluster&, ModuleRegistry&) { return failing_with_trees(); });
  EXPECT_EQ(controller.run(), 1);
  EXPECT_TRUE(fs::exists(controller.getContext().build_dir));
  EXPECT_TRUE(fs::exists(controller.getContext().install_dir));
}

TEST(RunControllerTest, failedDeliveryRollsBack) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());

  vector<string> first;
  {
    RunController controller(config);
    use_fakes(controller, first);
    ASSERT_EQ(controller.run(), 0);
  }
  auto status = snapshot(config, SnapshotKind::Status);
  auto run_snap = snapshot(config, SnapshotKind::RunSnap);
  auto success_snap = snapshot(config, SnapshotKind::SuccessSnap);

  config.nosend = false;
  config.force = true;
  config.target = "https://buildfarm.example.org/";

  vector<string> second;
  int calls = 0;
  RunController controller(config);
  use_fakes(controller, second);
  controller.setTransportFactory([&calls](const RunContext&) -> std::unique_ptr<Transport> {
    return std::make_unique<FakeTransport>(7, calls);
  });
  EXPECT_EQ(controller.run(), 7);
  EXPECT_EQ(second.size(), 3u);
  EXPECT_EQ(calls, 1);

  EXPECT_EQ(snapshot(config, SnapshotKind::Status), status);
  EXPECT_EQ(snapshot(config, SnapshotKind::RunSnap), run_snap);
  EXPECT_EQ(snapshot(config, SnapshotKind::SuccessSnap), success_snap);
}

TEST(RunControllerTest, repeatedFailedDeliveriesRetryUntilSent) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());
  auto source = branch_root(config) / constants::SourceDirname;
  auto t0 = std::time(nullptr) - 3600;
  auto t1 = std::time(nullptr) + 3600;

  touch(source / "src" / "backend" / "main.c", t0, "int main;\n");
  write_configure_ac(source);
  touch(source / "configure.ac", t0);

  {
    vector<string> trace;
    RunController controller(config);
    use_fakes(controller, trace);
    ASSERT_EQ(controller.run(), 0);
  }
  auto status = snapshot(config, SnapshotKind::Status);
  auto run_snap = snapshot(config, SnapshotKind::RunSnap);
  auto success_snap = snapshot(config, SnapshotKind::SuccessSnap);
  ASSERT_EQ(run_snap, optional<std::time_t>(t0));

  touch(source / "src" / "backend" / "main.c", t1);

  config.nosend = false;
  config.target = "https://buildfarm.example.org/";

  // Each failed delivery leaves the facts as they were, so the same change triggers again
  for (int attempt = 0; attempt < 3; attempt++) {
    vector<string> trace;
    int calls = 0;
    RunController controller(config);
    use_fakes(controller, trace);
    controller.setTransportFactory([&calls](const RunContext&) -> std::unique_ptr<Transport> {
      return std::make_unique<FakeTransport>(7, calls);
    });
    EXPECT_EQ(controller.run(), 7) << "attempt " << attempt;
    EXPECT_EQ(trace.size(), 3u) << "attempt " << attempt;
    EXPECT_EQ(calls, 1) << "attempt " << attempt;

    EXPECT_EQ(snapshot(config, SnapshotKind::Status), status) << "attempt " << attempt;
    EXPECT_EQ(snapshot(config, SnapshotKind::RunSnap), run_snap) << "attempt " << attempt;
    EXPECT_EQ(snapshot(config, SnapshotKind::SuccessSnap), success_snap) << "attempt " << attempt;
  }

  vector<string> trace;
  int calls = 0;
  RunController controller(config);
  use_fakes(controller, trace);
  controller.setTransportFactory([&calls](const RunContext&) -> std::unique_ptr<Transport> {
    return std::make_unique<FakeTransport>(0, calls);
  });
  EXPECT_EQ(controller.run(), 0);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(controller.getContext().run.changed_files, vector<string>({"src/backend/main.c"}));
  EXPECT_EQ(snapshot(config, SnapshotKind::RunSnap), optional<std::time_t>(t1));
  EXPECT_EQ(snapshot(config, SnapshotKind::SuccessSnap), optional<std::time_t>(t1));
}

TEST(RunControllerTest, cancelledRunStillRunsCleanupHooks) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());
  config.hooks = {"cleanup:sleep 0.2; echo done > cleanup-ran"};
  cancellation::reset();

  // A step that finishes while a termination request arrives
  StepSpec spec;
  spec.name = "make";
  spec.action = [](RunContext&) {
    cancellation::request(SIGTERM);
    return StepResult();
  };

  vector<string> trace;
  RunController controller(config);
  use_fakes(controller, trace);
  controller.setPipelineFactory(
      [&spec](RunContext&, DbCluster&, ModuleRegistry&) { return vector<StepSpec>{spec}; });

  EXPECT_EQ(controller.run(), 128 + SIGTERM);
  EXPECT_TRUE(controller.cleanedUp());
  EXPECT_FALSE(cancellation::requested());

  auto marker = branch_root(config) / "cleanup-ran";
  ASSERT_TRUE(fs::exists(marker));
  EXPECT_EQ(fileLines(marker), vector<string>({"done"}));

  cancellation::reset();
}

TEST(RunControllerTest, nostatusRecordsNothing) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());
  config.nostatus = true;

  vector<string> trace;
  RunController controller(config);
  use_fakes(controller, trace);
  EXPECT_EQ(controller.run(), 0);
  EXPECT_EQ(trace.size(), 3u);
  EXPECT_FALSE(snapshot(config, SnapshotKind::Status).has_value());
  EXPECT_FALSE(snapshot(config, SnapshotKind::RunSnap).has_value());
  EXPECT_FALSE(snapshot(config, SnapshotKind::SuccessSnap).has_value());
}

}
