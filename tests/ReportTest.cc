#include "TestSupport.hh"

#include "report/ConfigSummary.hh"
#include "report/Report.hh"
#include "report/ResultReporter.hh"
#include "runtime/RunContext.hh"
#include "state/FactStore.hh"
#include "state/SnapshotTracker.hh"
#include "util/constants.hh"

#include "gtest/gtest.h"

#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace {

using std::string;
using std::vector;

const std::time_t Now = 1700000000;

/// A run context plus the facts and tracker a reporter works with
struct ReportFixture {
  RunContext ctx;
  FactStore facts;
  SnapshotTracker tracker;

  ReportFixture(Config config) :
      ctx(std::move(config)),
      facts(ctx.branch_root, ctx.st_prefix),
      tracker(facts, TriggerFilter(), ctx.config.nostatus) {
    fs::create_directories(ctx.log_dir);
    ctx.run.start_time = Now;
  }

  /// Simulate the start of a run over history (status Now-3600, run.snap 5000)
  void startRun(std::time_t snapshot) {
    facts.write("status", Now - 3600);
    facts.write("run.snap", 5000);
    tracker.load(ctx.run, false, std::nullopt, Now);
    ctx.run.snapshot_current = snapshot;
    tracker.recordRunStart(ctx.run, Now);
  }
};

Config sending(const TmpDir& dir) {
  auto config = test_config(dir.path());
  config.nosend = false;
  config.target = "https://buildfarm.example.org/";
  config.web_txn_command = "true";
  config.secret = "s3cret";
  return config;
}

TEST(ReportRecordTest, saveAndLoad) {
  TmpDir dir(__func__);
  auto path = dir.path() / "web-txn.data";

  ReportRecord record;
  record.branch = "REL_16_STABLE";
  record.stage = "check";
  record.status = 2;
  record.animal = "dormouse";
  record.ts = Now;
  record.log_data = "line one\nline \"two\"\n";
  record.changed_this_run = "src/a.c!src/b.c";
  record.steps_completed = {"SCM-checkout", "configure", "build"};

  ASSERT_TRUE(save_report(path, record));
  auto loaded = load_report(path);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->branch, record.branch);
  EXPECT_EQ(loaded->stage, record.stage);
  EXPECT_EQ(loaded->status, record.status);
  EXPECT_EQ(loaded->ts, record.ts);
  EXPECT_EQ(loaded->log_data, record.log_data);
  EXPECT_EQ(loaded->changed_this_run, record.changed_this_run);
  EXPECT_EQ(loaded->steps_completed, record.steps_completed);
}

TEST(ReportRecordTest, loadMissingOrMalformed) {
  TmpDir dir(__func__);
  EXPECT_FALSE(load_report(dir.path() / "absent").has_value());

  std::ofstream(dir.path() / "garbage") << "this is not a report";
  EXPECT_FALSE(load_report(dir.path() / "garbage").has_value());
}

TEST(ResultReporterTest, exclusionStages) {
  EXPECT_TRUE(ResultReporter::exclusionStage("SCM-checkout"));
  EXPECT_TRUE(ResultReporter::exclusionStage("Git-Dirty"));
  EXPECT_TRUE(ResultReporter::exclusionStage("lock"));
  EXPECT_FALSE(ResultReporter::exclusionStage("build"));
  EXPECT_FALSE(ResultReporter::exclusionStage(ResultReporter::OK));
}

TEST(ResultReporterTest, assembleFailure) {
  TmpDir dir(__func__);
  ReportFixture f(sending(dir));
  f.ctx.run.snapshot_current = 6000;
  f.ctx.run.changed_files = {"src/a.c", "src/b.c"};
  f.ctx.run.changed_since_success = {"doc/x.sgml", "src/a.c", "src/b.c"};
  f.ctx.run.steps_completed = {"SCM-checkout", "configure"};

  ResultReporter reporter(f.ctx, f.tracker, nullptr);
  auto record = reporter.assemble("build", 2, {"make: *** [all] Error 2"});

  EXPECT_EQ(record.stage, "build");
  EXPECT_EQ(record.status, 2);
  EXPECT_EQ(record.branch, "HEAD");
  EXPECT_EQ(record.animal, "testanimal");
  EXPECT_EQ(record.ts, Now);
  EXPECT_EQ(record.secret, "s3cret");
  EXPECT_EQ(record.changed_this_run, "src/a.c!src/b.c");
  EXPECT_EQ(record.changed_since_success, "doc/x.sgml!src/a.c!src/b.c");
  EXPECT_EQ(record.steps_completed, vector<string>({"SCM-checkout", "configure"}));

  // The log starts with the snapshot time
  EXPECT_EQ(record.log_data.rfind("Last file mtime in snapshot: ", 0), 0u);
  EXPECT_NE(record.log_data.find("make: *** [all] Error 2\n"), string::npos);

  // The configuration summary never carries the secret
  EXPECT_NE(record.confsum.find("script_config"), string::npos);
  EXPECT_EQ(record.confsum.find("s3cret"), string::npos);
}

TEST(ResultReporterTest, assembleSuccessOmitsSinceSuccess) {
  TmpDir dir(__func__);
  ReportFixture f(sending(dir));
  f.ctx.run.changed_files = {"src/a.c"};
  f.ctx.run.changed_since_success = {"src/a.c"};
  f.ctx.saved_config_summary = "saved summary";

  ResultReporter reporter(f.ctx, f.tracker, nullptr);
  auto record = reporter.assemble(ResultReporter::OK, 0, {});
  EXPECT_EQ(record.changed_this_run, "src/a.c");
  EXPECT_TRUE(record.changed_since_success.empty());
  EXPECT_EQ(record.confsum, "saved summary");

  // No snapshot means no snapshot line
  EXPECT_TRUE(record.log_data.empty());
}

TEST(ResultReporterTest, localSuccessExitsZero) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());
  ReportFixture f(config);
  f.startRun(6000);

  ResultReporter reporter(f.ctx, f.tracker, nullptr);
  EXPECT_EQ(reporter.report(ResultReporter::OK, 0, {}), 0);
  EXPECT_EQ(f.tracker.readSnapshot(SnapshotKind::SuccessSnap), std::optional<std::time_t>(6000));
  EXPECT_TRUE(fs::exists(f.ctx.log_dir / constants::TxnFilename));
}

TEST(ResultReporterTest, localFailureExitsOne) {
  TmpDir dir(__func__);
  ReportFixture f(test_config(dir.path()));
  f.startRun(6000);

  ResultReporter reporter(f.ctx, f.tracker, nullptr);
  EXPECT_EQ(reporter.report("build", 2, {"error"}), 1);
  EXPECT_FALSE(f.tracker.readSnapshot(SnapshotKind::SuccessSnap).has_value());

  // The transaction is persisted even though nothing was sent
  auto record = load_report(f.ctx.log_dir / constants::TxnFilename);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->stage, "build");
  EXPECT_EQ(record->status, 2);
}

TEST(ResultReporterTest, deliveredFailureExitsOne) {
  TmpDir dir(__func__);
  ReportFixture f(sending(dir));
  f.startRun(6000);

  int calls = 0;
  FakeTransport transport(0, calls);
  ResultReporter reporter(f.ctx, f.tracker, &transport);
  EXPECT_EQ(reporter.report("check", 1, {"regression failed"}), 1);
  EXPECT_EQ(calls, 1);

  // A delivered failure keeps the advanced status and run snapshot
  EXPECT_EQ(f.tracker.readSnapshot(SnapshotKind::Status), std::optional<std::time_t>(Now));
  EXPECT_EQ(f.tracker.readSnapshot(SnapshotKind::RunSnap), std::optional<std::time_t>(6000));
}

TEST(ResultReporterTest, deliveredSuccessAdvancesSuccessSnapshot) {
  TmpDir dir(__func__);
  ReportFixture f(sending(dir));
  f.startRun(6000);

  int calls = 0;
  FakeTransport transport(0, calls);
  ResultReporter reporter(f.ctx, f.tracker, &transport);
  EXPECT_EQ(reporter.report(ResultReporter::OK, 0, {}), 0);
  EXPECT_EQ(f.tracker.readSnapshot(SnapshotKind::SuccessSnap), std::optional<std::time_t>(6000));
}

TEST(ResultReporterTest, transportFailureRollsBack) {
  TmpDir dir(__func__);
  ReportFixture f(sending(dir));
  f.startRun(6000);

  int calls = 0;
  FakeTransport transport(7, calls);
  ResultReporter reporter(f.ctx, f.tracker, &transport);

  // Repeated failures leave exactly the pre-run values behind
  for (int i = 0; i < 3; i++) {
    EXPECT_EQ(reporter.report("build", 2, {"error"}), 7);
    EXPECT_EQ(f.tracker.readSnapshot(SnapshotKind::Status),
              std::optional<std::time_t>(Now - 3600));
    EXPECT_EQ(f.tracker.readSnapshot(SnapshotKind::RunSnap), std::optional<std::time_t>(5000));
    EXPECT_FALSE(f.tracker.readSnapshot(SnapshotKind::SuccessSnap).has_value());
  }
  EXPECT_EQ(calls, 3);
}

TEST(ResultReporterTest, exclusionStageRemovesStaleArchive) {
  TmpDir dir(__func__);
  ReportFixture f(sending(dir));
  touch(f.ctx.log_dir / constants::ArchiveFilename, Now, "stale");

  int calls = 0;
  FakeTransport transport(0, calls);
  ResultReporter reporter(f.ctx, f.tracker, &transport);
  EXPECT_EQ(reporter.report("SCM-checkout", 128, {"fatal: repository not found"}), 1);
  EXPECT_FALSE(fs::exists(f.ctx.log_dir / constants::ArchiveFilename));
}

TEST(ConfigSummaryTest, configLogExcerpt) {
  TmpDir dir(__func__);
  auto log = dir.path() / "config.log";
  std::ofstream(log) << "garbage before\n"
                     << "This file contains any messages produced by compilers while\n"
                     << "It was created by PostgreSQL configure 16devel, which was\n"
                     << "generated by GNU Autoconf 2.69.  Invocation command line was\n"
                     << "## --------- ##\n"
                     << "uname -m = x86_64\n"
                     << "/usr/bin/hostinfo      = unknown\n"
                     << "/bin/machine           = <unknown>\n"
                     << "## Core tests. ##\n"
                     << "configure:1234: checking build system type\n";

  auto excerpt = config_log_excerpt(log);
  EXPECT_EQ(excerpt,
            "This file was created by PostgreSQL configure 16devel, which was\n"
            "generated by GNU Autoconf 2.69.  Invocation command line was\n"
            "uname -m = x86_64\n");

  EXPECT_TRUE(config_log_excerpt(dir.path() / "absent").empty());
}

}
