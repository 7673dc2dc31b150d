#include "TestSupport.hh"

#include "pipeline/StepScheduler.hh"
#include "runtime/Cancellation.hh"
#include "runtime/RunContext.hh"
#include "util/wrappers.hh"

#include "gtest/gtest.h"

#include <csignal>
#include <string>
#include <vector>

namespace {

using std::string;
using std::vector;

Config config_in(const TmpDir& dir, const string& skip = "", const string& only = "") {
  auto config = test_config(dir.path());
  config.skip_steps = skip;
  config.only_steps = only;
  return config;
}

TEST(StepSchedulerTest, runsEveryStepInOrder) {
  TmpDir dir(__func__);
  RunContext ctx(config_in(dir));
  vector<string> trace;

  StepScheduler scheduler(ctx);
  auto outcome = scheduler.run({recording_step("configure", 0, trace),
                                recording_step("build", 0, trace),
                                recording_step("check", 0, trace)});

  EXPECT_TRUE(outcome.ok());
  EXPECT_EQ(trace, vector<string>({"configure", "build", "check"}));
  EXPECT_EQ(ctx.run.steps_completed, vector<string>({"configure", "build", "check"}));
}

TEST(StepSchedulerTest, failFast) {
  TmpDir dir(__func__);
  RunContext ctx(config_in(dir));
  vector<string> trace;

  StepScheduler scheduler(ctx);
  auto outcome = scheduler.run({recording_step("configure", 0, trace),
                                recording_step("build", 2, trace),
                                recording_step("check", 0, trace),
                                recording_step("install", 0, trace)});

  ASSERT_TRUE(outcome.failure.has_value());
  EXPECT_FALSE(outcome.cancelled);
  EXPECT_EQ(outcome.failure->stage, "build");
  EXPECT_EQ(outcome.failure->status, 2);
  EXPECT_EQ(outcome.failure->log, vector<string>({"build output"}));

  // Nothing after the failure ran, and the failed step is not listed
  EXPECT_EQ(trace, vector<string>({"configure", "build"}));
  EXPECT_EQ(ctx.run.steps_completed, vector<string>({"configure"}));
}

TEST(StepSchedulerTest, skipSteps) {
  TmpDir dir(__func__);
  RunContext ctx(config_in(dir, "check install"));
  vector<string> trace;

  StepScheduler scheduler(ctx);
  auto outcome = scheduler.run({recording_step("build", 0, trace),
                                recording_step("check", 0, trace),
                                recording_step("install", 0, trace)});

  EXPECT_TRUE(outcome.ok());
  EXPECT_EQ(trace, vector<string>({"build"}));
}

TEST(StepSchedulerTest, onlySteps) {
  TmpDir dir(__func__);
  RunContext ctx(config_in(dir, "", "check,no-such-step"));
  vector<string> trace;

  StepScheduler scheduler(ctx);
  scheduler.run({recording_step("build", 0, trace), recording_step("check", 0, trace)});

  EXPECT_EQ(trace, vector<string>({"check"}));
}

TEST(StepSchedulerTest, predicateSkipsStep) {
  TmpDir dir(__func__);
  RunContext ctx(config_in(dir));
  vector<string> trace;

  auto pl_check = recording_step("pl-check", 0, trace);
  pl_check.predicate = [](const RunContext& c) { return c.configured("--with-perl"); };

  StepScheduler scheduler(ctx);
  auto outcome = scheduler.run({recording_step("build", 0, trace), pl_check});

  EXPECT_TRUE(outcome.ok());
  EXPECT_EQ(trace, vector<string>({"build"}));
  EXPECT_EQ(ctx.run.steps_completed, vector<string>({"build"}));
}

TEST(StepSchedulerTest, requiredStepsFollowFilter) {
  TmpDir dir(__func__);
  RunContext ctx(config_in(dir, "build"));
  vector<string> trace;

  auto check = recording_step("check", 0, trace);
  check.requires_steps = {"build"};

  StepScheduler scheduler(ctx);
  scheduler.run({recording_step("configure", 0, trace), check});

  EXPECT_EQ(trace, vector<string>({"configure"}));
}

TEST(StepSchedulerTest, unfilterableStepIgnoresFilter) {
  TmpDir dir(__func__);
  RunContext ctx(config_in(dir, "", "check"));
  vector<string> trace;

  auto start = recording_step("startdb", 0, trace);
  start.filterable = false;
  start.listed = false;

  StepScheduler scheduler(ctx);
  scheduler.run({start, recording_step("check", 0, trace)});

  EXPECT_EQ(trace, vector<string>({"startdb", "check"}));
  EXPECT_EQ(ctx.run.steps_completed, vector<string>({"check"}));
}

TEST(StepSchedulerTest, stepThatDidNothingIsNotListed) {
  TmpDir dir(__func__);
  RunContext ctx(config_in(dir));

  StepSpec idle;
  idle.name = "pl-check";
  idle.action = [](RunContext&) {
    StepResult result;
    result.attempted = false;
    return result;
  };

  StepScheduler scheduler(ctx);
  EXPECT_TRUE(scheduler.run({idle}).ok());
  EXPECT_TRUE(ctx.run.steps_completed.empty());
  EXPECT_EQ(scheduler.getExecuted(), vector<string>({"pl-check"}));
}

TEST(StepSchedulerTest, labelAndStageNameTheStep) {
  TmpDir dir(__func__);
  RunContext ctx(config_in(dir));
  fs::create_directories(ctx.log_dir);

  StepSpec labelled;
  labelled.name = "install";
  labelled.label = "install-check-C";
  labelled.action = [](RunContext&) {
    StepResult result;
    result.log = {"ok"};
    return result;
  };

  StepSpec staged;
  staged.name = "install";
  staged.action = [](RunContext&) {
    StepResult result;
    result.status = 1;
    result.stage = "startdb-C:2";
    result.log = {"could not start server"};
    return result;
  };

  StepScheduler scheduler(ctx);
  auto outcome = scheduler.run({labelled, staged});

  EXPECT_EQ(ctx.run.steps_completed, vector<string>({"install-check-C"}));
  ASSERT_TRUE(outcome.failure.has_value());
  EXPECT_EQ(outcome.failure->stage, "startdb-C:2");

  // Each step's log lands in the log directory under its reported name
  EXPECT_EQ(fileLines(ctx.logPath("install-check-C")), vector<string>({"ok"}));
  EXPECT_EQ(fileLines(ctx.logPath("startdb-C:2")), vector<string>({"could not start server"}));
}

TEST(StepSchedulerTest, nestedPipelineCarriesFailure) {
  TmpDir dir(__func__);
  RunContext ctx(config_in(dir));
  vector<string> trace;

  StepSpec group;
  group.name = "bin-check";
  group.listed = false;
  group.action = [&trace](RunContext& c) {
    return StepScheduler::nested(c,
                                 {recording_step("initdb-check", 0, trace),
                                  recording_step("pg_ctl-check", 3, trace),
                                  recording_step("psql-check", 0, trace)});
  };

  StepScheduler scheduler(ctx);
  auto outcome = scheduler.run({recording_step("build", 0, trace), group});

  ASSERT_TRUE(outcome.failure.has_value());
  EXPECT_EQ(outcome.failure->stage, "pg_ctl-check");
  EXPECT_EQ(outcome.failure->status, 3);
  EXPECT_EQ(trace, vector<string>({"build", "initdb-check", "pg_ctl-check"}));
  EXPECT_EQ(ctx.run.steps_completed, vector<string>({"build", "initdb-check"}));
}

TEST(StepSchedulerTest, nestedPipelineThatRanNothing) {
  TmpDir dir(__func__);
  RunContext ctx(config_in(dir, "", "build"));
  vector<string> trace;

  auto result = StepScheduler::nested(ctx, {recording_step("check", 0, trace)});
  EXPECT_TRUE(result.ok());
  EXPECT_FALSE(result.attempted);
  EXPECT_TRUE(trace.empty());
}

TEST(StepSchedulerTest, cancellationStopsPipeline) {
  TmpDir dir(__func__);
  RunContext ctx(config_in(dir));
  vector<string> trace;

  StepSpec interrupted;
  interrupted.name = "build";
  interrupted.action = [&trace](RunContext&) {
    trace.push_back("build");
    cancellation::request(SIGTERM);
    return StepResult();
  };

  StepScheduler scheduler(ctx);
  auto outcome = scheduler.run({interrupted, recording_step("check", 0, trace)});
  cancellation::reset();

  EXPECT_TRUE(outcome.cancelled);
  EXPECT_FALSE(outcome.failure.has_value());
  EXPECT_EQ(trace, vector<string>({"build"}));
}

TEST(StepSchedulerTest, failureDuringCancellationIsCancellation) {
  TmpDir dir(__func__);
  RunContext ctx(config_in(dir));

  StepSpec killed;
  killed.name = "check";
  killed.action = [](RunContext&) {
    cancellation::request(SIGINT);
    StepResult result;
    result.status = 128 + SIGTERM;
    return result;
  };

  StepScheduler scheduler(ctx);
  auto outcome = scheduler.run({killed});
  cancellation::reset();

  EXPECT_TRUE(outcome.cancelled);
  EXPECT_FALSE(outcome.failure.has_value());
}

}
