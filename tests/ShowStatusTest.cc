#include "TestSupport.hh"

#include "state/FactStore.hh"
#include "state/SnapshotTracker.hh"
#include "ui/commands.hh"

#include "gtest/gtest.h"

#include <ctime>
#include <optional>
#include <string>

namespace {

using std::string;

TEST(ShowStatusTest, printsRecordedAndMissingFacts) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());
  auto branch_root = config.build_root / config.branch;
  fs::create_directories(branch_root);

  std::time_t status = 1700000000;
  std::time_t run_snap = 1699990000;
  FactStore facts(branch_root, config.animal + ".");
  ASSERT_TRUE(facts.write(getSnapshotName(SnapshotKind::Status), status));
  ASSERT_TRUE(facts.write(getSnapshotName(SnapshotKind::RunSnap), run_snap));

  testing::internal::CaptureStdout();
  int rc = do_show_status(config);
  string output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(rc, 0);
  EXPECT_NE(output.find("testanimal:HEAD in " + branch_root.string()), string::npos);
  EXPECT_NE(output.find("status"), string::npos);
  EXPECT_NE(output.find("(1700000000)"), string::npos);
  EXPECT_NE(output.find("run.snap"), string::npos);
  EXPECT_NE(output.find("(1699990000)"), string::npos);
  EXPECT_NE(output.find("success.snap  never recorded"), string::npos);

  // Reading the facts leaves them untouched
  EXPECT_EQ(facts.read(getSnapshotName(SnapshotKind::Status)), std::optional<std::time_t>(status));
  EXPECT_FALSE(fs::exists(facts.path(getSnapshotName(SnapshotKind::SuccessSnap))));
}

TEST(ShowStatusTest, nothingRecordedYet) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());

  testing::internal::CaptureStdout();
  int rc = do_show_status(config);
  string output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(rc, 0);
  EXPECT_NE(output.find("status        never recorded"), string::npos);
  EXPECT_NE(output.find("run.snap      never recorded"), string::npos);
  EXPECT_NE(output.find("success.snap  never recorded"), string::npos);
}

TEST(ShowStatusDeathTest, missingAnimalIsFatal) {
  TmpDir dir(__func__);
  auto config = test_config(dir.path());
  config.animal.clear();

  EXPECT_EXIT(do_show_status(config), ::testing::ExitedWithCode(1), "no animal name configured");
}

}
