#include "TestSupport.hh"

#include "runtime/Cancellation.hh"
#include "runtime/Subprocess.hh"
#include "util/constants.hh"
#include "util/Environment.hh"
#include "util/shell.hh"

#include "gtest/gtest.h"

#include <chrono>
#include <csignal>
#include <string>
#include <thread>
#include <vector>

namespace {

using std::string;
using std::vector;

TEST(SubprocessTest, capturesStatusAndOutput) {
  auto result = run_log("echo hello; echo oops >&2; exit 3", Environment::inherited());
  EXPECT_EQ(result.status, 3);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.log, vector<string>({"hello", "oops"}));
}

TEST(SubprocessTest, usesExplicitEnvironment) {
  auto env = Environment::inherited();
  env.set("FARMHAND_TEST_VALUE", "from the run");
  env.unset("FARMHAND_TEST_ABSENT");

  auto result = run_log("echo \"$FARMHAND_TEST_VALUE\"; echo \"[${FARMHAND_TEST_ABSENT}]\"", env);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.log, vector<string>({"from the run", "[]"}));
}

TEST(SubprocessTest, runsInDirectory) {
  TmpDir dir(__func__);
  auto result = run_log("pwd -P", Environment::inherited(), dir.path());
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.log.size(), 1u);
  EXPECT_EQ(fs::path(result.log[0]), dir.path());
}

TEST(SubprocessTest, stdinIsEmpty) {
  auto result = run_log("cat; echo done", Environment::inherited());
  EXPECT_EQ(result.log, vector<string>({"done"}));
}

TEST(SubprocessTest, killedBySignal) {
  auto result = run_log("kill -KILL $$", Environment::inherited());
  EXPECT_EQ(result.status, 128 + SIGKILL);
}

TEST(SubprocessTest, cancelledAfterOutputClosedEscalatesToKill) {
  cancellation::reset();

  // Request cancellation once the command has closed its output and is only waiting
  std::thread requester([] {
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    cancellation::request(SIGTERM);
  });

  auto start = std::chrono::steady_clock::now();
  auto result = run_log("exec >/dev/null 2>&1; trap '' TERM; sleep 30", Environment::inherited());
  auto elapsed = std::chrono::steady_clock::now() - start;
  requester.join();

  EXPECT_EQ(result.status, 128 + SIGKILL);
  EXPECT_GE(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count(),
            constants::KillGraceSeconds);
  EXPECT_LT(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count(), 25);

  cancellation::reset();
}

TEST(SubprocessTest, runQuietDiscardsOutput) {
  EXPECT_EQ(run_quiet("echo ignored", Environment::inherited()), 0);
  EXPECT_EQ(run_quiet("exit 7", Environment::inherited()), 7);
}

TEST(ShellEscapeTest, quotesWhenNeeded) {
  EXPECT_EQ(shell_escaped("plain-word_1.log"), "plain-word_1.log");
  EXPECT_NE(shell_escaped("two words"), "two words");

  // Whatever the quoting, the shell must read the value back unchanged
  auto result = run_log("printf '%s\\n' " + shell_escaped("it's a $HOME \"test\""),
                        Environment::inherited());
  EXPECT_EQ(result.log, vector<string>({"it's a $HOME \"test\""}));
}

}
