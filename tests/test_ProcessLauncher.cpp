#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "mcp/ProcessLauncher.h"
#include "mcp/ProtocolExchange.h"

namespace {
ExchangeOutcome runToCompletion(ProcessSession& session) {
    ExchangeOptions options;
    options.timeoutMs = 5000;
    options.startupDelayMs = 0;
    ProtocolExchange exchange(options, nullptr);
    return exchange.run(session);
}

// 进程不存在或已成为僵尸都视为已结束
bool processGone(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open()) return true;
    std::string line;
    std::getline(stat, line);
    auto paren = line.rfind(')');
    return paren == std::string::npos || paren + 2 >= line.size() || line[paren + 2] == 'Z';
}

bool waitUntilGone(pid_t pid) {
    for (int i = 0; i < 100; ++i) {
        if (processGone(pid)) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return processGone(pid);
}
} // namespace

TEST(ProcessLauncher, SubstitutesDefaultArgsOnlyWhenNoneGiven) {
    EXPECT_EQ(ProcessLauncher::effectiveArgs({}),
              (std::vector<std::string>{"--list-functions", "--discovery"}));
    EXPECT_EQ(ProcessLauncher::effectiveArgs({"serve"}), (std::vector<std::string>{"serve"}));
}

TEST(ProcessLauncher, EnvironmentLayering) {
    setenv("TOOLSCOUT_TEST_AMBIENT", "ambient", 1);
    setenv("TOOLSCOUT_TEST_OVERRIDDEN", "ambient", 1);

    auto env = ProcessLauncher::buildEnvironment({
        {"TOOLSCOUT_TEST_OVERRIDDEN", "caller"},
        {"NODE_ENV", "production"},
        {"MCP_LIST_TOOLS", "false"}
    });

    EXPECT_EQ(env["TOOLSCOUT_TEST_AMBIENT"], "ambient");
    EXPECT_EQ(env["TOOLSCOUT_TEST_OVERRIDDEN"], "caller");
    // 发现模式标志优先级最高
    EXPECT_EQ(env["NODE_ENV"], "discovery");
    EXPECT_EQ(env["MCP_LIST_TOOLS"], "true");
    EXPECT_EQ(env["MCP_LIST_FUNCTIONS"], "true");
    EXPECT_EQ(env["MCP_DISCOVERY_MODE"], "true");
    EXPECT_EQ(env["MCP_REQUIRE_DESCRIPTIONS"], "true");
    EXPECT_EQ(env["FUNCTIONS_DISCOVERY"], "true");

    unsetenv("TOOLSCOUT_TEST_AMBIENT");
    unsetenv("TOOLSCOUT_TEST_OVERRIDDEN");
}

TEST(ProcessLauncher, QuotesArgumentsButNotCommand) {
    EXPECT_EQ(ProcessLauncher::shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(ProcessLauncher::buildCommandLine("npx -y server", {"a b", "$HOME"}),
              "npx -y server 'a b' '$HOME'");
}

TEST(ProcessLauncher, EmptyCommandIsSpawnFailure) {
    ProcessLauncher launcher;
    EXPECT_THROW(launcher.launch(LaunchRequest{}), SpawnFailure);
}

TEST(ProcessLauncher, ChildSeesMergedEnvironmentAndDefaultArgs) {
    ProcessLauncher launcher;
    LaunchRequest request;
    request.command = "echo \"$NODE_ENV $TOOLSCOUT_CALLER\"";
    request.env = {{"TOOLSCOUT_CALLER", "from-caller"}};

    auto session = launcher.launch(request);
    ASSERT_NE(session, nullptr);
    auto outcome = runToCompletion(*session);

    EXPECT_EQ(outcome.reason, TerminationReason::EXITED);
    EXPECT_EQ(outcome.exitCode, 0);
    EXPECT_EQ(session->stdoutText, "discovery from-caller --list-functions --discovery\n");
}

TEST(ProcessLauncher, ShellOperatorsInCommandAreHonoured) {
    ProcessLauncher launcher;
    LaunchRequest request;
    request.command = "echo first && echo second >&2; echo";
    request.args = {"it's quoted"};

    auto session = launcher.launch(request);
    runToCompletion(*session);

    EXPECT_EQ(session->stdoutText, "first\nit's quoted\n");
    EXPECT_EQ(session->stderrText, "second\n");
}

TEST(ProcessLauncher, UnknownCommandExitsWithShellStatus) {
    ProcessLauncher launcher;
    LaunchRequest request;
    request.command = "toolscout-definitely-missing-binary";

    auto session = launcher.launch(request);
    auto outcome = runToCompletion(*session);

    EXPECT_EQ(outcome.reason, TerminationReason::EXITED);
    EXPECT_EQ(outcome.exitCode, 127);
    EXPECT_FALSE(session->stderrText.empty());
}

TEST(ProcessSession, ReleaseIsIdempotent) {
    ProcessLauncher launcher;
    LaunchRequest request;
    request.command = "sleep";
    request.args = {"30"};

    auto session = launcher.launch(request);
    EXPECT_FALSE(session->hasExited());
    session->kill();
    session->kill();
    session->release();
    EXPECT_TRUE(session->hasExited());
    EXPECT_FALSE(session->stdinOpen());
    EXPECT_FALSE(session->stdoutOpen());
    EXPECT_FALSE(session->stderrOpen());
    session->release();
    session->kill();
}

TEST(ProcessSession, FirstResolutionWins) {
    ProcessSession session(-1, -1, -1, -1);
    EXPECT_TRUE(session.resolve(TerminationReason::EXITED));
    EXPECT_FALSE(session.resolve(TerminationReason::TIMED_OUT));
    EXPECT_EQ(session.reason(), TerminationReason::EXITED);
    EXPECT_STREQ(terminationReasonName(session.reason()), "exited");
}

TEST(ProcessSession, DetachedGrandchildDoesNotOutliveSession) {
    ProcessLauncher launcher;
    LaunchRequest request;
    request.command = "sleep 30 >/dev/null 2>&1 & echo $!";

    auto session = launcher.launch(request);
    auto outcome = runToCompletion(*session);
    EXPECT_EQ(outcome.reason, TerminationReason::EXITED);

    std::istringstream out(session->stdoutText);
    pid_t grandchild = 0;
    out >> grandchild;
    ASSERT_FALSE(out.fail());
    ASSERT_GT(grandchild, 0);
    EXPECT_TRUE(waitUntilGone(grandchild));

    // 已回收后 kill() 不再发信号
    EXPECT_TRUE(session->hasExited());
    session->kill();
    EXPECT_EQ(session->exitCode(), 0);
}
