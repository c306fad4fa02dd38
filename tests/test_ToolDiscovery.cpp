/**
 * 发现引擎端到端测试：通过 SpyLauncher 统计真实进程启动次数，验证缓存、
 * 超时、启动失败与策略优先级。
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "mcp/ToolDiscovery.h"

namespace {
const std::string kPingResponse = R"({"jsonrpc":"2.0","id":1,"result":{"tools":[{"name":"ping"}]}})";

class SpyLauncher : public IProcessLauncher {
public:
    std::unique_ptr<ProcessSession> launch(const LaunchRequest& request) override {
        ++launches;
        {
            std::lock_guard<std::mutex> lock(mtx);
            requests.push_back(request);
        }
        return real.launch(request);
    }

    std::atomic<int> launches{0};
    std::mutex mtx;
    std::vector<LaunchRequest> requests;

private:
    ProcessLauncher real;
};

class FailingLauncher : public IProcessLauncher {
public:
    std::unique_ptr<ProcessSession> launch(const LaunchRequest&) override {
        ++attempts;
        throw SpawnFailure("Failed to fork: Resource temporarily unavailable");
    }

    std::atomic<int> attempts{0};
};

class ThrowingIntLauncher : public IProcessLauncher {
public:
    std::unique_ptr<ProcessSession> launch(const LaunchRequest&) override {
        ++attempts;
        throw 42;
    }

    std::atomic<int> attempts{0};
};

struct Recorder {
    std::mutex mtx;
    std::vector<std::pair<LogLevel, std::string>> events;

    DiagnosticSink sink() {
        return [this](LogLevel level, const std::string& msg) {
            std::lock_guard<std::mutex> lock(mtx);
            events.emplace_back(level, msg);
        };
    }

    bool saw(LogLevel level, const std::string& fragment) {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& e : events) {
            if (e.first == level && e.second.find(fragment) != std::string::npos) return true;
        }
        return false;
    }
};

ServerConfig server(const std::string& command, std::vector<std::string> args = {}) {
    ServerConfig cfg;
    cfg.command = command;
    cfg.args = std::move(args);
    return cfg;
}

std::vector<std::string> sorted(std::vector<std::string> v) {
    std::sort(v.begin(), v.end());
    return v;
}
} // namespace

class ToolDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        spy = std::make_shared<SpyLauncher>();
        options.timeoutMs = 3000;
        options.startupDelayMs = 50;
    }

    std::unique_ptr<ToolDiscovery> makeDiscovery() {
        return std::make_unique<ToolDiscovery>(options, recorder.sink(), spy);
    }

    std::shared_ptr<SpyLauncher> spy;
    DiscoveryOptions options;
    Recorder recorder;
};

TEST_F(ToolDiscoveryTest, EchoedJsonRpcResponse) {
    auto discovery = makeDiscovery();
    auto tools = discovery->discoverTools("echo-server", server("echo", {kPingResponse}));
    EXPECT_EQ(tools, (std::vector<std::string>{"ping"}));
    EXPECT_TRUE(recorder.saw(LogLevel::INFO, "Discovering tools for echo-server"));
    EXPECT_TRUE(recorder.saw(LogLevel::DEBUG, "Discovered 1 tools for echo-server: ping"));
}

TEST_F(ToolDiscoveryTest, SecondCallIsServedFromCache) {
    auto discovery = makeDiscovery();
    auto cfg = server("echo", {kPingResponse});

    auto first = discovery->discoverTools("srv", cfg);
    auto second = discovery->discoverTools("srv", cfg);

    EXPECT_EQ(first, second);
    EXPECT_EQ(spy->launches.load(), 1);
    EXPECT_TRUE(recorder.saw(LogLevel::DEBUG, "Using cached tools for srv"));
}

TEST_F(ToolDiscoveryTest, ClearCacheForcesFreshSpawn) {
    auto discovery = makeDiscovery();
    auto cfg = server("echo", {kPingResponse});

    discovery->discoverTools("srv", cfg);
    discovery->clearCache();
    EXPECT_FALSE(discovery->isCached("srv"));
    auto again = discovery->discoverTools("srv", cfg);

    EXPECT_EQ(again, (std::vector<std::string>{"ping"}));
    EXPECT_EQ(spy->launches.load(), 2);
    EXPECT_TRUE(recorder.saw(LogLevel::INFO, "Tool discovery cache cleared"));
}

TEST_F(ToolDiscoveryTest, EmptyResultIsCached) {
    auto discovery = makeDiscovery();
    auto cfg = server("true", {"x"});

    EXPECT_TRUE(discovery->discoverTools("silent", cfg).empty());
    EXPECT_TRUE(discovery->isCached("silent"));
    EXPECT_TRUE(discovery->discoverTools("silent", cfg).empty());
    EXPECT_EQ(spy->launches.load(), 1);
}

TEST_F(ToolDiscoveryTest, LineScanFindsBareNameField) {
    auto discovery = makeDiscovery();
    auto tools = discovery->discoverTools("sleep-server", server("echo", {"\"name\": \"sleep\""}));
    EXPECT_NE(std::find(tools.begin(), tools.end(), "sleep"), tools.end());
}

TEST_F(ToolDiscoveryTest, JsonRpcTakesPriorityOverFunctionsBlock) {
    auto discovery = makeDiscovery();
    std::string output = std::string(R"({"functions":[{"name":"legacy_fn"}]})") + "\n" +
                         R"({"jsonrpc":"2.0","id":1,"result":{"tools":[{"name":"a"},{"name":"b"}]}})";
    auto tools = discovery->discoverTools("mixed", server("printf '%s\\n'", {output}));
    EXPECT_EQ(sorted(tools), (std::vector<std::string>{"a", "b"}));
}

TEST_F(ToolDiscoveryTest, ResultHasNoDuplicates) {
    auto discovery = makeDiscovery();
    auto tools = discovery->discoverTools("dup", server("echo", {"function: ping name: ping"}));
    EXPECT_EQ(tools, (std::vector<std::string>{"ping"}));
}

TEST_F(ToolDiscoveryTest, StderrIsUsedWhenStdoutIsSilent) {
    auto discovery = makeDiscovery();
    auto tools = discovery->discoverTools(
        "stderr-server", server("echo '{\"tools\":[{\"name\":\"stderr_tool\"}]}' >&2; true", {"x"}));
    EXPECT_EQ(tools, (std::vector<std::string>{"stderr_tool"}));
}

TEST_F(ToolDiscoveryTest, NonZeroExitStillExtracts) {
    auto discovery = makeDiscovery();
    auto tools = discovery->discoverTools("failing", server("echo '\"name\": \"still_found\"'; exit 2; true"));
    EXPECT_EQ(tools, (std::vector<std::string>{"still_found"}));
    EXPECT_TRUE(recorder.saw(LogLevel::WARNING, "Server process exited with code 2"));
}

TEST_F(ToolDiscoveryTest, HungProcessIsKilledAtTimeout) {
    options.timeoutMs = 500;
    auto discovery = makeDiscovery();

    auto started = std::chrono::steady_clock::now();
    auto tools = discovery->discoverTools("hung", server("sleep", {"30"}));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - started).count();

    EXPECT_TRUE(tools.empty());
    EXPECT_LT(elapsed, 500 + 2000);
    EXPECT_TRUE(discovery->isCached("hung"));
    EXPECT_TRUE(recorder.saw(LogLevel::INFO, "terminated server process after 500ms"));
    EXPECT_TRUE(recorder.saw(LogLevel::DEBUG, "Discovery session for hung ended: timed-out"));
}

TEST_F(ToolDiscoveryTest, VeryLongOutputIsHandled) {
    auto discovery = makeDiscovery();
    auto tools = discovery->discoverTools("blob", server("head -c 300000 /dev/zero | tr '\\0' a; true"));
    EXPECT_TRUE(tools.empty());
    EXPECT_TRUE(discovery->isCached("blob"));
    EXPECT_TRUE(recorder.saw(LogLevel::DEBUG, "Discovery session for blob ended: exited"));
}

TEST_F(ToolDiscoveryTest, LaunchRequestCarriesDefaultsAndEnv) {
    auto discovery = makeDiscovery();
    ServerConfig cfg = server("true");
    cfg.env = {{"API_KEY", "secret"}};

    discovery->discoverTools("defaults", cfg);

    std::lock_guard<std::mutex> lock(spy->mtx);
    ASSERT_EQ(spy->requests.size(), 1u);
    EXPECT_EQ(spy->requests[0].command, "true");
    EXPECT_EQ(spy->requests[0].args, (std::vector<std::string>{"--list-functions", "--discovery"}));
    EXPECT_EQ(spy->requests[0].env.at("API_KEY"), "secret");
    EXPECT_TRUE(recorder.saw(LogLevel::DEBUG, "Running command: true --list-functions --discovery"));
}

TEST_F(ToolDiscoveryTest, SpawnFailureIsNotCached) {
    auto failing = std::make_shared<FailingLauncher>();
    ToolDiscovery discovery(options, recorder.sink(), failing);
    auto cfg = server("anything");

    EXPECT_TRUE(discovery.discoverTools("broken", cfg).empty());
    EXPECT_FALSE(discovery.isCached("broken"));
    EXPECT_TRUE(recorder.saw(LogLevel::ERROR, "Failed to discover tools for broken: Failed to fork"));
    EXPECT_TRUE(recorder.saw(LogLevel::DEBUG, "Discovery session for broken ended: spawn-failed"));

    EXPECT_TRUE(discovery.discoverTools("broken", cfg).empty());
    EXPECT_EQ(failing->attempts.load(), 2);
}

TEST_F(ToolDiscoveryTest, MissingCommandIsReportedAndNotCached) {
    auto discovery = makeDiscovery();
    EXPECT_TRUE(discovery->discoverTools("no-command", ServerConfig{}).empty());
    EXPECT_FALSE(discovery->isCached("no-command"));
    EXPECT_EQ(spy->launches.load(), 0);
    EXPECT_TRUE(recorder.saw(LogLevel::ERROR, "No command defined for server no-command"));
}

TEST_F(ToolDiscoveryTest, ThrowingSinkDoesNotBreakDiscovery) {
    ToolDiscovery discovery(options, [](LogLevel, const std::string&) {
        throw std::runtime_error("ui went away");
    }, spy);
    auto tools = discovery.discoverTools("srv", server("echo", {kPingResponse}));
    EXPECT_EQ(tools, (std::vector<std::string>{"ping"}));
}

TEST_F(ToolDiscoveryTest, SinkThrowingNonStandardValueIsContained) {
    ToolDiscovery discovery(options, [](LogLevel, const std::string&) { throw 42; }, spy);
    auto cfg = server("echo", {kPingResponse});

    EXPECT_EQ(discovery.discoverTools("srv", cfg), (std::vector<std::string>{"ping"}));
    EXPECT_EQ(discovery.discoverTools("srv", cfg), (std::vector<std::string>{"ping"}));
    EXPECT_EQ(spy->launches.load(), 1);
}

TEST_F(ToolDiscoveryTest, NonStandardLaunchErrorReleasesLaterCalls) {
    auto throwing = std::make_shared<ThrowingIntLauncher>();
    ToolDiscovery discovery(options, recorder.sink(), throwing);
    auto cfg = server("anything");

    EXPECT_TRUE(discovery.discoverTools("odd", cfg).empty());
    EXPECT_FALSE(discovery.isCached("odd"));
    EXPECT_TRUE(recorder.saw(LogLevel::ERROR, "Failed to discover tools for odd: unknown error"));

    auto again = discovery.discoverToolsAsync("odd", cfg);
    ASSERT_EQ(again.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(again.get().empty());
    EXPECT_EQ(throwing->attempts.load(), 2);
}

TEST_F(ToolDiscoveryTest, ConcurrentCallsForSameServerShareOneSpawn) {
    auto discovery = makeDiscovery();
    auto cfg = server("sleep 0.3; echo", {kPingResponse});

    std::vector<std::future<std::vector<std::string>>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(discovery->discoverToolsAsync("shared", cfg));
    }
    for (auto& f : futures) {
        EXPECT_EQ(f.get(), (std::vector<std::string>{"ping"}));
    }
    EXPECT_EQ(spy->launches.load(), 1);
}

TEST_F(ToolDiscoveryTest, DiscoverAllSkipsDisabledServers) {
    auto discovery = makeDiscovery();
    ServerConfig disabled = server("echo", {kPingResponse});
    disabled.disabled = true;

    auto results = discovery->discoverAll({
        {"one", server("echo", {kPingResponse})},
        {"two", server("echo", {R"({"functions":[{"name":"f"}]})"})},
        {"off", disabled}
    });

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results["one"], (std::vector<std::string>{"ping"}));
    EXPECT_EQ(results["two"], (std::vector<std::string>{"f"}));
    EXPECT_EQ(results.count("off"), 0u);
    EXPECT_EQ(spy->launches.load(), 2);
}
