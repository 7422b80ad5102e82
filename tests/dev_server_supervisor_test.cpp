/**
 * @file dev_server_supervisor_test.cpp
 * @brief Tests for the ui:start / ui:stop protocol
 */

#include <gtest/gtest.h>
#include <algorithm>
#include "devui/dev_server_supervisor.hpp"
#include "devui/server_registry.hpp"
#include "devui/spawn_config.hpp"
#include "test_support.hpp"

using namespace devui;

class DevServerSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        identity.kind = RuntimeKind::COMPILED_BINARY;
        identity.executable_path = "/usr/local/bin/devui";
        identity.platform_family = PlatformFamily::POSIX;
    }

    std::unique_ptr<DevServerSupervisor> make_supervisor() {
        return std::make_unique<DevServerSupervisor>(
            logger, registry, health, http, launcher, ports, browser,
            [this] {
                if (identity_error) {
                    throw RuntimeDetectionError("Unable to determine CLI runtime executable path");
                }
                return identity;
            },
            log_path,
            [this](const std::string&) { return executable_ok; });
    }

    void record_server(const std::string& url) {
        registry.write({url, "2026-01-01T00:00:00.000Z"});
    }

    test::TempDir dir;
    std::filesystem::path log_path = dir.path() / ".devui" / "servers" / "devui.log";
    Logger logger;
    test::LogCapture capture{logger};
    ServerRegistry registry{dir.path() / ".devui" / "servers" / "tools.json"};
    test::FakeHealthChecker health;
    test::FakeHttpClient http;
    test::FakeProcessLauncher launcher;
    test::FakePortAllocator ports;
    test::FakeBrowserOpener browser;
    RuntimeIdentity identity;
    bool executable_ok = true;
    bool identity_error = false;
};

// Test: a recorded server that answers is reused and nothing is spawned
TEST_F(DevServerSupervisorTest, ReusesHealthyRecordedServer) {
    record_server("http://localhost:4000");
    health.healthy_urls["http://localhost:4000"] = true;

    StartResult result = make_supervisor()->start({});

    EXPECT_EQ(result.state, SupervisorState::HEALTHY_REUSE);
    EXPECT_EQ(result.url, "http://localhost:4000");
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(launcher.launched.empty());
    EXPECT_TRUE(capture.contains(LogLevel::INFO, "Developer UI is already running at: http://localhost:4000"));
    EXPECT_TRUE(capture.contains(LogLevel::INFO, "To stop the UI, run `devui ui:stop`."));
    EXPECT_FALSE(capture.contains("Starting..."));
}

// Test: a stale record leads to a new server and is overwritten
TEST_F(DevServerSupervisorTest, StaleRecordStartsNewServer) {
    record_server("http://localhost:4000");
    ports.port = 4002;
    http.respond("http://localhost:4002/api/trpc/listActions", 200, "{}");

    StartResult result = make_supervisor()->start({});

    EXPECT_EQ(result.state, SupervisorState::STARTED);
    EXPECT_EQ(result.url, "http://localhost:4002");
    ASSERT_EQ(launcher.launched.size(), 1u);
    EXPECT_TRUE(capture.contains(LogLevel::DEBUG,
        "Found UI server metadata but server is not healthy. Starting a new one..."));

    auto record = registry.read();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->url, "http://localhost:4002");
    EXPECT_NE(record->timestamp, "2026-01-01T00:00:00.000Z");
    EXPECT_TRUE(capture.contains(LogLevel::DEBUG,
        "UI server metadata written to " + registry.get_record_path().string()));
}

// Test: the spawned command is the server harness built from the runtime identity
TEST_F(DevServerSupervisorTest, SpawnsServerHarness) {
    StartResult result = make_supervisor()->start({4100, false});

    ASSERT_EQ(launcher.launched.size(), 1u);
    const SpawnConfig& config = launcher.launched[0];
    EXPECT_EQ(config.command, "/usr/local/bin/devui");
    std::vector<std::string> expected = {"server-harness", "4100", log_path.string()};
    EXPECT_EQ(config.args, expected);
    EXPECT_EQ(result.url, "http://localhost:4100");
    ASSERT_EQ(health.waited.size(), 1u);
    EXPECT_EQ(health.waited[0], "http://localhost:4100");
    EXPECT_TRUE(capture.contains(LogLevel::DEBUG, "No UI running. Starting a new one..."));
    EXPECT_TRUE(capture.contains(LogLevel::DEBUG,
        "Detected CLI runtime: compiled-binary at /usr/local/bin/devui (posix)"));
    EXPECT_TRUE(capture.contains(LogLevel::DEBUG, "Spawning: /usr/local/bin/devui server-harness 4100"));
    EXPECT_TRUE(capture.contains(LogLevel::INFO, "Starting..."));
    EXPECT_TRUE(capture.contains(LogLevel::INFO, "Developer UI started at: http://localhost:4100"));
}

// Test: a successful start releases the child so it outlives the command
TEST_F(DevServerSupervisorTest, StartedChildIsReleased) {
    make_supervisor()->start({});
    EXPECT_TRUE(launcher.next->released);
    EXPECT_FALSE(launcher.next->terminated);
}

// Test: health check timeout fails with one message, no record, and the child is stopped
TEST_F(DevServerSupervisorTest, HealthTimeoutFails) {
    health.becomes_healthy = false;

    auto supervisor = make_supervisor();
    StartResult result = supervisor->start({});

    EXPECT_EQ(result.state, SupervisorState::FAILED);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(supervisor->get_state(), SupervisorState::FAILED);
    EXPECT_FALSE(registry.read().has_value());
    EXPECT_TRUE(launcher.next->terminated);
    EXPECT_EQ(capture.lines(LogLevel::ERROR), std::vector<std::string>{"Failed to start Developer UI"});
    EXPECT_TRUE(capture.contains(LogLevel::DEBUG, "Health check failed"));
    EXPECT_FALSE(capture.contains("Developer UI started at"));
}

// Test: a health checker that throws is normalized the same way
TEST_F(DevServerSupervisorTest, HealthCheckerExceptionFails) {
    health.throw_on_wait = true;

    StartResult result = make_supervisor()->start({});

    EXPECT_EQ(result.state, SupervisorState::FAILED);
    EXPECT_EQ(capture.lines(LogLevel::ERROR), std::vector<std::string>{"Failed to start Developer UI"});
    EXPECT_TRUE(capture.contains(LogLevel::DEBUG, "health checker exploded"));
}

// Test: a child that already died aborts the health wait
TEST_F(DevServerSupervisorTest, DeadChildAbortsHealthWait) {
    launcher.next->exit_with(1);

    StartResult result = make_supervisor()->start({});
    EXPECT_EQ(result.state, SupervisorState::FAILED);
    EXPECT_FALSE(registry.read().has_value());
}

// Test: a supervisor can run start() again after a failure
TEST_F(DevServerSupervisorTest, StartAgainAfterFailure) {
    health.becomes_healthy = false;
    auto supervisor = make_supervisor();
    ASSERT_EQ(supervisor->start({}).state, SupervisorState::FAILED);

    health.becomes_healthy = true;
    launcher.next = std::make_shared<test::FakeProcessState>();
    StartResult result = supervisor->start({});

    EXPECT_EQ(result.state, SupervisorState::STARTED);
    EXPECT_EQ(supervisor->get_state(), SupervisorState::STARTED);
    EXPECT_FALSE(capture.contains("Rejected state transition"));
}

// Test: failed executable validation never attempts the spawn
TEST_F(DevServerSupervisorTest, InvalidExecutableFailsBeforeSpawn) {
    executable_ok = false;

    StartResult result = make_supervisor()->start({});

    EXPECT_EQ(result.state, SupervisorState::FAILED);
    EXPECT_TRUE(launcher.launched.empty());
    EXPECT_EQ(capture.lines(LogLevel::ERROR), std::vector<std::string>{"Failed to start Developer UI"});
    EXPECT_TRUE(capture.contains(LogLevel::DEBUG, "/usr/local/bin/devui"));
}

// Test: spawn errors such as ENOENT collapse into the same message
TEST_F(DevServerSupervisorTest, SpawnErrorFails) {
    launcher.fail_with_enoent = true;

    StartResult result = make_supervisor()->start({});

    EXPECT_EQ(result.state, SupervisorState::FAILED);
    EXPECT_EQ(capture.lines(LogLevel::ERROR), std::vector<std::string>{"Failed to start Developer UI"});
    EXPECT_TRUE(capture.contains(LogLevel::DEBUG, "No such file or directory"));
    EXPECT_FALSE(registry.read().has_value());
}

// Test: port allocation failure is a start failure, not a crash
TEST_F(DevServerSupervisorTest, PortAllocationFailureFails) {
    ports.fail = true;

    StartResult result = make_supervisor()->start({});
    EXPECT_EQ(result.state, SupervisorState::FAILED);
    EXPECT_TRUE(launcher.launched.empty());
}

// Test: runtime detection errors propagate unmodified
TEST_F(DevServerSupervisorTest, RuntimeDetectionErrorPropagates) {
    identity_error = true;

    auto supervisor = make_supervisor();
    EXPECT_THROW(supervisor->start({}), RuntimeDetectionError);
    EXPECT_EQ(supervisor->get_state(), SupervisorState::FAILED);
    EXPECT_TRUE(launcher.launched.empty());
}

// Test: an invalid identity is a configuration error that propagates
TEST_F(DevServerSupervisorTest, SpawnConfigErrorPropagates) {
    identity.executable_path = "";

    EXPECT_THROW(make_supervisor()->start({}), SpawnConfigError);
    EXPECT_TRUE(capture.lines(LogLevel::ERROR).empty());
}

// Test: metadata write failure warns but the start still succeeds
TEST_F(DevServerSupervisorTest, MetadataWriteFailureIsNonFatal) {
    test::write_file(dir.path() / ".devui" / "servers", "not a directory");

    StartResult result = make_supervisor()->start({});

    EXPECT_EQ(result.state, SupervisorState::STARTED);
    EXPECT_TRUE(capture.contains(LogLevel::WARN,
        "Failed to write UI server metadata. UI server will continue to run."));
    EXPECT_TRUE(capture.contains(LogLevel::INFO, "Developer UI started at: http://localhost:4000"));
    EXPECT_TRUE(capture.lines(LogLevel::ERROR).empty());
}

// Test: a failing content probe prints the dev-mode hint
TEST_F(DevServerSupervisorTest, ContentProbeFailurePrintsHint) {
    StartResult result = make_supervisor()->start({});

    EXPECT_EQ(result.state, SupervisorState::STARTED);
    EXPECT_TRUE(capture.contains(LogLevel::INFO,
        "Set env variable `DEVUI_ENV` to `dev` and start your app code to interact with it in the UI."));
}

// Test: a successful content probe prints no hint
TEST_F(DevServerSupervisorTest, ContentProbeSuccessNoHint) {
    http.respond("http://localhost:4000/api/trpc/listActions", 200, R"({"result":{"data":{}}})");

    make_supervisor()->start({});

    auto gets = http.gets();
    EXPECT_NE(std::find(gets.begin(), gets.end(), "http://localhost:4000/api/trpc/listActions"), gets.end());
    EXPECT_FALSE(capture.contains("DEVUI_ENV"));
}

// Test: the browser is opened only when asked, and its failure is swallowed
TEST_F(DevServerSupervisorTest, BrowserOpen) {
    make_supervisor()->start({std::nullopt, false});
    EXPECT_TRUE(browser.opened.empty());

    browser.fail = true;
    test::TempDir other;
    ServerRegistry fresh(other.path() / "tools.json");
    DevServerSupervisor supervisor(logger, fresh, health, http, launcher, ports, browser,
                                   [this] { return identity; }, log_path,
                                   [](const std::string&) { return true; });
    StartResult result = supervisor.start({std::nullopt, true});

    EXPECT_EQ(result.state, SupervisorState::STARTED);
    EXPECT_EQ(browser.opened, std::vector<std::string>{"http://localhost:4000"});
    EXPECT_TRUE(capture.contains(LogLevel::DEBUG, "Failed to open browser: no display"));
}

// Test: the requested port reaches the allocator
TEST_F(DevServerSupervisorTest, PortRequestForwarded) {
    make_supervisor()->start({0, false});
    ASSERT_EQ(ports.requests.size(), 1u);
    EXPECT_EQ(ports.requests[0], std::optional<int>(0));
}

// Test: stop with nothing recorded
TEST_F(DevServerSupervisorTest, StopWithoutServer) {
    EXPECT_TRUE(make_supervisor()->stop());
    EXPECT_TRUE(capture.contains(LogLevel::INFO, "No running Developer UI found."));
    EXPECT_TRUE(http.posts().empty());
}

// Test: stop posts the quit request and forgets the record
TEST_F(DevServerSupervisorTest, StopRecordedServer) {
    record_server("http://localhost:4000");
    http.respond("http://localhost:4000/api/__quitquitquit", 200);

    EXPECT_TRUE(make_supervisor()->stop());

    ASSERT_EQ(http.posts().size(), 1u);
    EXPECT_EQ(http.posts()[0].first, "http://localhost:4000/api/__quitquitquit");
    EXPECT_FALSE(registry.read().has_value());
    EXPECT_TRUE(capture.contains(LogLevel::INFO, "Developer UI at http://localhost:4000 has been stopped."));
}

// Test: a server that ignores the quit request and stays healthy is reported
TEST_F(DevServerSupervisorTest, StopFailsWhenServerStaysUp) {
    record_server("http://localhost:4000");
    http.respond("http://localhost:4000/api/__quitquitquit", 500);
    health.healthy_urls["http://localhost:4000"] = true;

    EXPECT_FALSE(make_supervisor()->stop());
    EXPECT_TRUE(capture.contains(LogLevel::WARN, "Failed to stop Developer UI at http://localhost:4000"));
    EXPECT_FALSE(registry.read().has_value());
}
