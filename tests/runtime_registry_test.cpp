/**
 * @file runtime_registry_test.cpp
 * @brief Tests for the directory-backed runtime registry
 */

#include <gtest/gtest.h>
#include <thread>
#include "devui/runtime_registry.hpp"
#include "test_support.hpp"

using namespace devui;
using namespace std::chrono_literals;

namespace {

    std::string runtime_document(const std::string& id, const std::string& url,
                                 const std::string& timestamp = "2026-01-01T00:00:00.000Z") {
        return test::make_runtime(id, url, timestamp).to_json().dump();
    }

} // namespace

class RuntimeRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        health.healthy_urls["http://localhost:3100"] = true;
        health.healthy_urls["http://localhost:3200"] = true;
    }

    void record(RuntimeEvent event, const RuntimeInfo& runtime) {
        std::lock_guard<std::mutex> lock(events_mutex);
        events.emplace_back(event, runtime.id);
    }

    std::vector<std::pair<RuntimeEvent, std::string>> snapshot() {
        std::lock_guard<std::mutex> lock(events_mutex);
        return events;
    }

    test::TempDir dir;
    std::filesystem::path runtimes = dir.path() / "runtimes";
    Logger logger;
    test::LogCapture capture{logger};
    test::FakeHealthChecker health;
    FileRuntimeRegistry registry{runtimes, health, logger, true, 20ms};

    std::mutex events_mutex;
    std::vector<std::pair<RuntimeEvent, std::string>> events;
};

// Test: RuntimeInfo parses the runtime file format
TEST(RuntimeInfoTest, FromJson) {
    auto j = nlohmann::json::parse(R"({
        "id": "123", "pid": 123,
        "reflectionServerUrl": "http://localhost:3100",
        "timestamp": "2026-01-01T00:00:00.000Z",
        "projectName": "my-app"
    })");

    auto info = RuntimeInfo::from_json(j);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->id, "123");
    EXPECT_EQ(info->pid, 123);
    EXPECT_EQ(info->reflection_server_url, "http://localhost:3100");
    EXPECT_EQ(info->project_name, std::optional<std::string>("my-app"));
    EXPECT_EQ(info->to_json(), j);
}

// Test: documents with missing or mistyped fields are rejected
TEST(RuntimeInfoTest, RejectsMalformed) {
    EXPECT_FALSE(RuntimeInfo::from_json(nlohmann::json::array()).has_value());
    EXPECT_FALSE(RuntimeInfo::from_json(nlohmann::json::parse(
        R"({"pid": 1, "reflectionServerUrl": "http://x", "timestamp": "t"})")).has_value());
    EXPECT_FALSE(RuntimeInfo::from_json(nlohmann::json::parse(
        R"({"id": "1", "pid": "1", "reflectionServerUrl": "http://x", "timestamp": "t"})")).has_value());
    EXPECT_FALSE(RuntimeInfo::from_json(nlohmann::json::parse(
        R"({"id": "1", "pid": 1, "reflectionServerUrl": "", "timestamp": "t"})")).has_value());
}

// Test: a missing directory is simply empty
TEST_F(RuntimeRegistryTest, MissingDirectoryIsEmpty) {
    registry.refresh();
    EXPECT_TRUE(registry.list().empty());
    EXPECT_FALSE(registry.most_recent().has_value());
}

// Test: a new healthy runtime file is added and announced
TEST_F(RuntimeRegistryTest, AddsHealthyRuntime) {
    auto sub = registry.subscribe([this](RuntimeEvent e, const RuntimeInfo& r) { record(e, r); });
    test::write_file(runtimes / "123.json", runtime_document("123", "http://localhost:3100"));

    registry.refresh();
    registry.refresh();

    auto found = registry.get_by_id("123");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->reflection_server_url, "http://localhost:3100");
    ASSERT_EQ(snapshot().size(), 1u);
    EXPECT_EQ(snapshot()[0], std::make_pair(RuntimeEvent::ADDED, std::string("123")));
    EXPECT_TRUE(capture.contains(LogLevel::DEBUG, "Runtime 123 added (http://localhost:3100)"));
}

// Test: a deleted runtime file is removed and announced
TEST_F(RuntimeRegistryTest, RemovesVanishedRuntime) {
    test::write_file(runtimes / "123.json", runtime_document("123", "http://localhost:3100"));
    registry.refresh();

    auto sub = registry.subscribe([this](RuntimeEvent e, const RuntimeInfo& r) { record(e, r); });
    std::filesystem::remove(runtimes / "123.json");
    registry.refresh();

    EXPECT_FALSE(registry.get_by_id("123").has_value());
    ASSERT_EQ(snapshot().size(), 1u);
    EXPECT_EQ(snapshot()[0], std::make_pair(RuntimeEvent::REMOVED, std::string("123")));
}

// Test: an unhealthy runtime is not added and its file is cleaned up
TEST_F(RuntimeRegistryTest, UnhealthyRuntimeDeleted) {
    test::write_file(runtimes / "999.json", runtime_document("999", "http://localhost:3999"));

    registry.refresh();

    EXPECT_FALSE(registry.get_by_id("999").has_value());
    EXPECT_FALSE(std::filesystem::exists(runtimes / "999.json"));
}

// Test: without health management the file of an unhealthy runtime is kept
TEST_F(RuntimeRegistryTest, UnhealthyRuntimeKeptWhenNotManaging) {
    FileRuntimeRegistry passive(runtimes, health, logger, false, 20ms);
    test::write_file(runtimes / "999.json", runtime_document("999", "http://localhost:3999"));

    passive.refresh();

    EXPECT_FALSE(passive.get_by_id("999").has_value());
    EXPECT_TRUE(std::filesystem::exists(runtimes / "999.json"));
}

// Test: a runtime that stops answering is deleted and then removed
TEST_F(RuntimeRegistryTest, HealthSweepRemovesDeadRuntime) {
    test::write_file(runtimes / "123.json", runtime_document("123", "http://localhost:3100"));
    test::write_file(runtimes / "456.json", runtime_document("456", "http://localhost:3200"));
    registry.refresh();
    ASSERT_EQ(registry.list().size(), 2u);

    auto sub = registry.subscribe([this](RuntimeEvent e, const RuntimeInfo& r) { record(e, r); });
    health.healthy_urls["http://localhost:3100"] = false;

    registry.check_health();
    EXPECT_FALSE(std::filesystem::exists(runtimes / "123.json"));
    EXPECT_TRUE(std::filesystem::exists(runtimes / "456.json"));

    registry.refresh();
    EXPECT_FALSE(registry.get_by_id("123").has_value());
    EXPECT_TRUE(registry.get_by_id("456").has_value());
    ASSERT_EQ(snapshot().size(), 1u);
    EXPECT_EQ(snapshot()[0], std::make_pair(RuntimeEvent::REMOVED, std::string("123")));
    EXPECT_EQ(registry.most_recent()->id, "456");
}

// Test: without health management registered runtimes are not re-probed
TEST_F(RuntimeRegistryTest, HealthSweepDisabledWhenNotManaging) {
    FileRuntimeRegistry passive(runtimes, health, logger, false, 20ms);
    test::write_file(runtimes / "123.json", runtime_document("123", "http://localhost:3100"));
    passive.refresh();
    health.healthy_urls["http://localhost:3100"] = false;

    passive.check_health();

    EXPECT_TRUE(std::filesystem::exists(runtimes / "123.json"));
    EXPECT_TRUE(passive.get_by_id("123").has_value());
}

// Test: an unexpected file is reported once, not on every scan
TEST_F(RuntimeRegistryTest, InvalidFileReportedOnce) {
    test::write_file(runtimes / "junk.json", "{ not json");

    registry.refresh();
    registry.refresh();
    registry.refresh();

    auto errors = capture.lines(LogLevel::ERROR);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("Unexpected file in the runtimes directory: "), std::string::npos);
    EXPECT_NE(errors[0].find("junk.json"), std::string::npos);
    EXPECT_TRUE(registry.list().empty());
}

// Test: files without the .json extension are ignored
TEST_F(RuntimeRegistryTest, IgnoresOtherExtensions) {
    test::write_file(runtimes / "notes.txt", "hello");
    registry.refresh();
    EXPECT_TRUE(capture.lines(LogLevel::ERROR).empty());
}

// Test: most_recent picks the latest timestamp
TEST_F(RuntimeRegistryTest, MostRecent) {
    test::write_file(runtimes / "1.json", runtime_document("1", "http://localhost:3100", "2026-01-01T00:00:00.000Z"));
    test::write_file(runtimes / "2.json", runtime_document("2", "http://localhost:3200", "2026-03-01T00:00:00.000Z"));

    registry.refresh();

    EXPECT_EQ(registry.list().size(), 2u);
    auto latest = registry.most_recent();
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->id, "2");
}

// Test: a reset subscription receives nothing more
TEST_F(RuntimeRegistryTest, UnsubscribeStopsEvents) {
    auto sub = registry.subscribe([this](RuntimeEvent e, const RuntimeInfo& r) { record(e, r); });
    EXPECT_TRUE(sub.active());
    sub.reset();
    EXPECT_FALSE(sub.active());

    test::write_file(runtimes / "123.json", runtime_document("123", "http://localhost:3100"));
    registry.refresh();

    EXPECT_TRUE(snapshot().empty());
}

// Test: a throwing listener is logged and does not stop the others
TEST_F(RuntimeRegistryTest, ThrowingListenerIsIsolated) {
    auto bad = registry.subscribe([](RuntimeEvent, const RuntimeInfo&) {
        throw std::runtime_error("listener broke");
    });
    auto good = registry.subscribe([this](RuntimeEvent e, const RuntimeInfo& r) { record(e, r); });

    test::write_file(runtimes / "123.json", runtime_document("123", "http://localhost:3100"));
    registry.refresh();

    EXPECT_EQ(snapshot().size(), 1u);
    EXPECT_TRUE(capture.contains(LogLevel::ERROR, "Runtime listener failed: listener broke"));
}

// Test: the polling thread picks up files written after start()
TEST_F(RuntimeRegistryTest, PollingDetectsNewFiles) {
    registry.start();
    auto sub = registry.subscribe([this](RuntimeEvent e, const RuntimeInfo& r) { record(e, r); });

    // Renamed into place so a scan never sees a partial file
    test::write_file(runtimes / "123.tmp", runtime_document("123", "http://localhost:3100"));
    std::filesystem::rename(runtimes / "123.tmp", runtimes / "123.json");

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (snapshot().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    registry.stop();

    ASSERT_FALSE(snapshot().empty());
    EXPECT_EQ(snapshot()[0].second, "123");
}
