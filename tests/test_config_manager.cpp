// File: tests/test_config_manager.cpp
#include "Module/ConfigManager.hpp"
#include "TestDoubles.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <unistd.h>

using namespace baseload;

// ============================================================================
// Peak usage parsing
// ============================================================================

TEST(ConfigManagerTest, PeakUsageParsing) {
    EXPECT_EQ(ConfigManager::parsePeakUsage("55"), 55);
    EXPECT_EQ(ConfigManager::parsePeakUsage("abc"), kDefaultPeakUsage);
    EXPECT_EQ(ConfigManager::parsePeakUsage("0"), kDefaultPeakUsage);
    EXPECT_EQ(ConfigManager::parsePeakUsage("101"), kDefaultPeakUsage);
    EXPECT_EQ(ConfigManager::parsePeakUsage("-3"), kDefaultPeakUsage);
    EXPECT_EQ(ConfigManager::parsePeakUsage("3"), kMinPeakUsage);
    EXPECT_EQ(ConfigManager::parsePeakUsage("1"), kMinPeakUsage);
    EXPECT_EQ(ConfigManager::parsePeakUsage("100"), 100);
    EXPECT_EQ(ConfigManager::parsePeakUsage("55abc"), kDefaultPeakUsage);
    EXPECT_EQ(ConfigManager::parsePeakUsage(""), kDefaultPeakUsage);
    EXPECT_EQ(ConfigManager::parsePeakUsage("99999999999999999999999"), kDefaultPeakUsage);
}

TEST(ConfigManagerTest, EnvironmentUpperCaseWins) {
    ::setenv("P", "60", 1);
    ::setenv("p", "20", 1);
    ASSERT_NE(ConfigManager::peakUsageEnvValue(), nullptr);
    EXPECT_STREQ(ConfigManager::peakUsageEnvValue(), "60");

    ::unsetenv("P");
    ASSERT_NE(ConfigManager::peakUsageEnvValue(), nullptr);
    EXPECT_STREQ(ConfigManager::peakUsageEnvValue(), "20");

    ::unsetenv("p");
    EXPECT_EQ(ConfigManager::peakUsageEnvValue(), nullptr);
}

// ============================================================================
// JSON -> EngineConfig
// ============================================================================

TEST(ConfigManagerTest, DefaultsFromEmptyObject) {
    Context ctx;
    ConfigManager cm(json::object(), ctx);
    const EngineConfig& ec = cm.engineConfig();
    EXPECT_EQ(ec.peakUsage, 40);
    EXPECT_EQ(ec.sampleIntervalMs, 3000);
    EXPECT_EQ(ec.compactionIntervalMs, 60000);
    EXPECT_EQ(ec.driftIntervalMs, 300000);
    EXPECT_EQ(ec.initialIntensity, 10000u);
    EXPECT_EQ(ec.memoryBlockBytes, 1024u * 1024u);
    EXPECT_EQ(ec.logFormat, LogFormat::Text);
    EXPECT_TRUE(ec.validate());
}

TEST(ConfigManagerTest, ReadsSections) {
    json cfg = {
        {"peak_usage", 55},
        {"Sampling", {{"sample_interval_ms", 500}, {"drift_interval_ms", 10000}}},
        {"CpuLoad", {{"initial_intensity", 2000}, {"workers", 2}}},
        {"Logging", {{"level", "debug"}, {"format", "json"}}},
        {"SystemBehavior", {{"random_seed", 99}}}
    };
    Context ctx;
    ConfigManager cm(cfg, ctx);
    const EngineConfig& ec = cm.engineConfig();
    EXPECT_EQ(ec.peakUsage, 55);
    EXPECT_EQ(ec.sampleIntervalMs, 500);
    EXPECT_EQ(ec.compactionIntervalMs, 60000);
    EXPECT_EQ(ec.driftIntervalMs, 10000);
    EXPECT_EQ(ec.initialIntensity, 2000u);
    EXPECT_EQ(ec.cpuWorkers, 2u);
    EXPECT_EQ(ec.logLevel, "debug");
    EXPECT_EQ(ec.logFormat, LogFormat::Json);
    EXPECT_EQ(ec.randomSeed, 99u);
}

TEST(ConfigManagerTest, BadValuesFallBack) {
    json cfg = {
        {"peak_usage", 150},
        {"Sampling", {{"sample_interval_ms", -5}, {"compaction_interval_ms", "fast"}}},
        {"Logging", {{"level", "loud"}, {"format", "xml"}}},
        {"CpuLoad", nullptr}
    };
    Context ctx;
    ConfigManager cm(cfg, ctx);
    const EngineConfig& ec = cm.engineConfig();
    EXPECT_EQ(ec.peakUsage, 40);
    EXPECT_EQ(ec.sampleIntervalMs, 3000);
    EXPECT_EQ(ec.compactionIntervalMs, 60000);
    EXPECT_EQ(ec.logLevel, "info");
    EXPECT_EQ(ec.logFormat, LogFormat::Text);
    EXPECT_EQ(ec.initialIntensity, 10000u);
}

TEST(ConfigManagerTest, IntervalsAboveInt32FallBack) {
    json cfg = {
        {"Sampling", {{"sample_interval_ms", 4294967296LL}, {"drift_interval_ms", 3000000000LL},
                      {"compaction_interval_ms", 2147483647LL}}}
    };
    Context ctx;
    ConfigManager cm(cfg, ctx);
    const EngineConfig& ec = cm.engineConfig();
    EXPECT_EQ(ec.sampleIntervalMs, 3000);
    EXPECT_EQ(ec.driftIntervalMs, 300000);
    EXPECT_EQ(ec.compactionIntervalMs, 2147483647);
    EXPECT_TRUE(ec.validate());

    auto stats = std::make_shared<baseload::testing::FakeStatsProvider>();
    EXPECT_NO_THROW(cm.buildPipeline(stats,
                                     std::make_shared<baseload::testing::RecordingSink>(),
                                     std::make_shared<baseload::testing::ScriptedRandom>(std::vector<double>{0.5})));
}

TEST(ConfigManagerTest, PeakUsageStringAndLowValue) {
    Context ctx;
    ConfigManager a(json{{"peak_usage", "3"}}, ctx);
    EXPECT_EQ(a.engineConfig().peakUsage, 5);

    ConfigManager b(json{{"peak_usage", "abc"}}, ctx);
    EXPECT_EQ(b.engineConfig().peakUsage, 40);
}

TEST(ConfigManagerTest, EnvironmentOverridesFile) {
    Context ctx;
    ConfigManager cm(json{{"peak_usage", 55}}, ctx, "30");
    EXPECT_EQ(cm.engineConfig().peakUsage, 30);

    ConfigManager bad(json{{"peak_usage", 55}}, ctx, "0");
    EXPECT_EQ(bad.engineConfig().peakUsage, 40);
}

TEST(ConfigManagerTest, NonObjectConfigUsesDefaults) {
    Context ctx;
    ConfigManager cm(json::array({1, 2, 3}), ctx);
    EXPECT_EQ(cm.engineConfig().peakUsage, 40);
}

TEST(ConfigManagerTest, MissingFileUsesDefaults) {
    ::unsetenv("P");
    ::unsetenv("p");
    Context ctx;
    ConfigManager cm(std::string("/nonexistent/baseload.json"), ctx);
    EXPECT_EQ(cm.engineConfig().peakUsage, 40);
}

TEST(ConfigManagerTest, LoadsFileAndUnparsableFile) {
    ::unsetenv("P");
    ::unsetenv("p");
    const std::string path = ::testing::TempDir() + "baseload_cfg_" + std::to_string(::getpid()) + ".json";
    {
        std::ofstream out(path);
        out << R"({"peak_usage": 25, "Sampling": {"sample_interval_ms": 1000}})";
    }
    Context ctx;
    {
        ConfigManager cm(path, ctx);
        EXPECT_EQ(cm.engineConfig().peakUsage, 25);
        EXPECT_EQ(cm.engineConfig().sampleIntervalMs, 1000);
    }
    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    {
        ConfigManager cm(path, ctx);
        EXPECT_EQ(cm.engineConfig().peakUsage, 40);
    }
    std::remove(path.c_str());
}

// ============================================================================
// Pipeline
// ============================================================================

TEST(ConfigManagerTest, BuildValidateStartStop) {
    json cfg = {
        {"peak_usage", 40},
        {"CpuLoad", {{"workers", 1}}}
    };
    Context ctx;
    ConfigManager cm(cfg, ctx);

    auto stats = std::make_shared<baseload::testing::FakeStatsProvider>();
    stats->push(10.0, 20.0, 1000ULL * utils::kMiB);
    auto sink = std::make_shared<baseload::testing::RecordingSink>();
    auto rng  = std::make_shared<baseload::testing::ScriptedRandom>(std::vector<double>{0.5});

    cm.buildPipeline(stats, sink, rng);
    EXPECT_EQ(cm.moduleCount(), 2u);
    ASSERT_NE(ctx.tm, nullptr);
    EXPECT_TRUE(cm.validateAll());

    cm.startAll();
    ASSERT_EQ(sink->startups.size(), 1u);
    EXPECT_TRUE(sink->startups[0].statsAvailable);
    EXPECT_EQ(cm.memory()->totalMemory(), 1000ULL * utils::kMiB);
    EXPECT_TRUE(cm.cpu()->isRunning());

    cm.stopAll();
    EXPECT_FALSE(cm.cpu()->isRunning());
    EXPECT_EQ(cm.memory()->currentBytes(), 0u);
}

TEST(ConfigManagerTest, RunLoopHonoursShutdownFlag) {
    json cfg = {
        {"Sampling", {{"sample_interval_ms", 10}}},
        {"CpuLoad", {{"workers", 1}}}
    };
    Context ctx;
    ConfigManager cm(cfg, ctx);
    cm.buildPipeline(std::make_shared<baseload::testing::FakeStatsProvider>(),
                     std::make_shared<baseload::testing::RecordingSink>(),
                     std::make_shared<baseload::testing::ScriptedRandom>(std::vector<double>{0.99}));
    ctx.shutdown_flag.store(true);
    EXPECT_TRUE(cm.runLoop(0.0));
    EXPECT_EQ(cm.loop()->ticksHandled(), 0u);
}

TEST(ConfigManagerTest, StartBeforeBuildThrows) {
    Context ctx;
    ConfigManager cm(json::object(), ctx);
    EXPECT_THROW(cm.startAll(), std::logic_error);
}
