// File: tests/test_sampling_loop.cpp
#include "Module/SamplingLoop.hpp"
#include "TestDoubles.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <ctime>
#include <memory>
#include <thread>

using namespace baseload;
using baseload::testing::FakeStatsProvider;
using baseload::testing::RecordingSink;
using baseload::testing::ScriptedRandom;

namespace {

// 2024-01-01 at the given UTC hour.
std::chrono::system_clock::time_point utcAt(int hour) {
    return std::chrono::system_clock::from_time_t(static_cast<std::time_t>(1704067200) + hour * 3600);
}

constexpr uint64_t kTotal = 1000ULL * utils::kMiB;   // 1 MiB step

class SamplingLoopTest : public ::testing::Test {
protected:
    SamplingLoopTest()
        : cpu_(tm_, 10000, 1),
          plan_(40) {}

    std::unique_ptr<SamplingLoop> makeLoop(ScriptedRandom& rng, int utcHour,
                                           const SamplingLoop::Intervals& iv = SamplingLoop::Intervals()) {
        controller_ = std::make_unique<AdaptiveControllerConcrete>(rng);
        return std::make_unique<SamplingLoop>(stats_, cpu_, memory_, *controller_, plan_, rng, sink_, iv,
                                              [utcHour] { return utcAt(utcHour); });
    }

    ThreadManager tm_;
    CpuLoadConcrete cpu_;
    MemoryBalloonConcrete memory_;
    UsagePlan plan_;
    FakeStatsProvider stats_;
    RecordingSink sink_;
    std::unique_ptr<AdaptiveControllerConcrete> controller_;
};

} // namespace

TEST_F(SamplingLoopTest, PrimeSetsTotalMemory) {
    ScriptedRandom rng({0.0});
    auto loop = makeLoop(rng, 10);
    stats_.push(10.0, 20.0, kTotal);

    EXPECT_TRUE(loop->prime());
    EXPECT_EQ(memory_.totalMemory(), kTotal);
    ASSERT_EQ(sink_.startups.size(), 1u);
    EXPECT_EQ(sink_.startups[0].originCeiling, 40);
    EXPECT_EQ(sink_.startups[0].hardCeiling, 70);
    EXPECT_EQ(sink_.startups[0].cpuWorkers, 1u);
}

TEST_F(SamplingLoopTest, PrimeWithoutStatsStillStarts) {
    ScriptedRandom rng({0.0});
    auto loop = makeLoop(rng, 10);

    EXPECT_FALSE(loop->prime());
    ASSERT_EQ(sink_.startups.size(), 1u);
    EXPECT_FALSE(sink_.startups[0].statsAvailable);
    EXPECT_EQ(memory_.totalMemory(), 0u);
}

TEST_F(SamplingLoopTest, TickAdjustsMemoryThenCpu) {
    // Every draw 0.0: always adjust, always increase while under target.
    ScriptedRandom rng({0.0});
    auto loop = makeLoop(rng, 10);
    stats_.push(10.0, 20.0, kTotal);
    loop->prime();

    stats_.push(10.0, 20.0, kTotal);
    loop->sampleTick();

    ASSERT_EQ(sink_.ticks.size(), 1u);
    EXPECT_DOUBLE_EQ(sink_.ticks[0].targetPercent, 32.0);
    EXPECT_FALSE(sink_.ticks[0].nightWindow);

    ASSERT_EQ(sink_.adjustments.size(), 2u);
    EXPECT_EQ(sink_.adjustments[0].resource, Resource::Memory);
    EXPECT_EQ(sink_.adjustments[1].resource, Resource::Cpu);
    EXPECT_TRUE(sink_.adjustments[0].increased);
    EXPECT_TRUE(sink_.adjustments[1].increased);

    EXPECT_EQ(memory_.currentBytes(), utils::kMiB);
    EXPECT_EQ(cpu_.currentIntensity(), 10010u);
}

TEST_F(SamplingLoopTest, NightWindowTargetsFullCeiling) {
    ScriptedRandom rng({0.99});
    auto loop = makeLoop(rng, 17);
    stats_.push(10.0, 20.0, kTotal);
    loop->sampleTick();

    ASSERT_EQ(sink_.ticks.size(), 1u);
    EXPECT_TRUE(sink_.ticks[0].nightWindow);
    EXPECT_DOUBLE_EQ(sink_.ticks[0].targetPercent, 40.0);
}

TEST_F(SamplingLoopTest, ForcedDecreaseAboveHardCeiling) {
    ScriptedRandom rng({0.0});
    auto loop = makeLoop(rng, 10);
    stats_.push(85.0, 75.0, kTotal);
    loop->sampleTick();

    ASSERT_EQ(sink_.adjustments.size(), 2u);
    EXPECT_EQ(sink_.adjustments[0].decision, Decision::Forced);
    EXPECT_EQ(sink_.adjustments[1].decision, Decision::Forced);
    EXPECT_EQ(cpu_.currentIntensity(), 9990u);
    EXPECT_EQ(rng.draws(), 0u);
}

TEST_F(SamplingLoopTest, StatsFailureReusesLastSnapshot) {
    ScriptedRandom rng({0.99});   // always skip
    auto loop = makeLoop(rng, 10);
    stats_.push(12.0, 34.0, kTotal);
    loop->sampleTick();

    loop->sampleTick();   // queue empty -> provider throws
    ASSERT_EQ(sink_.fallbacks.size(), 1u);
    ASSERT_EQ(sink_.ticks.size(), 2u);
    EXPECT_DOUBLE_EQ(sink_.ticks[1].stats.cpuPercent, 12.0);
    EXPECT_DOUBLE_EQ(sink_.ticks[1].stats.memoryPercent, 34.0);
    EXPECT_EQ(sink_.adjustments.size(), 4u);
}

TEST_F(SamplingLoopTest, LateTotalMemoryIsPickedUp) {
    ScriptedRandom rng({0.99});
    auto loop = makeLoop(rng, 10);
    loop->prime();
    ASSERT_EQ(memory_.totalMemory(), 0u);

    stats_.push(10.0, 20.0, kTotal);
    loop->sampleTick();
    EXPECT_EQ(memory_.totalMemory(), kTotal);
}

TEST_F(SamplingLoopTest, DriftChangesNextTarget) {
    ScriptedRandom rng({0.0});
    auto loop = makeLoop(rng, 10);

    loop->driftTick();
    ASSERT_EQ(sink_.drifts.size(), 1u);
    EXPECT_EQ(sink_.drifts[0].newCeiling, 8);
    EXPECT_EQ(plan_.currentCeiling(), 8);

    stats_.push(10.0, 20.0, kTotal);
    loop->sampleTick();
    EXPECT_DOUBLE_EQ(sink_.ticks[0].targetPercent, 8 * 0.8);
}

TEST_F(SamplingLoopTest, CompactionEmitsEvent) {
    ScriptedRandom rng({0.0});
    auto loop = makeLoop(rng, 10);
    loop->compactionTick();
    ASSERT_EQ(sink_.compactions.size(), 1u);
    EXPECT_EQ(sink_.compactions[0].balloonBytes, 0u);
}

TEST_F(SamplingLoopTest, RunStopsAtLimit) {
    ScriptedRandom rng({0.99});
    SamplingLoop::Intervals iv;
    iv.sample     = std::chrono::milliseconds(10);
    iv.compaction = std::chrono::milliseconds(60 * 1000);
    iv.drift      = std::chrono::milliseconds(60 * 1000);
    auto loop = makeLoop(rng, 10, iv);

    std::atomic<bool> shutdown{false};
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(loop->run(shutdown, 0.2));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(200));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_GT(loop->ticksHandled(), 0u);
    EXPECT_EQ(sink_.ticks.size(), loop->ticksHandled());
    EXPECT_TRUE(sink_.drifts.empty());
}

TEST_F(SamplingLoopTest, RunStopsOnShutdownFlag) {
    ScriptedRandom rng({0.99});
    auto loop = makeLoop(rng, 10);

    std::atomic<bool> shutdown{false};
    std::thread stopper([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        shutdown.store(true);
    });
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(loop->run(shutdown, 0.0));
    stopper.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    EXPECT_EQ(loop->ticksHandled(), 0u);   // default 3 s sample interval never fired
}
