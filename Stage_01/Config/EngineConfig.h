// EngineConfig.h
#pragma once

#include <cstdint>
#include <string>

namespace baseload {

// Peak-usage policy.
constexpr int    kDefaultPeakUsage = 40;
constexpr int    kMinPeakUsage     = 5;
constexpr int    kHardPeakLimit    = 70;

// Night window in UTC, [start, end).
constexpr int    kNightStartHourUtc = 16;
constexpr int    kNightEndHourUtc   = 20;
constexpr double kDaytimeFactor     = 0.8;

// Drift samples the ceiling from [kDriftLowFactor * origin, origin].
constexpr double kDriftLowFactor = 0.2;

/**
 * @enum LogFormat
 * @brief How the event sink renders control events.
 */
enum class LogFormat {
    Text,
    Json
};

/**
 * @struct EngineConfig
 * @brief Runtime settings for the load engines and the sampling loop.
 */
struct EngineConfig {
    /**
     * @brief User peak-usage ceiling in percent, already sanitized to [kMinPeakUsage, 100].
     */
    int peakUsage = kDefaultPeakUsage;

    /**
     * @brief Metrics + adjustment tick.
     */
    int32_t sampleIntervalMs = 3000;

    /**
     * @brief Allocator compaction tick.
     */
    int32_t compactionIntervalMs = 60 * 1000;

    /**
     * @brief Ceiling drift tick.
     */
    int32_t driftIntervalMs = 5 * 60 * 1000;

    /**
     * @brief Busy iterations per 1 ms sleep at startup.
     */
    uint64_t initialIntensity = 10000;

    /**
     * @brief Number of CPU workers. 0 = one per logical core.
     */
    unsigned cpuWorkers = 0;

    /**
     * @brief Balloon block size in bytes.
     */
    uint64_t memoryBlockBytes = 1024ULL * 1024ULL;

    std::string procStatPath    = "/proc/stat";
    std::string procMeminfoPath = "/proc/meminfo";

    std::string logLevel  = "info";
    LogFormat   logFormat = LogFormat::Text;

    /**
     * @brief Seed for the random source. 0 = seed from std::random_device.
     */
    uint64_t randomSeed = 0;

    bool validate() const {
        if (peakUsage < kMinPeakUsage || peakUsage > 100) return false;
        if (sampleIntervalMs <= 0 || compactionIntervalMs <= 0 || driftIntervalMs <= 0) return false;
        if (initialIntensity < 1) return false;
        if (memoryBlockBytes == 0) return false;
        if (procStatPath.empty() || procMeminfoPath.empty()) return false;
        return true;
    }
};

} // namespace baseload
