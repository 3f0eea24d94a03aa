// ControlEvents.h
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

#include "SystemStats.h"
#include "../Others/utils.h"

namespace baseload {

using json = nlohmann::json;

/**
 * @enum Resource
 * @brief Host resource a controller pass acts on.
 */
enum class Resource {
    Cpu,
    Memory
};

/**
 * @enum Decision
 * @brief Outcome category of one controller pass.
 */
enum class Decision {
    Forced,   // measured usage above the hard ceiling, unconditional decrease
    Skip,     // adjust-or-skip draw said no
    Adjust    // one step in the drawn direction
};

inline const char* resourceName(Resource r) {
    switch (r) {
        case Resource::Cpu:    return "CPU";
        case Resource::Memory: return "MEM";
    }
    return "UNKNOWN";
}

inline const char* decisionName(Decision d) {
    switch (d) {
        case Decision::Forced: return "forced";
        case Decision::Skip:   return "skip";
        case Decision::Adjust: return "adjust";
    }
    return "unknown";
}

/**
 * @struct AdjustmentEvent
 * @brief What one controller pass decided for one resource.
 *
 * increaseProbability is only meaningful for Decision::Adjust. resultingLevel
 * is the engine level after the step (intensity for CPU, balloon bytes for
 * memory); for Skip it is the unchanged level.
 */
struct AdjustmentEvent {
    std::chrono::system_clock::time_point timestamp;
    Resource resource         = Resource::Cpu;
    double   measuredPercent  = 0.0;
    double   targetPercent    = 0.0;
    Decision decision         = Decision::Skip;
    double   increaseProbability = 0.0;
    bool     increased        = false;
    uint64_t resultingLevel   = 0;

    json toJson() const {
        json j = {
            {"timestamp", utils::formatTimestamp(timestamp)},
            {"event", "adjustment"},
            {"resource", resourceName(resource)},
            {"measured_percent", measuredPercent},
            {"target_percent", targetPercent},
            {"decision", decisionName(decision)},
            {"level", resultingLevel}
        };
        if (decision == Decision::Adjust) {
            j["increase_probability"] = increaseProbability;
        }
        if (decision != Decision::Skip) {
            j["direction"] = increased ? "increase" : "decrease";
        }
        return j;
    }
};

/**
 * @struct TickSummary
 * @brief Snapshot of the loop state at the start of one sampling tick.
 */
struct TickSummary {
    SystemStats stats;
    double   targetPercent = 0.0;
    bool     nightWindow   = false;
    uint64_t balloonBytes  = 0;
    uint64_t intensity     = 0;

    json toJson() const {
        return {
            {"event", "tick"},
            {"stats", stats.toJson()},
            {"target_percent", targetPercent},
            {"night_window", nightWindow},
            {"balloon_mb", balloonBytes / utils::kMiB},
            {"intensity", intensity}
        };
    }
};

struct DriftEvent {
    int    originCeiling = 0;
    int    oldCeiling    = 0;
    int    newCeiling    = 0;
    double rangeLow      = 0.0;
    int    rangeHigh     = 0;

    json toJson() const {
        return {
            {"event", "drift"},
            {"origin_ceiling", originCeiling},
            {"old_ceiling", oldCeiling},
            {"new_ceiling", newCeiling},
            {"range_low", rangeLow},
            {"range_high", rangeHigh}
        };
    }
};

struct StartupSummary {
    int      originCeiling    = 0;
    int      ceiling          = 0;
    int      hardCeiling      = 0;
    uint64_t totalMemoryBytes = 0;
    unsigned cpuWorkers       = 0;
    bool     statsAvailable   = false;

    json toJson() const {
        return {
            {"event", "startup"},
            {"origin_ceiling", originCeiling},
            {"ceiling", ceiling},
            {"hard_ceiling", hardCeiling},
            {"total_memory_gb", totalMemoryBytes / utils::kGiB},
            {"cpu_workers", cpuWorkers},
            {"stats_available", statsAvailable}
        };
    }
};

struct CompactionEvent {
    std::chrono::system_clock::time_point timestamp;
    bool     memoryReturned = false;  // allocator handed pages back to the OS
    uint64_t balloonBytes   = 0;

    json toJson() const {
        return {
            {"timestamp", utils::formatTimestamp(timestamp)},
            {"event", "compaction"},
            {"memory_returned", memoryReturned},
            {"balloon_mb", balloonBytes / utils::kMiB}
        };
    }
};

} // namespace baseload
