// SystemStats.h
#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

#include "../Others/utils.h"

namespace baseload {

using json = nlohmann::json;

/**
 * @struct SystemStats
 * @brief Point-in-time host utilization snapshot.
 *
 * cpuPercent and memoryPercent are in [0, 100]. A default-constructed snapshot
 * (all zero) stands in when no successful read has happened yet.
 */
struct SystemStats {
    std::chrono::system_clock::time_point timestamp;
    double   cpuPercent       = 0.0;
    double   memoryPercent    = 0.0;
    uint64_t totalMemoryBytes = 0;
    uint64_t usedMemoryBytes  = 0;

    json toJson() const {
        return {
            {"timestamp", utils::formatTimestamp(timestamp)},
            {"cpu_percent", cpuPercent},
            {"memory_percent", memoryPercent},
            {"total_memory_bytes", totalMemoryBytes},
            {"used_memory_bytes", usedMemoryBytes}
        };
    }
};

} // namespace baseload
