// IStatsProvider.h
#pragma once

#include <stdexcept>
#include <string>

#include "../SharedStructures/SystemStats.h"

namespace baseload {

/**
 * @brief Raised by a stats provider when a snapshot cannot be produced.
 *        The control loop treats it as transient.
 */
class StatsUnavailableError : public std::runtime_error {
public:
    explicit StatsUnavailableError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @class IStatsProvider
 * @brief Source of point-in-time host utilization snapshots.
 */
class IStatsProvider {
public:
    virtual ~IStatsProvider() = default;

    /**
     * @brief Read a fresh snapshot.
     * @throws StatsUnavailableError if the underlying counters cannot be read.
     */
    virtual SystemStats getStats() = 0;

    /**
     * @brief Human-readable description of where the numbers come from.
     */
    virtual std::string getSpecs() const = 0;
};

} // namespace baseload
