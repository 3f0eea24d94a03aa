// UsagePlan.h
#pragma once

#include <algorithm>
#include <mutex>
#include <shared_mutex>

#include "ControlEvents.h"
#include "../Config/EngineConfig.h"
#include "../Interfaces/IRandomSource.h"

namespace baseload {

/**
 * @class UsagePlan
 * @brief Configured peak ceiling plus the drifting ceiling actually targeted.
 *
 * Read every sampling tick, rewritten every drift interval; guarded by a
 * read/write lock.
 */
class UsagePlan {
public:
    explicit UsagePlan(int originCeiling)
        : origin_(originCeiling), current_(std::min(originCeiling, kHardPeakLimit)) {}

    int originCeiling() const { return origin_; }

    int currentCeiling() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return current_;
    }

    /**
     * @brief Re-sample the current ceiling uniformly from [0.2 * origin, origin].
     *
     * The draw is truncated to an integer, raised to max(int(0.2 * origin), 5)
     * and capped at the hard ceiling.
     */
    DriftEvent drift(IRandomSource& rng) {
        const double low  = static_cast<double>(origin_) * kDriftLowFactor;
        const double high = static_cast<double>(origin_);
        const double draw = low + rng.uniform() * (high - low);

        int next = static_cast<int>(draw);
        next = std::max(next, static_cast<int>(low));
        next = std::max(next, kMinPeakUsage);
        next = std::min(next, kHardPeakLimit);

        DriftEvent ev;
        ev.originCeiling = origin_;
        ev.rangeLow      = low;
        ev.rangeHigh     = origin_;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            ev.oldCeiling = current_;
            current_ = next;
        }
        ev.newCeiling = next;
        return ev;
    }

private:
    const int origin_;
    mutable std::shared_mutex mutex_;
    int current_;
};

} // namespace baseload
