// TargetCalculator.h

#pragma once

#include <chrono>

#include "../Config/EngineConfig.h"
#include "utils.h"

namespace baseload {

/**
 * @brief True inside the daily UTC night window [16:00, 20:00).
 */
inline bool isNightWindow(const std::chrono::system_clock::time_point& tp) {
    const int hour = utils::utcHour(tp);
    return hour >= kNightStartHourUtc && hour < kNightEndHourUtc;
}

/**
 * @brief Desired utilization percentage for the current ceiling.
 *
 * Night window: the ceiling itself. Otherwise 80 % of it. Never above the
 * hard ceiling. Pure: no clock, no hidden state.
 */
inline double computeTarget(int ceiling, bool night, double hardCeiling = kHardPeakLimit) {
    double target = night ? static_cast<double>(ceiling)
                          : static_cast<double>(ceiling) * kDaytimeFactor;
    if (target > hardCeiling) {
        target = hardCeiling;
    }
    return target;
}

} // namespace baseload
