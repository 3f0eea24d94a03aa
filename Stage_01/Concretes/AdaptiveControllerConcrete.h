// AdaptiveControllerConcrete.h
#pragma once

#include <chrono>
#include <cmath>

#include <spdlog/spdlog.h>

#include "../Interfaces/ILoadEngine.h"
#include "../Interfaces/IRandomSource.h"
#include "../Config/EngineConfig.h"
#include "../SharedStructures/ControlEvents.h"

namespace baseload {

/**
 * @class AdaptiveControllerConcrete
 * @brief Two-stage probabilistic step decision for one resource per pass.
 *
 * Pass order:
 *   1. measured > hard ceiling: forced decrease, no draws.
 *   2. adjust-or-skip draw against adjustProbability(|measured - target|).
 *   3. direction draw against increaseProbability(measured - target).
 *
 * The probability tables are step functions and must stay that way.
 */
class AdaptiveControllerConcrete {
public:
    explicit AdaptiveControllerConcrete(IRandomSource& rng, double hardCeiling = kHardPeakLimit)
        : rng_(rng), hardCeiling_(hardCeiling) {}

    /**
     * @brief Probability of acting at all this tick.
     * @param absDiff |measured - target| in percentage points.
     */
    static double adjustProbability(double absDiff) {
        if (absDiff > 5) {
            return 0.90;
        } else if (absDiff >= 2) {
            return 0.70;
        }
        return 0.60;
    }

    /**
     * @brief Probability that an acting pass increases usage.
     * @param diff measured - target. Negative means under target.
     */
    static double increaseProbability(double diff) {
        const double absDiff = std::fabs(diff);
        if (diff < 0) {
            if (absDiff > 50) return 0.90;
            if (absDiff > 20) return 0.80;
            if (absDiff > 10) return 0.70;
            if (absDiff > 5)  return 0.65;
            if (absDiff >= 2) return 0.60;
            return 0.55;
        }
        if (absDiff > 50) return 0.10;
        if (absDiff > 20) return 0.20;
        if (absDiff > 10) return 0.30;
        if (absDiff > 5)  return 0.35;
        if (absDiff >= 2) return 0.40;
        return 0.45;
    }

    /**
     * @brief Stage 2 alone: draw a direction for a fixed difference.
     */
    bool drawDirection(double diff) {
        return rng_.uniform() < increaseProbability(diff);
    }

    /**
     * @brief Decide for one resource and apply at most one step to its engine.
     * @return The event describing what happened; exactly one per call.
     */
    AdjustmentEvent runPass(Resource resource, double measured, double target, ILoadEngine& engine);

    double hardCeiling() const { return hardCeiling_; }

private:
    IRandomSource& rng_;
    double hardCeiling_;
};

// ---------------- Implementation ---------------- //

inline AdjustmentEvent AdaptiveControllerConcrete::runPass(Resource resource, double measured,
                                                           double target, ILoadEngine& engine) {
    AdjustmentEvent ev;
    ev.timestamp       = std::chrono::system_clock::now();
    ev.resource        = resource;
    ev.measuredPercent = measured;
    ev.targetPercent   = target;

    if (measured > hardCeiling_) {
        const StepResult r = engine.adjustStep(false);
        ev.decision       = Decision::Forced;
        ev.increased      = false;
        ev.resultingLevel = r.level;
        return ev;
    }

    const double diff = measured - target;
    if (!(rng_.uniform() < adjustProbability(std::fabs(diff)))) {
        ev.decision       = Decision::Skip;
        ev.resultingLevel = engine.currentLevel();
        return ev;
    }

    ev.increaseProbability = increaseProbability(diff);
    const bool increase = rng_.uniform() < ev.increaseProbability;
    const StepResult r = engine.adjustStep(increase);

    ev.decision       = Decision::Adjust;
    ev.increased      = r.increased;
    ev.resultingLevel = r.level;
    spdlog::debug("[AdaptiveController] {} diff={:.2f} p_up={:.2f} -> {} level={}",
                  resourceName(resource), diff, ev.increaseProbability,
                  increase ? "increase" : "decrease", r.level);
    return ev;
}

} // namespace baseload
