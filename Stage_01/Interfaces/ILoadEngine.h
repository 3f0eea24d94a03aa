// ILoadEngine.h
#pragma once

#include <cstdint>
#include <string>

namespace baseload {

/**
 * @struct StepResult
 * @brief Outcome of one discrete load step.
 *
 * level is the engine's new controllable quantity: the tunable intensity for
 * the CPU engine, the balloon size in bytes for the memory engine.
 */
struct StepResult {
    bool     increased = false;
    uint64_t level     = 0;
};

/**
 * @class ILoadEngine
 * @brief A resource load generator the adaptive controller can nudge one step at a time.
 *
 * Typical usage:
 *   1. The control loop measures utilization and asks the controller for a decision.
 *   2. The controller calls adjustStep(true|false) exactly once, or not at all on skip.
 *   3. The next measurement reflects the new level.
 */
class ILoadEngine {
public:
    virtual ~ILoadEngine() = default;

    /**
     * @brief Move the generated load one step up or down.
     * @param increase true to raise usage, false to lower it.
     * @return Direction applied and the resulting level.
     */
    virtual StepResult adjustStep(bool increase) = 0;

    /**
     * @brief Current controllable level, same unit as StepResult::level.
     */
    virtual uint64_t currentLevel() const = 0;

    virtual std::string name() const = 0;
};

} // namespace baseload
