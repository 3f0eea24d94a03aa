// IEventSink.h
#pragma once

#include "../SharedStructures/ControlEvents.h"

namespace baseload {

/**
 * @class IEventSink
 * @brief Receives the structured events the control loop produces.
 *
 * Every sampling tick produces one TickSummary followed by one
 * AdjustmentEvent per resource. The remaining events are periodic or one-shot.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void onStartup(const StartupSummary& summary) = 0;
    virtual void onTick(const TickSummary& summary) = 0;
    virtual void onAdjustment(const AdjustmentEvent& event) = 0;
    virtual void onCompaction(const CompactionEvent& event) = 0;
    virtual void onDrift(const DriftEvent& event) = 0;

    // Transient stats failure; the loop keeps using the previous snapshot.
    virtual void onStatsFallback(const std::string& reason) = 0;
};

} // namespace baseload
