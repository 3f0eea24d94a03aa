// SpdlogEventSink.h
#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "../Interfaces/IEventSink.h"
#include "../Config/EngineConfig.h"
#include "../Others/utils.h"

namespace baseload {

/**
 * @class SpdlogEventSink
 * @brief Renders control events through an spdlog logger, as short text lines or one JSON object per line.
 *
 * Text adjustment lines read "<RES>-<measured>%-<p_up>-<direction>", e.g.
 * "CPU-45.3%-0.6-increase", "MEM-12.0%-skip", "CPU-75.2%-forced-decrease".
 */
class SpdlogEventSink : public IEventSink {
public:
    explicit SpdlogEventSink(LogFormat format = LogFormat::Text,
                             std::shared_ptr<spdlog::logger> logger = spdlog::default_logger())
        : format_(format), logger_(std::move(logger)) {}

    void onStartup(const StartupSummary& s) override {
        if (format_ == LogFormat::Json) {
            logger_->info("{}", s.toJson().dump());
            return;
        }
        logger_->info("[BaseLoad] Starting: peak_usage_origin={} peak_usage={} hard_peak_limit={} "
                      "total_memory_gb={} cpu_workers={} stats_available={}",
                      s.originCeiling, s.ceiling, s.hardCeiling,
                      s.totalMemoryBytes / utils::kGiB, s.cpuWorkers, s.statsAvailable);
    }

    void onTick(const TickSummary& t) override {
        if (format_ == LogFormat::Json) {
            logger_->info("{}", t.toJson().dump());
            return;
        }
        logger_->info("[SamplingLoop] cpu={:.1f}% mem={:.1f}% target={:.1f}% night={} "
                      "balloon={}MB intensity={}",
                      t.stats.cpuPercent, t.stats.memoryPercent, t.targetPercent,
                      t.nightWindow, t.balloonBytes / utils::kMiB, t.intensity);
    }

    void onAdjustment(const AdjustmentEvent& e) override {
        if (e.decision == Decision::Forced) {
            logger_->warn("[AdaptiveController] {} usage {:.1f}% above hard peak {}%, forcing decrease",
                          resourceName(e.resource), e.measuredPercent, kHardPeakLimit);
        }
        if (format_ == LogFormat::Json) {
            logger_->info("{}", e.toJson().dump());
            return;
        }
        logger_->info("{}", formatAdjustment(e));
    }

    void onCompaction(const CompactionEvent& e) override {
        if (format_ == LogFormat::Json) {
            logger_->info("{}", e.toJson().dump());
            return;
        }
        logger_->info("[SamplingLoop] Memory compaction triggered (returned_to_os={}, balloon={}MB)",
                      e.memoryReturned, e.balloonBytes / utils::kMiB);
    }

    void onDrift(const DriftEvent& e) override {
        if (format_ == LogFormat::Json) {
            logger_->info("{}", e.toJson().dump());
            return;
        }
        logger_->info("[UsagePlan] peak_usage updated: origin={} old={} new={} range=[{:.1f}, {}]",
                      e.originCeiling, e.oldCeiling, e.newCeiling, e.rangeLow, e.rangeHigh);
    }

    void onStatsFallback(const std::string& reason) override {
        logger_->warn("[SamplingLoop] Failed to read system stats, reusing last snapshot: {}", reason);
    }

    static std::string formatAdjustment(const AdjustmentEvent& e) {
        std::string line = std::string(resourceName(e.resource)) + "-" + utils::formatPercent(e.measuredPercent);
        switch (e.decision) {
            case Decision::Forced:
                return line + "-forced-decrease";
            case Decision::Skip:
                return line + "-skip";
            case Decision::Adjust:
                return line + "-" + utils::formatProbability(e.increaseProbability) + "-" +
                       (e.increased ? "increase" : "decrease");
        }
        return line;
    }

private:
    LogFormat format_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace baseload
