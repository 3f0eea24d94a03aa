//==================================================================================================
// ConfigManager.hpp  Null-safe config loader + pipeline builder
// - JSON file for intervals, engine tuning and logging; every key optional
// - Environment P (then p) overrides the peak-usage ceiling
// - Avoids json.value(...) on null by using small helpers
//==================================================================================================

#pragma once

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>   // access()

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "IModule.h"
#include "Modules.hpp"          // CpuLoadModule, MemoryLoadModule + Context
#include "ModuleFactory.hpp"    // ModuleFactory::create<...>()
#include "SamplingLoop.hpp"

#include "../Stage_01/Config/EngineConfig.h"
#include "../Stage_01/Interfaces/IStatsProvider.h"
#include "../Stage_01/Interfaces/IEventSink.h"
#include "../Stage_01/Interfaces/IRandomSource.h"
#include "../Stage_01/Concretes/ProcStatsConcrete.h"
#include "../Stage_01/Concretes/SpdlogEventSink.h"
#include "../Stage_01/Concretes/RandomSourceConcrete.h"
#include "../Stage_01/Concretes/AdaptiveControllerConcrete.h"
#include "../Stage_01/SharedStructures/UsagePlan.h"

namespace baseload {

using json = nlohmann::json;

// ---------- null-safe JSON helpers ----------
template<typename T>
inline T jvalue(const json& j, const char* key, const T& def) {
    if (j.is_object()) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            try {
                return it->get<T>();
            } catch (const json::exception& e) {
                spdlog::warn("[ConfigManager] Key '{}' has the wrong type ({}). Using default.", key, e.what());
            }
        }
    }
    return def;
}
inline json jobject_or_empty(const json& parent, const char* key) {
    if (parent.is_object()) {
        auto it = parent.find(key);
        if (it != parent.end() && it->is_object()) return *it;
    }
    return json::object();
}

// ---------- ConfigManager ----------
class ConfigManager {
public:
    ConfigManager(const std::string& configPath, Context& ctx)
        : ctx_(ctx)
    {
        if (::access(configPath.c_str(), R_OK) == 0) {
            std::ifstream f(configPath);
            try {
                config_ = json::parse(f);
                spdlog::info("[ConfigManager] Loaded configuration from {}", configPath);
            } catch (const json::parse_error& e) {
                spdlog::warn("[ConfigManager] Failed parsing {} ({}). Using defaults.", configPath, e.what());
                config_ = json::object();
            }
        } else {
            spdlog::warn("[ConfigManager] Config file not found: {}. Using defaults.", configPath);
            config_ = json::object();
        }
        if (!config_.is_object()) {
            spdlog::warn("[ConfigManager] Top-level config is not an object; resetting to defaults.");
            config_ = json::object();
        }
        sanitizeDefaults(config_);
        engineConfig_ = toEngineConfig(config_, peakUsageEnvValue());
    }

    ConfigManager(const json& cfg, Context& ctx, const char* envPeakUsage = nullptr)
        : ctx_(ctx), config_(cfg)
    {
        if (!config_.is_object()) {
            spdlog::warn("[ConfigManager] Top-level config is not an object; resetting to defaults.");
            config_ = json::object();
        }
        sanitizeDefaults(config_);
        engineConfig_ = toEngineConfig(config_, envPeakUsage);
    }

    // ---------- peak usage rules ----------
    // [1,100] accepted, below kMinPeakUsage raised to it, anything else -> default.
    static int sanitizePeakUsage(long value) {
        if (value < 1 || value > 100) {
            spdlog::warn("[ConfigManager] Peak usage {} out of range [1,100], using default {}.",
                         value, kDefaultPeakUsage);
            return kDefaultPeakUsage;
        }
        if (value < kMinPeakUsage) {
            spdlog::warn("[ConfigManager] Peak usage {} too low, using minimum {}.", value, kMinPeakUsage);
            return kMinPeakUsage;
        }
        return static_cast<int>(value);
    }

    static int parsePeakUsage(const std::string& raw) {
        long value = 0;
        try {
            size_t pos = 0;
            value = std::stol(raw, &pos);
            if (pos != raw.size()) {
                throw std::invalid_argument("trailing characters");
            }
        } catch (const std::logic_error&) {
            spdlog::warn("[ConfigManager] Invalid peak usage '{}', using default {}.", raw, kDefaultPeakUsage);
            return kDefaultPeakUsage;
        }
        return sanitizePeakUsage(value);
    }

    // P wins over p; nullptr when neither is set to a non-empty value.
    static const char* peakUsageEnvValue() {
        const char* v = std::getenv("P");
        if (v == nullptr || *v == '\0') {
            v = std::getenv("p");
        }
        return (v == nullptr || *v == '\0') ? nullptr : v;
    }

    static EngineConfig toEngineConfig(const json& cfg, const char* envPeakUsage) {
        EngineConfig ec;

        auto it = cfg.find("peak_usage");
        if (it != cfg.end() && !it->is_null()) {
            if (it->is_number_integer()) {
                ec.peakUsage = sanitizePeakUsage(it->get<long>());
            } else if (it->is_string()) {
                ec.peakUsage = parsePeakUsage(it->get<std::string>());
            } else {
                spdlog::warn("[ConfigManager] peak_usage must be an integer, using default {}.", kDefaultPeakUsage);
            }
        }
        if (envPeakUsage != nullptr) {
            ec.peakUsage = parsePeakUsage(envPeakUsage);
        }

        const json jSampling = jobject_or_empty(cfg, "Sampling");
        ec.sampleIntervalMs     = jvalue<int32_t>(jSampling, "sample_interval_ms", ec.sampleIntervalMs);
        ec.compactionIntervalMs = jvalue<int32_t>(jSampling, "compaction_interval_ms", ec.compactionIntervalMs);
        ec.driftIntervalMs      = jvalue<int32_t>(jSampling, "drift_interval_ms", ec.driftIntervalMs);

        const json jCpu = jobject_or_empty(cfg, "CpuLoad");
        ec.initialIntensity = jvalue<uint64_t>(jCpu, "initial_intensity", ec.initialIntensity);
        ec.cpuWorkers       = jvalue<unsigned>(jCpu, "workers", ec.cpuWorkers);

        const json jMem = jobject_or_empty(cfg, "MemoryLoad");
        ec.memoryBlockBytes = jvalue<uint64_t>(jMem, "block_bytes", ec.memoryBlockBytes);

        const json jStats = jobject_or_empty(cfg, "Stats");
        ec.procStatPath    = jvalue<std::string>(jStats, "proc_stat", ec.procStatPath);
        ec.procMeminfoPath = jvalue<std::string>(jStats, "proc_meminfo", ec.procMeminfoPath);

        const json jLog = jobject_or_empty(cfg, "Logging");
        ec.logLevel  = jvalue<std::string>(jLog, "level", ec.logLevel);
        ec.logFormat = jvalue<std::string>(jLog, "format", "text") == "json" ? LogFormat::Json : LogFormat::Text;

        const json jSys = jobject_or_empty(cfg, "SystemBehavior");
        ec.randomSeed = jvalue<uint64_t>(jSys, "random_seed", ec.randomSeed);

        return ec;
    }

    // Production wiring: /proc stats, spdlog sink, seeded Mersenne Twister.
    void buildPipeline() {
        buildPipeline(std::make_shared<ProcStatsConcrete>(engineConfig_.procStatPath, engineConfig_.procMeminfoPath),
                      std::make_shared<SpdlogEventSink>(engineConfig_.logFormat),
                      std::make_shared<RandomSourceConcrete>(engineConfig_.randomSeed));
    }

    void buildPipeline(std::shared_ptr<IStatsProvider> stats,
                       std::shared_ptr<IEventSink> sink,
                       std::shared_ptr<IRandomSource> rng) {
        if (!engineConfig_.validate()) {
            throw std::invalid_argument("EngineConfig failed validation");
        }
        if (!ctx_.tm) {
            ctx_.tm = std::make_shared<ThreadManager>();
        }
        stats_ = std::move(stats);
        sink_  = std::move(sink);
        rng_   = std::move(rng);

        cpu_        = std::make_shared<CpuLoadConcrete>(*ctx_.tm, engineConfig_.initialIntensity, engineConfig_.cpuWorkers);
        memory_     = std::make_shared<MemoryBalloonConcrete>(engineConfig_.memoryBlockBytes);
        plan_       = std::make_shared<UsagePlan>(engineConfig_.peakUsage);
        controller_ = std::make_shared<AdaptiveControllerConcrete>(*rng_);

        SamplingLoop::Intervals iv;
        iv.sample     = std::chrono::milliseconds(engineConfig_.sampleIntervalMs);
        iv.compaction = std::chrono::milliseconds(engineConfig_.compactionIntervalMs);
        iv.drift      = std::chrono::milliseconds(engineConfig_.driftIntervalMs);
        loop_ = std::make_unique<SamplingLoop>(*stats_, *cpu_, *memory_, *controller_, *plan_, *rng_, *sink_, iv);

        modules_.clear();
        modules_.push_back(ModuleFactory::create<MemoryLoadModule>(memory_));
        modules_.push_back(ModuleFactory::create<CpuLoadModule>(cpu_));

        spdlog::info("[ConfigManager] Pipeline built: {} modules, stats from {}, peak_usage={}.",
                     modules_.size(), stats_->getSpecs(), engineConfig_.peakUsage);
    }

    bool validateAll() {
        try {
            for (auto& m : modules_) {
                if (!m->validate()) {
                    spdlog::error("[ConfigManager] Module validation failed.");
                    return false;
                }
            }
        } catch (const std::exception& e) {
            spdlog::error("[ConfigManager] Exception during validateAll(): {}", e.what());
            return false;
        }
        spdlog::info("[ConfigManager] All modules validated.");
        return true;
    }

    // Initial snapshot first so the balloon knows total memory before anything runs.
    void startAll() {
        if (!loop_) {
            throw std::logic_error("startAll() before buildPipeline()");
        }
        loop_->prime();
        for (auto& m : modules_) m->start();
        spdlog::info("[ConfigManager] All modules started.");
    }

    void stopAll() {
        for (auto it = modules_.rbegin(); it != modules_.rend(); ++it) {
            (*it)->stop();
        }
        spdlog::info("[ConfigManager] All modules stopped.");
    }

    bool runLoop(double runSeconds) {
        if (!loop_) {
            throw std::logic_error("runLoop() before buildPipeline()");
        }
        return loop_->run(ctx_.shutdown_flag, runSeconds);
    }

    const json& config() const { return config_; }
    const EngineConfig& engineConfig() const { return engineConfig_; }

    // Optional accessors
    std::shared_ptr<CpuLoadConcrete> cpu() const { return cpu_; }
    std::shared_ptr<MemoryBalloonConcrete> memory() const { return memory_; }
    std::shared_ptr<UsagePlan> plan() const { return plan_; }
    SamplingLoop* loop() const { return loop_.get(); }
    size_t moduleCount() const { return modules_.size(); }

private:
    static void sanitizeDefaults(json& cfg) {
        auto ensure_object = [&cfg](const char* key) -> json& {
            if (!cfg.contains(key) || !cfg[key].is_object()) cfg[key] = json::object();
            return cfg[key];
        };
        auto ensure_positive_int = [](json& section, const char* key, int def) {
            // Values are read back as int32_t.
            if (!section.contains(key) || !section[key].is_number_integer() || section[key].get<long long>() <= 0 ||
                section[key].get<long long>() > std::numeric_limits<int32_t>::max()) {
                if (section.contains(key)) {
                    spdlog::warn("[ConfigManager] '{}' must be a positive 32-bit integer; using {}.", key, def);
                }
                section[key] = def;
            }
        };

        auto& sampling = ensure_object("Sampling");
        ensure_positive_int(sampling, "sample_interval_ms", 3000);
        ensure_positive_int(sampling, "compaction_interval_ms", 60 * 1000);
        ensure_positive_int(sampling, "drift_interval_ms", 5 * 60 * 1000);

        auto& cpu = ensure_object("CpuLoad");
        ensure_positive_int(cpu, "initial_intensity", 10000);
        if (!cpu.contains("workers") || !cpu["workers"].is_number_integer() || cpu["workers"].get<long>() < 0)
            cpu["workers"] = 0;

        auto& mem = ensure_object("MemoryLoad");
        ensure_positive_int(mem, "block_bytes", 1024 * 1024);

        auto& stats = ensure_object("Stats");
        if (!stats.contains("proc_stat") || !stats["proc_stat"].is_string() || stats["proc_stat"].get<std::string>().empty())
            stats["proc_stat"] = "/proc/stat";
        if (!stats.contains("proc_meminfo") || !stats["proc_meminfo"].is_string() || stats["proc_meminfo"].get<std::string>().empty())
            stats["proc_meminfo"] = "/proc/meminfo";

        auto& log = ensure_object("Logging");
        static const std::vector<std::string> kLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};
        if (!log.contains("level") || !log["level"].is_string() ||
            std::find(kLevels.begin(), kLevels.end(), log["level"].get<std::string>()) == kLevels.end()) {
            if (log.contains("level")) {
                spdlog::warn("[ConfigManager] Unknown log level {}; using info.", log["level"].dump());
            }
            log["level"] = "info";
        }
        if (!log.contains("format") || !log["format"].is_string() ||
            (log["format"] != "text" && log["format"] != "json")) {
            if (log.contains("format")) {
                spdlog::warn("[ConfigManager] Unknown log format {}; using text.", log["format"].dump());
            }
            log["format"] = "text";
        }

        auto& sysb = ensure_object("SystemBehavior");
        if (!sysb.contains("run_duration_sec") || !sysb["run_duration_sec"].is_number())
            sysb["run_duration_sec"] = 0;
        if (!sysb.contains("random_seed") || !sysb["random_seed"].is_number_integer() ||
            sysb["random_seed"].get<long long>() < 0)
            sysb["random_seed"] = 0;
    }

private:
    Context& ctx_;
    json config_;
    EngineConfig engineConfig_;

    std::vector<std::unique_ptr<IModule>> modules_;

    std::shared_ptr<IStatsProvider> stats_;
    std::shared_ptr<IEventSink> sink_;
    std::shared_ptr<IRandomSource> rng_;

    std::shared_ptr<CpuLoadConcrete> cpu_;
    std::shared_ptr<MemoryBalloonConcrete> memory_;
    std::shared_ptr<UsagePlan> plan_;
    std::shared_ptr<AdaptiveControllerConcrete> controller_;
    std::unique_ptr<SamplingLoop> loop_;
};

} // namespace baseload
