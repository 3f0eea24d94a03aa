// Modules.hpp

// ========================================================================================
// Modules.hpp  (all modules implementing IModule)
// ========================================================================================
#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include "IModule.h"
#include "ModuleFactory.hpp"

#include "../Stage_01/SharedStructures/ThreadManager.h"
#include "../Stage_01/Concretes/CpuLoadConcrete.h"
#include "../Stage_01/Concretes/MemoryBalloonConcrete.h"

namespace baseload {

//========================================================================================
// CORE: Context
//========================================================================================
// Context with ThreadManager and a global shutdown flag.
struct Context {
    std::atomic<bool> shutdown_flag{false};
    std::shared_ptr<ThreadManager> tm;
};

// ========================================================================================
// CpuLoadModule (wraps CpuLoadConcrete)
//  - start/stop drive the worker pool; both are idempotent
// ========================================================================================
class CpuLoadModule : public IModule {
public:
    explicit CpuLoadModule(std::shared_ptr<CpuLoadConcrete> engine)
        : engine_(std::move(engine)) {}

    bool validate() override {
        if (!engine_) {
            spdlog::error("[CpuLoadModule] No CPU engine supplied.");
            return false;
        }
        if (engine_->currentIntensity() < 1) {
            spdlog::error("[CpuLoadModule] Intensity must be >= 1.");
            return false;
        }
        spdlog::info("[CpuLoadModule] Validated: workers={}, intensity={}",
                     engine_->plannedWorkers(), engine_->currentIntensity());
        return true;
    }

    void start() override {
        spdlog::info("[CpuLoadModule] Starting...");
        engine_->start();
    }

    void stop() override {
        spdlog::info("[CpuLoadModule] Stopping...");
        engine_->stop();
        spdlog::info("[CpuLoadModule] Stopped.");
    }

private:
    std::shared_ptr<CpuLoadConcrete> engine_;
};

// ========================================================================================
// MemoryLoadModule (wraps MemoryBalloonConcrete)
//  - nothing to start; the balloon grows only through controller steps
//  - stop() frees every block
// ========================================================================================
class MemoryLoadModule : public IModule {
public:
    explicit MemoryLoadModule(std::shared_ptr<MemoryBalloonConcrete> engine)
        : engine_(std::move(engine)) {}

    bool validate() override {
        if (!engine_) {
            spdlog::error("[MemoryLoadModule] No memory engine supplied.");
            return false;
        }
        spdlog::info("[MemoryLoadModule] Validated: block={} KB", engine_->blockSize() / 1024);
        return true;
    }

    void start() override {
        if (engine_->totalMemory() == 0) {
            spdlog::warn("[MemoryLoadModule] Total memory unknown; memory steps are no-ops until a snapshot arrives.");
        }
        spdlog::info("[MemoryLoadModule] Ready.");
    }

    void stop() override {
        spdlog::info("[MemoryLoadModule] Stopping...");
        engine_->releaseAll();
        spdlog::info("[MemoryLoadModule] Stopped.");
    }

private:
    std::shared_ptr<MemoryBalloonConcrete> engine_;
};

} // namespace baseload
