// CpuLoadConcrete.h
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "../Interfaces/ILoadEngine.h"
#include "../SharedStructures/CancellationToken.h"
#include "../SharedStructures/ThreadManager.h"
#include "../../Module/RuntimeControls.hpp"

namespace baseload {

/**
 * @class CpuLoadConcrete
 * @brief Pool of duty-cycling workers whose busy share follows one shared intensity knob.
 *
 * Each worker counts iterations privately and sleeps 1 ms whenever the counter
 * is a multiple of the current intensity. The only state shared between
 * workers is the atomic intensity.
 */
class CpuLoadConcrete : public ILoadEngine {
public:
    static constexpr unsigned kFallbackWorkers = 4;

    CpuLoadConcrete(ThreadManager& threadManager, uint64_t initialIntensity, unsigned workers = 0);
    ~CpuLoadConcrete() override;

    CpuLoadConcrete(const CpuLoadConcrete&) = delete;
    CpuLoadConcrete& operator=(const CpuLoadConcrete&) = delete;

    void start();
    void stop();
    bool isRunning() const;
    size_t workerCount() const;

    // ----------------- ILoadEngine Interface -----------------
    StepResult adjustStep(bool increase) override;
    uint64_t currentLevel() const override { return currentIntensity(); }
    std::string name() const override { return "CPU"; }

    uint64_t currentIntensity() const { return intensity_.load(); }

    /**
     * @brief Number of workers start() will spawn.
     */
    unsigned plannedWorkers() const;

private:
    void workerLoop(unsigned id, CancellationToken token);

    ThreadManager& threadManager_;
    TunableIntensity intensity_;
    unsigned configuredWorkers_;

    mutable std::mutex runMutex_;   // guards running_ and token_
    bool running_ = false;
    CancellationToken token_;
};

// ---------------- Implementation ---------------- //

inline CpuLoadConcrete::CpuLoadConcrete(ThreadManager& threadManager, uint64_t initialIntensity, unsigned workers)
    : threadManager_(threadManager),
      intensity_(initialIntensity),
      configuredWorkers_(workers) {}

inline CpuLoadConcrete::~CpuLoadConcrete() {
    stop();
}

inline unsigned CpuLoadConcrete::plannedWorkers() const {
    if (configuredWorkers_ > 0) {
        return configuredWorkers_;
    }
    unsigned cores = std::thread::hardware_concurrency();
    return cores > 0 ? cores : kFallbackWorkers;
}

inline void CpuLoadConcrete::start() {
    std::lock_guard<std::mutex> lock(runMutex_);
    if (running_) {
        spdlog::debug("[CpuLoadConcrete] start() ignored, pool already running.");
        return;
    }

    token_ = CancellationToken();
    const unsigned n = plannedWorkers();
    try {
        for (unsigned i = 0; i < n; ++i) {
            threadManager_.addThread(Component::CpuWorker,
                                     std::thread(&CpuLoadConcrete::workerLoop, this, i, token_));
        }
    } catch (const std::exception& ex) {
        spdlog::error("[CpuLoadConcrete] Exception during worker start: {}", ex.what());
        token_.cancel();
        threadManager_.joinThreadsFor(Component::CpuWorker);
        throw;
    }
    running_ = true;
    spdlog::info("[CpuLoadConcrete] Started {} worker(s), intensity={}", n, intensity_.load());
}

inline void CpuLoadConcrete::stop() {
    std::lock_guard<std::mutex> lock(runMutex_);
    if (!running_) {
        return;
    }
    token_.cancel();
    threadManager_.joinThreadsFor(Component::CpuWorker);
    running_ = false;
    spdlog::info("[CpuLoadConcrete] All workers stopped.");
}

inline bool CpuLoadConcrete::isRunning() const {
    std::lock_guard<std::mutex> lock(runMutex_);
    return running_;
}

inline size_t CpuLoadConcrete::workerCount() const {
    return threadManager_.threadCountFor(Component::CpuWorker);
}

inline StepResult CpuLoadConcrete::adjustStep(bool increase) {
    StepResult r;
    r.increased = increase;
    r.level = increase ? intensity_.stepUp() : intensity_.stepDown();
    return r;
}

inline void CpuLoadConcrete::workerLoop(unsigned id, CancellationToken token) {
    spdlog::debug("[CpuLoadConcrete] worker {} started.", id);
    uint64_t counter = 0;
    while (!token.isCancelled()) {
        ++counter;
        if (counter % intensity_.load() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    spdlog::debug("[CpuLoadConcrete] worker {} exiting after {} iterations.", id, counter);
}

} // namespace baseload
