// MemoryBalloonConcrete.h
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <new>
#include <shared_mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "../Interfaces/ILoadEngine.h"
#include "../Others/utils.h"

namespace baseload {

/**
 * @class MemoryBalloonConcrete
 * @brief Holds a LIFO stack of touched fixed-size blocks whose total is the memory footprint.
 *
 * One step is 0.1 % of total host memory. Growth rounds the step up to whole
 * blocks; shrinkage frees whole blocks from the tail. All mutation and size
 * queries go through one read/write lock.
 */
class MemoryBalloonConcrete : public ILoadEngine {
public:
    static constexpr uint64_t kDefaultBlockBytes = utils::kMiB;
    static constexpr uint64_t kStepDivisor       = 1000;   // step = total / 1000

    explicit MemoryBalloonConcrete(uint64_t blockBytes = kDefaultBlockBytes);

    MemoryBalloonConcrete(const MemoryBalloonConcrete&) = delete;
    MemoryBalloonConcrete& operator=(const MemoryBalloonConcrete&) = delete;

    // ----------------- ILoadEngine Interface -----------------
    StepResult adjustStep(bool increase) override;
    uint64_t currentLevel() const override { return currentBytes(); }
    std::string name() const override { return "MEM"; }

    void setTotalMemory(uint64_t totalBytes);
    uint64_t totalMemory() const;
    uint64_t stepBytes() const;

    uint64_t currentBytes() const;
    size_t blockCount() const;
    uint64_t blockSize() const { return blockBytes_; }

    void releaseAll();

private:
    // Callers hold mutex_ exclusively.
    uint64_t bytesLocked() const { return static_cast<uint64_t>(blocks_.size()) * blockBytes_; }
    uint64_t adjustToLocked(uint64_t targetBytes);
    void allocateLocked(uint64_t bytes);
    void releaseLocked(uint64_t bytes);

    const uint64_t blockBytes_;
    mutable std::shared_mutex mutex_;
    std::vector<std::unique_ptr<uint8_t[]>> blocks_;
    uint64_t totalMemory_ = 0;
};

// ---------------- Implementation ---------------- //

inline MemoryBalloonConcrete::MemoryBalloonConcrete(uint64_t blockBytes)
    : blockBytes_(blockBytes > 0 ? blockBytes : kDefaultBlockBytes) {}

inline void MemoryBalloonConcrete::setTotalMemory(uint64_t totalBytes) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    totalMemory_ = totalBytes;
    spdlog::info("[MemoryBalloonConcrete] Total memory set to {} MB, step={} KB",
                 totalBytes / utils::kMiB, (totalBytes / kStepDivisor) / 1024);
}

inline uint64_t MemoryBalloonConcrete::totalMemory() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return totalMemory_;
}

inline uint64_t MemoryBalloonConcrete::stepBytes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return totalMemory_ / kStepDivisor;
}

inline uint64_t MemoryBalloonConcrete::currentBytes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return bytesLocked();
}

inline size_t MemoryBalloonConcrete::blockCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return blocks_.size();
}

inline StepResult MemoryBalloonConcrete::adjustStep(bool increase) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    const uint64_t current = bytesLocked();
    const uint64_t step    = totalMemory_ / kStepDivisor;

    uint64_t target;
    if (increase) {
        target = current + step;
    } else {
        target = current > step ? current - step : 0;
    }

    StepResult r;
    r.increased = increase;
    r.level = adjustToLocked(target);
    return r;
}

inline void MemoryBalloonConcrete::releaseAll() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const size_t n = blocks_.size();
    blocks_.clear();
    blocks_.shrink_to_fit();
    spdlog::info("[MemoryBalloonConcrete] Released all {} block(s).", n);
}

inline uint64_t MemoryBalloonConcrete::adjustToLocked(uint64_t targetBytes) {
    const uint64_t current = bytesLocked();
    if (targetBytes > current) {
        allocateLocked(targetBytes - current);
    } else if (targetBytes < current) {
        releaseLocked(current - targetBytes);
    }
    return bytesLocked();
}

inline void MemoryBalloonConcrete::allocateLocked(uint64_t bytes) {
    const uint64_t blocks = (bytes + blockBytes_ - 1) / blockBytes_;
    for (uint64_t i = 0; i < blocks; ++i) {
        try {
            std::unique_ptr<uint8_t[]> buf(new uint8_t[blockBytes_]);
            // Touch every byte so the pages are committed and not shared zero pages.
            for (uint64_t j = 0; j < blockBytes_; ++j) {
                buf[j] = static_cast<uint8_t>(j % 256);
            }
            blocks_.push_back(std::move(buf));
        } catch (const std::bad_alloc&) {
            spdlog::warn("[MemoryBalloonConcrete] Allocation failed after {} of {} block(s); keeping {} MB.",
                         i, blocks, bytesLocked() / utils::kMiB);
            return;
        }
    }
}

inline void MemoryBalloonConcrete::releaseLocked(uint64_t bytes) {
    uint64_t blocks = (bytes + blockBytes_ - 1) / blockBytes_;
    if (blocks > blocks_.size()) {
        blocks = blocks_.size();
    }
    blocks_.resize(blocks_.size() - static_cast<size_t>(blocks));
}

} // namespace baseload
