// ThreadManager.h
#pragma once

#include <thread>
#include <vector>
#include <unordered_map>
#include <string>
#include <mutex>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace baseload {

/**
 * @enum Component
 * @brief Identifies the component type for thread categorization.
 */
enum class Component {
    CpuWorker    // Duty-cycling CPU load workers
};

/**
 * @class ThreadManager
 * @brief Owns groups of named threads and joins them per group or all at once.
 */
class ThreadManager {
public:
    ThreadManager() = default;

    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;

    // ================== ENUM-BASED INTERFACE ==================
    void addThread(Component component, std::thread&& thread) {
        addThread(componentToString(component), std::move(thread));
    }
    bool joinThreadsFor(Component component) {
        return joinThreadsFor(componentToString(component));
    }
    size_t threadCountFor(Component component) const {
        return threadCountFor(componentToString(component));
    }

    // ================== STRING-BASED INTERFACE ==================
    void addThread(const std::string& component, std::thread&& thread) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread.joinable()) {
            throw std::invalid_argument("Thread must be joinable.");
        }
        threadMap_[component].emplace_back(std::move(thread));
    }

    // Threads are moved out before joining so the lock is not held while
    // waiting on them.
    bool joinThreadsFor(const std::string& component) {
        std::vector<std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = threadMap_.find(component);
            if (it == threadMap_.end()) {
                return false;
            }
            threads = std::move(it->second);
            threadMap_.erase(it);
        }
        bool joinedAny = false;
        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
                joinedAny = true;
            }
        }
        spdlog::debug("[ThreadManager] Joined {} thread(s) for '{}'", threads.size(), component);
        return joinedAny;
    }

    size_t threadCountFor(const std::string& component) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = threadMap_.find(component);
        return it == threadMap_.end() ? 0 : it->second.size();
    }

    // ================== COMMON FUNCTIONALITY ==================
    void joinAll() {
        std::unordered_map<std::string, std::vector<std::thread>> all;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            all.swap(threadMap_);
        }
        for (auto& [component, threads] : all) {
            for (auto& t : threads) {
                if (t.joinable()) {
                    t.join();
                }
            }
        }
    }

    size_t getThreadCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& [component, threads] : threadMap_) {
            count += threads.size();
        }
        return count;
    }

    // Owners must cancel their threads before this runs; joinAll() blocks on them.
    ~ThreadManager() {
        joinAll();
    }

    static std::string componentToString(Component c) {
        switch (c) {
        case Component::CpuWorker: return "CpuWorker";
        default:
            spdlog::error("[ThreadManager] Unknown component enum: {}", static_cast<int>(c));
            throw std::invalid_argument("Unknown component");
        }
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::thread>> threadMap_;
};

} // namespace baseload
