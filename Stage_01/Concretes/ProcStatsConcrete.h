// ProcStatsConcrete.h
#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

#include "../Interfaces/IStatsProvider.h"
#include "../SharedStructures/SystemStats.h"

namespace baseload {

/**
 * @class ProcStatsConcrete
 * @brief Stats provider reading Linux /proc/meminfo and the aggregate line of /proc/stat.
 *
 * CPU utilization is a delta between consecutive calls: the first call only
 * records a baseline and reports 0 %. Paths are injectable so the parser can
 * be fed fixture files.
 */
class ProcStatsConcrete : public IStatsProvider {
public:
    // user nice system idle iowait irq softirq steal
    static constexpr size_t kCpuFields = 8;

    explicit ProcStatsConcrete(std::string statPath = "/proc/stat",
                               std::string meminfoPath = "/proc/meminfo")
        : statPath_(std::move(statPath)), meminfoPath_(std::move(meminfoPath)) {}

    // ----------------- IStatsProvider Interface -----------------
    SystemStats getStats() override;
    std::string getSpecs() const override {
        return "procfs: " + statPath_ + ", " + meminfoPath_;
    }

private:
    struct CpuTimes {
        std::array<uint64_t, kCpuFields> fields{};
        uint64_t total() const {
            uint64_t t = 0;
            for (auto v : fields) t += v;
            return t;
        }
        uint64_t idle() const { return fields[3] + fields[4]; }   // idle + iowait
    };

    void readMemory(SystemStats& stats) const;
    double readCpuPercent();
    CpuTimes readCpuTimes() const;

    std::string statPath_;
    std::string meminfoPath_;

    std::mutex cpuMutex_;      // guards the baseline between calls
    bool hasBaseline_ = false;
    CpuTimes lastCpu_;
};

// ---------------- Implementation ---------------- //

inline SystemStats ProcStatsConcrete::getStats() {
    SystemStats stats;
    stats.timestamp = std::chrono::system_clock::now();
    readMemory(stats);
    stats.cpuPercent = readCpuPercent();
    return stats;
}

inline void ProcStatsConcrete::readMemory(SystemStats& stats) const {
    std::ifstream file(meminfoPath_);
    if (!file.is_open()) {
        throw StatsUnavailableError("cannot open " + meminfoPath_);
    }

    uint64_t memTotal = 0, memAvailable = 0, memFree = 0;
    bool haveAvailable = false;

    std::string line;
    while (std::getline(file, line)) {
        std::istringstream ss(line);
        std::string key;
        uint64_t value = 0;
        if (!(ss >> key >> value)) {
            continue;
        }
        value *= 1024;   // meminfo reports kB
        if (key == "MemTotal:") {
            memTotal = value;
        } else if (key == "MemAvailable:") {
            memAvailable = value;
            haveAvailable = true;
        } else if (key == "MemFree:") {
            memFree = value;
        }
    }

    if (memTotal == 0) {
        throw StatsUnavailableError("MemTotal missing from " + meminfoPath_);
    }
    if (!haveAvailable) {
        spdlog::debug("[ProcStatsConcrete] MemAvailable missing, using MemFree.");
        memAvailable = memFree;
    }
    if (memAvailable > memTotal) {
        memAvailable = memTotal;
    }

    stats.totalMemoryBytes = memTotal;
    stats.usedMemoryBytes  = memTotal - memAvailable;
    stats.memoryPercent    = static_cast<double>(stats.usedMemoryBytes) / static_cast<double>(memTotal) * 100.0;
}

inline ProcStatsConcrete::CpuTimes ProcStatsConcrete::readCpuTimes() const {
    std::ifstream file(statPath_);
    if (!file.is_open()) {
        throw StatsUnavailableError("cannot open " + statPath_);
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw StatsUnavailableError("cannot read " + statPath_);
    }

    std::istringstream ss(line);
    std::string label;
    ss >> label;
    if (label != "cpu") {
        throw StatsUnavailableError("unexpected first line in " + statPath_ + ": " + line);
    }

    CpuTimes t;
    size_t parsed = 0;
    for (; parsed < kCpuFields && (ss >> t.fields[parsed]); ++parsed) {}
    // Kernels older than 2.6.11 stop after irq/softirq; fewer than idle+iowait is malformed.
    if (parsed < 5) {
        throw StatsUnavailableError("invalid cpu line in " + statPath_ + ": " + line);
    }
    return t;
}

inline double ProcStatsConcrete::readCpuPercent() {
    const CpuTimes now = readCpuTimes();

    std::lock_guard<std::mutex> lock(cpuMutex_);
    if (!hasBaseline_) {
        lastCpu_ = now;
        hasBaseline_ = true;
        return 0.0;
    }

    const uint64_t total     = now.total();
    const uint64_t lastTotal = lastCpu_.total();
    const uint64_t idle      = now.idle();
    const uint64_t lastIdle  = lastCpu_.idle();
    lastCpu_ = now;

    if (total <= lastTotal) {
        return 0.0;
    }
    const uint64_t totalDelta = total - lastTotal;
    const uint64_t idleDelta  = idle > lastIdle ? idle - lastIdle : 0;
    if (idleDelta >= totalDelta) {
        return 0.0;
    }
    return static_cast<double>(totalDelta - idleDelta) / static_cast<double>(totalDelta) * 100.0;
}

} // namespace baseload
