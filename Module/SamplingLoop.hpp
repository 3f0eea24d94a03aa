// SamplingLoop.hpp
#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>
#include <malloc.h>    // malloc_trim (glibc)

#include "spdlog/spdlog.h"

#include "../Stage_01/Interfaces/IStatsProvider.h"
#include "../Stage_01/Interfaces/IEventSink.h"
#include "../Stage_01/Interfaces/IRandomSource.h"
#include "../Stage_01/Concretes/CpuLoadConcrete.h"
#include "../Stage_01/Concretes/MemoryBalloonConcrete.h"
#include "../Stage_01/Concretes/AdaptiveControllerConcrete.h"
#include "../Stage_01/SharedStructures/UsagePlan.h"
#include "../Stage_01/Others/TargetCalculator.h"

namespace baseload {

// ====== Sampling loop ========================================================
// Three periodic timers (sample, compaction, drift) multiplexed on the calling
// thread. A fire is handled to completion before the next one is looked at,
// so controller passes are strictly serialized.
class SamplingLoop {
public:
  using Clock     = std::chrono::steady_clock;
  using WallClock = std::function<std::chrono::system_clock::time_point()>;

  struct Intervals {
    std::chrono::milliseconds sample;
    std::chrono::milliseconds compaction;
    std::chrono::milliseconds drift;

    Intervals()
    : sample(3000),
      compaction(60 * 1000),
      drift(5 * 60 * 1000) {}
  };

  // Upper bound on one sleep so a shutdown request is noticed quickly.
  static constexpr std::chrono::milliseconds kMaxSleepSlice{50};

  SamplingLoop(IStatsProvider& stats,
               CpuLoadConcrete& cpu,
               MemoryBalloonConcrete& memory,
               AdaptiveControllerConcrete& controller,
               UsagePlan& plan,
               IRandomSource& rng,
               IEventSink& sink,
               const Intervals& intervals = Intervals(),
               WallClock wallClock = [] { return std::chrono::system_clock::now(); })
  : stats_(stats), cpu_(cpu), memory_(memory), controller_(controller),
    plan_(plan), rng_(rng), sink_(sink), intervals_(intervals),
    wallClock_(std::move(wallClock)) {}

  // Initial snapshot. Hands total memory to the balloon and emits the startup summary.
  bool prime() {
    StartupSummary s;
    s.originCeiling = plan_.originCeiling();
    s.ceiling       = plan_.currentCeiling();
    s.hardCeiling   = kHardPeakLimit;
    s.cpuWorkers    = cpu_.plannedWorkers();

    try {
      last_ = stats_.getStats();
      memory_.setTotalMemory(last_.totalMemoryBytes);
      s.totalMemoryBytes = last_.totalMemoryBytes;
      s.statsAvailable   = true;
    } catch (const StatsUnavailableError& e) {
      spdlog::warn("[SamplingLoop] Initial stats read failed, memory steps disabled until total is known: {}",
                   e.what());
      last_ = SystemStats();
    }
    sink_.onStartup(s);
    return s.statsAvailable;
  }

  // One metrics + adjustment pass: memory first, then CPU.
  void sampleTick() {
    try {
      last_ = stats_.getStats();
      if (memory_.totalMemory() == 0 && last_.totalMemoryBytes > 0) {
        memory_.setTotalMemory(last_.totalMemoryBytes);
      }
    } catch (const StatsUnavailableError& e) {
      sink_.onStatsFallback(e.what());
    }

    const int    ceiling = plan_.currentCeiling();
    const bool   night   = isNightWindow(wallClock_());
    const double target  = computeTarget(ceiling, night, controller_.hardCeiling());

    TickSummary t;
    t.stats         = last_;
    t.targetPercent = target;
    t.nightWindow   = night;
    t.balloonBytes  = memory_.currentBytes();
    t.intensity     = cpu_.currentIntensity();
    sink_.onTick(t);

    sink_.onAdjustment(controller_.runPass(Resource::Memory, last_.memoryPercent, target, memory_));
    sink_.onAdjustment(controller_.runPass(Resource::Cpu, last_.cpuPercent, target, cpu_));
  }

  // Hand freed heap pages (released balloon blocks) back to the OS.
  void compactionTick() {
    CompactionEvent e;
    e.timestamp      = std::chrono::system_clock::now();
    e.memoryReturned = (::malloc_trim(0) == 1);
    e.balloonBytes   = memory_.currentBytes();
    sink_.onCompaction(e);
  }

  void driftTick() {
    sink_.onDrift(plan_.drift(rng_));
  }

  // Blocks until shutdown is set or runSeconds elapse (runSeconds <= 0: no limit).
  bool run(const std::atomic<bool>& shutdown, double runSeconds) {
    const auto start = Clock::now();
    auto nextSample  = start + intervals_.sample;
    auto nextCompact = start + intervals_.compaction;
    auto nextDrift   = start + intervals_.drift;

    spdlog::info("[SamplingLoop] Running: sample={}ms compaction={}ms drift={}ms limit={}s",
                 intervals_.sample.count(), intervals_.compaction.count(),
                 intervals_.drift.count(), runSeconds);

    while (!shutdown.load()) {
      auto now = Clock::now();
      if (runSeconds > 0.0 &&
          std::chrono::duration<double>(now - start).count() > runSeconds) {
        spdlog::info("[SamplingLoop] Runtime limit reached ({} s).", runSeconds);
        break;
      }

      // Earliest due timer first; the others wait for the next iteration.
      auto* due = &nextSample;
      if (nextCompact < *due) due = &nextCompact;
      if (nextDrift < *due)   due = &nextDrift;

      if (*due <= now) {
        if (due == &nextSample) {
          sampleTick();
          reschedule(nextSample, intervals_.sample);
        } else if (due == &nextCompact) {
          compactionTick();
          reschedule(nextCompact, intervals_.compaction);
        } else {
          driftTick();
          reschedule(nextDrift, intervals_.drift);
        }
        ++ticks_;
        continue;
      }

      auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(*due - now);
      std::this_thread::sleep_for(std::min(wait + std::chrono::milliseconds(1), kMaxSleepSlice));
    }
    return true;
  }

  const SystemStats& lastStats() const { return last_; }
  uint64_t ticksHandled() const { return ticks_; }

private:
  // Ticker semantics: missed fires are dropped, not queued.
  static void reschedule(Clock::time_point& deadline, std::chrono::milliseconds interval) {
    const auto now = Clock::now();
    deadline += interval;
    while (deadline <= now) deadline += interval;
  }

  IStatsProvider&             stats_;
  CpuLoadConcrete&            cpu_;
  MemoryBalloonConcrete&      memory_;
  AdaptiveControllerConcrete& controller_;
  UsagePlan&                  plan_;
  IRandomSource&              rng_;
  IEventSink&                 sink_;
  Intervals                   intervals_;
  WallClock                   wallClock_;

  SystemStats last_;
  uint64_t    ticks_ = 0;
};

} // namespace baseload
