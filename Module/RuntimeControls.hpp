// RuntimeControls.hpp
#pragma once
#include <atomic>
#include <cstdint>

namespace baseload {

// Thread-safe knob the CPU workers read on every iteration.
//
// The value is the number of busy iterations a worker runs before sleeping
// once. Many readers, one writer (the control loop), no lock. Never below 1.
class TunableIntensity {
public:
  explicit TunableIntensity(uint64_t initial)
  : value_(initial < 1 ? 1 : initial) {}

  uint64_t load() const { return value_.load(std::memory_order_relaxed); }

  // x * 1.001, truncated. Integer form keeps it exact for any magnitude;
  // always advances by at least one so small values cannot stall.
  uint64_t stepUp() {
    const uint64_t cur  = load();
    const uint64_t grow = cur / 1000;
    const uint64_t next = cur + (grow > 0 ? grow : 1);
    value_.store(next, std::memory_order_relaxed);
    return next;
  }

  // x * 0.999, truncated, floor 1.
  uint64_t stepDown() {
    const uint64_t cur    = load();
    const uint64_t shrink = (cur + 999) / 1000;
    const uint64_t next   = (cur > shrink + 1) ? cur - shrink : 1;
    value_.store(next, std::memory_order_relaxed);
    return next;
  }

private:
  std::atomic<uint64_t> value_;
};

} // namespace baseload
