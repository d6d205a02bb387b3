// All comments are in English.
#pragma once
#include <array>
#include <cstdint>

#include "common/constants.hpp"

namespace shp {

struct StageStats {
  uint64_t ran     = 0;   // ticks the position advanced a valid slot
  uint64_t bubbles = 0;   // ticks the position held an invalid slot
};

struct EngineStats {
  uint64_t ticks         = 0;
  uint64_t idle_ticks    = 0;   // no valid slot anywhere and nothing retired
  uint64_t admitted      = 0;
  uint64_t retired       = 0;   // continuation digests emitted
  uint64_t hashes        = 0;   // final blocks retired
  uint64_t continuations = 0;   // admissions with use_continuation
  uint64_t rejected      = 0;   // admission records refused by validation

  // Per-position counters (0 .. kNumStages-1)
  std::array<StageStats, kNumStages> stages{};

  void Reset() {
    ticks = 0;
    idle_ticks = 0;
    admitted = 0;
    retired = 0;
    hashes = 0;
    continuations = 0;
    rejected = 0;
    stages = {};
  }

  // Share of stage-ticks that carried a valid slot.
  double Utilization() const {
    uint64_t ran = 0, total = 0;
    for (const auto& s : stages) {
      ran   += s.ran;
      total += s.ran + s.bubbles;
    }
    return total == 0 ? 0.0 : static_cast<double>(ran) / static_cast<double>(total);
  }
};

// Helper: accumulate StageStats
inline void AccumulateStage(StageStats& dst, const StageStats& src) {
  dst.ran     += src.ran;
  dst.bubbles += src.bubbles;
}

// Helper: accumulate EngineStats (lane -> engine). Ticks are summed; callers
// that want wall ticks read them from a single lane.
inline void AccumulateEngineStats(EngineStats& dst, const EngineStats& src) {
  dst.ticks         += src.ticks;
  dst.idle_ticks    += src.idle_ticks;
  dst.admitted      += src.admitted;
  dst.retired       += src.retired;
  dst.hashes        += src.hashes;
  dst.continuations += src.continuations;
  dst.rejected      += src.rejected;
  for (std::size_t i = 0; i < kNumStages; ++i) {
    AccumulateStage(dst.stages[i], src.stages[i]);
  }
}

} // namespace shp
