// common/constants.hpp
#pragma once
// All comments are in English.

#include <cstddef>
#include <cstdint>

namespace shp {

// -----------------------------------------------------------------------------
// SHA-384 geometry
// -----------------------------------------------------------------------------
inline constexpr std::size_t kBlockWords  = 16;   // 1024-bit block
inline constexpr std::size_t kDigestWords = 8;    // running digest / working state
inline constexpr std::size_t kHashWords   = 6;    // 384-bit output
inline constexpr std::size_t kTotalRounds = 80;

// -----------------------------------------------------------------------------
// Pipeline
// -----------------------------------------------------------------------------
inline constexpr std::size_t kRoundsPerStage  = 8;
inline constexpr std::size_t kNumStages       = kTotalRounds / kRoundsPerStage;  // 10
inline constexpr std::size_t kScheduleWindow  = kBlockWords;
inline constexpr std::uint64_t kPipelineLatency = kNumStages;  // ticks from admission to retirement

// -----------------------------------------------------------------------------
// Replication / runner defaults
// -----------------------------------------------------------------------------
inline constexpr std::size_t   kDefaultEngines                = 4;
inline constexpr std::size_t   kMaxEngines                    = 1024;
inline constexpr std::uint64_t kDefaultMaxTicks               = 1000000;
inline constexpr std::size_t   kDefaultReferenceRoundsPerTick = 8;

// -----------------------------------------------------------------------------
// Sanity checks
// -----------------------------------------------------------------------------
static_assert(kTotalRounds % kRoundsPerStage == 0, "rounds must split evenly across stages");
static_assert(kNumStages == 10,                     "the pipeline has 10 stages");
static_assert(kHashWords < kDigestWords,           "SHA-384 truncates the SHA-512 state");
static_assert(kRoundsPerStage <= kScheduleWindow / 2,
              "one batch must fit in the non-overlapping half of the window");

} // namespace shp
