#pragma once
// All comments are in English.

#include <array>
#include <cstddef>

#include "common/constants.hpp"
#include "common/sha_types.hpp"

namespace shp {

// Eight schedule words W[t..t+7] plus the window after they were written back.
struct ScheduleBatch {
  std::array<Word64, kRoundsPerStage> words{};
  ScheduleWindow                      window{};
};

/**
 * MessageScheduler
 *
 * Expands one batch of 8 schedule words per tick from the 16-word circular
 * window. For round base t < 16 the batch is the raw block words t..t+7; for
 * t >= 16 it is the FIPS 180-4 recurrence
 *
 *   W[t] = s1(W[t-2]) + W[t-7] + s0(W[t-15]) + W[t-16]     (indices mod 16)
 *
 * evaluated in the order w0,w1 (window only), w2<-w0, w3<-w1, w4<-w2,
 * w5<-w3, w6<-w4, w7<-w5,w0. W[t-15] and W[t-16] of every word in the batch
 * are still in the window when read; the new words overwrite slots
 * (t mod 16)..(t+7 mod 16) only after the batch is complete.
 */
class MessageScheduler {
public:
  // t must be a multiple of 8 in [0, 72]; throws std::out_of_range otherwise.
  static ScheduleBatch Expand(const ScheduleWindow& window, std::size_t round_base);

  static bool IsValidRoundBase(std::size_t round_base) {
    return round_base % kRoundsPerStage == 0 &&
           round_base + kRoundsPerStage <= kTotalRounds;
  }
};

} // namespace shp
