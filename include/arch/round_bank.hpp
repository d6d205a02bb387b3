#pragma once
// All comments are in English.

#include <array>

#include "common/constants.hpp"
#include "common/sha_types.hpp"

namespace shp {

// Pre-summed K[t+r] + W[t+r] for the 8 rounds of one stage.
using RoundOperands = std::array<Word64, kRoundsPerStage>;

/**
 * RoundBank
 *
 * Eight sequential SHA-2 rounds inside one tick. Only a and e receive new
 * values each round; b,c,d and f,g,h are promotions of earlier a/e values.
 * The bank therefore tracks two histories of 4 + 8 entries and reads the
 * final state off their last four entries:
 *
 *   a_hist = [d, c, b, a, a1 .. a8]      e_hist = [h, g, f, e, e1 .. e8]
 *   result = {a8, a7, a6, a5, e8, e7, e6, e5}
 */
class RoundBank {
public:
  static WorkingState Apply(const WorkingState& in, const RoundOperands& kw);

  // One round with T1 = h + S1(e) + Ch(e,f,g) + kw and T2 = S0(a) + Maj(a,b,c).
  static WorkingState ApplyOne(const WorkingState& in, Word64 kw);

private:
  static constexpr std::size_t kHistory = 4 + kRoundsPerStage;
};

} // namespace shp
