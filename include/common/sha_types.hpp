#pragma once
#include <array>
#include <cstdint>

#include "common/constants.hpp"

/* All comments are in English.
 * Word-level value types shared by the scheduler, the round bank and the pipeline.
 */

namespace shp {

using Word64 = std::uint64_t;

using MessageBlock   = std::array<Word64, kBlockWords>;      // pre-padded by the caller
using DigestState    = std::array<Word64, kDigestWords>;     // running per-message hash
using Hash384        = std::array<Word64, kHashWords>;       // first 6 digest words
using ScheduleWindow = std::array<Word64, kScheduleWindow>;  // last 16 schedule words

// Working variables a..h of one in-flight block.
struct WorkingState {
    Word64 a = 0, b = 0, c = 0, d = 0;
    Word64 e = 0, f = 0, g = 0, h = 0;

    static WorkingState FromDigest(const DigestState& s) {
        return WorkingState{s[0], s[1], s[2], s[3], s[4], s[5], s[6], s[7]};
    }
    DigestState ToDigest() const { return DigestState{a, b, c, d, e, f, g, h}; }

    bool operator==(const WorkingState& o) const {
        return a == o.a && b == o.b && c == o.c && d == o.d &&
               e == o.e && f == o.f && g == o.g && h == o.h;
    }
    bool operator!=(const WorkingState& o) const { return !(*this == o); }
};

} // namespace shp
