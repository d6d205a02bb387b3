#pragma once
#include <cstdint>
#include <optional>

#include "common/sha_types.hpp"

/* All comments are in English.
 * One pipeline position. A slot is created invalid at reset, filled at
 * admission into position 0, carried through positions 1..9 one tick at a
 * time, and consumed at retirement.
 */

namespace shp {

struct StageSlot {
    bool           valid          = false;
    bool           is_final_block = false;
    DigestState    digest_carry{};   // set at admission, read at retirement only
    WorkingState   working{};        // a..h after the rounds done so far
    ScheduleWindow window{};         // last 16 schedule words

    // Bookkeeping for routing and latency; never touched by the arithmetic.
    std::optional<std::uint64_t> message_tag;
    std::uint64_t                admit_tick = 0;
};

} // namespace shp
