#pragma once
// All comments are in English.

#include <cstdint>
#include <optional>

#include "common/sha_types.hpp"

namespace shp {

// Per-tick admission record of one pipeline.
// An empty `block` means no admission this tick (a bubble enters position 0).
struct TickInput {
  std::optional<MessageBlock>  block;
  bool                         use_continuation = false;
  std::optional<DigestState>   continuation_digest;
  bool                         is_final_block = false;
  std::optional<std::uint64_t> message_tag;   // optional: ordering guard + routing
};

// Per-tick output record of one pipeline.
struct TickOutput {
  bool        continuation_valid = false;
  DigestState continuation_digest{};
  bool        hash_valid = false;
  Hash384     hash{};

  // Echo of the retiring block's bookkeeping (meaningful when continuation_valid).
  std::optional<std::uint64_t> message_tag;
  std::uint64_t                admit_tick = 0;
};

// Convenience builders for the common admission shapes.
inline TickInput FirstBlockInput(const MessageBlock& block, bool is_final,
                                 std::optional<std::uint64_t> tag = std::nullopt) {
  TickInput in;
  in.block          = block;
  in.is_final_block = is_final;
  in.message_tag    = tag;
  return in;
}

inline TickInput ContinuationInput(const MessageBlock& block, const DigestState& carry,
                                   bool is_final,
                                   std::optional<std::uint64_t> tag = std::nullopt) {
  TickInput in;
  in.block               = block;
  in.use_continuation    = true;
  in.continuation_digest = carry;
  in.is_final_block      = is_final;
  in.message_tag         = tag;
  return in;
}

} // namespace shp
