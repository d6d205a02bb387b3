// All comments are in English.
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "common/constants.hpp"
#include "common/sha_types.hpp"

namespace shp {

/**
 * Unpipelined SHA-384 compression (FIPS 180-4, 6.4.2): full 80-word schedule,
 * 80 rounds, word-wise feed-forward. Used as the oracle for the pipeline.
 */
DigestState CompressBlock(const DigestState& digest, const MessageBlock& block);

// Chain all blocks starting from the SHA-384 initial digest.
DigestState CompressMessage(const std::vector<MessageBlock>& blocks);

// CompressMessage() truncated to 384 bits. Throws std::invalid_argument on an empty list.
Hash384 ReferenceHash(const std::vector<MessageBlock>& blocks);

/**
 * IterativeCompressor
 * Cycle model of a non-pipelined compressor: one block at a time, a fixed
 * number of rounds per tick (1, 2, 4 or 8), 80 / rounds_per_tick ticks per
 * block, feed-forward applied on the last round tick.
 *
 *   Idle --Start--> Rounds --(last tick)--> Done --Start--> Rounds ...
 */
class IterativeCompressor {
public:
  enum class State { kIdle, kRounds, kDone };

  explicit IterativeCompressor(std::size_t rounds_per_tick = 1);

  // Load a block; allowed in kIdle or kDone, otherwise std::logic_error.
  void Start(const DigestState& digest, const MessageBlock& block);

  // Advance one tick; returns true if rounds were applied.
  bool Tick();

  // Run Start + ticks to completion; returns the ticks spent.
  std::uint64_t RunBlock(const DigestState& digest, const MessageBlock& block);

  State state() const { return state_; }
  bool  busy() const  { return state_ == State::kRounds; }
  bool  done() const  { return state_ == State::kDone; }

  // Valid in kDone only; std::logic_error otherwise.
  const DigestState& result() const;

  std::size_t   rounds_per_tick() const { return rounds_per_tick_; }
  std::uint64_t ticks_used() const { return ticks_used_; }     // across all blocks
  std::uint64_t ticks_per_block() const { return kTotalRounds / rounds_per_tick_; }

private:
  std::size_t  rounds_per_tick_ = 1;
  State        state_ = State::kIdle;

  DigestState  carry_{};
  WorkingState working_{};
  std::array<Word64, kTotalRounds> schedule_{};
  std::size_t  round_ = 0;

  DigestState   result_{};
  std::uint64_t ticks_used_ = 0;
};

} // namespace shp
