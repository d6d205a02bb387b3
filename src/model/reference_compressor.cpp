// All comments are in English.
#include "model/reference_compressor.hpp"

#include <stdexcept>
#include <string>

#include "arch/arith_core.hpp"
#include "arch/round_bank.hpp"
#include "common/digest_format.hpp"
#include "common/sha384_tables.hpp"

namespace shp {

namespace {

std::array<Word64, kTotalRounds> ExpandSchedule(const MessageBlock& block) {
  std::array<Word64, kTotalRounds> w{};
  for (std::size_t t = 0; t < kBlockWords; ++t) w[t] = block[t];
  for (std::size_t t = kBlockWords; t < kTotalRounds; ++t) {
    w[t] = arith::Add4(arith::SmallSigma1(w[t - 2]), w[t - 7],
                       arith::SmallSigma0(w[t - 15]), w[t - 16]);
  }
  return w;
}

} // namespace

DigestState CompressBlock(const DigestState& digest, const MessageBlock& block) {
  const auto w = ExpandSchedule(block);

  Word64 a = digest[0], b = digest[1], c = digest[2], d = digest[3];
  Word64 e = digest[4], f = digest[5], g = digest[6], h = digest[7];

  for (std::size_t t = 0; t < kTotalRounds; ++t) {
    const Word64 t1 = arith::Add5(h, arith::BigSigma1(e), arith::Ch(e, f, g),
                                  kRoundConstants[t], w[t]);
    const Word64 t2 = arith::Add2(arith::BigSigma0(a), arith::Maj(a, b, c));
    h = g;
    g = f;
    f = e;
    e = arith::Add2(d, t1);
    d = c;
    c = b;
    b = a;
    a = arith::Add2(t1, t2);
  }

  DigestState out = digest;
  out[0] += a; out[1] += b; out[2] += c; out[3] += d;
  out[4] += e; out[5] += f; out[6] += g; out[7] += h;
  return out;
}

DigestState CompressMessage(const std::vector<MessageBlock>& blocks) {
  DigestState digest = kInitialDigest;
  for (const auto& blk : blocks) digest = CompressBlock(digest, blk);
  return digest;
}

Hash384 ReferenceHash(const std::vector<MessageBlock>& blocks) {
  if (blocks.empty()) {
    throw std::invalid_argument("ReferenceHash: a padded message has at least one block.");
  }
  return TruncateToHash(CompressMessage(blocks));
}

// ==================== IterativeCompressor ====================

IterativeCompressor::IterativeCompressor(std::size_t rounds_per_tick)
  : rounds_per_tick_(rounds_per_tick)
{
  if (rounds_per_tick != 1 && rounds_per_tick != 2 &&
      rounds_per_tick != 4 && rounds_per_tick != 8) {
    throw std::invalid_argument("IterativeCompressor: rounds_per_tick must be 1, 2, 4 or 8, got " +
                                std::to_string(rounds_per_tick));
  }
}

void IterativeCompressor::Start(const DigestState& digest, const MessageBlock& block) {
  if (state_ == State::kRounds) {
    throw std::logic_error("IterativeCompressor::Start: previous block still in progress.");
  }
  carry_    = digest;
  working_  = WorkingState::FromDigest(digest);
  schedule_ = ExpandSchedule(block);
  round_    = 0;
  state_    = State::kRounds;
}

bool IterativeCompressor::Tick() {
  if (state_ != State::kRounds) return false;

  for (std::size_t i = 0; i < rounds_per_tick_; ++i, ++round_) {
    const Word64 kw = arith::Add2(kRoundConstants[round_], schedule_[round_]);
    working_ = RoundBank::ApplyOne(working_, kw);
  }
  ++ticks_used_;

  if (round_ == kTotalRounds) {
    const DigestState w = working_.ToDigest();
    for (std::size_t k = 0; k < kDigestWords; ++k) result_[k] = arith::Add2(carry_[k], w[k]);
    state_ = State::kDone;
  }
  return true;
}

std::uint64_t IterativeCompressor::RunBlock(const DigestState& digest, const MessageBlock& block) {
  const std::uint64_t before = ticks_used_;
  Start(digest, block);
  while (busy()) Tick();
  return ticks_used_ - before;
}

const DigestState& IterativeCompressor::result() const {
  if (state_ != State::kDone) {
    throw std::logic_error("IterativeCompressor::result: no finished block.");
  }
  return result_;
}

} // namespace shp
