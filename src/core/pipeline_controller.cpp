// All comments are in English.
#include "core/pipeline_controller.hpp"

#include <stdexcept>
#include <string>

#include "arch/arith_core.hpp"
#include "arch/message_scheduler.hpp"
#include "arch/round_bank.hpp"
#include "common/digest_format.hpp"
#include "common/sha384_tables.hpp"

namespace shp {

PipelineController::PipelineController(bool enforce_message_ordering)
  : enforce_ordering_(enforce_message_ordering)
{
}

void PipelineController::Validate(const TickInput& in) const {
  if (!in.block) {
    if (in.use_continuation || in.continuation_digest || in.is_final_block || in.message_tag) {
      throw std::invalid_argument(
          "PipelineController::Step: admission flags given without a block.");
    }
    return;
  }
  if (in.use_continuation && !in.continuation_digest) {
    throw std::invalid_argument(
        "PipelineController::Step: use_continuation set but no continuation digest.");
  }
  if (!in.use_continuation && in.continuation_digest) {
    throw std::invalid_argument(
        "PipelineController::Step: continuation digest given without use_continuation.");
  }
  if (enforce_ordering_ && in.message_tag) {
    const std::uint64_t tag = *in.message_tag;
    auto it = inflight_tags_.find(tag);
    std::size_t pending = (it == inflight_tags_.end()) ? 0 : it->second;
    // The block at position 9 leaves before admission happens in this tick.
    const StageSlot& last = slots_[kNumStages - 1];
    if (last.valid && last.message_tag && *last.message_tag == tag && pending > 0) {
      --pending;
    }
    if (pending > 0) {
      throw std::invalid_argument("PipelineController::Step: message " + std::to_string(tag) +
                                  " already has a block in flight.");
    }
  }
}

TickOutput PipelineController::Step(const TickInput& in) {
  try {
    Validate(in);
  } catch (const std::invalid_argument&) {
    CountRejected();
    throw;
  }

  // (1) Retire position 9.
  TickOutput out;
  const StageSlot& last = slots_[kNumStages - 1];
  if (last.valid) {
    out = Retire(last);
    TrackRetirement(last);
    ++stats_.retired;
    if (out.hash_valid) ++stats_.hashes;
  }

  // (2) Advance downstream-first so each position reads last tick's upstream.
  for (std::size_t pos = kNumStages - 1; pos > 0; --pos) {
    slots_[pos] = RunStage(pos, slots_[pos - 1]);
  }

  // (3) Admit into position 0.
  if (in.block) {
    const StageSlot admitted = Admit(in, tick_);
    slots_[0] = RunStage(0, admitted);
    TrackAdmission(slots_[0]);
    ++stats_.admitted;
    if (in.use_continuation) ++stats_.continuations;
  } else {
    slots_[0] = StageSlot{};
  }

  for (std::size_t pos = 0; pos < kNumStages; ++pos) {
    if (slots_[pos].valid) ++stats_.stages[pos].ran;
    else                   ++stats_.stages[pos].bubbles;
  }
  if (!out.continuation_valid && empty()) ++stats_.idle_ticks;
  ++stats_.ticks;
  ++tick_;
  return out;
}

StageSlot PipelineController::Admit(const TickInput& in, std::uint64_t tick) {
  StageSlot s;
  s.valid          = true;
  s.is_final_block = in.is_final_block;
  s.digest_carry   = in.use_continuation ? *in.continuation_digest : kInitialDigest;
  s.working        = WorkingState::FromDigest(s.digest_carry);
  s.window         = *in.block;
  s.message_tag    = in.message_tag;
  s.admit_tick     = tick;
  return s;
}

StageSlot PipelineController::RunStage(std::size_t position, const StageSlot& upstream) {
  if (!upstream.valid) return StageSlot{};

  const std::size_t round_base = position * kRoundsPerStage;
  const ScheduleBatch batch = MessageScheduler::Expand(upstream.window, round_base);

  RoundOperands kw{};
  for (std::size_t r = 0; r < kRoundsPerStage; ++r) {
    kw[r] = arith::Add2(kRoundConstants[round_base + r], batch.words[r]);
  }

  StageSlot next = upstream;   // digest_carry, flags and bookkeeping ride along
  next.working = RoundBank::Apply(upstream.working, kw);
  next.window  = batch.window;
  return next;
}

TickOutput PipelineController::Retire(const StageSlot& slot) {
  TickOutput out;
  const DigestState working = slot.working.ToDigest();
  for (std::size_t k = 0; k < kDigestWords; ++k) {
    out.continuation_digest[k] = arith::Add2(slot.digest_carry[k], working[k]);
  }
  out.continuation_valid = true;
  if (slot.is_final_block) {
    out.hash       = TruncateToHash(out.continuation_digest);
    out.hash_valid = true;
  }
  out.message_tag = slot.message_tag;
  out.admit_tick  = slot.admit_tick;
  return out;
}

void PipelineController::TrackAdmission(const StageSlot& slot) {
  if (slot.message_tag) ++inflight_tags_[*slot.message_tag];
}

void PipelineController::TrackRetirement(const StageSlot& slot) {
  if (!slot.message_tag) return;
  auto it = inflight_tags_.find(*slot.message_tag);
  if (it == inflight_tags_.end()) return;
  if (--it->second == 0) inflight_tags_.erase(it);
}

void PipelineController::Reset() {
  for (auto& s : slots_) s = StageSlot{};
  inflight_tags_.clear();
  tick_ = 0;
  stats_.Reset();
}

const StageSlot& PipelineController::slot(std::size_t position) const {
  if (position >= kNumStages) {
    throw std::out_of_range("PipelineController::slot: position out of range.");
  }
  return slots_[position];
}

std::size_t PipelineController::occupancy() const {
  std::size_t n = 0;
  for (const auto& s : slots_) n += s.valid ? 1 : 0;
  return n;
}

bool PipelineController::InFlight(std::uint64_t tag) const {
  return inflight_tags_.find(tag) != inflight_tags_.end();
}

} // namespace shp
