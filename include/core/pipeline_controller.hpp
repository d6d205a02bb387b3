#pragma once
// All comments are in English.
#include <array>
#include <cstdint>
#include <unordered_map>

#include "common/constants.hpp"
#include "common/sha_types.hpp"
#include "arch/stage_slot.hpp"
#include "core/tick_io.hpp"
#include "stats/sim_stats.hpp"

namespace shp {

/**
 * PipelineController
 *
 * Ten stage slots, one per group of 8 rounds. Each Step() is one tick:
 *   1. retire the slot resident at position 9 (feed-forward, continuation
 *      digest, optional 384-bit hash);
 *   2. advance positions 9..1, each from its upstream slot of the previous tick;
 *   3. admit the new block (or a bubble) into position 0.
 * A block admitted in tick n is reported by tick n + kPipelineLatency.
 *
 * There is no backpressure and no stalling. Step() validates the admission
 * record before touching any state and throws std::invalid_argument when it
 * is inconsistent; a rejected tick does not advance.
 */
class PipelineController {
public:
  explicit PipelineController(bool enforce_message_ordering = true);

  // One tick with an optional admission.
  TickOutput Step(const TickInput& in);

  // One tick without admission.
  TickOutput Step() { return Step(TickInput{}); }

  // Throws std::invalid_argument if `in` would be rejected by Step().
  void Validate(const TickInput& in) const;

  // Counts an admission record refused before reaching Step() (lock-step callers).
  void CountRejected() { ++stats_.rejected; }

  // All slots invalid, tick counter and statistics cleared.
  void Reset();

  // ---- Introspection ----
  const StageSlot& slot(std::size_t position) const;
  std::size_t      occupancy() const;
  bool             empty() const { return occupancy() == 0; }
  std::uint64_t    tick() const { return tick_; }
  bool             InFlight(std::uint64_t tag) const;
  const EngineStats& stats() const { return stats_; }

  void SetEnforceMessageOrdering(bool v) { enforce_ordering_ = v; }
  bool enforce_message_ordering() const { return enforce_ordering_; }

private:
  static StageSlot  Admit(const TickInput& in, std::uint64_t tick);
  static StageSlot  RunStage(std::size_t position, const StageSlot& upstream);
  static TickOutput Retire(const StageSlot& slot);

  void TrackAdmission(const StageSlot& slot);
  void TrackRetirement(const StageSlot& slot);

private:
  std::array<StageSlot, kNumStages> slots_{};
  std::uint64_t tick_ = 0;
  bool enforce_ordering_ = true;

  // message tag -> number of its blocks currently in flight
  std::unordered_map<std::uint64_t, std::size_t> inflight_tags_;

  EngineStats stats_{};
};

} // namespace shp
