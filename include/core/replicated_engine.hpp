#pragma once
// All comments are in English.
#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/pipeline_controller.hpp"
#include "core/tick_io.hpp"
#include "stats/sim_stats.hpp"

namespace shp {

/**
 * ReplicatedEngine
 *
 * N independent pipelines ("lanes") stepped in lock-step. Lanes share no
 * state; lane i only ever sees inputs[i]. All inputs of a tick are validated
 * before any lane advances, so a rejected tick leaves every lane untouched.
 */
class ReplicatedEngine {
public:
  explicit ReplicatedEngine(std::size_t lanes, bool enforce_message_ordering = true);

  // inputs.size() must equal lanes(); returns one output per lane.
  std::vector<TickOutput> Step(const std::vector<TickInput>& inputs);

  // One tick with no admission on any lane.
  std::vector<TickOutput> StepIdle();

  void Reset();

  std::size_t lanes() const { return lanes_.size(); }
  std::uint64_t tick() const { return lanes_.front().tick(); }
  bool empty() const;

  PipelineController&       lane(std::size_t i);
  const PipelineController& lane(std::size_t i) const;

  // Sum over lanes (ticks summed too; see AccumulateEngineStats).
  EngineStats AggregateStats() const;

private:
  std::vector<PipelineController> lanes_;
};

} // namespace shp
