// All comments are in English.
#include "core/replicated_engine.hpp"

#include <stdexcept>
#include <string>

namespace shp {

ReplicatedEngine::ReplicatedEngine(std::size_t lanes, bool enforce_message_ordering)
{
  if (lanes == 0) {
    throw std::invalid_argument("ReplicatedEngine: lane count must be > 0.");
  }
  lanes_.reserve(lanes);
  for (std::size_t i = 0; i < lanes; ++i) lanes_.emplace_back(enforce_message_ordering);
}

std::vector<TickOutput> ReplicatedEngine::Step(const std::vector<TickInput>& inputs) {
  if (inputs.size() != lanes_.size()) {
    throw std::invalid_argument("ReplicatedEngine::Step: expected " +
                                std::to_string(lanes_.size()) + " inputs, got " +
                                std::to_string(inputs.size()));
  }
  for (std::size_t i = 0; i < lanes_.size(); ++i) {
    try {
      lanes_[i].Validate(inputs[i]);
    } catch (const std::invalid_argument&) {
      lanes_[i].CountRejected();
      throw;
    }
  }

  std::vector<TickOutput> outs;
  outs.reserve(lanes_.size());
  for (std::size_t i = 0; i < lanes_.size(); ++i) outs.push_back(lanes_[i].Step(inputs[i]));
  return outs;
}

std::vector<TickOutput> ReplicatedEngine::StepIdle() {
  return Step(std::vector<TickInput>(lanes_.size()));
}

void ReplicatedEngine::Reset() {
  for (auto& l : lanes_) l.Reset();
}

bool ReplicatedEngine::empty() const {
  for (const auto& l : lanes_) {
    if (!l.empty()) return false;
  }
  return true;
}

PipelineController& ReplicatedEngine::lane(std::size_t i) {
  if (i >= lanes_.size()) throw std::out_of_range("ReplicatedEngine::lane: lane id out of range.");
  return lanes_[i];
}

const PipelineController& ReplicatedEngine::lane(std::size_t i) const {
  if (i >= lanes_.size()) throw std::out_of_range("ReplicatedEngine::lane: lane id out of range.");
  return lanes_[i];
}

EngineStats ReplicatedEngine::AggregateStats() const {
  EngineStats total;
  for (const auto& l : lanes_) AccumulateEngineStats(total, l.stats());
  return total;
}

} // namespace shp
