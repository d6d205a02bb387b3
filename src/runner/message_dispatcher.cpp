// All comments are in English.
#include "runner/message_dispatcher.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

#include "common/digest_format.hpp"

namespace shp {

MessageDispatcher::MessageDispatcher(ReplicatedEngine& engine)
  : engine_(engine),
    lane_queues_(engine.lanes()),
    lane_backlog_(engine.lanes(), 0),
    lane_submitted_(engine.lanes(), 0)
{
}

std::size_t MessageDispatcher::PickLane() const {
  std::size_t best = 0;
  for (std::size_t i = 1; i < lane_backlog_.size(); ++i) {
    if (lane_backlog_[i] < lane_backlog_[best]) best = i;
  }
  return best;
}

std::uint64_t MessageDispatcher::Submit(PaddedMessage msg) {
  if (msg.blocks.empty()) {
    throw std::invalid_argument("MessageDispatcher::Submit: message '" + msg.name +
                                "' has no blocks.");
  }
  Job job;
  job.id          = next_id_++;
  job.name        = std::move(msg.name);
  job.lane        = PickLane();
  job.blocks      = std::move(msg.blocks);
  job.submit_tick = engine_.tick();

  lane_backlog_[job.lane]   += job.blocks.size();
  lane_submitted_[job.lane] += job.blocks.size();
  lane_queues_[job.lane].push_back(job.id);

  const std::uint64_t id = job.id;
  jobs_.emplace(id, std::move(job));
  return id;
}

TickInput MessageDispatcher::NextInputForLane(std::size_t lane) {
  for (std::uint64_t id : lane_queues_[lane]) {
    Job& job = jobs_.at(id);
    if (job.in_flight || job.next_block >= job.blocks.size()) continue;

    const MessageBlock& blk = job.blocks[job.next_block];
    const bool is_final = (job.next_block + 1 == job.blocks.size());
    TickInput in = (job.next_block == 0)
                       ? FirstBlockInput(blk, is_final, job.id)
                       : ContinuationInput(blk, job.carry, is_final, job.id);
    job.in_flight = true;
    ++job.next_block;
    --lane_backlog_[lane];
    return in;
  }
  return TickInput{};
}

void MessageDispatcher::HandleOutput(std::size_t lane, const TickOutput& out, std::uint64_t now) {
  if (!out.continuation_valid) return;
  if (!out.message_tag) {
    throw std::logic_error("MessageDispatcher: untagged block retired on lane " +
                           std::to_string(lane));
  }
  auto it = jobs_.find(*out.message_tag);
  if (it == jobs_.end()) {
    throw std::logic_error("MessageDispatcher: retirement for unknown message " +
                           std::to_string(*out.message_tag));
  }
  Job& job = it->second;
  job.in_flight = false;
  job.carry     = out.continuation_digest;
  util::AccumulateQueueLatency(latency_.block, now - out.admit_tick);

  if (!out.hash_valid) return;

  MessageResult r;
  r.id          = job.id;
  r.name        = job.name;
  r.lane        = lane;
  r.blocks      = job.blocks.size();
  r.hash        = out.hash;
  r.submit_tick = job.submit_tick;
  r.done_tick   = now;
  util::AccumulateQueueLatency(latency_.message, now - job.submit_tick);

  if (verbose_) {
    std::cout << "[Dispatcher] message " << r.id << " (" << r.name << ") done on lane "
              << lane << " at tick " << now << ": " << ToHex(r.hash) << "\n";
  }

  auto& q = lane_queues_[lane];
  q.erase(std::remove(q.begin(), q.end(), job.id), q.end());
  jobs_.erase(it);

  result_index_[r.id] = results_.size();
  results_.push_back(std::move(r));
}

std::size_t MessageDispatcher::Step() {
  const std::uint64_t now = engine_.tick();

  std::vector<TickInput> inputs;
  inputs.reserve(engine_.lanes());
  for (std::size_t lane = 0; lane < engine_.lanes(); ++lane) {
    inputs.push_back(NextInputForLane(lane));
  }

  const auto outs = engine_.Step(inputs);

  const std::size_t before = results_.size();
  for (std::size_t lane = 0; lane < outs.size(); ++lane) HandleOutput(lane, outs[lane], now);
  return results_.size() - before;
}

std::uint64_t MessageDispatcher::RunUntilIdle(std::uint64_t max_ticks) {
  std::uint64_t spent = 0;
  while (!idle()) {
    if (spent >= max_ticks) {
      throw std::runtime_error("MessageDispatcher::RunUntilIdle: " + std::to_string(jobs_.size()) +
                               " message(s) unfinished after " + std::to_string(max_ticks) +
                               " ticks.");
    }
    Step();
    ++spent;
  }
  return spent;
}

std::optional<MessageResult> MessageDispatcher::Result(std::uint64_t id) const {
  auto it = result_index_.find(id);
  if (it == result_index_.end()) return std::nullopt;
  return results_[it->second];
}

std::uint64_t MessageDispatcher::lane_blocks_submitted(std::size_t lane) const {
  if (lane >= lane_submitted_.size()) {
    throw std::out_of_range("MessageDispatcher::lane_blocks_submitted: lane id out of range.");
  }
  return lane_submitted_[lane];
}

} // namespace shp
