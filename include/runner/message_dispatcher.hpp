#pragma once
// All comments are in English.

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/sha_types.hpp"
#include "core/replicated_engine.hpp"
#include "utils/latency_stats.hpp"

namespace shp {

// A message already split into padded blocks.
struct PaddedMessage {
  std::string               name;
  std::vector<MessageBlock> blocks;
};

struct MessageResult {
  std::uint64_t id = 0;
  std::string   name;
  std::size_t   lane = 0;
  std::size_t   blocks = 0;
  Hash384       hash{};
  std::uint64_t submit_tick = 0;
  std::uint64_t done_tick   = 0;
};

/**
 * MessageDispatcher
 *
 * Feeds whole messages into a ReplicatedEngine while honouring the chaining
 * protocol: a message never has more than one block in flight, and its next
 * block is admitted with the continuation digest of the previous one.
 * Different messages on the same lane interleave; each tick every lane admits
 * the next block of its oldest ready message.
 *
 * Messages are tagged with their id, so the engine's ordering guard checks the
 * dispatcher as well.
 */
class MessageDispatcher {
public:
  explicit MessageDispatcher(ReplicatedEngine& engine);

  // Queue a message on the least-loaded lane; returns its id.
  // Throws std::invalid_argument for a message without blocks.
  std::uint64_t Submit(PaddedMessage msg);

  // One engine tick; returns the number of messages completed in it.
  std::size_t Step();

  // Step until every submitted message completed. Throws std::runtime_error
  // when more than max_ticks ticks would be needed. Returns ticks spent.
  std::uint64_t RunUntilIdle(std::uint64_t max_ticks);

  bool        idle() const { return jobs_.empty(); }
  std::size_t active_messages() const { return jobs_.size(); }

  // Completed messages in completion order.
  const std::vector<MessageResult>& results() const { return results_; }
  std::optional<MessageResult>      Result(std::uint64_t id) const;

  const util::LatencyStats& latency() const { return latency_; }
  std::uint64_t             lane_blocks_submitted(std::size_t lane) const;

  void SetVerbose(bool v) { verbose_ = v; }

private:
  struct Job {
    std::uint64_t             id = 0;
    std::string               name;
    std::size_t               lane = 0;
    std::vector<MessageBlock> blocks;
    std::size_t               next_block = 0;
    bool                      in_flight = false;
    DigestState               carry{};
    std::uint64_t             submit_tick = 0;
  };

  // Pick the admission for one lane; empty input if nothing is ready.
  TickInput NextInputForLane(std::size_t lane);
  void      HandleOutput(std::size_t lane, const TickOutput& out, std::uint64_t now);
  std::size_t PickLane() const;

private:
  ReplicatedEngine& engine_;

  std::unordered_map<std::uint64_t, Job>   jobs_;
  std::vector<std::deque<std::uint64_t>>   lane_queues_;     // active ids, oldest first
  std::vector<std::uint64_t>               lane_backlog_;    // blocks not yet admitted
  std::vector<std::uint64_t>               lane_submitted_;  // blocks ever submitted

  std::vector<MessageResult>                      results_;
  std::unordered_map<std::uint64_t, std::size_t>  result_index_;

  std::uint64_t      next_id_ = 0;
  util::LatencyStats latency_{};
  bool               verbose_ = false;
};

} // namespace shp
