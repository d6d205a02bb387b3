// All comments are in English.
#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "common/constants.hpp"
#include "common/sha_types.hpp"
#include "runner/test_vectors.hpp"
#include "stats/sim_stats.hpp"
#include "utils/latency_stats.hpp"

namespace shp {

struct SimConfig {
  std::size_t   engines                   = kDefaultEngines;
  bool          enforce_message_ordering  = true;
  std::uint64_t max_ticks                 = kDefaultMaxTicks;
  std::size_t   reference_rounds_per_tick = kDefaultReferenceRoundsPerTick;
  bool          check_reference           = true;
  std::string   stats_dir                 = "stats";
  std::string   run_name                  = "run";
  bool          verbose                   = false;
};

struct VectorOutcome {
  std::string   name;
  std::size_t   lane = 0;
  std::size_t   blocks = 0;
  Hash384       got{};
  Hash384       expected{};
  bool          matches_expected  = false;
  bool          matches_reference = true;   // stays true when the check is off
  std::uint64_t latency_ticks = 0;
};

struct SimReport {
  std::vector<VectorOutcome> outcomes;      // in vector-file order
  std::size_t   passed = 0;
  std::size_t   failed = 0;
  std::uint64_t ticks = 0;                  // engine ticks until idle
  std::uint64_t total_blocks = 0;
  std::uint64_t reference_ticks = 0;        // IterativeCompressor ticks for the same blocks

  std::vector<EngineStats>   lane_stats;
  std::vector<std::uint64_t> lane_blocks;
  util::LatencyStats         latency{};

  bool AllPassed() const { return failed == 0; }
};

SimConfig ParseConfig(const std::string& json_path);
SimConfig ParseConfigText(const std::string& json_text);
SimConfig ParseConfigJson(const nlohmann::json& j);

// Runs every vector through a dispatcher-driven ReplicatedEngine and checks
// the hashes against the expected values (and the reference, if enabled).
SimReport RunVectors(const SimConfig& cfg, const std::vector<TestVector>& vectors);

// Writes <stats_dir>/<run_name>__lanes.csv; returns the path written.
std::string WriteReportCsv(const SimConfig& cfg, const SimReport& report);

void PrintSummary(const SimConfig& cfg, const SimReport& report, std::ostream& os);

} // namespace shp
