// All comments are in English.
#include "runner/simulation.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <stdexcept>

#include "common/digest_format.hpp"
#include "common/sha384_tables.hpp"
#include "core/replicated_engine.hpp"
#include "model/reference_compressor.hpp"
#include "runner/message_dispatcher.hpp"
#include "stats/lane_summary_csv.hpp"

using nlohmann::json;

namespace shp {

namespace {

std::string SanitizeName(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  for (char ch : input) {
    const unsigned char uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) || ch == '_' || ch == '-') {
      out.push_back(ch);
    } else {
      out.push_back('_');
    }
  }
  if (out.empty()) {
    out = "unnamed";
  }
  return out;
}

std::int64_t PositiveInt(const json& j, const char* key, std::int64_t fallback) {
  if (!j.contains(key)) return fallback;
  const auto& v = j.at(key);
  if (!v.is_number_integer()) {
    throw std::invalid_argument(std::string("ParseConfig: '") + key + "' must be an integer");
  }
  const std::int64_t n = v.get<std::int64_t>();
  if (n <= 0) {
    throw std::invalid_argument(std::string("ParseConfig: '") + key + "' must be positive");
  }
  return n;
}

bool BoolOr(const json& j, const char* key, bool fallback) {
  if (!j.contains(key)) return fallback;
  const auto& v = j.at(key);
  if (!v.is_boolean()) {
    throw std::invalid_argument(std::string("ParseConfig: '") + key + "' must be a boolean");
  }
  return v.get<bool>();
}

std::string StringOr(const json& j, const char* key, const std::string& fallback) {
  if (!j.contains(key)) return fallback;
  const auto& v = j.at(key);
  if (!v.is_string()) {
    throw std::invalid_argument(std::string("ParseConfig: '") + key + "' must be a string");
  }
  return v.get<std::string>();
}

// Runs the vector's blocks through the non-pipelined FSM; returns its hash.
Hash384 ReferenceFsmHash(IterativeCompressor& fsm, const TestVector& tv, std::uint64_t& ticks) {
  DigestState digest = kInitialDigest;
  for (const auto& blk : tv.blocks) {
    ticks += fsm.RunBlock(digest, blk);
    digest = fsm.result();
  }
  return TruncateToHash(digest);
}

} // namespace

SimConfig ParseConfigJson(const json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("ParseConfig: top-level JSON value must be an object");
  }

  static const char* kKnownKeys[] = {
      "engines", "enforce_message_ordering", "max_ticks", "reference_rounds_per_tick",
      "check_reference", "stats_dir", "run_name", "verbose"};
  for (auto it = j.begin(); it != j.end(); ++it) {
    bool known = false;
    for (const char* k : kKnownKeys) known = known || (it.key() == k);
    if (!known) {
      std::cerr << "[ParseConfig][Warn] unknown key '" << it.key() << "' ignored.\n";
    }
  }

  SimConfig c;
  c.engines   = static_cast<std::size_t>(PositiveInt(j, "engines", static_cast<std::int64_t>(kDefaultEngines)));
  c.max_ticks = static_cast<std::uint64_t>(PositiveInt(j, "max_ticks", static_cast<std::int64_t>(kDefaultMaxTicks)));
  c.reference_rounds_per_tick = static_cast<std::size_t>(
      PositiveInt(j, "reference_rounds_per_tick", static_cast<std::int64_t>(kDefaultReferenceRoundsPerTick)));

  c.enforce_message_ordering = BoolOr(j, "enforce_message_ordering", true);
  c.check_reference          = BoolOr(j, "check_reference", true);
  c.verbose                  = BoolOr(j, "verbose", false);
  c.stats_dir                = StringOr(j, "stats_dir", "stats");
  c.run_name                 = StringOr(j, "run_name", "run");

  if (c.engines > kMaxEngines) {
    throw std::invalid_argument("ParseConfig: 'engines' must be at most " +
                                std::to_string(kMaxEngines));
  }

  const std::size_t rpt = c.reference_rounds_per_tick;
  if (rpt != 1 && rpt != 2 && rpt != 4 && rpt != 8) {
    throw std::invalid_argument("ParseConfig: reference_rounds_per_tick must be 1, 2, 4 or 8");
  }
  if (c.stats_dir.empty()) {
    throw std::invalid_argument("ParseConfig: stats_dir must not be empty");
  }
  return c;
}

SimConfig ParseConfigText(const std::string& json_text) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error& ex) {
    throw std::runtime_error(std::string("ParseConfig: invalid JSON: ") + ex.what());
  }
  return ParseConfigJson(j);
}

SimConfig ParseConfig(const std::string& json_path) {
  std::ifstream ifs(json_path);
  if (!ifs) throw std::runtime_error("ParseConfig: cannot open json file: " + json_path);
  std::string jtxt((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return ParseConfigText(jtxt);
}

SimReport RunVectors(const SimConfig& cfg, const std::vector<TestVector>& vectors) {
  ReplicatedEngine engine(cfg.engines, cfg.enforce_message_ordering);
  MessageDispatcher dispatcher(engine);
  dispatcher.SetVerbose(cfg.verbose);

  std::vector<std::uint64_t> ids;
  ids.reserve(vectors.size());
  SimReport report;
  for (const auto& tv : vectors) {
    ids.push_back(dispatcher.Submit(PaddedMessage{tv.name, tv.blocks}));
    report.total_blocks += tv.blocks.size();
  }
  std::cout << "[Simulation] Submitted " << vectors.size() << " message(s), "
            << report.total_blocks << " block(s) on " << cfg.engines << " lane(s).\n";

  report.ticks = dispatcher.RunUntilIdle(cfg.max_ticks);

  IterativeCompressor fsm(cfg.reference_rounds_per_tick);
  for (std::size_t i = 0; i < vectors.size(); ++i) {
    const TestVector& tv = vectors[i];
    const auto res = dispatcher.Result(ids[i]);
    if (!res) {
      throw std::runtime_error("RunVectors: no result for " + tv.name);
    }

    VectorOutcome o;
    o.name             = tv.name;
    o.lane             = res->lane;
    o.blocks           = tv.blocks.size();
    o.got              = res->hash;
    o.expected         = tv.expected;
    o.matches_expected = (res->hash == tv.expected);
    o.latency_ticks    = res->done_tick - res->submit_tick;
    if (cfg.check_reference) {
      o.matches_reference = (ReferenceFsmHash(fsm, tv, report.reference_ticks) == res->hash);
    }

    if (o.matches_expected && o.matches_reference) {
      ++report.passed;
    } else {
      ++report.failed;
      std::cerr << "[Simulation] MISMATCH " << tv.name << "\n"
                << "  expected:  " << ToHex(tv.expected) << "\n"
                << "  pipeline:  " << ToHex(res->hash) << "\n";
      if (!o.matches_reference) {
        std::cerr << "  reference disagrees with pipeline\n";
      }
    }
    report.outcomes.push_back(std::move(o));
  }

  for (std::size_t lane = 0; lane < engine.lanes(); ++lane) {
    report.lane_stats.push_back(engine.lane(lane).stats());
    report.lane_blocks.push_back(dispatcher.lane_blocks_submitted(lane));
  }
  report.latency = dispatcher.latency();
  return report;
}

std::string WriteReportCsv(const SimConfig& cfg, const SimReport& report) {
  const std::filesystem::path dir(cfg.stats_dir);
  std::filesystem::create_directories(dir);
  const auto csv_path = dir / (SanitizeName(cfg.run_name) + "__lanes.csv");

  LaneSummaryCsvLogger logger(csv_path.string(), /*append=*/false);
  for (std::size_t lane = 0; lane < report.lane_stats.size(); ++lane) {
    logger.AppendRow(cfg.run_name, lane, report.lane_stats[lane], report.lane_blocks[lane]);
  }
  std::cout << "[Simulation] Lane stats CSV written to " << csv_path << "\n";
  return csv_path.string();
}

void PrintSummary(const SimConfig& cfg, const SimReport& report, std::ostream& os) {
  const auto old_flags = os.flags();
  const auto old_precision = os.precision();

  os << "[Simulation] " << report.passed << "/" << report.outcomes.size() << " vector(s) passed\n";
  os << "[Simulation] engine ticks: " << report.ticks
     << ", blocks: " << report.total_blocks
     << ", lanes: " << cfg.engines << "\n";
  if (report.ticks > 0) {
    os << std::fixed << std::setprecision(3)
       << "[Simulation] blocks per tick: "
       << static_cast<double>(report.total_blocks) / static_cast<double>(report.ticks) << "\n";
  }
  if (cfg.check_reference) {
    os << "[Simulation] reference FSM (" << cfg.reference_rounds_per_tick
       << " rounds/tick) ticks: " << report.reference_ticks << "\n";
  }
  os << std::fixed << std::setprecision(2)
     << "[Simulation] message latency mean/min/max: " << report.latency.message.Mean() << "/"
     << report.latency.message.min << "/" << report.latency.message.max << " ticks\n";

  os.flags(old_flags);
  os.precision(old_precision);
}

} // namespace shp
