// All comments are in English.
#pragma once
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include "stats/sim_stats.hpp"

namespace shp {

// Writes one row per engine lane with its aggregated counters.
class LaneSummaryCsvLogger {
public:
  explicit LaneSummaryCsvLogger(const std::string& path, bool append = true)
  : path_(path)
  {
    std::ios_base::openmode mode = std::ios::out;
    mode |= (append ? std::ios::app : std::ios::trunc);
    file_.open(path_, mode);
    if (!file_.is_open()) {
      throw std::runtime_error("LaneSummaryCsvLogger: failed to open file: " + path_);
    }
    if (!append) {
      WriteHeader_();
    } else {
      file_.seekp(0, std::ios::end);
      if (file_.tellp() == 0) {
        WriteHeader_();
      }
    }
    file_ << std::fixed << std::setprecision(4);
  }

  void AppendRow(const std::string& run_name,
                 std::size_t lane,
                 const EngineStats& S,
                 std::uint64_t blocks_submitted)
  {
    file_
      << run_name << ','
      << lane << ','
      << S.ticks << ','
      << blocks_submitted << ','
      << S.admitted << ','
      << S.retired << ','
      << S.hashes << ','
      << S.continuations << ','
      << S.idle_ticks << ','
      << S.Utilization()
      << '\n';
    file_.flush();
  }

private:
  void WriteHeader_() {
    file_ << "run,lane,ticks,blocks_submitted,admitted,retired,hashes,continuations,"
             "idle_ticks,stage_utilization\n";
  }

  std::string path_;
  std::ofstream file_;
};

} // namespace shp
