// All comments are in English.
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "runner/simulation.hpp"
#include "runner/test_vectors.hpp"

int main(int argc, char** argv) {
  // Usage: ./sha384_sim <vectors.txt> <config.json>
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <vectors.txt> <config.json>\n";
    return 1;
  }

  const std::string vectors_path = argv[1];
  const std::string json_path    = argv[2];

  try {
    // (1) Parse config
    const shp::SimConfig cfg = shp::ParseConfig(json_path);

    // (2) Load pre-padded vectors
    const std::vector<shp::TestVector> vectors = shp::LoadTestVectors(vectors_path);
    if (vectors.empty()) {
      std::cerr << "[Simulation] No vectors in " << vectors_path << "\n";
      return 1;
    }

    // (3) Run, report, dump stats
    const shp::SimReport report = shp::RunVectors(cfg, vectors);
    shp::PrintSummary(cfg, report, std::cout);
    shp::WriteReportCsv(cfg, report);

    if (!report.AllPassed()) {
      std::cout << "[Simulation] Differences detected.\n";
      return 1;
    }
    std::cout << "[Simulation] Completed successfully.\n";
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[Simulation] Error: " << ex.what() << "\n";
    return 2;
  }
}
