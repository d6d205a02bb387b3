// All comments are in English.
#pragma once
#include <istream>
#include <string>
#include <vector>

#include "common/sha_types.hpp"

namespace shp {

struct TestVector {
  std::string               name;
  std::vector<MessageBlock> blocks;     // already padded
  Hash384                   expected{};
};

// Vector file layout, one token per line (blank lines ignored):
//   <number of tests>
//   per test: <block count>, 16 hex words per block, 6 hex words of expected hash
// Throws std::runtime_error with the offending line number on malformed input.
std::vector<TestVector> ParseTestVectors(std::istream& is, const std::string& source = "<stream>");

std::vector<TestVector> LoadTestVectors(const std::string& path);

} // namespace shp
