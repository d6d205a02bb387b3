#pragma once
// All comments are in English.

#include <string>
#include <vector>

#include "common/sha_types.hpp"

namespace shp {

// Build a MessageBlock from a loose word list; throws std::invalid_argument
// unless exactly kBlockWords words are given.
MessageBlock MakeBlock(const std::vector<Word64>& words);

// First kHashWords words of a finished digest.
Hash384 TruncateToHash(const DigestState& digest);

// Parse one 64-bit big-endian hex word (optional "0x", 1..16 digits).
// Throws std::invalid_argument on anything else.
Word64 ParseHexWord(const std::string& text);

// Parse a 96-digit hash string; spaces are ignored.
Hash384 ParseHash384(const std::string& text);

std::string ToHex(Word64 w);
std::string ToHex(const Hash384& hash);
std::string ToHex(const DigestState& digest);

} // namespace shp
