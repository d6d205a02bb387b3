#pragma once
// All comments are in English.
// Test-only SHA-384 padding (FIPS 180-4, 5.1.2): the engine itself expects
// pre-padded blocks.

#include <cstdint>
#include <string>
#include <vector>

#include "common/sha_types.hpp"

namespace shp {
namespace testing {

inline std::vector<MessageBlock> PadMessage(const std::string& msg) {
    std::vector<std::uint8_t> bytes(msg.begin(), msg.end());
    const std::uint64_t bit_len = static_cast<std::uint64_t>(msg.size()) * 8;
    bytes.push_back(0x80);
    while (bytes.size() % 128 != 112) bytes.push_back(0x00);
    for (int i = 0; i < 8; ++i) bytes.push_back(0x00);              // high 64 bits of length
    for (int i = 7; i >= 0; --i) bytes.push_back(static_cast<std::uint8_t>(bit_len >> (8 * i)));

    std::vector<MessageBlock> blocks(bytes.size() / 128);
    for (std::size_t b = 0; b < blocks.size(); ++b) {
        for (std::size_t w = 0; w < kBlockWords; ++w) {
            Word64 v = 0;
            for (std::size_t k = 0; k < 8; ++k) v = (v << 8) | bytes[b * 128 + w * 8 + k];
            blocks[b][w] = v;
        }
    }
    return blocks;
}

// Deterministic filler text of a given length.
inline std::string MakeText(std::size_t n, char seed) {
    std::string s(n, '\0');
    for (std::size_t i = 0; i < n; ++i) s[i] = static_cast<char>('a' + (seed + i * 7) % 26);
    return s;
}

} // namespace testing
} // namespace shp
