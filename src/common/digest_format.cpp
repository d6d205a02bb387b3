// All comments are in English.
#include "common/digest_format.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace shp {

namespace {

int HexDigitValue(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  return -1;
}

template <std::size_t N>
std::string WordsToHex(const std::array<Word64, N>& words) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (Word64 w : words) oss << std::setw(16) << w;
  return oss.str();
}

} // namespace

MessageBlock MakeBlock(const std::vector<Word64>& words) {
  if (words.size() != kBlockWords) {
    throw std::invalid_argument("MakeBlock: expected " + std::to_string(kBlockWords) +
                                " words, got " + std::to_string(words.size()));
  }
  MessageBlock block{};
  for (std::size_t i = 0; i < kBlockWords; ++i) block[i] = words[i];
  return block;
}

Hash384 TruncateToHash(const DigestState& digest) {
  Hash384 hash{};
  for (std::size_t i = 0; i < kHashWords; ++i) hash[i] = digest[i];
  return hash;
}

Word64 ParseHexWord(const std::string& text) {
  std::size_t pos = 0;
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) pos = 2;
  const std::size_t digits = text.size() - pos;
  if (digits == 0 || digits > 16) {
    throw std::invalid_argument("ParseHexWord: bad length in '" + text + "'");
  }
  Word64 value = 0;
  for (; pos < text.size(); ++pos) {
    const int v = HexDigitValue(text[pos]);
    if (v < 0) throw std::invalid_argument("ParseHexWord: non-hex digit in '" + text + "'");
    value = (value << 4) | static_cast<Word64>(v);
  }
  return value;
}

Hash384 ParseHash384(const std::string& text) {
  std::string digits;
  digits.reserve(text.size());
  for (char ch : text) {
    if (!std::isspace(static_cast<unsigned char>(ch))) digits.push_back(ch);
  }
  if (digits.size() != kHashWords * 16) {
    throw std::invalid_argument("ParseHash384: expected 96 hex digits, got " +
                                std::to_string(digits.size()));
  }
  Hash384 hash{};
  for (std::size_t i = 0; i < kHashWords; ++i) {
    hash[i] = ParseHexWord(digits.substr(i * 16, 16));
  }
  return hash;
}

std::string ToHex(Word64 w) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(16) << w;
  return oss.str();
}

std::string ToHex(const Hash384& hash)       { return WordsToHex(hash); }
std::string ToHex(const DigestState& digest) { return WordsToHex(digest); }

} // namespace shp
