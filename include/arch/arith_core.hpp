#pragma once
// All comments are in English.

#include "common/sha_types.hpp"

namespace shp {
namespace arith {

/**
 * ArithmeticCore
 *
 * Modular 64-bit addition and the SHA-2 (64-bit) bitwise primitives.
 * Multi-operand sums go through 3:2 carry-save compressors and finish with a
 * single carry-propagate add, mirroring the adder trees of the hardware stage:
 *   - Add3: 1 compressor + 1 CPA
 *   - Add4: 2 compressors + 1 CPA
 *   - Add5: 3 compressors + 1 CPA
 * All functions are pure and total; wraparound is silent.
 */

// Redundant (sum, carry) pair; sum + carry == original operands (mod 2^64).
struct CarrySave {
    Word64 sum   = 0;
    Word64 carry = 0;
};

inline Word64 Add2(Word64 a, Word64 b) { return a + b; }

// 3:2 compressor.
inline CarrySave Compress32(Word64 a, Word64 b, Word64 c) {
    CarrySave cs;
    cs.sum   = a ^ b ^ c;
    cs.carry = ((a & b) | (b & c) | (a & c)) << 1;
    return cs;
}

inline Word64 Add3(Word64 a, Word64 b, Word64 c) {
    const CarrySave l0 = Compress32(a, b, c);
    return Add2(l0.sum, l0.carry);
}

inline Word64 Add4(Word64 a, Word64 b, Word64 c, Word64 d) {
    const CarrySave l0 = Compress32(a, b, c);
    const CarrySave l1 = Compress32(l0.sum, l0.carry, d);
    return Add2(l1.sum, l1.carry);
}

inline Word64 Add5(Word64 a, Word64 b, Word64 c, Word64 d, Word64 e) {
    const CarrySave l0 = Compress32(a, b, c);
    const CarrySave l1 = Compress32(l0.sum, l0.carry, d);
    const CarrySave l2 = Compress32(l1.sum, l1.carry, e);
    return Add2(l2.sum, l2.carry);
}

// n is taken mod 64; Rotr(x, 0) == x.
inline Word64 Rotr(Word64 x, unsigned n) {
    n &= 63u;
    return n == 0 ? x : ((x >> n) | (x << (64u - n)));
}

inline Word64 Shr(Word64 x, unsigned n) { return n >= 64u ? 0 : (x >> n); }

inline Word64 Ch(Word64 x, Word64 y, Word64 z)  { return (x & y) ^ (~x & z); }
inline Word64 Maj(Word64 x, Word64 y, Word64 z) { return (x & y) ^ (x & z) ^ (y & z); }

inline Word64 BigSigma0(Word64 x)   { return Rotr(x, 28) ^ Rotr(x, 34) ^ Rotr(x, 39); }
inline Word64 BigSigma1(Word64 x)   { return Rotr(x, 14) ^ Rotr(x, 18) ^ Rotr(x, 41); }
inline Word64 SmallSigma0(Word64 x) { return Rotr(x, 1)  ^ Rotr(x, 8)  ^ Shr(x, 7); }
inline Word64 SmallSigma1(Word64 x) { return Rotr(x, 19) ^ Rotr(x, 61) ^ Shr(x, 6); }

} // namespace arith
} // namespace shp
