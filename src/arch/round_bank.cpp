// All comments are in English.
#include "arch/round_bank.hpp"

#include "arch/arith_core.hpp"

namespace shp {

WorkingState RoundBank::Apply(const WorkingState& in, const RoundOperands& kw) {
  std::array<Word64, kHistory> a_hist{};
  std::array<Word64, kHistory> e_hist{};
  a_hist[0] = in.d; a_hist[1] = in.c; a_hist[2] = in.b; a_hist[3] = in.a;
  e_hist[0] = in.h; e_hist[1] = in.g; e_hist[2] = in.f; e_hist[3] = in.e;

  for (std::size_t r = 0; r < kRoundsPerStage; ++r) {
    const Word64 a = a_hist[r + 3], b = a_hist[r + 2], c = a_hist[r + 1], d = a_hist[r];
    const Word64 e = e_hist[r + 3], f = e_hist[r + 2], g = e_hist[r + 1], h = e_hist[r];

    const Word64 t1 = arith::Add4(h, arith::BigSigma1(e), arith::Ch(e, f, g), kw[r]);
    const Word64 t2 = arith::Add2(arith::BigSigma0(a), arith::Maj(a, b, c));

    a_hist[r + 4] = arith::Add2(t1, t2);
    e_hist[r + 4] = arith::Add2(d, t1);
  }

  WorkingState out;
  out.a = a_hist[kHistory - 1]; out.b = a_hist[kHistory - 2];
  out.c = a_hist[kHistory - 3]; out.d = a_hist[kHistory - 4];
  out.e = e_hist[kHistory - 1]; out.f = e_hist[kHistory - 2];
  out.g = e_hist[kHistory - 3]; out.h = e_hist[kHistory - 4];
  return out;
}

WorkingState RoundBank::ApplyOne(const WorkingState& in, Word64 kw) {
  const Word64 t1 = arith::Add4(in.h, arith::BigSigma1(in.e), arith::Ch(in.e, in.f, in.g), kw);
  const Word64 t2 = arith::Add2(arith::BigSigma0(in.a), arith::Maj(in.a, in.b, in.c));

  WorkingState out;
  out.a = arith::Add2(t1, t2);
  out.b = in.a;
  out.c = in.b;
  out.d = in.c;
  out.e = arith::Add2(in.d, t1);
  out.f = in.e;
  out.g = in.f;
  out.h = in.g;
  return out;
}

} // namespace shp
