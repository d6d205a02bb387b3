// All comments are in English.
#include "arch/message_scheduler.hpp"

#include <stdexcept>
#include <string>

#include "arch/arith_core.hpp"

namespace shp {

namespace {

inline std::size_t Slot(std::size_t index) { return index % kScheduleWindow; }

} // namespace

ScheduleBatch MessageScheduler::Expand(const ScheduleWindow& window, std::size_t round_base) {
  if (!IsValidRoundBase(round_base)) {
    throw std::out_of_range("MessageScheduler::Expand: invalid round base " +
                            std::to_string(round_base));
  }

  ScheduleBatch out;
  out.window = window;
  const std::size_t t = round_base;

  if (t < kBlockWords) {
    // Raw block words; the window already holds them in place.
    for (std::size_t j = 0; j < kRoundsPerStage; ++j) out.words[j] = window[t + j];
    return out;
  }

  // W[t + j - k] for k in {2, 7}: inside the batch when j >= k, else in the window.
  auto w = out.words.data();
  auto recent = [&](std::size_t j, std::size_t k) -> Word64 {
    return (j >= k) ? w[j - k] : window[Slot(t + j - k)];
  };

  for (std::size_t j = 0; j < kRoundsPerStage; ++j) {
    w[j] = arith::Add4(arith::SmallSigma1(recent(j, 2)),
                       recent(j, 7),
                       arith::SmallSigma0(window[Slot(t + j - 15)]),
                       window[Slot(t + j - 16)]);
  }

  for (std::size_t j = 0; j < kRoundsPerStage; ++j) out.window[Slot(t + j)] = w[j];
  return out;
}

} // namespace shp
