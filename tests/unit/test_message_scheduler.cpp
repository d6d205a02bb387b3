#include "arch/message_scheduler.hpp"
#include "arch/arith_core.hpp"
#include <array>
#include <iostream>
#include <stdexcept>

/* All comments are in English */

using namespace shp;

namespace {
int g_failures = 0;
void CHECK(bool cond, const char* msg) {
    if (!cond) { ++g_failures; std::cerr << "[FAIL] " << msg << "\n"; }
}

MessageBlock SampleBlock() {
    MessageBlock b{};
    Word64 x = 0x243f6a8885a308d3ULL;
    for (std::size_t i = 0; i < kBlockWords; ++i) {
        x = x * 6364136223846793005ULL + 1442695040888963407ULL;
        b[i] = x;
    }
    return b;
}

// Straight-line W[0..79] for comparison.
std::array<Word64, kTotalRounds> FullSchedule(const MessageBlock& b) {
    std::array<Word64, kTotalRounds> w{};
    for (std::size_t t = 0; t < kBlockWords; ++t) w[t] = b[t];
    for (std::size_t t = kBlockWords; t < kTotalRounds; ++t) {
        w[t] = arith::SmallSigma1(w[t - 2]) + w[t - 7] + arith::SmallSigma0(w[t - 15]) + w[t - 16];
    }
    return w;
}

void TEST_RawWordsForFirstTwoBatches() {
    std::cout << "[RUN ] RawWordsForFirstTwoBatches\n";
    const MessageBlock b = SampleBlock();
    for (std::size_t base : {std::size_t{0}, std::size_t{8}}) {
        const ScheduleBatch batch = MessageScheduler::Expand(b, base);
        bool same = true;
        for (std::size_t r = 0; r < kRoundsPerStage; ++r) same = same && (batch.words[r] == b[base + r]);
        CHECK(same, "batches below round 16 pass the block words through");
        CHECK(batch.window == b, "window is unchanged below round 16");
    }
    std::cout << "[DONE] RawWordsForFirstTwoBatches\n";
}

void TEST_MatchesFullSchedule() {
    std::cout << "[RUN ] MatchesFullSchedule\n";
    const MessageBlock b = SampleBlock();
    const auto w = FullSchedule(b);

    ScheduleWindow window = b;
    for (std::size_t base = 0; base < kTotalRounds; base += kRoundsPerStage) {
        const ScheduleBatch batch = MessageScheduler::Expand(window, base);
        bool words_ok = true;
        bool window_ok = true;
        for (std::size_t r = 0; r < kRoundsPerStage; ++r) {
            words_ok  = words_ok && (batch.words[r] == w[base + r]);
            window_ok = window_ok && (batch.window[(base + r) % kScheduleWindow] == w[base + r]);
        }
        CHECK(words_ok, "batch words equal W[t..t+7]");
        CHECK(window_ok, "window holds the latest words after the batch");
        window = batch.window;
    }
    std::cout << "[DONE] MatchesFullSchedule\n";
}

void TEST_ExpandIsPure() {
    std::cout << "[RUN ] ExpandIsPure\n";
    const MessageBlock b = SampleBlock();
    const ScheduleWindow copy = b;
    const ScheduleBatch first  = MessageScheduler::Expand(b, 16);
    const ScheduleBatch second = MessageScheduler::Expand(b, 16);
    CHECK(b == copy, "input window not modified");
    CHECK(first.words == second.words && first.window == second.window,
          "same inputs give the same batch");
    std::cout << "[DONE] ExpandIsPure\n";
}

void TEST_InvalidRoundBase() {
    std::cout << "[RUN ] InvalidRoundBase\n";
    const MessageBlock b = SampleBlock();
    CHECK(MessageScheduler::IsValidRoundBase(0) && MessageScheduler::IsValidRoundBase(72),
          "0 and 72 are valid bases");
    CHECK(!MessageScheduler::IsValidRoundBase(4), "unaligned base is invalid");
    CHECK(!MessageScheduler::IsValidRoundBase(80), "base 80 is past the last stage");

    bool threw = false;
    try { (void)MessageScheduler::Expand(b, 80); } catch (const std::out_of_range&) { threw = true; }
    CHECK(threw, "Expand(80) should throw out_of_range");

    threw = false;
    try { (void)MessageScheduler::Expand(b, 12); } catch (const std::out_of_range&) { threw = true; }
    CHECK(threw, "Expand(12) should throw out_of_range");
    std::cout << "[DONE] InvalidRoundBase\n";
}

} // namespace

int main() {
    std::cout << "=== MessageScheduler Unit Tests ===\n";
    TEST_RawWordsForFirstTwoBatches();
    TEST_MatchesFullSchedule();
    TEST_ExpandIsPure();
    TEST_InvalidRoundBase();
    if (g_failures == 0) {
        std::cout << "[PASS] All tests passed.\n";
        return 0;
    } else {
        std::cout << "[FAIL] " << g_failures << " test(s) failed.\n";
        return 1;
    }
}
