// All comments are in English.
// Cycle-level checks of one 10-stage pipeline: latency, chaining, throughput,
// admission validation and the per-message ordering guard.

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/constants.hpp"
#include "common/digest_format.hpp"
#include "common/padding.hpp"
#include "core/pipeline_controller.hpp"
#include "model/reference_compressor.hpp"

using namespace shp;

namespace {
int g_failures = 0;
void CHECK(bool cond, const char* msg) {
    if (!cond) { ++g_failures; std::cerr << "[FAIL] " << msg << "\n"; }
}

const char* kAbcHash =
    "cb00753f45a35e8bb5a03d699ac65007272c32ab0eded163"
    "1a8b605a43ff5bed8086072ba1e7cc2358baeca134c825a7";
const char* kEmptyHash =
    "38b060a751ac96384cd9327eb1b1e36a21fdb71114be0743"
    "4c0cc7bf63f6e1da274edebfe76f65fbd51ad2f14898b95b";
const char* kTwoBlockMsg =
    "abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmn"
    "hijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu";
const char* kTwoBlockHash =
    "09330c33f71147e83d192fc782cd1b4753111b173b3b05d2"
    "2fa08086e3b0f712fcc7c71a557e2db966c3e9fa91746039";

// Admits one block and steps until something retires; returns that output and
// the tick it appeared in.
TickOutput RunSingle(PipelineController& ctl, const TickInput& in, std::uint64_t& out_tick) {
    TickOutput out = ctl.Step(in);
    while (!out.continuation_valid) {
        out_tick = ctl.tick();
        out = ctl.Step();
    }
    return out;
}

// ----------------------------- Latency ------------------------------------

void TEST_SingleBlockLatency() {
    std::cout << "[RUN ] SingleBlockLatency\n";
    PipelineController ctl;
    const auto blk = testing::PadMessage("abc").front();

    TickOutput out = ctl.Step(FirstBlockInput(blk, /*is_final=*/true));
    CHECK(!out.continuation_valid, "nothing retires on the admission tick");
    CHECK(ctl.slot(0).valid && ctl.occupancy() == 1, "block sits in position 0");

    for (std::size_t k = 1; k < kNumStages; ++k) {
        out = ctl.Step();
        CHECK(!out.continuation_valid && !out.hash_valid, "no output before the 10th tick");
        CHECK(ctl.slot(k).valid, "block advanced one position per tick");
    }
    CHECK(ctl.tick() == kPipelineLatency, "ten ticks elapsed");

    out = ctl.Step();
    CHECK(out.continuation_valid && out.hash_valid, "hash appears on tick 10");
    CHECK(out.hash == ParseHash384(kAbcHash), "SHA-384(\"abc\")");
    CHECK(out.admit_tick == 0, "admit tick echoed");
    CHECK(ctl.empty(), "pipeline drained");

    const EngineStats& st = ctl.stats();
    CHECK(st.ticks == 11 && st.admitted == 1 && st.retired == 1 && st.hashes == 1,
          "counters after one block");
    CHECK(st.idle_ticks == 0, "no idle tick yet");
    ctl.Step();
    CHECK(ctl.stats().idle_ticks == 1, "empty tick counted as idle");
    std::cout << "[DONE] SingleBlockLatency\n";
}

void TEST_EmptyMessage() {
    std::cout << "[RUN ] EmptyMessage\n";
    PipelineController ctl;
    std::uint64_t at = 0;
    const TickOutput out = RunSingle(ctl, FirstBlockInput(testing::PadMessage("").front(), true), at);
    CHECK(at == 10, "empty-message hash at tick 10");
    CHECK(out.hash_valid && out.hash == ParseHash384(kEmptyHash), "SHA-384(\"\")");
    std::cout << "[DONE] EmptyMessage\n";
}

// ----------------------------- Chaining -----------------------------------

void TEST_TwoBlockChaining() {
    std::cout << "[RUN ] TwoBlockChaining\n";
    PipelineController ctl;
    const auto blocks = testing::PadMessage(kTwoBlockMsg);

    std::uint64_t at = 0;
    const TickOutput first = RunSingle(ctl, FirstBlockInput(blocks[0], false, 7), at);
    CHECK(at == 10, "first block retires at tick 10");
    CHECK(first.continuation_valid && !first.hash_valid, "non-final block yields only a continuation");
    CHECK(first.message_tag && *first.message_tag == 7, "tag echoed");
    CHECK(!ctl.InFlight(7), "tag released on retirement");

    const TickOutput second =
        RunSingle(ctl, ContinuationInput(blocks[1], first.continuation_digest, true, 7), at);
    CHECK(at == 21, "second block admitted at 11 retires at 21");
    CHECK(second.hash_valid && second.hash == ParseHash384(kTwoBlockHash), "two-block hash");
    CHECK(ctl.stats().continuations == 1, "one continuation admission");
    std::cout << "[DONE] TwoBlockChaining\n";
}

// ----------------------------- Throughput ---------------------------------

void TEST_BackToBackMessages() {
    std::cout << "[RUN ] BackToBackMessages\n";
    constexpr std::size_t kMessages = 24;
    PipelineController ctl;

    std::vector<Hash384> expect;
    std::vector<TickOutput> outs;
    std::vector<std::uint64_t> out_ticks;
    for (std::size_t i = 0; i < kMessages + kNumStages; ++i) {
        TickInput in;
        if (i < kMessages) {
            const auto blocks = testing::PadMessage(testing::MakeText(i * 4, static_cast<char>(i)));
            expect.push_back(ReferenceHash(blocks));
            in = FirstBlockInput(blocks.front(), true, i);
        }
        const std::uint64_t now = ctl.tick();
        const TickOutput out = ctl.Step(in);
        if (out.continuation_valid) {
            outs.push_back(out);
            out_ticks.push_back(now);
        }
        if (i >= kNumStages - 1 && i < kMessages) {
            CHECK(ctl.occupancy() == kNumStages, "pipeline full in steady state");
        }
    }

    CHECK(outs.size() == kMessages, "every message retired");
    bool order_ok = true, hash_ok = true, tick_ok = true;
    for (std::size_t i = 0; i < outs.size(); ++i) {
        order_ok = order_ok && outs[i].message_tag && *outs[i].message_tag == i;
        hash_ok  = hash_ok && outs[i].hash_valid && outs[i].hash == expect[i];
        tick_ok  = tick_ok && out_ticks[i] == kPipelineLatency + i;
    }
    CHECK(order_ok, "outputs in admission order");
    CHECK(hash_ok, "every hash matches the reference");
    CHECK(tick_ok, "one result per tick starting at tick 10");
    CHECK(ctl.stats().Utilization() > 0.5, "stages mostly busy");
    std::cout << "[DONE] BackToBackMessages\n";
}

// ----------------------------- Validation ---------------------------------

template <typename Fn>
bool RejectsWithoutAdvancing(PipelineController& ctl, Fn fn) {
    const std::uint64_t tick = ctl.tick();
    const std::size_t occ = ctl.occupancy();
    bool threw = false;
    try { fn(); } catch (const std::invalid_argument&) { threw = true; }
    return threw && ctl.tick() == tick && ctl.occupancy() == occ;
}

void TEST_MalformedInputs() {
    std::cout << "[RUN ] MalformedInputs\n";
    PipelineController ctl;
    const auto blk = testing::PadMessage("abc").front();
    ctl.Step(FirstBlockInput(blk, true, 1));

    CHECK(RejectsWithoutAdvancing(ctl, [&] {
        TickInput in;
        in.is_final_block = true;
        ctl.Step(in);
    }), "flags without a block are rejected");

    CHECK(RejectsWithoutAdvancing(ctl, [&] {
        TickInput in = FirstBlockInput(blk, true);
        in.use_continuation = true;
        ctl.Step(in);
    }), "use_continuation without a digest is rejected");

    CHECK(RejectsWithoutAdvancing(ctl, [&] {
        TickInput in = FirstBlockInput(blk, true);
        in.continuation_digest = DigestState{};
        ctl.Step(in);
    }), "digest without use_continuation is rejected");

    CHECK(ctl.stats().rejected == 3, "rejections counted");
    CHECK(ctl.slot(1).valid == false && ctl.slot(0).valid, "slots untouched by rejected ticks");

    bool threw = false;
    try { (void)ctl.slot(kNumStages); } catch (const std::out_of_range&) { threw = true; }
    CHECK(threw, "slot(10) should throw");
    std::cout << "[DONE] MalformedInputs\n";
}

void TEST_OrderingGuard() {
    std::cout << "[RUN ] OrderingGuard\n";
    PipelineController ctl;
    const auto blk = testing::PadMessage("abc").front();
    ctl.Step(FirstBlockInput(blk, false, 42));
    CHECK(ctl.InFlight(42), "tag tracked after admission");

    // Second block of message 42 while the first is still in position 0..8.
    for (std::size_t k = 1; k < kNumStages; ++k) {
        CHECK(RejectsWithoutAdvancing(ctl, [&] { ctl.Step(FirstBlockInput(blk, true, 42)); }),
              "duplicate tag rejected while its block is in flight");
        ctl.Step(FirstBlockInput(blk, true, 100 + k));
    }
    CHECK(ctl.slot(kNumStages - 1).message_tag == std::optional<std::uint64_t>(42),
          "first block reached position 9");

    // Position 9 retires before admission, so the tag is free in this tick.
    const TickOutput out = ctl.Step(FirstBlockInput(blk, true, 42));
    CHECK(out.continuation_valid && *out.message_tag == 42, "first block of 42 retired");
    CHECK(ctl.slot(0).message_tag == std::optional<std::uint64_t>(42), "new block of 42 admitted");

    PipelineController loose(/*enforce_message_ordering=*/false);
    loose.Step(FirstBlockInput(blk, true, 5));
    bool threw = false;
    try { loose.Step(FirstBlockInput(blk, true, 5)); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(!threw, "guard disabled accepts duplicate tags");
    CHECK(loose.occupancy() == 2, "both blocks admitted");

    ctl.SetEnforceMessageOrdering(false);
    CHECK(!ctl.enforce_message_ordering(), "guard can be switched off");
    std::cout << "[DONE] OrderingGuard\n";
}

void TEST_Reset() {
    std::cout << "[RUN ] Reset\n";
    PipelineController ctl;
    const auto blk = testing::PadMessage("abc").front();
    for (std::uint64_t t = 0; t < 4; ++t) ctl.Step(FirstBlockInput(blk, true, t));
    ctl.Reset();
    CHECK(ctl.empty() && ctl.tick() == 0, "no slots and tick 0 after Reset");
    CHECK(!ctl.InFlight(0) && !ctl.InFlight(3), "tags cleared");
    CHECK(ctl.stats().admitted == 0 && ctl.stats().ticks == 0, "stats cleared");

    std::uint64_t at = 0;
    const TickOutput out = RunSingle(ctl, FirstBlockInput(blk, true, 0), at);
    CHECK(at == 10 && out.hash == ParseHash384(kAbcHash), "pipeline usable after Reset");
    std::cout << "[DONE] Reset\n";
}

} // namespace

int main() {
    std::cout << "=== PipelineController Tests ===\n";
    TEST_SingleBlockLatency();
    TEST_EmptyMessage();
    TEST_TwoBlockChaining();
    TEST_BackToBackMessages();
    TEST_MalformedInputs();
    TEST_OrderingGuard();
    TEST_Reset();
    if (g_failures == 0) {
        std::cout << "[PASS] All tests passed.\n";
        return 0;
    } else {
        std::cout << "[FAIL] " << g_failures << " test(s) failed.\n";
        return 1;
    }
}
