#include <string.h>
#include <unity.h>
#include <vector>

#include "KnobControl_decoder.hpp"

using kc::EncoderState;
using kc::QuadratureDecoder;
using kc::RotationEvent;

struct Counts {
    int cw = 0;
    int ccw = 0;
};

// Feeds CLK/DT level strings ("0110") into a decoder seeded at LL.
static Counts play(const char* clk, const char* dt, uint8_t edgesPerEvent) {
    QuadratureDecoder dec(edgesPerEvent);
    dec.reset(EncoderState::LL);

    Counts c;
    for (size_t i = 0; i < strlen(clk); ++i) {
        const auto next = kc::encoderState(clk[i] == '1' ? kc::PinLevel::High : kc::PinLevel::Low,
            dt[i] == '1' ? kc::PinLevel::High : kc::PinLevel::Low);
        RotationEvent ev;
        if (dec.feed(next, ev)) {
            if (ev == RotationEvent::Clockwise)
                ++c.cw;
            else
                ++c.ccw;
        }
    }
    return c;
}

static std::vector<RotationEvent> replay(EncoderState seed, const std::vector<EncoderState>& states) {
    QuadratureDecoder dec;
    dec.reset(seed);

    std::vector<RotationEvent> events;
    RotationEvent ev;
    for (auto s : states) {
        if (dec.feed(s, ev))
            events.push_back(ev);
    }
    return events;
}

void testAdjacentTransitionsEmitOneEvent() {
    const EncoderState cycle[] = { EncoderState::LL, EncoderState::LH, EncoderState::HH, EncoderState::HL };

    for (int i = 0; i < 4; ++i) {
        const auto a = cycle[i];
        const auto b = cycle[(i + 1) % 4];
        QuadratureDecoder dec(1);
        RotationEvent ev;

        dec.reset(a);
        TEST_ASSERT_TRUE(dec.feed(b, ev));
        TEST_ASSERT_TRUE(ev == RotationEvent::Clockwise);

        dec.reset(b);
        TEST_ASSERT_TRUE(dec.feed(a, ev));
        TEST_ASSERT_TRUE(ev == RotationEvent::CounterClockwise);
    }
}

void testDoubleBitTransitionsAreIgnored() {
    const EncoderState pairs[][2] = {
        { EncoderState::LL, EncoderState::HH },
        { EncoderState::HH, EncoderState::LL },
        { EncoderState::LH, EncoderState::HL },
        { EncoderState::HL, EncoderState::LH },
    };

    for (const auto& p : pairs) {
        QuadratureDecoder dec(1);
        RotationEvent ev;
        dec.reset(p[0]);
        TEST_ASSERT_FALSE(dec.feed(p[1], ev));
        TEST_ASSERT_TRUE(dec.state() == p[1]);
        TEST_ASSERT_EQUAL(QuadratureDecoder::STEP_INVALID, QuadratureDecoder::step(p[0], p[1]));
    }
}

void testRepeatedStateIsNoOp() {
    for (uint8_t s = 0; s < 4; ++s) {
        QuadratureDecoder dec(1);
        RotationEvent ev;
        dec.reset(EncoderState(s));
        TEST_ASSERT_FALSE(dec.feed(EncoderState(s), ev));
        TEST_ASSERT_EQUAL(0, dec.pendingEdges());
    }
}

void testTransitionTableShape() {
    int forward = 0, backward = 0, none = 0, invalid = 0;
    for (uint8_t a = 0; a < 4; ++a) {
        for (uint8_t b = 0; b < 4; ++b) {
            switch (QuadratureDecoder::step(EncoderState(a), EncoderState(b))) {
            case QuadratureDecoder::STEP_FORWARD: ++forward; break;
            case QuadratureDecoder::STEP_BACKWARD: ++backward; break;
            case QuadratureDecoder::STEP_NONE: ++none; break;
            case QuadratureDecoder::STEP_INVALID: ++invalid; break;
            }
        }
    }
    TEST_ASSERT_EQUAL(4, forward);
    TEST_ASSERT_EQUAL(4, backward);
    TEST_ASSERT_EQUAL(4, none);
    TEST_ASSERT_EQUAL(4, invalid);
}

void testFullClockwiseCycleEmitsOneEvent() {
    const auto events = replay(EncoderState::LL,
        { EncoderState::LH, EncoderState::HH, EncoderState::HL, EncoderState::LL });
    TEST_ASSERT_EQUAL(1, events.size());
    TEST_ASSERT_TRUE(events[0] == RotationEvent::Clockwise);
}

void testFullCounterClockwiseCycleEmitsOneEvent() {
    const auto events = replay(EncoderState::LL,
        { EncoderState::HL, EncoderState::HH, EncoderState::LH, EncoderState::LL });
    TEST_ASSERT_EQUAL(1, events.size());
    TEST_ASSERT_TRUE(events[0] == RotationEvent::CounterClockwise);
}

void testEventOnlyAtEndOfDetent() {
    QuadratureDecoder dec;
    RotationEvent ev;
    dec.reset(EncoderState::LL);
    TEST_ASSERT_FALSE(dec.feed(EncoderState::LH, ev));
    TEST_ASSERT_FALSE(dec.feed(EncoderState::HH, ev));
    TEST_ASSERT_FALSE(dec.feed(EncoderState::HL, ev));
    TEST_ASSERT_EQUAL(3, dec.pendingEdges());
    TEST_ASSERT_TRUE(dec.feed(EncoderState::LL, ev));
    TEST_ASSERT_EQUAL(0, dec.pendingEdges());
}

void testBackAndForthCancels() {
    const auto events = replay(EncoderState::LL,
        { EncoderState::LH, EncoderState::HH, EncoderState::LH, EncoderState::LL });
    TEST_ASSERT_EQUAL(0, events.size());
}

void testDoubleChangeBecomesBaseline() {
    QuadratureDecoder dec;
    RotationEvent ev;
    dec.reset(EncoderState::LL);

    TEST_ASSERT_FALSE(dec.feed(EncoderState::HH, ev));
    TEST_ASSERT_TRUE(dec.state() == EncoderState::HH);

    // Partially counted detent is dropped.
    dec.reset(EncoderState::LL);
    dec.feed(EncoderState::LH, ev);
    dec.feed(EncoderState::HH, ev);
    TEST_ASSERT_EQUAL(2, dec.pendingEdges());
    TEST_ASSERT_FALSE(dec.feed(EncoderState::LL, ev));
    TEST_ASSERT_EQUAL(0, dec.pendingEdges());

    // And a full detent from the new baseline still counts.
    TEST_ASSERT_FALSE(dec.feed(EncoderState::LH, ev));
    TEST_ASSERT_FALSE(dec.feed(EncoderState::HH, ev));
    TEST_ASSERT_FALSE(dec.feed(EncoderState::HL, ev));
    TEST_ASSERT_TRUE(dec.feed(EncoderState::LL, ev));
    TEST_ASSERT_TRUE(ev == RotationEvent::Clockwise);
}

void testReplayIsDeterministic() {
    const std::vector<EncoderState> noisy = {
        EncoderState::LH, EncoderState::LL, EncoderState::LH, EncoderState::HH,
        EncoderState::HL, EncoderState::LL, EncoderState::HH, EncoderState::HL,
        EncoderState::HH, EncoderState::LH, EncoderState::LL, EncoderState::HL,
        EncoderState::HH, EncoderState::LH, EncoderState::LL,
    };

    const auto first = replay(EncoderState::LL, noisy);
    const auto second = replay(EncoderState::LL, noisy);
    TEST_ASSERT_EQUAL(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i)
        TEST_ASSERT_TRUE(first[i] == second[i]);
}

void testHalfCycleDetents() {
    // CLK leads: one step clockwise
    Counts c = play("011", "001", 2);
    TEST_ASSERT_EQUAL(1, c.cw);
    TEST_ASSERT_EQUAL(0, c.ccw);

    c = play("001", "011", 2);
    TEST_ASSERT_EQUAL(0, c.cw);
    TEST_ASSERT_EQUAL(1, c.ccw);

    // flicker on DT before the real step
    c = play("00001", "01011", 2);
    TEST_ASSERT_EQUAL(0, c.cw);
    TEST_ASSERT_EQUAL(1, c.ccw);

    c = play("00011", "01001", 2);
    TEST_ASSERT_EQUAL(1, c.cw);
    TEST_ASSERT_EQUAL(0, c.ccw);

    c = play("011000110", "001101100", 2);
    TEST_ASSERT_EQUAL(2, c.cw);
    TEST_ASSERT_EQUAL(2, c.ccw);
}

void testReversedSwapsDirection() {
    QuadratureDecoder dec(4, true);
    RotationEvent ev;
    dec.reset(EncoderState::LL);
    dec.feed(EncoderState::LH, ev);
    dec.feed(EncoderState::HH, ev);
    dec.feed(EncoderState::HL, ev);
    TEST_ASSERT_TRUE(dec.feed(EncoderState::LL, ev));
    TEST_ASSERT_TRUE(ev == RotationEvent::CounterClockwise);
}

void testEdgesPerEventValidation() {
    TEST_ASSERT_TRUE(QuadratureDecoder::isValidEdgesPerEvent(1));
    TEST_ASSERT_TRUE(QuadratureDecoder::isValidEdgesPerEvent(2));
    TEST_ASSERT_TRUE(QuadratureDecoder::isValidEdgesPerEvent(4));
    TEST_ASSERT_FALSE(QuadratureDecoder::isValidEdgesPerEvent(0));
    TEST_ASSERT_FALSE(QuadratureDecoder::isValidEdgesPerEvent(3));
    TEST_ASSERT_EQUAL(4, QuadratureDecoder(3).edgesPerEvent());
}

void testStateFromLevels() {
    using kc::PinLevel;
    // arguments are CLK, DT, names are DT first
    TEST_ASSERT_TRUE(kc::encoderState(PinLevel::High, PinLevel::Low) == EncoderState::LH);
    TEST_ASSERT_TRUE(kc::encoderState(PinLevel::Low, PinLevel::High) == EncoderState::HL);
    TEST_ASSERT_TRUE(kc::clkLevel(EncoderState::LH) == PinLevel::High);
    TEST_ASSERT_TRUE(kc::dtLevel(EncoderState::LH) == PinLevel::Low);
    TEST_ASSERT_TRUE(kc::dtLevel(EncoderState::HL) == PinLevel::High);
    TEST_ASSERT_EQUAL_STRING("LH", kc::stateName(EncoderState::LH));
}

extern "C" void app_main() {
    UNITY_BEGIN();
    RUN_TEST(testAdjacentTransitionsEmitOneEvent);
    RUN_TEST(testDoubleBitTransitionsAreIgnored);
    RUN_TEST(testRepeatedStateIsNoOp);
    RUN_TEST(testTransitionTableShape);
    RUN_TEST(testFullClockwiseCycleEmitsOneEvent);
    RUN_TEST(testFullCounterClockwiseCycleEmitsOneEvent);
    RUN_TEST(testEventOnlyAtEndOfDetent);
    RUN_TEST(testBackAndForthCancels);
    RUN_TEST(testDoubleChangeBecomesBaseline);
    RUN_TEST(testReplayIsDeterministic);
    RUN_TEST(testHalfCycleDetents);
    RUN_TEST(testReversedSwapsDirection);
    RUN_TEST(testEdgesPerEventValidation);
    RUN_TEST(testStateFromLevels);
    UNITY_END();
}
