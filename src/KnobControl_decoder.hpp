#pragma once

#include <stdint.h>

#include "KnobControl_gpio.hpp"

namespace kc {

/**
 * \brief Combined level of both encoder pins, DT first, CLK second.
 *
 * LH is DT low and CLK high, so CLK leads on the way LL -> LH -> HH.
 */
enum class EncoderState : uint8_t {
    LL = 0,
    LH = 1,
    HL = 2,
    HH = 3,
};

enum class RotationEvent : uint8_t {
    Clockwise,
    CounterClockwise,
};

inline EncoderState encoderState(PinLevel clk, PinLevel dt) {
    return EncoderState((static_cast<uint8_t>(dt) << 1) | static_cast<uint8_t>(clk));
}

inline PinLevel clkLevel(EncoderState s) { return (static_cast<uint8_t>(s) & 1) ? PinLevel::High : PinLevel::Low; }
inline PinLevel dtLevel(EncoderState s) { return (static_cast<uint8_t>(s) & 2) ? PinLevel::High : PinLevel::Low; }

const char* stateName(EncoderState s);
const char* eventName(RotationEvent ev);

/**
 * \brief Quadrature decoder for a two channel rotary encoder.
 *
 * Clockwise rotation walks the cycle LL -> LH -> HH -> HL -> LL (CLK changes ahead
 * of DT), counter-clockwise walks it backwards. One event is emitted per detent, a detent being edgesPerEvent
 * valid edges in the same direction. A change of both pins at once cannot be decoded:
 * it becomes the new baseline, emits nothing and drops the partially counted detent.
 *
 * Not thread-safe, the owner serializes calls to feed() and reset().
 */
class QuadratureDecoder {
public:
    /**
     * \brief Outcome of a single transition.
     */
    enum Step : int8_t {
        STEP_BACKWARD = -1,
        STEP_NONE = 0,
        STEP_FORWARD = 1,
        STEP_INVALID = 2, //!< both pins changed
    };

    explicit QuadratureDecoder(uint8_t edgesPerEvent = 4, bool reversed = false);

    static bool isValidEdgesPerEvent(uint8_t edges) { return edges == 1 || edges == 2 || edges == 4; }

    /**
     * \brief Classify the transition between two states, without touching any decoder.
     */
    static Step step(EncoderState previous, EncoderState next);

    /**
     * \brief Set the baseline, typically from a synchronous read of both pins.
     */
    void reset(EncoderState state);

    /**
     * \brief Process the state the pins are in after an edge.
     *
     * \param next the new state of the pins
     * \param event filled in when the function returns true
     * \return true if a detent was completed and event holds its direction
     */
    bool feed(EncoderState next, RotationEvent& event);

    EncoderState state() const { return m_state; }
    int8_t pendingEdges() const { return m_accum; } //!< Signed edges counted towards the next detent
    uint8_t edgesPerEvent() const { return m_edges_per_event; }
    bool reversed() const { return m_reversed; }

private:
    EncoderState m_state;
    int8_t m_accum;
    uint8_t m_edges_per_event;
    bool m_reversed;
};

} // namespace kc
