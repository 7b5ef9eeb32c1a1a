#include "KnobControl_decoder.hpp"

namespace kc {

static const auto F = QuadratureDecoder::STEP_FORWARD;
static const auto B = QuadratureDecoder::STEP_BACKWARD;
static const auto N = QuadratureDecoder::STEP_NONE;
static const auto X = QuadratureDecoder::STEP_INVALID;

// Indexed by (previous << 2) | next.
static const QuadratureDecoder::Step TRANSITIONS[16] = {
    //  to LL  LH  HL  HH
    /* LL */ N, F, B, X,
    /* LH */ B, N, X, F,
    /* HL */ F, X, N, B,
    /* HH */ X, B, F, N,
};

const char* stateName(EncoderState s) {
    static const char* names[] = { "LL", "LH", "HL", "HH" };
    return names[static_cast<uint8_t>(s) & 3];
}

const char* eventName(RotationEvent ev) {
    return ev == RotationEvent::Clockwise ? "clockwise" : "counter-clockwise";
}

QuadratureDecoder::QuadratureDecoder(uint8_t edgesPerEvent, bool reversed)
    : m_state(EncoderState::LL)
    , m_accum(0)
    , m_edges_per_event(isValidEdgesPerEvent(edgesPerEvent) ? edgesPerEvent : 4)
    , m_reversed(reversed) {
}

QuadratureDecoder::Step QuadratureDecoder::step(EncoderState previous, EncoderState next) {
    return TRANSITIONS[(static_cast<uint8_t>(previous) << 2) | static_cast<uint8_t>(next)];
}

void QuadratureDecoder::reset(EncoderState state) {
    m_state = state;
    m_accum = 0;
}

bool QuadratureDecoder::feed(EncoderState next, RotationEvent& event) {
    const auto s = step(m_state, next);
    m_state = next;

    switch (s) {
    case STEP_NONE:
        return false;
    case STEP_INVALID:
        m_accum = 0;
        return false;
    case STEP_FORWARD:
    case STEP_BACKWARD:
        break;
    }

    m_accum += s;
    if (m_accum >= m_edges_per_event) {
        m_accum = 0;
        event = m_reversed ? RotationEvent::CounterClockwise : RotationEvent::Clockwise;
        return true;
    } else if (m_accum <= -m_edges_per_event) {
        m_accum = 0;
        event = m_reversed ? RotationEvent::Clockwise : RotationEvent::CounterClockwise;
        return true;
    }
    return false;
}

} // namespace kc
