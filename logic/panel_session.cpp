/*
 * Panel Session Implementation
 */

#include "logic/panel_session.hpp"

EpdStatus session_check(const PanelSession &session, SessionOp op) {
    if (session.state != SessionState::Initialized) {
        return EpdStatus::ProtocolStateError;
    }

    if (op == SessionOp::DisplayPartial && session.mode != PanelMode::Partial) {
        return EpdStatus::ProtocolStateError;
    }

    return EpdStatus::Ok;
}

void session_on_init(PanelSession &session, PanelMode mode) {
    session.state = SessionState::Initialized;
    session.mode = mode;
    session.partial_seeded = false;
}

void session_on_sleep(PanelSession &session) {
    session.state = SessionState::Sleeping;
    session.partial_seeded = false;
}

void session_on_fault(PanelSession &session) {
    session.state = SessionState::Faulted;
    session.partial_seeded = false;
}

const char *session_state_label(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "UNINITIALIZED";
        case SessionState::Initialized:   return "INITIALIZED";
        case SessionState::Sleeping:      return "SLEEPING";
        case SessionState::Faulted:       return "FAULTED";
    }
    return "UNKNOWN";
}

const char *panel_mode_label(PanelMode mode) {
    switch (mode) {
        case PanelMode::Full:    return "FULL";
        case PanelMode::Fast:    return "FAST";
        case PanelMode::Partial: return "PARTIAL";
    }
    return "UNKNOWN";
}
