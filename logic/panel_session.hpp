/*
 * Panel Session - Lifecycle state machine for one physical panel
 * Pure logic, no hardware dependency. Testable on host.
 *
 *   Uninitialized --init*--> Initialized(mode) --sleep--> Sleeping
 *          ^                   |      ^                    |
 *          |                   | fault|init*               | init*
 *          +---- Faulted <-----+      +--------------------+
 *
 * Every state accepts init*. Refresh operations need Initialized; the
 * partial refresh additionally needs mode == Partial.
 */

#ifndef PANEL_SESSION_HPP
#define PANEL_SESSION_HPP

#include "types.h"
#include <cstdint>

enum class SessionOp : uint8_t {
    Display,         /* display(black, red) */
    Clear,
    BaseColor,       /* display_base_color() */
    DisplayPartial,
    Sleep
};

struct PanelSession {
    SessionState state = SessionState::Uninitialized;
    PanelMode mode = PanelMode::Full;
    bool partial_seeded = false;   /* Partial RAM holds a defined baseline */
};

/*
 * Check whether op may be issued in the current state.
 * Returns Ok or ProtocolStateError. Never mutates the session.
 */
EpdStatus session_check(const PanelSession &session, SessionOp op);

/* Init variant completed: enter Initialized(mode), partial baseline lost */
void session_on_init(PanelSession &session, PanelMode mode);

/* Deep sleep entered */
void session_on_sleep(PanelSession &session);

/* Transport failure or busy deadline: state is indeterminate */
void session_on_fault(PanelSession &session);

const char *session_state_label(SessionState state);
const char *panel_mode_label(PanelMode mode);

#endif /* PANEL_SESSION_HPP */
