#pragma once

#include <terminal/terminal_session.hpp>
#include <core/types.hpp>

// Turns "pick option N" into the arrow presses and Enter the host menu expects.
// The menu moves relative to its cursor, so the caller supplies where the
// cursor was last seen; a stale index lands on the wrong option.
class SelectionTranslator {
public:
    SelectionTranslator(TerminalSession& terminal, const KeyConfig& keys);

    // Directional keys from current to target, then Enter.
    static KeySequence plan(int target_index, int current_index);

    // Send plan(target, current). Keys are spaced by move_delay_ms so the
    // host's input polling sees each one.
    void select(int target_index, int current_index);

    // Move the cursor to target without confirming.
    void focus(int target_index, int current_index);

private:
    TerminalSession& terminal_;
    KeyConfig keys_;

    void send_moves(int target_index, int current_index);
};
