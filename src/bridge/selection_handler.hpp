#pragma once

#include <string>
#include <core/types.hpp>
#include <prompt/prompt_state.hpp>
#include <terminal/terminal_session.hpp>
#include "prompt_monitor.hpp"
#include "remote_chat.hpp"
#include "selection_translator.hpp"
#include "turn_marker.hpp"

enum class SelectionStatus {
    Selected,
    Dismissed,
    Stale,          // the tracked options no longer cover the request
    Invalid,        // malformed request
    BlindPick,      // no prompt tracked; keys sent anyway
    Interrupted,
    Answered,       // free text typed into the prompt
    NoPrompt,       // free text not consumed; no prompt on screen
    Busy,           // another selection is still driving the prompt
};

struct SelectionOutcome {
    SelectionStatus status;
    std::string message;   // reply for the user
};

// Entry points for remote events that act on the mirrored prompt.
//
// A selection claims the prompt before touching the terminal: the options and
// cursor index are read and the control detached in one critical section,
// with the fingerprint left in place. A monitor tick running meanwhile then
// sees "same prompt, claimed" and neither retracts nor republishes it.
class SelectionHandler {
public:
    SelectionHandler(PromptState& state, PromptMonitor& monitor, TerminalSession& terminal,
                     RemoteChat& chat, TurnMarker& marker,
                     const KeyConfig& keys, const ControlConfig& control);

    // A control button press carrying payload ("pick:<n>" / "pick:dismiss").
    SelectionOutcome on_callback(ChatId chat, const std::string& payload);

    SelectionOutcome on_selection(ChatId chat, int index);
    SelectionOutcome on_dismiss(ChatId chat);

    // Textual pick: an index, or "dismiss" / "esc" / "escape". With no prompt
    // tracked an index is sent blind as that many Down presses and Enter.
    SelectionOutcome pick(ChatId chat, const std::string& arg);

    // Answer an on-screen prompt with free text. NoPrompt means the text
    // should go to the terminal as a message instead.
    SelectionOutcome on_free_text(ChatId chat, const std::string& text);

    // Escape the host application, end the turn and retract any control.
    SelectionOutcome interrupt(ChatId chat);

private:
    PromptState& state_;
    PromptMonitor& monitor_;
    TerminalSession& terminal_;
    RemoteChat& chat_;
    TurnMarker& marker_;
    KeyConfig keys_;
    ControlConfig control_;
    SelectionTranslator translator_;

    void retract(const ControlHandle& handle, const std::string& status);
};
