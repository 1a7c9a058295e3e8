#pragma once

#include <functional>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <prompt/prompt_parser.hpp>
#include <prompt/prompt_state.hpp>
#include <terminal/terminal_session.hpp>
#include "remote_chat.hpp"

struct MonitorSettings {
    MonitorConfig monitor;
    ParserLimits parser;
    ControlConfig control;
};

// What one reconciliation step did.
enum class TickOutcome {
    CaptureFailed,   // no snapshot; state untouched
    NoPrompt,        // nothing on screen, nothing bound
    Resolved,        // prompt gone; binding cleared
    Unchanged,       // same prompt as bound; options refreshed
    Claimed,         // same prompt, a selection is in progress; left alone
    Published,       // new or changed prompt published
};

const char* tick_outcome_name(TickOutcome outcome);

// Keeps the remote control in step with the menu on screen for one turn.
class PromptMonitor {
public:
    PromptMonitor(PromptState& state, TerminalSession& terminal, RemoteChat& chat,
                  const MonitorSettings& settings);

    // Capture, parse and reconcile once.
    TickOutcome reconcile(ChatId chat);

    // Reconcile an already-parsed screen (nullopt = no prompt).
    TickOutcome apply(ChatId chat, const std::optional<ParsedPrompt>& parsed);

    // Synchronous check used before treating a message as free text.
    // True if a prompt is on screen (and now mirrored).
    bool check_and_show(ChatId chat);

    // Poll until turn_is_pending() turns false, then tear down.
    void run(ChatId chat, const std::function<bool()>& turn_is_pending);

    // Retract any bound control with "Request completed" and clear state.
    void teardown();

private:
    PromptState& state_;
    TerminalSession& terminal_;
    RemoteChat& chat_;
    MonitorSettings settings_;
    PromptParser parser_;

    // nullopt when the snapshot could not be taken.
    std::optional<std::optional<ParsedPrompt>> capture_and_parse();
    void retract(const ControlHandle& handle, const char* status);
};
