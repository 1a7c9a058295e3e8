#include "selection_handler.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <prompt/prompt_control.hpp>
#include <fmt/format.h>
#include <climits>

SelectionHandler::SelectionHandler(PromptState& state, PromptMonitor& monitor,
                                   TerminalSession& terminal, RemoteChat& chat,
                                   TurnMarker& marker, const KeyConfig& keys,
                                   const ControlConfig& control)
    : state_(state), monitor_(monitor), terminal_(terminal), chat_(chat), marker_(marker),
      keys_(keys), control_(control), translator_(terminal, keys) {}

void SelectionHandler::retract(const ControlHandle& handle, const std::string& status) {
    auto r = chat_.retract_control(handle, status);
    if (r.is_err()) {
        bridge_log(fmt::format("select: retract of message {} failed: {}",
                               handle.message_id, r.error));
    }
}

// ── Button presses ──────────────────────────────────────────

SelectionOutcome SelectionHandler::on_callback(ChatId chat, const std::string& payload) {
    auto pick = decode_pick(payload);
    if (!pick) return {SelectionStatus::Invalid, "Invalid selection"};
    if (pick->dismiss) return on_dismiss(chat);
    return on_selection(chat, pick->index);
}

SelectionOutcome SelectionHandler::on_selection(ChatId chat, int index) {
    auto claim = state_.claim(index);
    if (!claim) {
        size_t count = state_.option_count();
        bridge_log(fmt::format("select: stale pick target={} options={} chat={}",
                               index, count, chat));
        return {SelectionStatus::Stale,
                fmt::format("Prompt may have changed (options={}, target={}). "
                            "Use /screenshot to check.", count, index)};
    }

    const std::string label = claim->options[index].label;
    bridge_log(fmt::format("select: '{}' target={} highlighted={}",
                           label, index, claim->highlighted_index));

    translator_.select(index, claim->highlighted_index);

    // Retract before releasing the claim so no tick refreshes options behind a live control
    std::string status = "Selected: " + label;
    if (claim->control) retract(*claim->control, status);
    state_.finish_claim(claim->token);
    return {SelectionStatus::Selected, status};
}

SelectionOutcome SelectionHandler::on_dismiss(ChatId chat) {
    terminal_.send_key(Key::Escape);
    auto control = state_.release();
    if (control) retract(*control, STATUS_DISMISSED);
    bridge_log(fmt::format("select: dismissed by chat {}", chat));
    return {SelectionStatus::Dismissed, STATUS_DISMISSED};
}

// ── Text commands ───────────────────────────────────────────

SelectionOutcome SelectionHandler::pick(ChatId chat, const std::string& arg) {
    std::string value = to_lower(trimmed(arg));
    if (value.empty())
        return {SelectionStatus::Invalid, "Usage: /pick <number>"};

    if (value == "dismiss" || value == "esc" || value == "escape") {
        terminal_.send_key(Key::Escape);
        return {SelectionStatus::Dismissed, "Sent Escape"};
    }

    int target = safe_stoi(value, INT_MIN);
    if (target == INT_MIN)
        return {SelectionStatus::Invalid, "Usage: /pick <number> (0-based index)"};

    size_t count = state_.option_count();
    if (target < 0) {
        return {SelectionStatus::Stale, count == 0
            ? std::string("Index out of range. No active prompt tracked.")
            : fmt::format("Index out of range. Valid: 0-{}", count - 1)};
    }
    if (count == 0) {
        translator_.select(target, 0);
        return {SelectionStatus::BlindPick,
                fmt::format("Sent {} Down arrow(s) + Enter (no active prompt tracked)", target)};
    }

    auto outcome = on_selection(chat, target);
    if (outcome.status == SelectionStatus::Stale)
        outcome.message = fmt::format("Index out of range. Valid: 0-{}", count - 1);
    return outcome;
}

SelectionOutcome SelectionHandler::on_free_text(ChatId chat, const std::string& text) {
    if (!monitor_.check_and_show(chat)) return {SelectionStatus::NoPrompt, ""};

    auto claim = state_.claim();
    if (!claim) {
        bridge_log(fmt::format("select: free text from chat {} while a selection is in progress", chat));
        return {SelectionStatus::Busy, "A selection is in progress. Try again in a moment."};
    }

    auto placeholder = find_placeholder(claim->options, control_);
    if (placeholder) {
        // Moving onto the placeholder switches the menu to text input; no Enter yet
        translator_.focus(*placeholder, claim->highlighted_index);
        platform::sleep_ms(FREE_TEXT_SETTLE_MS);
    } else {
        terminal_.send_key(Key::Escape);
        platform::sleep_ms(keys_.escape_settle_ms);
    }
    terminal_.send_text(text);
    terminal_.send_key(Key::Enter);

    bridge_log(fmt::format("select: free-text answer ({}) for chat {}",
                           placeholder ? "placeholder" : "escaped", chat));
    std::string status = "Custom answer: " + utf8_prefix(text, CUSTOM_ANSWER_PREVIEW_CHARS);
    if (claim->control) retract(*claim->control, status);
    state_.finish_claim(claim->token);
    return {SelectionStatus::Answered, status};
}

SelectionOutcome SelectionHandler::interrupt(ChatId chat) {
    terminal_.send_key(Key::Escape);
    marker_.clear();
    auto control = state_.release();
    if (control) retract(*control, STATUS_INTERRUPTED);
    bridge_log(fmt::format("select: interrupted by chat {}", chat));
    return {SelectionStatus::Interrupted, "Interrupted"};
}
