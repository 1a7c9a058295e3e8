#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include "prompt_parser.hpp"

struct ControlButton {
    std::string text;
    std::string payload;   // "pick:<index>" or "pick:dismiss"
};

// Content of a remote control mirroring a prompt. How it is drawn is up to
// the RemoteChat implementation.
struct PromptControl {
    std::string text;                     // full listing: question, labels, descriptions
    std::vector<ControlButton> buttons;   // one row per button, dismiss last
};

// A decoded button press.
struct ControlPick {
    bool dismiss = false;
    int index = -1;
};

// True for free-text placeholder options ("Other", "3. Type something.").
bool is_placeholder_option(const std::string& label, const ControlConfig& config);

// Index of the first placeholder option, if any.
std::optional<int> find_placeholder(const std::vector<PromptOption>& options,
                                    const ControlConfig& config);

// Button text for a label, cut to config.label_max_length code points.
std::string display_label(const std::string& label, const ControlConfig& config);

PromptControl render_prompt_control(const ParsedPrompt& prompt, const ControlConfig& config);

// Decode a button payload. Returns nullopt for anything that is not a pick.
std::optional<ControlPick> decode_pick(const std::string& payload);
