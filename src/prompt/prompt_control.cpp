#include "prompt_control.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cctype>

// Strip a leading "<digits>." enumeration, then normalize case and a trailing period.
static std::string placeholder_key(const std::string& label) {
    std::string s = trimmed(label);
    size_t i = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) i++;
    if (i > 0 && i < s.size() && s[i] == '.') s.erase(0, i + 1);
    s = to_lower(trimmed(s));
    while (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

bool is_placeholder_option(const std::string& label, const ControlConfig& config) {
    std::string key = placeholder_key(label);
    for (const auto& p : config.placeholders) {
        if (key == to_lower(p)) return true;
    }
    return false;
}

std::optional<int> find_placeholder(const std::vector<PromptOption>& options,
                                    const ControlConfig& config) {
    for (size_t i = 0; i < options.size(); i++) {
        if (is_placeholder_option(options[i].label, config)) return static_cast<int>(i);
    }
    return std::nullopt;
}

std::string display_label(const std::string& label, const ControlConfig& config) {
    if (utf8_length(label) <= config.label_max_length) return label;
    return utf8_prefix(label, config.label_max_length) + "...";
}

PromptControl render_prompt_control(const ParsedPrompt& prompt, const ControlConfig& config) {
    PromptControl control;

    control.text = fmt::format("{}\n\n{}\n", CONTROL_HEADER, prompt.question);
    for (const auto& opt : prompt.options) {
        if (opt.description)
            control.text += fmt::format("\n  {}\n    {}", opt.label, *opt.description);
        else
            control.text += fmt::format("\n  {}", opt.label);
    }
    control.text += fmt::format("\n\n{}", CONTROL_TRAILER);

    // Placeholders only decline the menu in the host app; typing a message covers them.
    for (size_t i = 0; i < prompt.options.size(); i++) {
        const auto& label = prompt.options[i].label;
        if (is_placeholder_option(label, config)) continue;
        control.buttons.push_back({display_label(label, config),
                                   fmt::format("{}{}", PICK_PREFIX, i)});
    }
    control.buttons.push_back({DISMISS_BUTTON_TEXT, PICK_DISMISS});
    return control;
}

std::optional<ControlPick> decode_pick(const std::string& payload) {
    if (!starts_with(payload, PICK_PREFIX)) return std::nullopt;
    ControlPick pick;
    if (payload == PICK_DISMISS) {
        pick.dismiss = true;
        return pick;
    }
    std::string value = payload.substr(std::string(PICK_PREFIX).size());
    if (value.empty()) return std::nullopt;
    int index = safe_stoi(value, -1);
    if (index < 0) return std::nullopt;
    pick.index = index;
    return pick;
}
