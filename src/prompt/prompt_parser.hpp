#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

struct PromptOption {
    std::string label;
    std::optional<std::string> description;

    bool operator==(const PromptOption& o) const {
        return label == o.label && description == o.description;
    }
    bool operator!=(const PromptOption& o) const { return !(*this == o); }
};

// A selection menu read off the screen. Always holds at least two options.
struct ParsedPrompt {
    std::string question;
    std::vector<PromptOption> options;
    int highlighted_index = 0;

    bool operator==(const ParsedPrompt& o) const {
        return question == o.question && options == o.options &&
               highlighted_index == o.highlighted_index;
    }
    bool operator!=(const ParsedPrompt& o) const { return !(*this == o); }
};

// Detects the host application's interactive selection menu in normalized
// pane text. The host renders menus like:
//
//     Question text here
//
//     › 1. Option A
//         Description of A
//       2. Option B
//
//     Enter to select · ↑/↓ to navigate · Esc to cancel
//
// Detection is anchored on the footer at the bottom of the pane and works
// upward, since scrollback above the menu is arbitrary conversation text.
// Misses are preferred over false detections.
class PromptParser {
public:
    explicit PromptParser(const ParserLimits& limits = ParserLimits{});

    std::optional<ParsedPrompt> parse(const std::string& text) const;

    // True if the navigation footer text appears anywhere in the text.
    static bool has_footer(const std::string& text);

private:
    ParserLimits limits_;

    int find_footer(const std::vector<std::string>& lines) const;
    int find_cursor(const std::vector<std::string>& lines, int footer) const;
    int find_first_option(const std::vector<std::string>& lines, int cursor,
                          size_t label_indent) const;
    std::string find_question(const std::vector<std::string>& lines, int first_option) const;
};

// Line classification helpers, shared with the control renderer's tests.
namespace PromptLines {

// Byte length of "<glyph> " at the start of a trimmed line, 0 if absent.
size_t cursor_prefix_len(const std::string& trimmed_line);

bool is_horizontal_rule(const std::string& line);

// Short runs of dashes used between option groups, e.g. "—" or "--".
bool is_dash_separator(const std::string& trimmed_line);

bool has_box_corner(const std::string& line);

} // namespace PromptLines
