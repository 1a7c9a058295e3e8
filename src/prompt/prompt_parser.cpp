#include "prompt_parser.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <algorithm>

namespace {

// ❯  ›  >
const char* const CURSOR_GLYPHS[] = {"\xe2\x9d\xaf", "\xe2\x80\xba", ">"};

// ╭ ╮ ╰ ╯
const char* const BOX_CORNERS[] = {"\xe2\x95\xad", "\xe2\x95\xae", "\xe2\x95\xb0", "\xe2\x95\xaf"};

const char* const RULE_CHAR = "\xe2\x94\x80";  // ─

// ─ — – -
const char* const DASH_CHARS[] = {"\xe2\x94\x80", "\xe2\x80\x94", "\xe2\x80\x93", "-"};

} // namespace

namespace PromptLines {

size_t cursor_prefix_len(const std::string& s) {
    for (const char* glyph : CURSOR_GLYPHS) {
        std::string g(glyph);
        if (starts_with(s, g) && s.size() > g.size() && s[g.size()] == ' ')
            return g.size() + 1;
    }
    return 0;
}

bool is_horizontal_rule(const std::string& line) {
    std::string s = trimmed(line);
    size_t len = utf8_length(s);
    return len > 10 && count_codepoint(s, RULE_CHAR) * 10 > len * 7;
}

bool is_dash_separator(const std::string& s) {
    if (s.empty() || utf8_length(s) > 3) return false;
    for (size_t i = 0; i < s.size(); ) {
        size_t len = utf8_char_len(s, i);
        bool dash = false;
        for (const char* d : DASH_CHARS) {
            if (s.compare(i, len, d) == 0) { dash = true; break; }
        }
        if (!dash) return false;
        i += len;
    }
    return true;
}

bool has_box_corner(const std::string& line) {
    for (const char* corner : BOX_CORNERS) {
        if (contains(line, corner)) return true;
    }
    return false;
}

} // namespace PromptLines

using namespace PromptLines;

PromptParser::PromptParser(const ParserLimits& limits) : limits_(limits) {}

bool PromptParser::has_footer(const std::string& text) {
    return contains(text, FOOTER_NAVIGATE_WORD) && contains(text, FOOTER_SELECT_WORD);
}

int PromptParser::find_footer(const std::vector<std::string>& lines) const {
    int seen = 0;
    for (int i = static_cast<int>(lines.size()) - 1; i >= 0 && seen < limits_.footer_window; --i) {
        std::string s = trimmed(lines[i]);
        if (s.empty()) continue;
        seen++;
        if (starts_with(s, FOOTER_CONFIRM_WORD) && contains(s, FOOTER_NAVIGATE_WORD))
            return i;
    }
    return -1;
}

int PromptParser::find_cursor(const std::vector<std::string>& lines, int footer) const {
    int stop = std::max(footer - limits_.cursor_window, 0);
    for (int i = footer - 1; i >= stop; --i) {
        if (cursor_prefix_len(trimmed(lines[i])) > 0) return i;
    }
    return -1;
}

int PromptParser::find_first_option(const std::vector<std::string>& lines, int cursor,
                                    size_t label_indent) const {
    int first = cursor;
    int stop = std::max(cursor - limits_.option_window, 0);
    for (int i = cursor - 1; i >= stop; --i) {
        const std::string& line = lines[i];
        if (trimmed(line).empty()) break;
        if (is_horizontal_rule(line) || has_box_corner(line)) break;
        if (leading_whitespace(line) > label_indent) continue;  // wrapped description
        first = i;
    }
    return first;
}

std::string PromptParser::find_question(const std::vector<std::string>& lines,
                                        int first_option) const {
    int stop = std::max(first_option - limits_.question_window, 0);
    for (int i = first_option - 1; i >= stop; --i) {
        std::string s = trimmed(lines[i]);
        if (s.empty()) continue;
        if (is_horizontal_rule(lines[i]) || has_box_corner(s)) break;
        if (utf8_length(s) > limits_.min_question_length) return s;
    }
    return "";
}

std::optional<ParsedPrompt> PromptParser::parse(const std::string& text) const {
    std::vector<std::string> lines = split_lines(text);

    int footer = find_footer(lines);
    if (footer < 0) return std::nullopt;

    int cursor = find_cursor(lines, footer);
    if (cursor < 0) return std::nullopt;

    size_t label_indent = leading_whitespace(lines[cursor]) + 2;
    int first_option = find_first_option(lines, cursor, label_indent);

    ParsedPrompt prompt;
    prompt.question = find_question(lines, first_option);
    if (prompt.question.empty()) prompt.question = FALLBACK_QUESTION;

    for (int i = first_option; i < footer; ++i) {
        const std::string& line = lines[i];
        std::string s = trimmed(line);
        if (s.empty()) continue;
        if (contains(s, FOOTER_NAVIGATE_WORD)) break;
        if (is_horizontal_rule(line) || is_dash_separator(s)) continue;

        size_t glyph = cursor_prefix_len(s);
        if (glyph > 0) {
            prompt.highlighted_index = static_cast<int>(prompt.options.size());
            prompt.options.push_back({s.substr(glyph), std::nullopt});
        } else if (leading_whitespace(line) <= label_indent) {
            prompt.options.push_back({s, std::nullopt});
        } else if (!prompt.options.empty()) {
            auto& desc = prompt.options.back().description;
            if (desc) *desc += " " + s;
            else desc = s;
        }
    }

    if (prompt.options.size() < 2) return std::nullopt;
    return prompt;
}
