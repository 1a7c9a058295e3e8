#pragma once

#include <string>
#include <vector>
#include <ctime>

// Seconds since the Unix epoch.
std::time_t now_epoch();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

// Number of leading space/tab bytes.
inline size_t leading_whitespace(const std::string& s) {
    auto pos = s.find_first_not_of(" \t");
    return pos == std::string::npos ? s.size() : pos;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

std::string to_lower(std::string s);

std::vector<std::string> split_lines(const std::string& text);

// ── UTF-8 ───────────────────────────────────────────────────

// Byte length of the code point starting at s[pos] (1 for invalid lead bytes).
size_t utf8_char_len(const std::string& s, size_t pos);

// Number of code points in s.
size_t utf8_length(const std::string& s);

// First `count` code points of s.
std::string utf8_prefix(const std::string& s, size_t count);

// Count occurrences of a (multi-byte) code point.
size_t count_codepoint(const std::string& s, const std::string& cp);
