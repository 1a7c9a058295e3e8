#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

std::time_t now_epoch() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        return used == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        auto nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

size_t utf8_char_len(const std::string& s, size_t pos) {
    auto c = static_cast<unsigned char>(s[pos]);
    size_t len = 1;
    if ((c & 0xE0) == 0xC0) len = 2;
    else if ((c & 0xF0) == 0xE0) len = 3;
    else if ((c & 0xF8) == 0xF0) len = 4;
    return std::min(len, s.size() - pos);
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (size_t i = 0; i < s.size(); i += utf8_char_len(s, i)) n++;
    return n;
}

std::string utf8_prefix(const std::string& s, size_t count) {
    size_t i = 0;
    for (size_t n = 0; n < count && i < s.size(); n++) i += utf8_char_len(s, i);
    return s.substr(0, i);
}

size_t count_codepoint(const std::string& s, const std::string& cp) {
    if (cp.empty()) return 0;
    size_t n = 0;
    for (auto pos = s.find(cp); pos != std::string::npos; pos = s.find(cp, pos + cp.size())) n++;
    return n;
}
