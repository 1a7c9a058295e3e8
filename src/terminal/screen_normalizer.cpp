#include "screen_normalizer.hpp"
#include <algorithm>

namespace ScreenNormalizer {

static constexpr char ESC = '\033';
static constexpr char BEL = '\007';

// Index just past a CSI sequence whose parameters start at i.
static size_t skip_csi(const std::string& s, size_t i) {
    size_t n = s.size();
    while (i < n && s[i] >= 0x30 && s[i] <= 0x3F) i++;  // parameters, incl. ? > ;
    while (i < n && s[i] >= 0x20 && s[i] <= 0x2F) i++;  // intermediates
    if (i < n && s[i] >= 0x40 && s[i] <= 0x7E) i++;     // final byte
    return i;
}

// Index just past an OSC sequence whose payload starts at i.
// Terminated by BEL or ST (ESC \); an unterminated OSC runs to the end.
static size_t skip_osc(const std::string& s, size_t i) {
    size_t n = s.size();
    while (i < n) {
        if (s[i] == BEL) return i + 1;
        if (s[i] == ESC && i + 1 < n && s[i + 1] == '\\') return i + 2;
        i++;
    }
    return n;
}

std::string normalize(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    size_t n = raw.size();

    for (size_t i = 0; i < n; ) {
        char c = raw[i];
        if (c == ESC) {
            if (i + 1 >= n) break;
            char kind = raw[i + 1];
            if (kind == '[') {
                i = skip_csi(raw, i + 2);
            } else if (kind == ']') {
                i = skip_osc(raw, i + 2);
            } else if (kind == '(' || kind == ')' || kind == '*' || kind == '+') {
                i = std::min(i + 3, n);
            } else {
                i += 2;
            }
        } else if (c == '\r') {
            i++;
        } else {
            out += c;
            i++;
        }
    }
    return out;
}

} // namespace ScreenNormalizer
