#pragma once

#include <string>

// Plain-text view of a raw pane snapshot.
//
// Column positions carry meaning downstream (option labels vs. wrapped
// descriptions), so only escape sequences and carriage returns are removed;
// newlines, spaces and tabs come through untouched.
namespace ScreenNormalizer {

// Strip CSI, OSC, charset designation and other two-byte escape sequences.
// Total and idempotent.
std::string normalize(const std::string& raw);

} // namespace ScreenNormalizer
