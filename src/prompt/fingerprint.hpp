#pragma once

#include <string>
#include "prompt_parser.hpp"

// Identity of a prompt: its question and ordered labels. Descriptions and the
// highlighted index are left out so reflowed text and cursor movement do not
// make a prompt look new.
std::string prompt_fingerprint(const ParsedPrompt& prompt);
