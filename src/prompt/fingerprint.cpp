#include "fingerprint.hpp"

// ASCII unit separator; never rendered by the host application.
static constexpr char FIELD_SEP = '\x1f';

std::string prompt_fingerprint(const ParsedPrompt& prompt) {
    std::string fp = prompt.question;
    for (const auto& opt : prompt.options) {
        fp += FIELD_SEP;
        fp += opt.label;
    }
    return fp;
}
