#include "selection_translator.hpp"
#include <platform/platform.hpp>
#include <cstdlib>

SelectionTranslator::SelectionTranslator(TerminalSession& terminal, const KeyConfig& keys)
    : terminal_(terminal), keys_(keys) {}

KeySequence SelectionTranslator::plan(int target_index, int current_index) {
    int delta = target_index - current_index;
    KeySequence keys(std::abs(delta), delta > 0 ? Key::Down : Key::Up);
    keys.push_back(Key::Enter);
    return keys;
}

void SelectionTranslator::send_moves(int target_index, int current_index) {
    int delta = target_index - current_index;
    Key key = delta > 0 ? Key::Down : Key::Up;
    for (int i = 0; i < std::abs(delta); i++) {
        terminal_.send_key(key);
        platform::sleep_ms(keys_.move_delay_ms);
    }
}

void SelectionTranslator::select(int target_index, int current_index) {
    send_moves(target_index, current_index);
    platform::sleep_ms(keys_.confirm_delay_ms);
    terminal_.send_key(Key::Enter);
}

void SelectionTranslator::focus(int target_index, int current_index) {
    send_moves(target_index, current_index);
}
