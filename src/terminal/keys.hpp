#pragma once

#include <string>
#include <vector>

// Named key presses understood by the host application's menus.
enum class Key {
    Up,
    Down,
    Enter,
    Escape,
};

using KeySequence = std::vector<Key>;

// tmux send-keys name for a key.
inline const char* tmux_key_name(Key key) {
    switch (key) {
        case Key::Up:     return "Up";
        case Key::Down:   return "Down";
        case Key::Enter:  return "Enter";
        case Key::Escape: return "Escape";
    }
    return "";
}
