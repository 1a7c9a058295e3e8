#pragma once

#include "base_cli.hpp"
#include <string>

// Forward declarations for command registration
void register_prompt_commands(BaseCLI& cli);
void register_turn_commands(BaseCLI& cli);

class BridgeCLI : public BaseCLI {
public:
    BridgeCLI();

    // Interactive console: the terminal stands in for the remote chat.
    void run_repl();

    // Parse a pane dump (or the live pane when path is empty) and print the
    // detected prompt. Returns a process exit code: 0 found, 1 none, 2 error.
    int run_parse(const std::string& path);

    int run_init_config();

private:
    void register_all_commands();
    void handle_message(const std::string& text);

    bool quit_ = false;
};
