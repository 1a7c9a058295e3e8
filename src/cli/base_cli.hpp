#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <terminal/tmux_session.hpp>
#include <prompt/prompt_state.hpp>
#include <bridge/prompt_monitor.hpp>
#include <bridge/selection_handler.hpp>
#include <bridge/turn_marker.hpp>
#include <bridge/turn_workers.hpp>
#include "console_chat.hpp"

// The local console plays the remote chat; it has a single conversation.
constexpr ChatId CONSOLE_CHAT = 1;

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI();

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_config();
    bool require_session();

    // Build the bridge components from the loaded config.
    void init_bridge();
    void clear_bridge();

    // Returns false if no such command is registered.
    bool execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    std::optional<Config> config;
    std::string config_error;
    std::unique_ptr<TmuxSession> terminal;
    std::unique_ptr<ConsoleChat> chat;
    std::unique_ptr<PromptState> prompt_state;
    std::unique_ptr<PromptMonitor> monitor;
    std::unique_ptr<TurnMarker> marker;
    std::unique_ptr<TurnWorkers> workers;
    std::unique_ptr<SelectionHandler> selection;

    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
