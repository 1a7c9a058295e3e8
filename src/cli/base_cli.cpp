#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error = config_result.error;
    }
}

BaseCLI::~BaseCLI() {
    clear_bridge();
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail("Config could not be loaded: " + config_error);
        std::cout << theme::step("Fix " + get_config_path().string() + " or run 'panebridge init-config'.");
        return false;
    }
    return true;
}

bool BaseCLI::require_session() {
    if (!require_config()) {
        return false;
    }
    if (!terminal || !terminal->exists()) {
        std::cout << theme::fail(fmt::format("tmux session '{}' not found",
                                             config->tmux().session));
        return false;
    }
    return true;
}

void BaseCLI::init_bridge() {
    if (!config) return;
    const Config& c = config.value();

    MonitorSettings settings{c.monitor(), c.parser(), c.control()};

    terminal = std::make_unique<TmuxSession>(c.tmux());
    chat = std::make_unique<ConsoleChat>();
    prompt_state = std::make_unique<PromptState>();
    monitor = std::make_unique<PromptMonitor>(*prompt_state, *terminal, *chat, settings);
    marker = std::make_unique<TurnMarker>(c.turn());
    workers = std::make_unique<TurnWorkers>(*marker, *monitor, *chat, *terminal,
                                            c.monitor(), c.keys());
    selection = std::make_unique<SelectionHandler>(*prompt_state, *monitor, *terminal, *chat,
                                                   *marker, c.keys(), c.control());
}

void BaseCLI::clear_bridge() {
    // Workers reference everything else; stop them first
    if (workers) workers->shutdown();
    selection.reset();
    workers.reset();
    marker.reset();
    monitor.reset();
    prompt_state.reset();
    chat.reset();
    terminal.reset();
}

bool BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        return false;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
    return true;
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Prompt",  {"/pick", "/dismiss", "/prompt", "/screen"}},
        {"Turn",    {"/stop", "/end", "/status"}},
        {"General", {"/help", "/quit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::AMBER << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::TEAL
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n" << theme::dim("    Anything else is sent to the terminal as a message.") << "\n\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string session = config ? config->tmux().session : "?";
    return rl_esc(theme::color::TEAL) + "panebridge"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::AMBER) + session
         + rl_esc(theme::color::RESET) + "> ";
}
