#include "bridge_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <prompt/fingerprint.hpp>
#include <prompt/prompt_parser.hpp>
#include <terminal/screen_normalizer.hpp>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <cstdlib>

#include <readline/readline.h>
#include <readline/history.h>

BridgeCLI::BridgeCLI() {
    init_bridge();
    register_all_commands();
}

void BridgeCLI::register_all_commands() {
    add_command("/help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("/quit", [this](BaseCLI& cli, const std::string& arg) {
        quit_ = true;
    }, "Exit (the running turn keeps its marker)");

    register_prompt_commands(*this);
    register_turn_commands(*this);
}

void BridgeCLI::handle_message(const std::string& text) {
    if (!require_session()) return;

    // An on-screen prompt takes the text as its answer
    auto answer = selection->on_free_text(CONSOLE_CHAT, text);
    if (answer.status == SelectionStatus::Answered) {
        std::cout << theme::ok(answer.message);
        return;
    }
    if (answer.status == SelectionStatus::Busy) {
        std::cout << theme::fail(answer.message);
        return;
    }

    auto r = workers->forward_message(CONSOLE_CHAT, text);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return;
    }
    std::cout << theme::dim(fmt::format("    sent to {}", config->tmux().session)) << "\n";
}

void BridgeCLI::run_repl() {
    if (!require_config()) return;

    std::cout << theme::banner(config->tmux().session);
    if (!terminal->exists()) {
        std::cout << theme::fail(fmt::format("tmux session '{}' not found",
                                             config->tmux().session));
        std::cout << theme::step("Start it with: tmux new -s " + config->tmux().session);
    }
    std::cout << theme::dim("    /help for commands") << "\n\n";
    bridge_log("cli: repl started");

    std::string line;
    while (!quit_) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);
        trim(line);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        if (line[0] != '/') {
            handle_message(line);
            continue;
        }

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        if (!execute_command(to_lower(command), args)) {
            std::cout << theme::fail("Unknown command: " + command);
            std::cout << theme::step("Type '/help' for available commands.");
        }
    }

    // Cleanup
    clear_bridge();
    bridge_log("cli: repl exited");
}

int BridgeCLI::run_parse(const std::string& path) {
    if (!require_config()) return 2;

    std::string raw;
    if (path.empty()) {
        auto snap = terminal->capture_snapshot();
        if (snap.is_err()) {
            std::cout << theme::fail("Capture failed: " + snap.error);
            return 2;
        }
        raw = snap.value;
    } else {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            std::cout << theme::fail("Cannot read " + path);
            return 2;
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        raw = ss.str();
    }

    PromptParser parser(config->parser());
    auto parsed = parser.parse(ScreenNormalizer::normalize(raw));
    if (!parsed) {
        std::cout << theme::info("No interactive prompt detected.");
        return 1;
    }

    std::cout << theme::section("Prompt");
    std::cout << theme::kv("Question", parsed->question);
    for (size_t i = 0; i < parsed->options.size(); i++) {
        const auto& opt = parsed->options[i];
        bool cursor = static_cast<int>(i) == parsed->highlighted_index;
        std::cout << (cursor ? theme::color::TEAL + "  > " : std::string("    "))
                  << fmt::format("[{}] {}", i, opt.label) << theme::color::RESET << "\n";
        if (opt.description) {
            std::cout << theme::dim("          " + *opt.description) << "\n";
        }
    }

    std::string fp = prompt_fingerprint(*parsed);
    for (auto& c : fp) {
        if (c == '\x1f') c = '|';
    }
    std::cout << "\n" << theme::kv("Identity", fp) << "\n";
    return 0;
}

int BridgeCLI::run_init_config() {
    bool existed = config_exists();
    auto r = create_default_config();
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    if (existed) {
        std::cout << theme::info("Config already exists: " + get_config_path().string());
    } else {
        std::cout << theme::ok("Wrote " + get_config_path().string());
    }
    return 0;
}
