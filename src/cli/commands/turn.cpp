#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

static void do_stop(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    auto outcome = cli.selection->interrupt(CONSOLE_CHAT);
    std::cout << theme::ok(outcome.message);
}

static void do_end(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;
    cli.workers->end_turn();
    std::cout << theme::ok("Turn ended");
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::section("Status");

    if (config_exists()) {
        std::cout << theme::kv("Config", get_config_path().string());
    } else {
        std::cout << theme::kv("Config", "defaults (no config file)");
    }
    if (!cli.require_config()) return;

    const auto& session = cli.config->tmux().session;
    std::cout << theme::kv("Session", cli.terminal->exists()
        ? session : session + " (not found)");
    std::cout << theme::kv("Turn", cli.workers->turn_pending() ? "pending" : "idle");
    std::cout << theme::kv("Marker", cli.marker->path().string());

    auto binding = cli.prompt_state->snapshot();
    if (binding.fingerprint) {
        std::cout << theme::kv("Prompt", fmt::format("{} options, cursor on {}{}",
            binding.options.size(), binding.highlighted_index,
            binding.claimed() ? " (selection in progress)" : ""));
    } else {
        std::cout << theme::kv("Prompt", "-");
    }
    std::cout << "\n";
}

void register_turn_commands(BaseCLI& cli) {
    cli.add_command("/stop", do_stop, "Interrupt the application and end the turn");
    cli.add_command("/end", do_end, "End the turn without interrupting");
    cli.add_command("/status", do_status, "Show session, turn and prompt state");
}
