#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>
#include <terminal/screen_normalizer.hpp>

static void print_outcome(const SelectionOutcome& outcome) {
    switch (outcome.status) {
        case SelectionStatus::Selected:
        case SelectionStatus::Dismissed:
        case SelectionStatus::Interrupted:
        case SelectionStatus::Answered:
            std::cout << theme::ok(outcome.message);
            break;
        case SelectionStatus::BlindPick:
            std::cout << theme::info(outcome.message);
            break;
        case SelectionStatus::NoPrompt:
            std::cout << theme::info("No interactive prompt on screen.");
            break;
        case SelectionStatus::Stale:
        case SelectionStatus::Invalid:
        case SelectionStatus::Busy:
            std::cout << theme::fail(outcome.message);
            break;
    }
}

static void do_pick(BaseCLI& cli, const std::string& arg) {
    if (trimmed(arg).empty()) {
        std::cout << theme::step("Usage: /pick <number>");
        std::cout << theme::dim("    Selects option N from the current interactive prompt.") << "\n";
        return;
    }
    if (!cli.require_session()) return;
    print_outcome(cli.selection->pick(CONSOLE_CHAT, arg));
}

static void do_dismiss(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    print_outcome(cli.selection->on_dismiss(CONSOLE_CHAT));
}

static void do_prompt(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    if (!cli.monitor->check_and_show(CONSOLE_CHAT)) {
        std::cout << theme::info("No interactive prompt on screen.");
        return;
    }
    auto binding = cli.prompt_state->snapshot();
    std::cout << theme::kv("Options", std::to_string(binding.options.size()));
    std::cout << theme::kv("Cursor", std::to_string(binding.highlighted_index));
    std::cout << theme::kv("Control", binding.control
        ? fmt::format("#{}", binding.control->message_id) : std::string("-"));
}

static void do_screen(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    auto snap = cli.terminal->capture_snapshot();
    if (snap.is_err()) {
        std::cout << theme::fail("Capture failed: " + snap.error);
        return;
    }

    int count = safe_stoi(trimmed(arg), 25);
    if (count <= 0) count = 25;
    auto lines = split_lines(ScreenNormalizer::normalize(snap.value));
    while (!lines.empty() && trimmed(lines.back()).empty()) lines.pop_back();
    size_t start = lines.size() > static_cast<size_t>(count) ? lines.size() - count : 0;

    std::cout << theme::section("Screen");
    for (size_t i = start; i < lines.size(); i++) {
        std::cout << theme::dim("  | ") << lines[i] << "\n";
    }
    std::cout << "\n";
}

void register_prompt_commands(BaseCLI& cli) {
    cli.add_command("/pick", do_pick, "Select option N of the current prompt");
    cli.add_command("/dismiss", do_dismiss, "Dismiss the prompt (Escape)");
    cli.add_command("/prompt", do_prompt, "Check the screen for a prompt now");
    cli.add_command("/screen", do_screen, "Show the last N lines of the pane");
}
