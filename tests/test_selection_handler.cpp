#include <gtest/gtest.h>
#include <bridge/selection_handler.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include "fakes.hpp"

namespace fs = std::filesystem;

static std::string placeholder_menu() {
    return "Which name should the module get?\n"
           "\n"
           "\xe2\x80\xba 1. parser\n"
           "  2. reader\n"
           "  3. Type something.\n"
           "\n"
           "Enter to select \xc2\xb7 \xe2\x86\x91/\xe2\x86\x93 to navigate \xc2\xb7 Esc to cancel\n";
}

class SelectionHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        marker_path = fs::temp_directory_path() /
                      ("panebridge_select_test_" + std::to_string(getpid()));
        TurnConfig turn;
        turn.marker_path = marker_path.string();
        marker = std::make_unique<TurnMarker>(turn);

        keys.move_delay_ms = 0;
        keys.confirm_delay_ms = 0;
        keys.escape_settle_ms = 0;

        MonitorSettings settings;
        settings.monitor.start_delay_ms = 0;
        monitor = std::make_unique<PromptMonitor>(state, terminal, chat, settings);
        handler = std::make_unique<SelectionHandler>(state, *monitor, terminal, chat, *marker,
                                                     keys, ControlConfig{});
    }

    void TearDown() override {
        fs::remove(marker_path);
    }

    // Put a menu on screen and let the monitor publish it.
    void show(const std::string& screen) {
        terminal.set_screen(screen);
        ASSERT_EQ(monitor->reconcile(1), TickOutcome::Published);
    }

    fs::path marker_path;
    PromptState state;
    FakeTerminal terminal;
    FakeChat chat;
    KeyConfig keys;
    std::unique_ptr<TurnMarker> marker;
    std::unique_ptr<PromptMonitor> monitor;
    std::unique_ptr<SelectionHandler> handler;
};

// ── Button presses ──────────────────────────────────────────

TEST_F(SelectionHandlerTest, SelectMovesFromTrackedCursor) {
    show(menu_screen("Proceed with changes?", 1));

    auto outcome = handler->on_callback(1, "pick:0");
    EXPECT_EQ(outcome.status, SelectionStatus::Selected);
    EXPECT_EQ(outcome.message, "Selected: 1. Yes");
    EXPECT_EQ(terminal.sent(), (std::vector<std::string>{"key:Up", "key:Enter"}));

    auto retracted = chat.retractions();
    ASSERT_EQ(retracted.size(), 1u);
    EXPECT_EQ(retracted[0].handle, chat.published[0].handle);
    EXPECT_EQ(retracted[0].status, "Selected: 1. Yes");

    auto b = state.snapshot();
    EXPECT_FALSE(b.control.has_value());
    EXPECT_TRUE(b.options.empty());
    EXPECT_FALSE(b.claimed());
}

TEST_F(SelectionHandlerTest, MonitorTickDuringSelectionIsHarmless) {
    show(menu_screen());

    // The menu stays drawn while the keys go in; ticks must neither
    // retract the claimed control nor publish the same menu again.
    std::vector<TickOutcome> ticks;
    terminal.on_key = [&](Key) { ticks.push_back(monitor->reconcile(1)); };

    auto outcome = handler->on_selection(1, 1);
    terminal.on_key = nullptr;

    EXPECT_EQ(outcome.status, SelectionStatus::Selected);
    ASSERT_EQ(ticks.size(), 2u);
    EXPECT_EQ(ticks[0], TickOutcome::Claimed);
    EXPECT_EQ(ticks[1], TickOutcome::Claimed);
    EXPECT_EQ(chat.publish_count(), 1u);

    auto retracted = chat.retractions();
    ASSERT_EQ(retracted.size(), 1u);
    EXPECT_EQ(retracted[0].status, "Selected: 2. No");
}

TEST_F(SelectionHandlerTest, SecondPressOnSameControlIsStale) {
    show(menu_screen());
    EXPECT_EQ(handler->on_selection(1, 1).status, SelectionStatus::Selected);

    auto again = handler->on_selection(1, 1);
    EXPECT_EQ(again.status, SelectionStatus::Stale);
    EXPECT_EQ(again.message,
              "Prompt may have changed (options=0, target=1). Use /screenshot to check.");
    EXPECT_EQ(chat.retractions().size(), 1u);
}

TEST_F(SelectionHandlerTest, OutOfRangeSelectionSendsNothing) {
    show(menu_screen());
    auto outcome = handler->on_selection(1, 5);
    EXPECT_EQ(outcome.status, SelectionStatus::Stale);
    EXPECT_EQ(outcome.message,
              "Prompt may have changed (options=2, target=5). Use /screenshot to check.");
    EXPECT_TRUE(terminal.sent().empty());
    EXPECT_TRUE(state.snapshot().control.has_value());
}

TEST_F(SelectionHandlerTest, DismissSendsEscape) {
    show(menu_screen());
    auto outcome = handler->on_callback(1, "pick:dismiss");
    EXPECT_EQ(outcome.status, SelectionStatus::Dismissed);
    EXPECT_EQ(terminal.sent(), (std::vector<std::string>{"key:Escape"}));

    auto retracted = chat.retractions();
    ASSERT_EQ(retracted.size(), 1u);
    EXPECT_EQ(retracted[0].status, "Dismissed (Escape sent)");
    EXPECT_TRUE(state.snapshot().empty());
}

TEST_F(SelectionHandlerTest, MalformedPayload) {
    auto outcome = handler->on_callback(1, "bogus");
    EXPECT_EQ(outcome.status, SelectionStatus::Invalid);
    EXPECT_EQ(outcome.message, "Invalid selection");
    EXPECT_TRUE(terminal.sent().empty());
}

// ── /pick ───────────────────────────────────────────────────

TEST_F(SelectionHandlerTest, PickTrackedPrompt) {
    show(menu_screen());
    auto outcome = handler->pick(1, " 1 ");
    EXPECT_EQ(outcome.status, SelectionStatus::Selected);
    EXPECT_EQ(terminal.sent(), (std::vector<std::string>{"key:Down", "key:Enter"}));
}

TEST_F(SelectionHandlerTest, PickOutOfRange) {
    show(menu_screen());
    auto outcome = handler->pick(1, "4");
    EXPECT_EQ(outcome.status, SelectionStatus::Stale);
    EXPECT_EQ(outcome.message, "Index out of range. Valid: 0-1");
    EXPECT_TRUE(terminal.sent().empty());
}

TEST_F(SelectionHandlerTest, BlindPickWithoutTrackedPrompt) {
    auto outcome = handler->pick(1, "2");
    EXPECT_EQ(outcome.status, SelectionStatus::BlindPick);
    EXPECT_EQ(outcome.message, "Sent 2 Down arrow(s) + Enter (no active prompt tracked)");
    EXPECT_EQ(terminal.sent(),
              (std::vector<std::string>{"key:Down", "key:Down", "key:Enter"}));
}

TEST_F(SelectionHandlerTest, PickEscapeWords) {
    for (const char* word : {"dismiss", "esc", "Escape"}) {
        auto outcome = handler->pick(1, word);
        EXPECT_EQ(outcome.status, SelectionStatus::Dismissed);
        EXPECT_EQ(outcome.message, "Sent Escape");
    }
    EXPECT_EQ(terminal.sent().size(), 3u);
}

TEST_F(SelectionHandlerTest, PickRejectsNonNumbers) {
    EXPECT_EQ(handler->pick(1, "two").status, SelectionStatus::Invalid);
    EXPECT_EQ(handler->pick(1, "").status, SelectionStatus::Invalid);
    EXPECT_TRUE(terminal.sent().empty());
}

TEST_F(SelectionHandlerTest, PickNegativeIndexIsOutOfRange) {
    show(menu_screen());
    auto outcome = handler->pick(1, "-1");
    EXPECT_EQ(outcome.status, SelectionStatus::Stale);
    EXPECT_EQ(outcome.message, "Index out of range. Valid: 0-1");

    state.release();
    EXPECT_EQ(handler->pick(1, "-3").status, SelectionStatus::Stale);
    EXPECT_TRUE(terminal.sent().empty());
}

// ── Free text ───────────────────────────────────────────────

TEST_F(SelectionHandlerTest, FreeTextWithoutPromptIsNotConsumed) {
    terminal.set_screen("idle shell\n");
    EXPECT_EQ(handler->on_free_text(1, "hello").status, SelectionStatus::NoPrompt);
    EXPECT_TRUE(terminal.sent().empty());
    EXPECT_EQ(chat.publish_count(), 0u);
}

TEST_F(SelectionHandlerTest, FreeTextGoesThroughPlaceholder) {
    terminal.set_screen(placeholder_menu());
    auto outcome = handler->on_free_text(1, "lexer");
    EXPECT_EQ(outcome.status, SelectionStatus::Answered);
    EXPECT_EQ(outcome.message, "Custom answer: lexer");

    EXPECT_EQ(terminal.sent(),
              (std::vector<std::string>{"key:Down", "key:Down", "text:lexer", "key:Enter"}));
    auto retracted = chat.retractions();
    ASSERT_EQ(retracted.size(), 1u);
    EXPECT_EQ(retracted[0].status, "Custom answer: lexer");
    EXPECT_FALSE(state.snapshot().claimed());
}

TEST_F(SelectionHandlerTest, FreeTextEscapesMenuWithoutPlaceholder) {
    show(menu_screen());
    std::string text(50, 'a');
    EXPECT_EQ(handler->on_free_text(1, text).status, SelectionStatus::Answered);

    EXPECT_EQ(terminal.sent(),
              (std::vector<std::string>{"key:Escape", "text:" + text, "key:Enter"}));
    auto retracted = chat.retractions();
    ASSERT_EQ(retracted.size(), 1u);
    EXPECT_EQ(retracted[0].status, "Custom answer: " + std::string(40, 'a'));
}

TEST_F(SelectionHandlerTest, FreeTextWaitsForSelectionInProgress) {
    show(menu_screen());
    auto other = state.claim(1);
    ASSERT_TRUE(other.has_value());

    auto outcome = handler->on_free_text(1, "never mind");
    EXPECT_EQ(outcome.status, SelectionStatus::Busy);
    EXPECT_TRUE(terminal.sent().empty());
    EXPECT_TRUE(chat.retractions().empty());
    EXPECT_TRUE(state.snapshot().claimed());
}

TEST_F(SelectionHandlerTest, ClaimHeldUntilControlRetracted) {
    show(menu_screen());

    // Ticks run while the retract is in flight must not restore options
    std::vector<TickOutcome> ticks;
    chat.on_retract = [&] { ticks.push_back(monitor->reconcile(1)); };
    EXPECT_EQ(handler->on_selection(1, 1).status, SelectionStatus::Selected);
    chat.on_retract = nullptr;

    ASSERT_EQ(ticks.size(), 1u);
    EXPECT_EQ(ticks[0], TickOutcome::Claimed);
    EXPECT_FALSE(state.snapshot().claimed());
}

// ── Interrupt ───────────────────────────────────────────────

TEST_F(SelectionHandlerTest, InterruptEndsTurn) {
    ASSERT_TRUE(marker->begin().is_ok());
    show(menu_screen());

    auto outcome = handler->interrupt(1);
    EXPECT_EQ(outcome.status, SelectionStatus::Interrupted);
    EXPECT_EQ(terminal.sent(), (std::vector<std::string>{"key:Escape"}));
    EXPECT_FALSE(marker->is_pending());

    auto retracted = chat.retractions();
    ASSERT_EQ(retracted.size(), 1u);
    EXPECT_EQ(retracted[0].status, "Interrupted by /stop");
    EXPECT_TRUE(state.snapshot().empty());
}
