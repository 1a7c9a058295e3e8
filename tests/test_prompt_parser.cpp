#include <gtest/gtest.h>
#include <prompt/prompt_parser.hpp>

static const std::string FOOTER =
    "Enter to select \xc2\xb7 \xe2\x86\x91/\xe2\x86\x93 to navigate \xc2\xb7 Esc to cancel";
static const std::string ARROW = "\xe2\x80\xba";   // ›
static const std::string HEAVY = "\xe2\x9d\xaf";   // ❯

static std::optional<ParsedPrompt> parse(const std::string& text) {
    return PromptParser().parse(text);
}

// ── Detection ───────────────────────────────────────────────

TEST(PromptParser, ConfirmationMenu) {
    std::string text =
        "Proceed with changes?\n"
        "\n" +
        ARROW + " 1. Yes\n"
        "  2. No\n"
        "\n" +
        FOOTER + "\n";

    auto p = parse(text);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->question, "Proceed with changes?");
    ASSERT_EQ(p->options.size(), 2u);
    EXPECT_EQ(p->options[0], (PromptOption{"1. Yes", std::nullopt}));
    EXPECT_EQ(p->options[1], (PromptOption{"2. No", std::nullopt}));
    EXPECT_EQ(p->highlighted_index, 0);
}

TEST(PromptParser, NoFooterNoPrompt) {
    std::string text =
        "Proceed with changes?\n"
        "\n" +
        ARROW + " 1. Yes\n"
        "  2. No\n";
    EXPECT_FALSE(parse(text).has_value());
}

TEST(PromptParser, EmptyText) {
    EXPECT_FALSE(parse("").has_value());
    EXPECT_FALSE(parse("\n\n\n").has_value());
}

TEST(PromptParser, SingleOptionIsNotAMenu) {
    std::string text = "Continue?\n\n" + ARROW + " 1. Ok\n\n" + FOOTER;
    EXPECT_FALSE(parse(text).has_value());
}

TEST(PromptParser, FooterWithoutCursor) {
    std::string text = "Continue?\n\n  1. Ok\n  2. Cancel\n\n" + FOOTER;
    EXPECT_FALSE(parse(text).has_value());
}

TEST(PromptParser, FooterMustBeNearBottom) {
    std::string text = "Continue?\n\n" + ARROW + " 1. Ok\n  2. Cancel\n\n" + FOOTER + "\n";
    for (int i = 0; i < 6; i++) text += "later output line\n";
    EXPECT_FALSE(parse(text).has_value());
}

TEST(PromptParser, FooterMentionedInConversation) {
    // Footer words appear, but not on a line starting with "Enter"
    std::string text =
        "Use the arrows to navigate and Enter to select.\n"
        "\n" +
        ARROW + " some quoted line\n"
        "  another line\n";
    EXPECT_FALSE(parse(text).has_value());
}

// ── Structure ───────────────────────────────────────────────

TEST(PromptParser, CursorOnLaterOption) {
    std::string text =
        "Which database should I use?\n"
        "\n"
        "  1. Postgres\n"
        "  2. SQLite\n" +
        HEAVY + " 3. MySQL\n"
        "\n" +
        FOOTER;

    auto p = parse(text);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->question, "Which database should I use?");
    ASSERT_EQ(p->options.size(), 3u);
    EXPECT_EQ(p->options[0].label, "1. Postgres");
    EXPECT_EQ(p->options[2].label, "3. MySQL");
    EXPECT_EQ(p->highlighted_index, 2);
}

TEST(PromptParser, AsciiCursor) {
    std::string text = "Pick a color for it\n\n  1. Red\n> 2. Blue\n\n" + FOOTER;
    auto p = parse(text);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->highlighted_index, 1);
    EXPECT_EQ(p->options[1].label, "2. Blue");
}

TEST(PromptParser, DescriptionsAttachToOptions) {
    std::string text =
        "How should I proceed?\n"
        "\n" +
        ARROW + " 1. Refactor\n"
        "     Split the module into two files\n"
        "     and update the imports\n"
        "  2. Patch\n"
        "     Minimal change\n"
        "  3. Skip\n"
        "\n" +
        FOOTER;

    auto p = parse(text);
    ASSERT_TRUE(p.has_value());
    ASSERT_EQ(p->options.size(), 3u);
    EXPECT_EQ(p->options[0].description,
              std::optional<std::string>("Split the module into two files and update the imports"));
    EXPECT_EQ(p->options[1].description, std::optional<std::string>("Minimal change"));
    EXPECT_FALSE(p->options[2].description.has_value());
}

TEST(PromptParser, DescriptionAboveCursorIsSkipped) {
    std::string text =
        "How should I proceed?\n"
        "\n"
        "  1. Refactor\n"
        "     Split the module\n" +
        ARROW + " 2. Patch\n"
        "\n" +
        FOOTER;

    auto p = parse(text);
    ASSERT_TRUE(p.has_value());
    ASSERT_EQ(p->options.size(), 2u);
    EXPECT_EQ(p->options[0].label, "1. Refactor");
    EXPECT_EQ(p->options[0].description, std::optional<std::string>("Split the module"));
    EXPECT_EQ(p->highlighted_index, 1);
}

TEST(PromptParser, IndentedMenu) {
    std::string text =
        "  Allow this command to run?\n"
        "\n"
        "  " + ARROW + " 1. Yes\n"
        "    2. Yes, and don't ask again\n"
        "       for this project\n"
        "    3. No\n"
        "\n"
        "  " + FOOTER;

    auto p = parse(text);
    ASSERT_TRUE(p.has_value());
    ASSERT_EQ(p->options.size(), 3u);
    EXPECT_EQ(p->options[1].label, "2. Yes, and don't ask again");
    EXPECT_EQ(p->options[1].description, std::optional<std::string>("for this project"));
    EXPECT_EQ(p->question, "Allow this command to run?");
}

TEST(PromptParser, SeparatorsBetweenGroupsAreSkipped) {
    std::string text =
        "Choose an action now\n"
        "\n" +
        ARROW + " 1. Apply\n"
        "  2. Revert\n"
        "  \xe2\x80\x94\n"
        "\n"
        "  3. Other\n"
        "\n" +
        FOOTER;

    auto p = parse(text);
    ASSERT_TRUE(p.has_value());
    ASSERT_EQ(p->options.size(), 3u);
    EXPECT_EQ(p->options[2].label, "3. Other");
}

TEST(PromptParser, HorizontalRuleBoundsQuestion) {
    std::string rule;
    for (int i = 0; i < 20; i++) rule += "\xe2\x94\x80";
    std::string text =
        "Real question text?\n" +
        rule + "\n"
        "\n" +
        ARROW + " 1. A\n"
        "  2. B\n"
        "\n" +
        FOOTER;

    auto p = parse(text);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->question, "Select an option:");
}

TEST(PromptParser, BoxCornerBoundsOptions) {
    std::string text =
        "\xe2\x95\xb0\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x95\xaf\n" +
        ARROW + " 1. A\n"
        "  2. B\n"
        "\n" +
        FOOTER;

    auto p = parse(text);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->question, "Select an option:");
    ASSERT_EQ(p->options.size(), 2u);
    EXPECT_EQ(p->options[0].label, "1. A");
}

TEST(PromptParser, ShortLinesAreNotQuestions) {
    std::string text =
        "Which branch to merge?\n"
        "\n"
        "Tab\n"
        "\n" +
        ARROW + " 1. main\n"
        "  2. dev\n"
        "\n" +
        FOOTER;

    auto p = parse(text);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->question, "Which branch to merge?");
}

TEST(PromptParser, ScrollbackAboveMenuIgnored) {
    std::string text;
    for (int i = 0; i < 50; i++) text += "> 1. quoted text from earlier\n";
    text += "\nSave the file?\n\n" + ARROW + " 1. Yes\n  2. No\n\n" + FOOTER;

    auto p = parse(text);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->question, "Save the file?");
    EXPECT_EQ(p->options.size(), 2u);
}

TEST(PromptParser, ParseIsDeterministic) {
    std::string text = "Proceed with changes?\n\n" + ARROW + " 1. Yes\n  2. No\n\n" + FOOTER;
    EXPECT_EQ(parse(text), parse(text));
}

TEST(PromptParser, WindowsAreConfigurable) {
    std::string text = "Continue?\n\n" + ARROW + " 1. Ok\n  2. Cancel\n\n" + FOOTER + "\n";
    for (int i = 0; i < 6; i++) text += "status line\n";

    ParserLimits limits;
    limits.footer_window = 8;
    EXPECT_TRUE(PromptParser(limits).parse(text).has_value());
}

TEST(PromptParser, HasFooter) {
    EXPECT_TRUE(PromptParser::has_footer(FOOTER));
    EXPECT_FALSE(PromptParser::has_footer("Enter to select"));
}

// ── Line helpers ────────────────────────────────────────────

TEST(PromptLines, CursorPrefix) {
    EXPECT_EQ(PromptLines::cursor_prefix_len(ARROW + " 1. Yes"), 4u);
    EXPECT_EQ(PromptLines::cursor_prefix_len(HEAVY + " x"), 4u);
    EXPECT_EQ(PromptLines::cursor_prefix_len("> x"), 2u);
    EXPECT_EQ(PromptLines::cursor_prefix_len(">x"), 0u);
    EXPECT_EQ(PromptLines::cursor_prefix_len("1. Yes"), 0u);
}

TEST(PromptLines, HorizontalRule) {
    std::string rule;
    for (int i = 0; i < 12; i++) rule += "\xe2\x94\x80";
    EXPECT_TRUE(PromptLines::is_horizontal_rule(rule));
    EXPECT_FALSE(PromptLines::is_horizontal_rule("\xe2\x94\x80\xe2\x94\x80"));
    EXPECT_FALSE(PromptLines::is_horizontal_rule("plain text that is long"));
}

TEST(PromptLines, DashSeparator) {
    EXPECT_TRUE(PromptLines::is_dash_separator("--"));
    EXPECT_TRUE(PromptLines::is_dash_separator("\xe2\x80\x94"));
    EXPECT_FALSE(PromptLines::is_dash_separator("----"));
    EXPECT_FALSE(PromptLines::is_dash_separator("-a"));
    EXPECT_FALSE(PromptLines::is_dash_separator(""));
}
