#include <gtest/gtest.h>
#include <prompt/prompt_state.hpp>

static void bind(PromptState& state, int options, int highlighted = 0) {
    state.with_binding([&](PromptBinding& b) {
        b.fingerprint = "fp";
        b.control = ControlHandle{1, 42};
        b.options.clear();
        for (int i = 0; i < options; i++)
            b.options.push_back({"option " + std::to_string(i), std::nullopt});
        b.highlighted_index = highlighted;
        return 0;
    });
}

TEST(PromptState, StartsEmpty) {
    PromptState state;
    EXPECT_TRUE(state.snapshot().empty());
    EXPECT_EQ(state.option_count(), 0u);
    EXPECT_FALSE(state.claim().has_value());
    EXPECT_FALSE(state.release().has_value());
}

TEST(PromptState, ClaimTakesControlAndKeepsFingerprint) {
    PromptState state;
    bind(state, 3, 1);

    auto claim = state.claim(2);
    ASSERT_TRUE(claim.has_value());
    EXPECT_EQ(claim->control, std::optional<ControlHandle>(ControlHandle{1, 42}));
    EXPECT_EQ(claim->options.size(), 3u);
    EXPECT_EQ(claim->highlighted_index, 1);

    auto b = state.snapshot();
    EXPECT_EQ(b.fingerprint, std::optional<std::string>("fp"));
    EXPECT_FALSE(b.control.has_value());
    EXPECT_TRUE(b.options.empty());
    EXPECT_TRUE(b.claimed());

    // A second claim finds nothing to act on
    EXPECT_FALSE(state.claim(0).has_value());

    state.finish_claim(claim->token);
    EXPECT_FALSE(state.snapshot().claimed());
}

TEST(PromptState, StaleTokenDoesNotEndNewerClaim) {
    PromptState state;
    bind(state, 2);
    auto first = state.claim(0);
    ASSERT_TRUE(first.has_value());

    // A new prompt is bound and claimed before the first handler finishes
    bind(state, 3);
    auto second = state.claim(1);
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->token, second->token);

    state.finish_claim(first->token);
    EXPECT_TRUE(state.snapshot().claimed());

    state.finish_claim(second->token);
    EXPECT_FALSE(state.snapshot().claimed());
}

TEST(PromptState, ClaimOutOfRangeLeavesBindingAlone) {
    PromptState state;
    bind(state, 2);

    EXPECT_FALSE(state.claim(2).has_value());
    EXPECT_FALSE(state.claim(-1).has_value());

    auto b = state.snapshot();
    EXPECT_TRUE(b.control.has_value());
    EXPECT_EQ(b.options.size(), 2u);
    EXPECT_FALSE(b.claimed());
}

TEST(PromptState, ReleaseClearsEverything) {
    PromptState state;
    bind(state, 2);

    auto control = state.release();
    EXPECT_EQ(control, std::optional<ControlHandle>(ControlHandle{1, 42}));
    EXPECT_TRUE(state.snapshot().empty());
    EXPECT_FALSE(state.release().has_value());
}
