#include "prompt_state.hpp"

PromptBinding PromptState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return binding_;
}

std::optional<PromptClaim> PromptState::claim(std::optional<int> target) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (binding_.options.empty()) return std::nullopt;
    if (target && (*target < 0 || *target >= static_cast<int>(binding_.options.size())))
        return std::nullopt;

    PromptClaim claim;
    claim.control = binding_.control;
    claim.options = std::move(binding_.options);
    claim.highlighted_index = binding_.highlighted_index;
    claim.token = ++last_token_;

    binding_.control.reset();
    binding_.options.clear();
    binding_.claim = claim.token;
    return claim;
}

std::optional<ControlHandle> PromptState::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto control = binding_.control;
    binding_ = PromptBinding{};
    return control;
}

void PromptState::finish_claim(ClaimToken token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (binding_.claim == token) binding_.claim = 0;
}

size_t PromptState::option_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return binding_.options.size();
}
