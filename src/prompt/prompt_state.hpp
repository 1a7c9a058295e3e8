#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "prompt_parser.hpp"

// Identifies one claim; 0 means unclaimed.
using ClaimToken = uint64_t;

// What the remote side currently shows for the watched terminal.
struct PromptBinding {
    std::optional<std::string> fingerprint;
    std::optional<ControlHandle> control;
    std::vector<PromptOption> options;
    int highlighted_index = 0;

    // A selection is being acted on: the control has been taken by the
    // selection handler while the fingerprint stays so the monitor neither
    // retracts it again nor republishes it.
    ClaimToken claim = 0;

    bool claimed() const { return claim != 0; }
    bool empty() const { return !fingerprint && !control && options.empty(); }
};

// Result of claiming the current prompt for a selection.
struct PromptClaim {
    std::optional<ControlHandle> control;  // taken from the binding; caller retracts it
    std::vector<PromptOption> options;
    int highlighted_index = 0;
    ClaimToken token = 0;     // pass back to finish_claim
};

// Process-wide prompt record for one terminal session. Every field changes
// under one mutex; the monitor loop and remote-event handlers share an
// instance by reference.
class PromptState {
public:
    PromptState() = default;
    PromptState(const PromptState&) = delete;
    PromptState& operator=(const PromptState&) = delete;

    // Copy of the current binding.
    PromptBinding snapshot() const;

    // Run fn(binding) with the lock held and return its result. Used for the
    // monitor's read-modify-write reconciliation step.
    template <typename Fn>
    auto with_binding(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(binding_);
    }

    // Take the control and options for a selection. The fingerprint is kept.
    // Returns nullopt, leaving the binding untouched, when no options are
    // tracked or target is not a valid index into them.
    std::optional<PromptClaim> claim(std::optional<int> target = std::nullopt);

    // The selection handler is done with its claim. A claim replaced in the
    // meantime (new prompt published and claimed again) is left alone.
    void finish_claim(ClaimToken token);

    size_t option_count() const;

    // Clear everything and return the control that was bound, if any.
    std::optional<ControlHandle> release();

private:
    mutable std::mutex mutex_;
    PromptBinding binding_;
    ClaimToken last_token_ = 0;
};
