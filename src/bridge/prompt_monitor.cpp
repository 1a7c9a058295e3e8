#include "prompt_monitor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <prompt/fingerprint.hpp>
#include <prompt/prompt_control.hpp>
#include <terminal/screen_normalizer.hpp>
#include <fmt/format.h>
#include <stdexcept>
#include <algorithm>

const char* tick_outcome_name(TickOutcome outcome) {
    switch (outcome) {
        case TickOutcome::CaptureFailed: return "capture-failed";
        case TickOutcome::NoPrompt:      return "no-prompt";
        case TickOutcome::Resolved:      return "resolved";
        case TickOutcome::Unchanged:     return "unchanged";
        case TickOutcome::Claimed:       return "claimed";
        case TickOutcome::Published:     return "published";
    }
    return "?";
}

PromptMonitor::PromptMonitor(PromptState& state, TerminalSession& terminal, RemoteChat& chat,
                             const MonitorSettings& settings)
    : state_(state), terminal_(terminal), chat_(chat),
      settings_(settings), parser_(settings.parser) {}

// ── Reconciliation ──────────────────────────────────────────

std::optional<std::optional<ParsedPrompt>> PromptMonitor::capture_and_parse() {
    auto snap = terminal_.capture_snapshot();
    if (snap.is_err()) {
        bridge_log("monitor: capture failed: " + snap.error);
        return std::nullopt;
    }
    if (snap.value.empty()) return std::nullopt;

    std::string text = ScreenNormalizer::normalize(snap.value);
    auto parsed = parser_.parse(text);
    if (parsed) {
        std::string labels;
        for (const auto& o : parsed->options) {
            if (!labels.empty()) labels += ", ";
            labels += o.label;
        }
        bridge_log(fmt::format("monitor: parsed q='{}' opts={} [{}] hi={}",
                               parsed->question, parsed->options.size(), labels,
                               parsed->highlighted_index));
    } else if (PromptParser::has_footer(text)) {
        dump_pane(snap.value);
        bridge_log("monitor: footer found but parse failed, pane dumped to " + pane_dump_path());
    }
    return parsed;
}

void PromptMonitor::retract(const ControlHandle& handle, const char* status) {
    auto r = chat_.retract_control(handle, status);
    if (r.is_err()) {
        bridge_log(fmt::format("monitor: retract of message {} failed: {}",
                               handle.message_id, r.error));
    }
}

TickOutcome PromptMonitor::reconcile(ChatId chat) {
    auto parsed = capture_and_parse();
    if (!parsed) return TickOutcome::CaptureFailed;
    return apply(chat, *parsed);
}

TickOutcome PromptMonitor::apply(ChatId chat, const std::optional<ParsedPrompt>& parsed) {
    return state_.with_binding([&](PromptBinding& b) {
        if (!parsed) {
            if (b.claimed()) return TickOutcome::Claimed;
            if (b.empty()) return TickOutcome::NoPrompt;
            if (b.control) retract(*b.control, STATUS_RESOLVED);
            b = PromptBinding{};
            return TickOutcome::Resolved;
        }

        std::string fp = prompt_fingerprint(*parsed);
        if (b.fingerprint && *b.fingerprint == fp) {
            if (b.claimed()) return TickOutcome::Claimed;
            b.options = parsed->options;
            b.highlighted_index = parsed->highlighted_index;
            return TickOutcome::Unchanged;
        }

        if (b.control) retract(*b.control, STATUS_SUPERSEDED);

        auto published = chat_.publish_control(chat, render_prompt_control(*parsed, settings_.control));
        if (published.is_err()) {
            bridge_log("monitor: publish failed: " + published.error);
        }

        // Bound even when publishing failed, so a later tick does not post a duplicate.
        b.fingerprint = fp;
        b.control = published.is_ok() ? std::optional<ControlHandle>(published.value) : std::nullopt;
        b.options = parsed->options;
        b.highlighted_index = parsed->highlighted_index;
        b.claim = 0;
        return TickOutcome::Published;
    });
}

bool PromptMonitor::check_and_show(ChatId chat) {
    auto parsed = capture_and_parse();
    if (!parsed || !*parsed) return false;
    apply(chat, *parsed);
    return true;
}

// ── Loop ────────────────────────────────────────────────────

void PromptMonitor::run(ChatId chat, const std::function<bool()>& turn_is_pending) {
    platform::sleep_ms(settings_.monitor.start_delay_ms);
    bridge_log(fmt::format("monitor: started for chat {}", chat));

    while (turn_is_pending()) {
        try {
            TickOutcome outcome = reconcile(chat);
            if (outcome == TickOutcome::Published || outcome == TickOutcome::Resolved)
                bridge_log(fmt::format("monitor: tick {}", tick_outcome_name(outcome)));
        } catch (const std::exception& e) {
            bridge_log(fmt::format("monitor: error: {}", e.what()));
        }

        // Sleep in slices so a finished turn is noticed promptly
        for (int slept = 0; slept < settings_.monitor.poll_interval_ms && turn_is_pending();
             slept += MONITOR_SLEEP_SLICE_MS) {
            platform::sleep_ms(std::min(MONITOR_SLEEP_SLICE_MS,
                                        settings_.monitor.poll_interval_ms - slept));
        }
    }

    teardown();
    bridge_log(fmt::format("monitor: stopped for chat {}", chat));
}

void PromptMonitor::teardown() {
    auto control = state_.release();
    if (control) retract(*control, STATUS_COMPLETED);
}
