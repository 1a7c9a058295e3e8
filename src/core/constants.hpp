#pragma once

// ── Monitor timing ──────────────────────────────────────────
constexpr int MONITOR_SLEEP_SLICE_MS     = 100;   // Liveness is rechecked at this granularity

// ── Control statuses ────────────────────────────────────────
// Text a retracted control is replaced with.
constexpr const char* STATUS_RESOLVED    = "Prompt was resolved";
constexpr const char* STATUS_SUPERSEDED  = "Previous prompt superseded";
constexpr const char* STATUS_COMPLETED   = "Request completed";
constexpr const char* STATUS_DISMISSED   = "Dismissed (Escape sent)";
constexpr const char* STATUS_INTERRUPTED = "Interrupted by /stop";

// ── Control rendering ───────────────────────────────────────
constexpr const char* CONTROL_HEADER      = "Interactive prompt:";
constexpr const char* CONTROL_TRAILER     = "Or type a message to skip this prompt.";
constexpr const char* DISMISS_BUTTON_TEXT = "--- Dismiss (Escape) ---";
constexpr const char* PICK_PREFIX         = "pick:";
constexpr const char* PICK_DISMISS        = "pick:dismiss";
constexpr const char* FALLBACK_QUESTION   = "Select an option:";

// ── Footer detection ────────────────────────────────────────
constexpr const char* FOOTER_CONFIRM_WORD  = "Enter";
constexpr const char* FOOTER_NAVIGATE_WORD = "to navigate";
constexpr const char* FOOTER_SELECT_WORD   = "to select";

// ── Free-text answers ───────────────────────────────────────
constexpr int CUSTOM_ANSWER_PREVIEW_CHARS = 40;
constexpr int FREE_TEXT_SETTLE_MS         = 200;
