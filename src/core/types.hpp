#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Local command execution result
struct CommandOutput {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Remote chat identifiers
using ChatId = int64_t;
using MessageId = int64_t;

// A published remote control: the chat it lives in and the message carrying it.
struct ControlHandle {
    ChatId chat_id = 0;
    MessageId message_id = 0;

    bool operator==(const ControlHandle& o) const {
        return chat_id == o.chat_id && message_id == o.message_id;
    }
    bool operator!=(const ControlHandle& o) const { return !(*this == o); }
};

// Configuration structures
struct TmuxConfig {
    std::string session = "claude";
    int command_timeout_ms = 5000;
};

struct MonitorConfig {
    int poll_interval_ms = 500;
    int start_delay_ms = 500;
    int typing_interval_ms = 4000;
};

struct KeyConfig {
    int move_delay_ms = 50;
    int confirm_delay_ms = 100;
    int escape_settle_ms = 500;
    size_t long_text_threshold = 200;
    int long_text_delay_ms = 500;
};

struct ParserLimits {
    int footer_window = 5;          // bottom lines searched for the footer
    int cursor_window = 40;         // lines above the footer searched for the cursor
    int option_window = 30;         // lines above the cursor searched for the first option
    int question_window = 10;       // lines above the first option searched for the question
    size_t min_question_length = 5; // question must be longer than this (code points)
};

struct ControlConfig {
    size_t label_max_length = 60;
    std::vector<std::string> placeholders = {"other", "type something"};
};

struct TurnConfig {
    std::string marker_path;        // "" means ~/.panebridge/pending
    int max_age_secs = 600;
};
