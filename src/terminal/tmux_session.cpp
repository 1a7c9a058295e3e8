#include "tmux_session.hpp"
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

TmuxSession::TmuxSession(const TmuxConfig& config)
    : session_(config.session), timeout_ms_(config.command_timeout_ms) {}

Result<CommandOutput> TmuxSession::tmux(const std::vector<std::string>& args) {
    return platform::run("tmux", args, timeout_ms_);
}

Result<std::string> TmuxSession::capture_snapshot() {
    auto r = tmux({"capture-pane", "-t", session_, "-p"});
    if (r.is_err()) return Result<std::string>::Err(r.error);
    if (r.value.failed()) {
        return Result<std::string>::Err(fmt::format(
            "capture-pane exit={} {}", r.value.exit_code, r.value.stderr_data));
    }
    return Result<std::string>::Ok(r.value.stdout_data);
}

void TmuxSession::send_key(Key key) {
    auto r = tmux({"send-keys", "-t", session_, tmux_key_name(key)});
    if (r.is_err() || r.value.failed()) {
        bridge_log(fmt::format("tmux: send-keys {} to {} failed: {}",
                               tmux_key_name(key), session_,
                               r.is_err() ? r.error : r.value.stderr_data));
    }
}

void TmuxSession::send_text(const std::string& text) {
    auto r = tmux({"send-keys", "-t", session_, "-l", text});
    if (r.is_err() || r.value.failed()) {
        bridge_log(fmt::format("tmux: literal send to {} failed: {}", session_,
                               r.is_err() ? r.error : r.value.stderr_data));
    }
}

bool TmuxSession::exists() {
    auto r = tmux({"has-session", "-t", session_});
    return r.is_ok() && r.value.success();
}
