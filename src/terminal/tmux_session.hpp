#pragma once

#include <string>
#include <core/types.hpp>
#include "terminal_session.hpp"

// TerminalSession backed by a tmux session, driven through the tmux CLI.
class TmuxSession : public TerminalSession {
public:
    explicit TmuxSession(const TmuxConfig& config);

    Result<std::string> capture_snapshot() override;
    void send_key(Key key) override;
    void send_text(const std::string& text) override;
    bool exists() override;

    const std::string& name() const { return session_; }

private:
    std::string session_;
    int timeout_ms_;

    Result<CommandOutput> tmux(const std::vector<std::string>& args);
};
