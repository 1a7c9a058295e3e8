#pragma once

#include <string>
#include <core/types.hpp>
#include "keys.hpp"

// The terminal pane the host application runs in.
// Implementations must be safe to call from several threads at once.
class TerminalSession {
public:
    virtual ~TerminalSession() = default;

    // Raw text of the visible pane. An Err or an empty value means the
    // snapshot is unavailable for this instant.
    virtual Result<std::string> capture_snapshot() = 0;

    // Fire-and-forget key press.
    virtual void send_key(Key key) = 0;

    // Type text literally, without pressing Enter.
    virtual void send_text(const std::string& text) = 0;

    virtual bool exists() = 0;
};
