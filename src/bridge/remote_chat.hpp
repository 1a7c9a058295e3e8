#pragma once

#include <string>
#include <core/types.hpp>
#include <prompt/prompt_control.hpp>

// The chat platform the bridge mirrors prompts to. The transport and message
// rendering live behind this interface. Calls may come from several threads.
class RemoteChat {
public:
    virtual ~RemoteChat() = default;

    // Post a message carrying a selectable control.
    virtual Result<ControlHandle> publish_control(ChatId chat, const PromptControl& control) = 0;

    // Replace a control's message with a status line and remove its buttons.
    virtual Result<void> retract_control(const ControlHandle& handle, const std::string& status) = 0;

    // Show "typing..." in the chat for a few seconds.
    virtual Result<void> send_typing(ChatId chat) = 0;
};
