#pragma once

#include <atomic>
#include <mutex>
#include <bridge/remote_chat.hpp>

// RemoteChat that renders to this terminal, for driving the bridge locally.
// Buttons are shown with their option index for use with /pick.
class ConsoleChat : public RemoteChat {
public:
    Result<ControlHandle> publish_control(ChatId chat, const PromptControl& control) override;
    Result<void> retract_control(const ControlHandle& handle, const std::string& status) override;
    Result<void> send_typing(ChatId chat) override;

private:
    std::mutex out_mutex_;
    std::atomic<MessageId> next_message_id_{1};
};
