#include "console_chat.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <iostream>

Result<ControlHandle> ConsoleChat::publish_control(ChatId chat, const PromptControl& control) {
    ControlHandle handle{chat, next_message_id_++};

    std::lock_guard<std::mutex> lock(out_mutex_);
    std::cout << "\n" << theme::section(fmt::format("Prompt #{}", handle.message_id));
    for (const auto& line : split_lines(control.text)) {
        std::cout << "    " << line << "\n";
    }
    std::cout << "\n";
    for (const auto& b : control.buttons) {
        std::string key = b.payload == PICK_DISMISS
            ? std::string("dismiss")
            : b.payload.substr(std::string(PICK_PREFIX).size());
        std::cout << theme::color::TEAL << fmt::format("    [{}] ", key)
                  << theme::color::RESET << b.text << "\n";
    }
    std::cout << theme::dim("    /pick <n>, /pick dismiss, or type an answer") << "\n\n";
    std::cout.flush();
    return Result<ControlHandle>::Ok(handle);
}

Result<void> ConsoleChat::retract_control(const ControlHandle& handle, const std::string& status) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    std::cout << theme::info(fmt::format("Prompt #{}: {}", handle.message_id, status));
    std::cout.flush();
    return Result<void>::Ok();
}

Result<void> ConsoleChat::send_typing(ChatId chat) {
    return Result<void>::Ok();
}
