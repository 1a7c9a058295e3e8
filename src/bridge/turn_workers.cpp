#include "turn_workers.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

TurnWorkers::TurnWorkers(TurnMarker& marker, PromptMonitor& monitor, RemoteChat& chat,
                         TerminalSession& terminal, const MonitorConfig& monitor_config,
                         const KeyConfig& keys)
    : marker_(marker), monitor_(monitor), chat_(chat), terminal_(terminal),
      monitor_config_(monitor_config), keys_(keys) {}

TurnWorkers::~TurnWorkers() {
    shutdown();
}

// ── Lifecycle ───────────────────────────────────────────────

bool TurnWorkers::alive() {
    return !stopping_ && marker_.is_pending();
}

void TurnWorkers::launch(std::function<void()> body) {
    auto worker = std::make_unique<Worker>();
    Worker* raw = worker.get();
    worker->thread = std::thread([raw, body = std::move(body)]() {
        body();
        raw->done = true;
    });

    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(std::move(worker));
}

void TurnWorkers::reap_finished() {
    std::vector<std::unique_ptr<Worker>> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end(); ) {
            if ((*it)->done) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& w : finished) {
        if (w->thread.joinable()) w->thread.join();
    }
}

Result<void> TurnWorkers::start_turn(ChatId chat) {
    reap_finished();
    stopping_ = false;

    auto r = marker_.begin();
    if (r.is_err()) return r;

    launch([this, chat]() { typing_loop(chat); });
    launch([this, chat]() { monitor_.run(chat, [this]() { return alive(); }); });
    bridge_log(fmt::format("turn: started for chat {}", chat));
    return Result<void>::Ok();
}

Result<void> TurnWorkers::forward_message(ChatId chat, const std::string& message) {
    auto r = start_turn(chat);
    if (r.is_err()) return r;

    terminal_.send_text(message);
    // Long input arrives as a bracketed paste; an Enter sent too soon is dropped
    if (message.size() > keys_.long_text_threshold)
        platform::sleep_ms(keys_.long_text_delay_ms);
    terminal_.send_key(Key::Enter);
    return Result<void>::Ok();
}

void TurnWorkers::end_turn() {
    marker_.clear();
}

void TurnWorkers::shutdown() {
    stopping_ = true;
    std::vector<std::unique_ptr<Worker>> all;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        all.swap(workers_);
    }
    for (auto& w : all) {
        if (w->thread.joinable()) w->thread.join();
    }
}

// ── Typing indicator ────────────────────────────────────────

void TurnWorkers::typing_loop(ChatId chat) {
    while (alive()) {
        auto r = chat_.send_typing(chat);
        if (r.is_err()) bridge_log("turn: typing indicator failed: " + r.error);

        for (int slept = 0; slept < monitor_config_.typing_interval_ms && alive();
             slept += MONITOR_SLEEP_SLICE_MS) {
            platform::sleep_ms(MONITOR_SLEEP_SLICE_MS);
        }
    }
}
