#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <terminal/terminal_session.hpp>
#include "prompt_monitor.hpp"
#include "remote_chat.hpp"
#include "turn_marker.hpp"

// Starts and owns the background workers of a turn: a prompt monitor and a
// typing indicator, both ending once the turn marker is gone. Overlapping
// turns may leave more than one monitor running; they serialize on the
// shared PromptState.
class TurnWorkers {
public:
    TurnWorkers(TurnMarker& marker, PromptMonitor& monitor, RemoteChat& chat,
                TerminalSession& terminal, const MonitorConfig& monitor_config,
                const KeyConfig& keys);
    ~TurnWorkers();

    TurnWorkers(const TurnWorkers&) = delete;
    TurnWorkers& operator=(const TurnWorkers&) = delete;

    // Begin a turn: write the marker and launch the workers.
    Result<void> start_turn(ChatId chat);

    // Start a turn and type message into the terminal followed by Enter.
    Result<void> forward_message(ChatId chat, const std::string& message);

    // End the turn; workers wind down on their next liveness check.
    void end_turn();

    bool turn_pending() { return marker_.is_pending(); }

    // End the turn and wait for every worker to exit.
    void shutdown();

private:
    TurnMarker& marker_;
    PromptMonitor& monitor_;
    RemoteChat& chat_;
    TerminalSession& terminal_;
    MonitorConfig monitor_config_;
    KeyConfig keys_;

    struct Worker {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    std::atomic<bool> stopping_{false};
    std::mutex workers_mutex_;
    std::vector<std::unique_ptr<Worker>> workers_;

    bool alive();
    void typing_loop(ChatId chat);
    void launch(std::function<void()> body);
    void reap_finished();
};
