#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <platform/platform.hpp>

inline std::string bridge_log_path() {
    static std::string path = (platform::temp_dir() / "panebridge_debug.log").string();
    return path;
}

// Raw pane written when the footer is visible but no prompt could be parsed.
inline std::string pane_dump_path() {
    static std::string path = (platform::temp_dir() / "panebridge_pane_dump.txt").string();
    return path;
}

inline void bridge_log(const std::string& msg) {
    std::ofstream out(bridge_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

inline void dump_pane(const std::string& pane) {
    std::ofstream out(pane_dump_path(), std::ios::trunc);
    if (out) out << pane;
}
