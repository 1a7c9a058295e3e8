#include "turn_marker.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>

TurnMarker::TurnMarker(const TurnConfig& config)
    : path_(config.marker_path.empty()
                ? platform::home_dir() / ".panebridge" / "pending"
                : platform::expand_user(config.marker_path)),
      max_age_secs_(config.max_age_secs) {}

Result<void> TurnMarker::begin() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        return Result<void>::Err("Failed to write turn marker " + path_.string());
    }
    out << now_epoch();
    return Result<void>::Ok();
}

void TurnMarker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::remove(path_, ec);
}

bool TurnMarker::is_pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!fs::exists(path_, ec)) return false;

    std::ifstream in(path_);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    trim(content);
    long long started = 0;
    try {
        started = std::stoll(content);
    } catch (const std::exception&) {
        started = 0;
    }

    if (max_age_secs_ > 0 && (started <= 0 || now_epoch() - started > max_age_secs_)) {
        bridge_log(fmt::format("turn: marker {} expired, removing", path_.string()));
        fs::remove(path_, ec);
        return false;
    }
    return true;
}
