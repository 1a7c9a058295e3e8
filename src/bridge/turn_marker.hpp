#pragma once

#include <filesystem>
#include <mutex>
#include <core/types.hpp>

namespace fs = std::filesystem;

// "A response is in flight" latch, kept as a file holding the start time so
// the host application's completion hook can clear it from outside.
class TurnMarker {
public:
    explicit TurnMarker(const TurnConfig& config);

    // Start a turn (overwrites any previous marker).
    Result<void> begin();

    // End the turn. Missing marker is not an error.
    void clear();

    // True while a marker exists and is younger than max_age_secs.
    // An expired marker is removed.
    bool is_pending();

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    int max_age_secs_;
    std::mutex mutex_;
};
