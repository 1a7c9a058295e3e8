#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.panebridge/config.yaml; a missing file yields defaults.
    static Result<Config> load();

    // Load a specific file. A missing file yields defaults.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text.
    static Result<Config> parse(const std::string& yaml);

    // Accessors
    const TmuxConfig& tmux() const { return tmux_; }
    const MonitorConfig& monitor() const { return monitor_; }
    const KeyConfig& keys() const { return keys_; }
    const ParserLimits& parser() const { return parser_; }
    const ControlConfig& control() const { return control_; }
    const TurnConfig& turn() const { return turn_; }

    Config();

private:
    TmuxConfig tmux_;
    MonitorConfig monitor_;
    KeyConfig keys_;
    ParserLimits parser_;
    ControlConfig control_;
    TurnConfig turn_;

    friend class ConfigBuilder;
};

bool config_exists();

fs::path get_config_dir();
fs::path get_config_path();

// Write a commented default config unless one exists.
Result<void> create_default_config();
