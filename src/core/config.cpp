#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

// Session name from the environment wins over the built-in default,
// the config file wins over both.
static std::string default_session() {
    const char* env = std::getenv("TMUX_SESSION");
    return (env && *env) ? std::string(env) : std::string("claude");
}

Config::Config() {
    tmux_.session = default_session();
}

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / ".panebridge";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    fs::create_directories(config_path.parent_path());

    const char* default_config = R"(# panebridge configuration

tmux:
  session: "claude"                # overridden by $TMUX_SESSION when unset here
  command_timeout_ms: 5000

monitor:
  poll_interval_ms: 500
  start_delay_ms: 500
  typing_interval_ms: 4000

keys:
  move_delay_ms: 50                # gap between arrow presses
  confirm_delay_ms: 100            # gap before Enter
  escape_settle_ms: 500
  long_text_threshold: 200         # longer messages wait before Enter
  long_text_delay_ms: 500

# Search windows of the menu detector (lines)
parser:
  footer_window: 5
  cursor_window: 40
  option_window: 30
  question_window: 10
  min_question_length: 5

control:
  label_max_length: 60
  placeholders: ["other", "type something"]

turn:
  marker_path: "~/.panebridge/pending"
  max_age_secs: 600
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

// A positive integer, or the fallback.
static int positive_int(const YAML::Node& node, int fallback) {
    int v = node.as<int>(fallback);
    return v > 0 ? v : fallback;
}

// A non-negative integer (delays may be zero), or the fallback.
static int non_negative_int(const YAML::Node& node, int fallback) {
    int v = node.as<int>(fallback);
    return v >= 0 ? v : fallback;
}

static TmuxConfig parse_tmux_config(const YAML::Node& node, TmuxConfig tmux) {
    tmux.session = node["session"].as<std::string>(tmux.session);
    if (tmux.session.empty()) tmux.session = default_session();
    tmux.command_timeout_ms = positive_int(node["command_timeout_ms"], tmux.command_timeout_ms);
    return tmux;
}

static MonitorConfig parse_monitor_config(const YAML::Node& node) {
    MonitorConfig m;
    m.poll_interval_ms = positive_int(node["poll_interval_ms"], m.poll_interval_ms);
    m.start_delay_ms = non_negative_int(node["start_delay_ms"], m.start_delay_ms);
    m.typing_interval_ms = positive_int(node["typing_interval_ms"], m.typing_interval_ms);
    return m;
}

static KeyConfig parse_key_config(const YAML::Node& node) {
    KeyConfig k;
    k.move_delay_ms = non_negative_int(node["move_delay_ms"], k.move_delay_ms);
    k.confirm_delay_ms = non_negative_int(node["confirm_delay_ms"], k.confirm_delay_ms);
    k.escape_settle_ms = non_negative_int(node["escape_settle_ms"], k.escape_settle_ms);
    k.long_text_threshold = static_cast<size_t>(
        non_negative_int(node["long_text_threshold"], static_cast<int>(k.long_text_threshold)));
    k.long_text_delay_ms = non_negative_int(node["long_text_delay_ms"], k.long_text_delay_ms);
    return k;
}

static ParserLimits parse_parser_limits(const YAML::Node& node) {
    ParserLimits p;
    p.footer_window = positive_int(node["footer_window"], p.footer_window);
    p.cursor_window = positive_int(node["cursor_window"], p.cursor_window);
    p.option_window = positive_int(node["option_window"], p.option_window);
    p.question_window = positive_int(node["question_window"], p.question_window);
    p.min_question_length = static_cast<size_t>(
        non_negative_int(node["min_question_length"], static_cast<int>(p.min_question_length)));
    return p;
}

static ControlConfig parse_control_config(const YAML::Node& node) {
    ControlConfig c;
    c.label_max_length = static_cast<size_t>(
        positive_int(node["label_max_length"], static_cast<int>(c.label_max_length)));

    // A single string or a list
    auto placeholders = node["placeholders"];
    if (placeholders) {
        if (placeholders.IsSequence()) {
            c.placeholders = placeholders.as<std::vector<std::string>>(std::vector<std::string>());
        } else if (placeholders.IsScalar()) {
            c.placeholders = {placeholders.as<std::string>()};
        }
    }
    return c;
}

static TurnConfig parse_turn_config(const YAML::Node& node) {
    TurnConfig t;
    t.marker_path = node["marker_path"].as<std::string>("");
    t.max_age_secs = non_negative_int(node["max_age_secs"], t.max_age_secs);
    return t;
}

class ConfigBuilder {
public:
    static Config from(const YAML::Node& root) {
        Config config;
        auto section = [&](const char* key) {
            return (root.IsMap() && root[key]) ? root[key] : YAML::Node();
        };
        config.tmux_ = parse_tmux_config(section("tmux"), config.tmux_);
        config.monitor_ = parse_monitor_config(section("monitor"));
        config.keys_ = parse_key_config(section("keys"));
        config.parser_ = parse_parser_limits(section("parser"));
        config.control_ = parse_control_config(section("control"));
        config.turn_ = parse_turn_config(section("turn"));
        return config;
    }
};

static Config build(const YAML::Node& root) {
    return ConfigBuilder::from(root);
}

Result<Config> Config::parse(const std::string& yaml) {
    try {
        return Result<Config>::Ok(build(YAML::Load(yaml)));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }

    try {
        return Result<Config>::Ok(build(YAML::LoadFile(path.string())));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load() {
    return load_file(get_config_path());
}
