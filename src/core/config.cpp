#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".fleet";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.rfind("~/", 0) == 0) return platform::home_dir() / path.substr(2);
    return fs::path(path);
}

Config Config::defaults() {
    Config config;
    config.state_dir_ = get_global_config_dir() / "state";
    config.log_file_ = (platform::temp_dir() / "fleet_debug.log").string();
    config.connect_timeout_ = CONNECT_TIMEOUT_SECS;
    config.command_timeout_ = COMMAND_TIMEOUT_SECS;
    config.monitor_.tick_seconds = MONITOR_TICK_SECS;
    config.monitor_.alert_cap = MAX_ALERTS;
    config.sync_.history_cap = MAX_SYNC_HISTORY;
    config.sync_.remote_temp_dir = DEFAULT_REMOTE_TEMP_DIR;
    return config;
}

static int positive_or(const YAML::Node& node, int fallback) {
    int v = node.as<int>(fallback);
    return v > 0 ? v : fallback;
}

Result<Config> Config::load_global() {
    std::error_code ec;
    if (!fs::exists(get_global_config_path(), ec)) {
        return Result<Config>::Ok(defaults());
    }
    return load(get_global_config_path());
}

Result<Config> Config::load(const fs::path& path) {
    Config config = defaults();

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::Validation,
                "Config root must be a mapping: " + path.string());
        }

        if (root["state_dir"]) {
            config.state_dir_ = expand_home(root["state_dir"].as<std::string>());
        }
        // An explicit empty log_file disables the debug log
        if (root["log_file"]) {
            config.log_file_ = expand_home(root["log_file"].as<std::string>("")).string();
        }
        config.connect_timeout_ = positive_or(root["connect_timeout"], config.connect_timeout_);
        config.command_timeout_ = positive_or(root["command_timeout"], config.command_timeout_);

        if (auto mon = root["monitor"]) {
            config.monitor_.tick_seconds = positive_or(mon["tick_seconds"], config.monitor_.tick_seconds);
            config.monitor_.alert_cap = positive_or(mon["alert_cap"], config.monitor_.alert_cap);
        }

        if (auto sync = root["sync"]) {
            config.sync_.history_cap = positive_or(sync["history_cap"], config.sync_.history_cap);
            config.sync_.remote_temp_dir = sync["remote_temp_dir"].as<std::string>(config.sync_.remote_temp_dir);
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Validation,
            "Failed to parse config " + path.string() + ": " + e.what());
    }

    return Result<Config>::Ok(config);
}
