#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

struct MonitorSettings {
    int tick_seconds = 10;
    int alert_cap = 1000;
};

struct SyncSettings {
    int history_cap = 1000;
    std::string remote_temp_dir = "/tmp";
};

class Config {
public:
    // Load from ~/.fleet/config.yaml (defaults if the file does not exist)
    static Result<Config> load_global();

    // Load from an explicit YAML file
    static Result<Config> load(const fs::path& path);

    // Built-in defaults
    static Config defaults();

    // Accessors
    const fs::path& state_dir() const { return state_dir_; }
    const std::string& log_file() const { return log_file_; }
    int connect_timeout() const { return connect_timeout_; }
    int command_timeout() const { return command_timeout_; }
    const MonitorSettings& monitor() const { return monitor_; }
    const SyncSettings& sync() const { return sync_; }

public:
    Config() = default;

private:
    fs::path state_dir_;
    std::string log_file_;
    int connect_timeout_ = 10;
    int command_timeout_ = 300;
    MonitorSettings monitor_;
    SyncSettings sync_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Expand a leading "~/" to the home directory.
fs::path expand_home(const std::string& path);
