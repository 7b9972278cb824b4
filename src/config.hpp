#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace dailyrun {

struct TimerDefaults {
    std::string on_calendar = "*-*-* 14:00:00"; // daily at 2 PM local time
    bool persistent = true;
};

struct Config {
    std::string shell = "bash"; // interpreter for non-executable scripts
    std::vector<std::string> editors = {"nano", "vi"};
    std::vector<std::string> dependencies = {"systemctl", "bash", "nano"};
    TimerDefaults timer;

    // Load ~/.dailyrun/config.json (if present) + env vars. Never writes.
    static Config load(const std::string& home);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply a parsed JSON document over the defaults
    static Config from_json(const nlohmann::json& j);
};

std::string config_path(const std::string& home);

} // namespace dailyrun
