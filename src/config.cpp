#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace dailyrun {

std::string config_path(const std::string& home) {
    return home + "/.dailyrun/config.json";
}

nlohmann::json Config::defaults_json() {
    return {
        {"shell", "bash"},
        {"editors", {"nano", "vi"}},
        {"dependencies", {"systemctl", "bash", "nano"}},
        {"timer", {
            {"on_calendar", "*-*-* 14:00:00"},
            {"persistent", true}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static bool read_string_list(const nlohmann::json& j, const char* key,
                             std::vector<std::string>& out) {
    if (!j.contains(key) || !j[key].is_array()) return false;
    std::vector<std::string> values;
    for (const auto& item : j[key]) {
        if (!item.is_string()) return false;
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return true;
}

Config Config::from_json(const nlohmann::json& original) {
    Config cfg;
    nlohmann::json j = original.is_object()
        ? merge_defaults(original, defaults_json())
        : defaults_json();

    if (j["shell"].is_string() && !j["shell"].get<std::string>().empty())
        cfg.shell = j["shell"].get<std::string>();
    else
        std::cerr << "[config] Ignoring invalid 'shell' value\n";

    if (!read_string_list(j, "editors", cfg.editors))
        std::cerr << "[config] Ignoring invalid 'editors' value\n";
    if (!read_string_list(j, "dependencies", cfg.dependencies))
        std::cerr << "[config] Ignoring invalid 'dependencies' value\n";

    if (j["timer"].is_object()) {
        auto& t = j["timer"];
        if (t.contains("on_calendar") && t["on_calendar"].is_string())
            cfg.timer.on_calendar = t["on_calendar"].get<std::string>();
        if (t.contains("persistent") && t["persistent"].is_boolean())
            cfg.timer.persistent = t["persistent"].get<bool>();
    }

    return cfg;
}

Config Config::load(const std::string& home) {
    Config cfg;

    std::string path = config_path(home);
    std::ifstream file(path);
    if (file.is_open()) {
        try {
            cfg = from_json(nlohmann::json::parse(file));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << path << ": " << e.what()
                      << " (using defaults)\n";
            cfg = Config{};
        }
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("DAILYRUN_SHELL")) {
        if (*v) cfg.shell = v;
    }

    return cfg;
}

} // namespace dailyrun
