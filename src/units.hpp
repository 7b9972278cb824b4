#pragma once
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace dailyrun {

class ProcessRunner;
struct Config;
struct Environment;

constexpr const char* kServiceUnit = "daily_by_hostname.service";
constexpr const char* kTimerUnit = "daily_by_hostname.timer";

struct UnitPaths {
    std::string dir;
    std::string service;
    std::string timer;
};

UnitPaths unit_paths(const std::string& home);

// Inputs for rendering; unset fields fall back to defaults.
struct UnitSettings {
    std::string run_arg;
    std::optional<std::string> description;
    std::optional<std::string> on_calendar;
    std::optional<std::string> persistent; // raw flag value
};

std::string default_description(const std::string& self_path);

// Anything but the exact strings "true"/"false" becomes "true".
std::string normalize_persistent(const std::optional<std::string>& value,
                                 bool fallback);

std::string render_service(const UnitSettings& settings, const Environment& env);
std::string render_timer(const UnitSettings& settings, const Environment& env,
                         const Config& config);

// Write both unit files (service first). Throws std::runtime_error on I/O
// failure.
void create_units(const UnitSettings& settings, const Environment& env,
                  const Config& config, std::ostream& out);

void print_unit_paths(const Environment& env, std::ostream& out);

enum class UnitKind { Service, Timer };

// Editor command (program + args) or empty if none is available
std::vector<std::string> resolve_editor(const Environment& env, const Config& config);

void edit_unit(UnitKind kind, const Environment& env, const Config& config,
               ProcessRunner& processes, std::ostream& out);

void delete_units(const Environment& env, std::ostream& out);

} // namespace dailyrun
