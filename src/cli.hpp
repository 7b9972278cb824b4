#pragma once
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "control.hpp"
#include "os_detect.hpp"

namespace dailyrun {

enum class DependencyMode { None, Check, Script };
enum class ConfigsMode { None, Create, Paths, EditTimer, EditService, Delete };
enum class InstallCadence { None, Daily, Hourly };

struct Options {
    OsSelection os = OsSelection::Auto;
    std::optional<std::string> run_target;
    std::optional<std::string> dry_run_target;
    bool verbose = false;
    bool help = false;

    DependencyMode dependencies = DependencyMode::None;
    ConfigsMode configs = ConfigsMode::None;
    std::optional<std::string> run_arg;
    InstallCadence install_timer = InstallCadence::None;

    std::optional<std::string> persistent;
    std::optional<std::string> on_calendar;
    std::optional<std::string> description;

    // At most one is set; parse_args rejects combinations.
    std::optional<ControlIntent> control;
};

// Parse argv (without the program name). Throws std::invalid_argument on
// unknown flags, missing values, invalid choices, or conflicting flags.
Options parse_args(const std::vector<std::string>& args);

void print_usage(std::ostream& out);

const char* install_cadence_name(InstallCadence cadence);

} // namespace dailyrun
