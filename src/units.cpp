#include "units.hpp"
#include "config.hpp"
#include "environment.hpp"
#include "process.hpp"
#include "util.hpp"

#include <filesystem>
#include <stdexcept>

namespace dailyrun {

namespace fs = std::filesystem;

UnitPaths unit_paths(const std::string& home) {
    UnitPaths p;
    p.dir = home + "/.config/systemd/user";
    p.service = p.dir + "/" + kServiceUnit;
    p.timer = p.dir + "/" + kTimerUnit;
    return p;
}

std::string default_description(const std::string& self_path) {
    return "Daily User Run of " + self_path;
}

std::string normalize_persistent(const std::optional<std::string>& value,
                                 bool fallback) {
    if (!value) return fallback ? "true" : "false";
    if (*value == "true" || *value == "false") return *value;
    return "true";
}

static std::string description_for(const UnitSettings& settings,
                                   const Environment& env) {
    if (settings.description && !settings.description->empty()) {
        return *settings.description;
    }
    return default_description(env.self_path);
}

std::string render_service(const UnitSettings& settings, const Environment& env) {
    std::vector<std::string> lines = {
        "[Unit]",
        "Description=" + description_for(settings, env),
        "After=network.target",
        "",
        "[Service]",
        "Type=oneshot",
        "ExecStart=" + env.self_path + " --run \"" + settings.run_arg + "\"",
        "",
        "# End of service file\n",
    };
    return join(lines, "\n");
}

std::string render_timer(const UnitSettings& settings, const Environment& env,
                         const Config& config) {
    std::string on_calendar = config.timer.on_calendar;
    if (settings.on_calendar && !settings.on_calendar->empty()) {
        on_calendar = *settings.on_calendar;
    }

    std::vector<std::string> lines = {
        "[Unit]",
        "Description=Timer for: " + description_for(settings, env),
        "",
        "[Timer]",
        "OnCalendar=" + on_calendar,
        "Persistent=" + normalize_persistent(settings.persistent, config.timer.persistent),
        "",
        "[Install]",
        "WantedBy=default.target",
        "",
        "# End of timer file\n",
    };
    return join(lines, "\n");
}

void create_units(const UnitSettings& settings, const Environment& env,
                  const Config& config, std::ostream& out) {
    UnitPaths paths = unit_paths(env.home);

    std::error_code ec;
    fs::create_directories(paths.dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create " + paths.dir + ": " + ec.message());
    }

    if (!atomic_write_file(paths.service, render_service(settings, env))) {
        throw std::runtime_error("Failed to write " + paths.service);
    }
    if (!atomic_write_file(paths.timer, render_timer(settings, env, config))) {
        throw std::runtime_error("Failed to write " + paths.timer);
    }

    out << "Created service file: " << paths.service << "\n"
        << "Created timer file:   " << paths.timer << "\n"
        << "You can now enable and start the timer with:\n"
        << "  $ systemctl --user enable " << kTimerUnit << "\n"
        << "  $ systemctl --user start " << kTimerUnit << "\n";
}

void print_unit_paths(const Environment& env, std::ostream& out) {
    UnitPaths paths = unit_paths(env.home);
    out << paths.service << "\n" << paths.timer << "\n";
}

std::vector<std::string> resolve_editor(const Environment& env, const Config& config) {
    auto from_env = split_whitespace(env.editor);
    if (!from_env.empty()) return from_env;

    for (const auto& candidate : config.editors) {
        if (!find_in_path(candidate, env.path).empty()) {
            return {candidate};
        }
    }
    return {};
}

void edit_unit(UnitKind kind, const Environment& env, const Config& config,
               ProcessRunner& processes, std::ostream& out) {
    UnitPaths paths = unit_paths(env.home);
    const std::string& file = kind == UnitKind::Service ? paths.service : paths.timer;

    std::error_code ec;
    if (!fs::exists(file, ec)) {
        out << (kind == UnitKind::Service ? "Service" : "Timer")
            << " file not found: " << file << "\n";
        return;
    }

    auto editor = resolve_editor(env, config);
    if (editor.empty()) {
        out << "No suitable editor found! Please set $EDITOR.\n";
        return;
    }

    editor.push_back(file);
    processes.run(editor);
}

void delete_units(const Environment& env, std::ostream& out) {
    UnitPaths paths = unit_paths(env.home);

    std::error_code ec;
    if (fs::exists(paths.service, ec)) {
        fs::remove(paths.service);
        out << "Deleted service file: " << paths.service << "\n";
    }
    if (fs::exists(paths.timer, ec)) {
        fs::remove(paths.timer);
        out << "Deleted timer file: " << paths.timer << "\n";
    }
}

} // namespace dailyrun
