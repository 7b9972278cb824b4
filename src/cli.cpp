#include "cli.hpp"

#include <stdexcept>
#include <utility>

namespace dailyrun {

void print_usage(std::ostream& out) {
    out << "Usage: dailyrun [options]\n"
        << "\n"
        << "Daily script by hostname that can be run by a systemd user timer.\n"
        << "\n"
        << "Options:\n"
        << "  --os {auto,arch,ubuntu}        Select OS or auto-detect from /etc/os-release\n"
        << "  -f, --run RUN_ARG              Run the given directory of scripts, script, or command\n"
        << "  -n, --dry-run RUN_ARG          Show what --run would do without doing it\n"
        << "  -v, --verbose                  Enable verbose output\n"
        << "  --dependencies {check,script}  Show required commands or suggest install commands\n"
        << "  --configs {create,paths,edit-timer,edit-service,delete}\n"
        << "                                 Manage the systemd service/timer files\n"
        << "  --run-arg RUN_ARG              Argument passed to --run by the service (required\n"
        << "                                 with --configs create)\n"
        << "  --install-systemd-timer {daily,hourly}\n"
        << "                                 Print installation guidance\n"
        << "  --Persistent {true,false}      [Timer] Persistent= (default true)\n"
        << "  --OnCalendar EXPR              [Timer] OnCalendar= (default '*-*-* 14:00:00')\n"
        << "  --Description TEXT             [Unit] Description= (default uses binary path)\n"
        << "  --status                       Show the user timer status\n"
        << "  --enable_and_start             Enable and start the user timer\n"
        << "  --disable_and_stop             Disable and stop the user timer\n"
        << "  --logs                         Show today's logs of the service\n"
        << "  -h, --help                     Show this help\n"
        << "\n"
        << "Environment variables:\n"
        << "  EDITOR                         Editor for --configs edit-timer/edit-service\n"
        << "  DAILYRUN_SHELL                 Interpreter for non-executable scripts (default bash)\n";
}

const char* install_cadence_name(InstallCadence cadence) {
    switch (cadence) {
        case InstallCadence::Daily:  return "daily";
        case InstallCadence::Hourly: return "hourly";
        case InstallCadence::None:   break;
    }
    return "none";
}

template <typename T>
static T parse_choice(const std::string& flag, const std::string& value,
                      const std::vector<std::pair<const char*, T>>& choices) {
    for (const auto& [name, result] : choices) {
        if (value == name) return result;
    }
    std::string allowed;
    for (const auto& choice : choices) {
        if (!allowed.empty()) allowed += ", ";
        allowed += std::string("'") + choice.first + "'";
    }
    throw std::invalid_argument("argument " + flag + ": invalid choice: '" + value +
                                "' (choose from " + allowed + ")");
}

static void set_control(Options& opts, ControlIntent intent, const std::string& flag) {
    if (opts.control && *opts.control != intent) {
        throw std::invalid_argument(
            "argument " + flag + ": not allowed with another of "
            "--status/--enable_and_start/--disable_and_stop/--logs");
    }
    opts.control = intent;
}

Options parse_args(const std::vector<std::string>& args) {
    Options opts;

    for (size_t i = 0; i < args.size(); i++) {
        std::string flag = args[i];
        std::optional<std::string> inline_value;

        // --flag=value form (long options only)
        if (flag.rfind("--", 0) == 0) {
            auto eq = flag.find('=');
            if (eq != std::string::npos) {
                inline_value = flag.substr(eq + 1);
                flag = flag.substr(0, eq);
            }
        }

        auto value = [&]() -> std::string {
            if (inline_value) return *inline_value;
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("argument " + flag + ": expected one argument");
            }
            return args[++i];
        };
        auto no_value = [&]() {
            if (inline_value) {
                throw std::invalid_argument("argument " + flag + ": ignored explicit argument '" +
                                            *inline_value + "'");
            }
        };

        if (flag == "-h" || flag == "--help") {
            no_value();
            opts.help = true;
        } else if (flag == "--os") {
            opts.os = parse_choice<OsSelection>(flag, value(), {
                {"auto", OsSelection::Auto},
                {"arch", OsSelection::Arch},
                {"ubuntu", OsSelection::Ubuntu}});
        } else if (flag == "-f" || flag == "--run") {
            opts.run_target = value();
        } else if (flag == "-n" || flag == "--dry-run") {
            opts.dry_run_target = value();
        } else if (flag == "-v" || flag == "--verbose") {
            no_value();
            opts.verbose = true;
        } else if (flag == "--dependencies") {
            opts.dependencies = parse_choice<DependencyMode>(flag, value(), {
                {"check", DependencyMode::Check},
                {"script", DependencyMode::Script}});
        } else if (flag == "--configs") {
            opts.configs = parse_choice<ConfigsMode>(flag, value(), {
                {"create", ConfigsMode::Create},
                {"paths", ConfigsMode::Paths},
                {"edit-timer", ConfigsMode::EditTimer},
                {"edit-service", ConfigsMode::EditService},
                {"delete", ConfigsMode::Delete}});
        } else if (flag == "--run-arg") {
            opts.run_arg = value();
        } else if (flag == "--install-systemd-timer") {
            opts.install_timer = parse_choice<InstallCadence>(flag, value(), {
                {"daily", InstallCadence::Daily},
                {"hourly", InstallCadence::Hourly}});
        } else if (flag == "--Persistent") {
            opts.persistent = value();
        } else if (flag == "--OnCalendar") {
            opts.on_calendar = value();
        } else if (flag == "--Description") {
            opts.description = value();
        } else if (flag == "--status") {
            no_value();
            set_control(opts, ControlIntent::Status, flag);
        } else if (flag == "--enable_and_start") {
            no_value();
            set_control(opts, ControlIntent::EnableAndStart, flag);
        } else if (flag == "--disable_and_stop") {
            no_value();
            set_control(opts, ControlIntent::DisableAndStop, flag);
        } else if (flag == "--logs") {
            no_value();
            set_control(opts, ControlIntent::Logs, flag);
        } else {
            throw std::invalid_argument("unrecognized arguments: " + args[i]);
        }
    }

    if (opts.run_target && opts.dry_run_target) {
        throw std::invalid_argument("argument -n/--dry-run: not allowed with argument -f/--run");
    }

    return opts;
}

} // namespace dailyrun
