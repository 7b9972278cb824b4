#include "dispatcher.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "control.hpp"
#include "dependencies.hpp"
#include "environment.hpp"
#include "os_detect.hpp"
#include "process.hpp"
#include "runner.hpp"
#include "units.hpp"

namespace dailyrun {

static int handle_configs(const Options& opts, const Environment& env,
                          const Config& config, ProcessRunner& processes,
                          std::ostream& out) {
    switch (opts.configs) {
        case ConfigsMode::Paths:
            print_unit_paths(env, out);
            break;
        case ConfigsMode::Create: {
            if (!opts.run_arg || opts.run_arg->empty()) {
                out << "Error: --configs create requires --run-arg\n";
                return 1;
            }
            UnitSettings settings;
            settings.run_arg = *opts.run_arg;
            settings.description = opts.description;
            settings.on_calendar = opts.on_calendar;
            settings.persistent = opts.persistent;
            create_units(settings, env, config, out);
            break;
        }
        case ConfigsMode::EditService:
            edit_unit(UnitKind::Service, env, config, processes, out);
            break;
        case ConfigsMode::EditTimer:
            edit_unit(UnitKind::Timer, env, config, processes, out);
            break;
        case ConfigsMode::Delete:
            delete_units(env, out);
            break;
        case ConfigsMode::None:
            break;
    }
    return 0;
}

int dispatch(const Options& opts, const Environment& env, const Config& config,
             ProcessRunner& processes, std::ostream& out) {
    OsFamily os = detect_os(opts.os, env.os_release_path);
    if (opts.verbose) {
        out << "Detected/Selected OS: " << os_family_name(os) << "\n";
    }

    if (opts.dependencies == DependencyMode::Check) {
        check_dependencies(env, config, opts.verbose, out);
        return 0;
    }
    if (opts.dependencies == DependencyMode::Script) {
        suggest_install_script(env, config, opts.verbose, out);
        return 0;
    }

    if (opts.configs != ConfigsMode::None) {
        return handle_configs(opts, env, config, processes, out);
    }

    if (opts.install_timer != InstallCadence::None) {
        out << "You requested to install a systemd timer: "
            << install_cadence_name(opts.install_timer) << "\n"
            << "But the recommended way is to run: --configs create, then enable and start.\n";
        return 0;
    }

    if (opts.control) {
        run_control(*opts.control, processes, out);
        return 0;
    }

    RunOptions run_opts;
    run_opts.verbose = opts.verbose;
    run_opts.shell = config.shell;

    if (opts.run_target && !opts.run_target->empty()) {
        run_target(*opts.run_target, run_opts, processes, out);
    } else if (opts.dry_run_target && !opts.dry_run_target->empty()) {
        run_opts.dry_run = true;
        run_target(*opts.dry_run_target, run_opts, processes, out);
    } else if (opts.verbose) {
        out << "No run or dry-run argument provided. Doing nothing.\n";
    }
    return 0;
}

} // namespace dailyrun
