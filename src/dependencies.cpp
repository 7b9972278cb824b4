#include "dependencies.hpp"
#include "config.hpp"
#include "environment.hpp"
#include "process.hpp"

namespace dailyrun {

std::vector<std::string> missing_programs(const std::vector<std::string>& required,
                                          const std::string& path_env) {
    std::vector<std::string> missing;
    for (const auto& name : required) {
        if (find_in_path(name, path_env).empty()) {
            missing.push_back(name);
        }
    }
    return missing;
}

std::string install_prefix(OsFamily family) {
    switch (family) {
        case OsFamily::Arch:   return "sudo pacman -S";
        case OsFamily::Ubuntu: return "sudo apt-get install";
        case OsFamily::Unknown: break;
    }
    return "<your_package_manager_install_command>";
}

void check_dependencies(const Environment& env, const Config& config,
                        bool verbose, std::ostream& out) {
    for (const auto& name : config.dependencies) {
        std::string found = find_in_path(name, env.path);
        if (!found.empty()) {
            out << "[OK]   " << name << " found at " << found << "\n";
        } else {
            out << "[MISS] " << name << " NOT found\n";
        }
    }
    if (verbose) out << "Dependency check finished.\n";
}

void suggest_install_script(const Environment& env, const Config& config,
                            bool verbose, std::ostream& out) {
    OsFamily family = detect_os(OsSelection::Auto, env.os_release_path);
    auto missing = missing_programs(config.dependencies, env.path);

    if (missing.empty()) {
        out << "All essential commands appear to be installed.\n";
        return;
    }

    std::string prefix = install_prefix(family);
    out << "Suggested installation commands (based on detected OS):\n";
    for (const auto& name : missing) {
        out << "  " << prefix << " " << name << "\n";
    }

    if (verbose) out << "Suggested install script generation completed.\n";
}

} // namespace dailyrun
