#include "environment.hpp"

#include <cstdlib>
#include <filesystem>
#include <unistd.h>
#include <pwd.h>

namespace dailyrun {

static std::string getenv_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

static std::string resolve_self_path(const char* argv0) {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.empty()) return exe.string();

    if (argv0 && *argv0) {
        auto abs = std::filesystem::absolute(argv0, ec);
        if (!ec) return abs.lexically_normal().string();
        return argv0;
    }
    return "dailyrun";
}

Environment Environment::capture(const char* argv0) {
    Environment env;
    env.home = getenv_or_empty("HOME");
    if (env.home.empty()) {
        if (const passwd* pw = getpwuid(getuid())) {
            if (pw->pw_dir) env.home = pw->pw_dir;
        }
    }
    env.editor = getenv_or_empty("EDITOR");
    env.path = getenv_or_empty("PATH");
    env.self_path = resolve_self_path(argv0);
    return env;
}

} // namespace dailyrun
