#include "process.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace dailyrun {

static ProcessResult wait_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return ProcessResult{false, -1};
    }
    if (WIFEXITED(status)) {
        return ProcessResult{true, WEXITSTATUS(status)};
    }
    if (WIFSIGNALED(status)) {
        return ProcessResult{true, 128 + WTERMSIG(status)};
    }
    return ProcessResult{true, -1};
}

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty() || argv[0].empty()) return ProcessResult{};

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        cargv.push_back(const_cast<char*>(a.c_str()));
    }
    cargv.push_back(nullptr);

    // Keep our own buffered output ahead of the child's
    std::cout.flush();
    std::cerr.flush();

    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[process] fork failed: " << std::strerror(errno) << "\n";
        return ProcessResult{};
    }

    if (pid == 0) {
        if (argv[0].find('/') != std::string::npos) {
            execv(cargv[0], cargv.data());
        } else {
            execvp(cargv[0], cargv.data());
        }
        _exit(127);
    }

    return wait_child(pid);
}

ProcessResult PosixProcessRunner::run_shell(const std::string& command) {
    std::cout.flush();
    std::cerr.flush();

    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[process] fork failed: " << std::strerror(errno) << "\n";
        return ProcessResult{};
    }

    if (pid == 0) {
        execl("/bin/sh", "sh", "-c", command.c_str(), nullptr);
        _exit(127);
    }

    return wait_child(pid);
}

bool is_executable_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return (st.st_mode & S_IXUSR) != 0;
}

std::string find_in_path(const std::string& name, const std::string& path_env) {
    if (name.empty()) return {};

    auto usable = [](const std::string& candidate) {
        std::error_code ec;
        return std::filesystem::is_regular_file(candidate, ec) &&
               access(candidate.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        return usable(name) ? name : std::string();
    }

    for (const auto& entry : split(path_env, ':')) {
        std::string dir = entry.empty() ? "." : entry;
        std::string candidate = dir + "/" + name;
        if (usable(candidate)) return candidate;
    }
    return {};
}

} // namespace dailyrun
