#pragma once
#include <string>
#include <vector>

namespace dailyrun {

struct ProcessResult {
    bool started = false;
    int exit_code = -1; // 127 when exec failed in the child
};

// Seam for every child process the tool spawns. Children inherit the
// terminal; callers wait for completion.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Exec argv[0] with the given arguments. No shell is involved; argv[0]
    // containing no '/' is looked up on PATH.
    virtual ProcessResult run(const std::vector<std::string>& argv) = 0;

    // Untrusted passthrough: hand command to /bin/sh -c verbatim. Nothing is
    // escaped, so the string has full shell semantics.
    virtual ProcessResult run_shell(const std::string& command) = 0;
};

class PosixProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv) override;
    ProcessResult run_shell(const std::string& command) override;
};

// Regular file (symlinks followed) with the owner-execute bit set.
bool is_executable_file(const std::string& path);

// Resolve a program name like `which`. Returns empty if not found.
std::string find_in_path(const std::string& name, const std::string& path_env);

} // namespace dailyrun
