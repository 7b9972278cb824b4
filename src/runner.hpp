#pragma once
#include <ostream>
#include <string>

namespace dailyrun {

class ProcessRunner;

enum class TargetKind { Directory, ExecutableFile, ScriptFile, Command };

TargetKind classify_target(const std::string& target);

struct RunOptions {
    bool dry_run = false;
    bool verbose = false;
    std::string shell = "bash"; // interpreter for ScriptFile targets
};

// Run (or with dry_run, describe) a directory of scripts, a single file, or
// an opaque shell command. Child exit statuses are not propagated.
void run_target(const std::string& target, const RunOptions& opts,
                ProcessRunner& processes, std::ostream& out);

} // namespace dailyrun
