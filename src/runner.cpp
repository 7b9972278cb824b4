#include "runner.hpp"
#include "process.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <vector>

namespace dailyrun {

namespace fs = std::filesystem;

TargetKind classify_target(const std::string& target) {
    std::error_code ec;
    if (fs::is_directory(target, ec)) return TargetKind::Directory;
    if (fs::is_regular_file(target, ec)) {
        return is_executable_file(target) ? TargetKind::ExecutableFile
                                          : TargetKind::ScriptFile;
    }
    return TargetKind::Command;
}

static void report(const ProcessResult& result, const std::string& what,
                   bool verbose) {
    if (!verbose) return;
    if (!result.started) {
        std::cerr << "[run] Failed to start: " << what << "\n";
    } else if (result.exit_code != 0) {
        std::cerr << "[run] " << what << " exited with status "
                  << result.exit_code << "\n";
    }
}

// A bare file name would be looked up on PATH by exec; pin it to the cwd.
static std::string exec_path(const std::string& file) {
    if (file.find('/') != std::string::npos) return file;
    return "./" + file;
}

static std::vector<fs::path> sorted_entries(const std::string& dir) {
    std::vector<fs::path> entries;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        std::cerr << "[run] Cannot list " << dir << ": " << ec.message() << "\n";
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::path& a, const fs::path& b) {
                  return a.filename().string() < b.filename().string();
              });
    return entries;
}

static void run_directory(const std::string& dir, const RunOptions& opts,
                          ProcessRunner& processes, std::ostream& out) {
    for (const auto& entry : sorted_entries(dir)) {
        std::string full_path = entry.string();
        std::error_code ec;
        if (!fs::is_regular_file(entry, ec) || !is_executable_file(full_path)) {
            if (opts.verbose) out << "Skipping: " << full_path << "\n";
            continue;
        }

        if (opts.verbose) out << "Found executable script: " << full_path << "\n";
        if (opts.dry_run) {
            out << "[DRYRUN] Would run: '" << full_path << "'\n";
            continue;
        }
        out << "Running: '" << full_path << "'\n";
        report(processes.run({full_path}), full_path, opts.verbose);
    }
}

void run_target(const std::string& target, const RunOptions& opts,
                ProcessRunner& processes, std::ostream& out) {
    switch (classify_target(target)) {
        case TargetKind::Directory:
            run_directory(target, opts, processes, out);
            break;

        case TargetKind::ExecutableFile:
            if (opts.dry_run) {
                out << "[DRYRUN] Would run file: '" << target << "'\n";
            } else {
                out << "Running file: '" << target << "'\n";
                report(processes.run({exec_path(target)}), target, opts.verbose);
            }
            break;

        case TargetKind::ScriptFile:
            if (opts.verbose) {
                out << "'" << target << "' is a file but probably not executable. "
                    << "Attempting to run in shell.\n";
            }
            if (opts.dry_run) {
                out << "[DRYRUN] Would run via shell: '" << target << "'\n";
            } else {
                report(processes.run({opts.shell, target}), target, opts.verbose);
            }
            break;

        case TargetKind::Command:
            if (opts.dry_run) {
                out << "[DRYRUN] Would run command: " << target << "\n";
            } else {
                report(processes.run_shell(target), target, opts.verbose);
            }
            break;
    }
}

} // namespace dailyrun
