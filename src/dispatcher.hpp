#pragma once
#include <ostream>

namespace dailyrun {

struct Options;
struct Config;
struct Environment;
class ProcessRunner;

// Route one invocation to exactly one handler. First matching branch wins:
// dependencies, configs, install-systemd-timer, control intent, run/dry-run.
// Returns the process exit status.
int dispatch(const Options& opts, const Environment& env, const Config& config,
             ProcessRunner& processes, std::ostream& out);

} // namespace dailyrun
