#include "control.hpp"
#include "process.hpp"
#include "units.hpp"
#include "util.hpp"

namespace dailyrun {

std::vector<std::string> control_command(ControlIntent intent) {
    switch (intent) {
        case ControlIntent::Status:
            return {"systemctl", "--user", "status", kTimerUnit};
        case ControlIntent::EnableAndStart:
            return {"systemctl", "--user", "enable", "--now", kTimerUnit};
        case ControlIntent::DisableAndStop:
            return {"systemctl", "--user", "disable", "--now", kTimerUnit};
        case ControlIntent::Logs:
            return {"journalctl", "--user-unit", kServiceUnit, "--since", "today"};
    }
    return {};
}

void run_control(ControlIntent intent, ProcessRunner& processes, std::ostream& out) {
    auto argv = control_command(intent);
    if (argv.empty()) return;
    out << "Running: " << join(argv, " ") << "\n";
    processes.run(argv);
}

} // namespace dailyrun
