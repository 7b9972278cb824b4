#pragma once
#include <ostream>
#include <string>
#include <vector>

namespace dailyrun {

class ProcessRunner;

enum class ControlIntent { Status, EnableAndStart, DisableAndStop, Logs };

// Fixed systemctl/journalctl invocation for an intent
std::vector<std::string> control_command(ControlIntent intent);

// Echo the command line, then run it. Its exit status is not inspected.
void run_control(ControlIntent intent, ProcessRunner& processes, std::ostream& out);

} // namespace dailyrun
