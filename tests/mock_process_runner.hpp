#pragma once
#include "process.hpp"
#include <string>
#include <vector>

namespace dailyrun {

class MockProcessRunner : public ProcessRunner {
public:
    std::vector<std::vector<std::string>> runs;
    std::vector<std::string> shell_commands;
    ProcessResult next_result{true, 0};

    ProcessResult run(const std::vector<std::string>& argv) override {
        runs.push_back(argv);
        return next_result;
    }

    ProcessResult run_shell(const std::string& command) override {
        shell_commands.push_back(command);
        return next_result;
    }

    size_t call_count() const { return runs.size() + shell_commands.size(); }
};

} // namespace dailyrun
