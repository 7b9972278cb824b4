#include "cli.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "environment.hpp"
#include "process.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char* argv[]) try {
    std::vector<std::string> args(argv + 1, argv + argc);

    dailyrun::Options opts;
    try {
        opts = dailyrun::parse_args(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        dailyrun::print_usage(std::cerr);
        return 2;
    }

    if (opts.help) {
        dailyrun::print_usage(std::cout);
        return 0;
    }

    auto env = dailyrun::Environment::capture(argc > 0 ? argv[0] : nullptr);
    auto config = dailyrun::Config::load(env.home);

    dailyrun::PosixProcessRunner processes;
    return dailyrun::dispatch(opts, env, config, processes, std::cout);
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
