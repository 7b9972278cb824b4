#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "os_detect.hpp"

namespace dailyrun {

struct Config;
struct Environment;

// Programs from `required` that are not resolvable on path_env
std::vector<std::string> missing_programs(const std::vector<std::string>& required,
                                          const std::string& path_env);

// Package-manager install prefix for an OS family
std::string install_prefix(OsFamily family);

void check_dependencies(const Environment& env, const Config& config,
                        bool verbose, std::ostream& out);

// Always auto-detects the OS; any --os override is ignored here.
void suggest_install_script(const Environment& env, const Config& config,
                            bool verbose, std::ostream& out);

} // namespace dailyrun
