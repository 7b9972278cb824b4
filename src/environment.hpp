#pragma once
#include <string>

namespace dailyrun {

// Everything the handlers would otherwise look up globally. Built once in
// main(); tests construct their own.
struct Environment {
    std::string home;
    std::string editor;                            // $EDITOR, may be empty
    std::string path;                              // $PATH
    std::string os_release_path = "/etc/os-release";
    std::string self_path;                         // absolute path of this binary

    static Environment capture(const char* argv0);
};

} // namespace dailyrun
