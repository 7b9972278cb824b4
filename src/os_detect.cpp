#include "os_detect.hpp"
#include "util.hpp"

namespace dailyrun {

OsFamily detect_os(OsSelection selection, const std::string& os_release_path) {
    if (selection == OsSelection::Arch) return OsFamily::Arch;
    if (selection == OsSelection::Ubuntu) return OsFamily::Ubuntu;

    std::string content;
    if (!read_file(os_release_path, content)) {
        return OsFamily::Unknown;
    }

    content = to_lower(content);
    if (content.find("arch linux") != std::string::npos) return OsFamily::Arch;
    if (content.find("ubuntu") != std::string::npos) return OsFamily::Ubuntu;
    return OsFamily::Unknown;
}

const char* os_family_name(OsFamily family) {
    switch (family) {
        case OsFamily::Arch:   return "arch";
        case OsFamily::Ubuntu: return "ubuntu";
        case OsFamily::Unknown: break;
    }
    return "unknown";
}

} // namespace dailyrun
