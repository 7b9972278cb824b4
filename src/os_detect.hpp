#pragma once
#include <string>

namespace dailyrun {

enum class OsSelection { Auto, Arch, Ubuntu };
enum class OsFamily { Arch, Ubuntu, Unknown };

// Explicit selections are returned as-is. Auto reads os_release_path and
// looks for "arch linux" then "ubuntu" (case-insensitive).
OsFamily detect_os(OsSelection selection, const std::string& os_release_path);

const char* os_family_name(OsFamily family);

} // namespace dailyrun
