#include <catch2/catch.hpp>
#include "os_detect.hpp"
#include "test_helpers.hpp"

using namespace dailyrun;

TEST_CASE("detect_os: explicit selection ignores file content", "[os]") {
    test::TempDir dir;
    std::string release = dir.path + "/os-release";
    test::write_file(release, "NAME=\"Ubuntu\"\n");

    REQUIRE(detect_os(OsSelection::Arch, release) == OsFamily::Arch);
    REQUIRE(detect_os(OsSelection::Ubuntu, dir.path + "/missing") == OsFamily::Ubuntu);
}

TEST_CASE("detect_os: auto recognizes Arch Linux case-insensitively", "[os]") {
    test::TempDir dir;
    std::string release = dir.path + "/os-release";
    test::write_file(release, "NAME=\"ARCH LINUX\"\nID=arch\n");
    REQUIRE(detect_os(OsSelection::Auto, release) == OsFamily::Arch);
}

TEST_CASE("detect_os: Arch marker wins over Ubuntu marker", "[os]") {
    test::TempDir dir;
    std::string release = dir.path + "/os-release";
    test::write_file(release, "NAME=\"Ubuntu\"\nPRETTY_NAME=\"not really Arch Linux\"\n");
    REQUIRE(detect_os(OsSelection::Auto, release) == OsFamily::Arch);
}

TEST_CASE("detect_os: auto recognizes Ubuntu", "[os]") {
    test::TempDir dir;
    std::string release = dir.path + "/os-release";
    test::write_file(release, "NAME=\"Ubuntu\"\nVERSION_ID=\"24.04\"\n");
    REQUIRE(detect_os(OsSelection::Auto, release) == OsFamily::Ubuntu);
}

TEST_CASE("detect_os: unknown distribution and missing file", "[os]") {
    test::TempDir dir;
    std::string release = dir.path + "/os-release";
    test::write_file(release, "NAME=\"Fedora Linux\"\n");
    REQUIRE(detect_os(OsSelection::Auto, release) == OsFamily::Unknown);
    REQUIRE(detect_os(OsSelection::Auto, dir.path + "/missing") == OsFamily::Unknown);
}

TEST_CASE("os_family_name: short names", "[os]") {
    REQUIRE(std::string(os_family_name(OsFamily::Arch)) == "arch");
    REQUIRE(std::string(os_family_name(OsFamily::Ubuntu)) == "ubuntu");
    REQUIRE(std::string(os_family_name(OsFamily::Unknown)) == "unknown");
}
