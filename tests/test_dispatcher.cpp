#include <catch2/catch.hpp>
#include "dispatcher.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "units.hpp"
#include "mock_process_runner.hpp"
#include "test_helpers.hpp"
#include <sstream>

using namespace dailyrun;

// Parse + dispatch against a temp HOME with mocked processes
struct DispatchFixture {
    test::TempDir home;
    Environment env = test::make_env(home.path);
    Config config;
    MockProcessRunner procs;
    std::ostringstream out;

    int run(const std::vector<std::string>& args) {
        return dispatch(parse_args(args), env, config, procs, out);
    }
};

// ═══ configs ═════════════════════════════════════════════════════

TEST_CASE("dispatch: configs create without run-arg fails and writes nothing", "[dispatcher]") {
    DispatchFixture f;
    REQUIRE(f.run({"--configs", "create"}) != 0);
    REQUIRE(f.out.str() == "Error: --configs create requires --run-arg\n");
    REQUIRE_FALSE(std::filesystem::exists(unit_paths(f.home.path).service));
    REQUIRE_FALSE(std::filesystem::exists(unit_paths(f.home.path).timer));
}

TEST_CASE("dispatch: configs create writes both units", "[dispatcher]") {
    DispatchFixture f;
    REQUIRE(f.run({"--configs", "create", "--run-arg", "/tmp/x",
                   "--OnCalendar", "09:00:00", "--Persistent", "false"}) == 0);

    auto p = unit_paths(f.home.path);
    std::string timer = test::read_file(p.timer);
    REQUIRE(timer.find("OnCalendar=09:00:00\n") != std::string::npos);
    REQUIRE(timer.find("Persistent=false\n") != std::string::npos);
    REQUIRE(test::read_file(p.service).find("\"/tmp/x\"") != std::string::npos);
}

TEST_CASE("dispatch: configs delete with no files exits cleanly", "[dispatcher]") {
    DispatchFixture f;
    REQUIRE(f.run({"--configs", "delete"}) == 0);
    REQUIRE(f.out.str().empty());
}

TEST_CASE("dispatch: configs paths", "[dispatcher]") {
    DispatchFixture f;
    REQUIRE(f.run({"--configs", "paths"}) == 0);
    auto p = unit_paths(f.home.path);
    REQUIRE(f.out.str() == p.service + "\n" + p.timer + "\n");
}

// ═══ priority ════════════════════════════════════════════════════

TEST_CASE("dispatch: dependencies win over everything else", "[dispatcher]") {
    DispatchFixture f;
    REQUIRE(f.run({"--dependencies", "check", "--configs", "create",
                   "--run-arg", "x", "--status", "-f", "echo hi"}) == 0);
    REQUIRE(f.out.str().find("[MISS] systemctl NOT found") != std::string::npos);
    REQUIRE(f.procs.call_count() == 0);
    REQUIRE_FALSE(std::filesystem::exists(unit_paths(f.home.path).dir));
}

TEST_CASE("dispatch: configs win over install, control and run", "[dispatcher]") {
    DispatchFixture f;
    REQUIRE(f.run({"--configs", "paths", "--install-systemd-timer", "daily",
                   "--logs", "-f", "echo hi"}) == 0);
    REQUIRE(f.out.str().find("You requested") == std::string::npos);
    REQUIRE(f.procs.call_count() == 0);
}

TEST_CASE("dispatch: install-systemd-timer is advisory", "[dispatcher]") {
    DispatchFixture f;
    REQUIRE(f.run({"--install-systemd-timer", "hourly", "--status"}) == 0);
    REQUIRE(f.out.str() ==
            "You requested to install a systemd timer: hourly\n"
            "But the recommended way is to run: --configs create, then enable and start.\n");
    REQUIRE(f.procs.call_count() == 0);
}

TEST_CASE("dispatch: control intent wins over run", "[dispatcher]") {
    DispatchFixture f;
    REQUIRE(f.run({"--status", "-f", "echo hi"}) == 0);
    REQUIRE(f.procs.runs.size() == 1);
    REQUIRE(f.procs.runs[0][0] == "systemctl");
    REQUIRE(f.procs.shell_commands.empty());
}

// ═══ run / dry-run ═══════════════════════════════════════════════

TEST_CASE("dispatch: run passes opaque command to the shell", "[dispatcher]") {
    DispatchFixture f;
    REQUIRE(f.run({"--run", "echo hello"}) == 0);
    REQUIRE(f.procs.shell_commands == std::vector<std::string>{"echo hello"});
}

TEST_CASE("dispatch: run uses configured shell for plain files", "[dispatcher]") {
    DispatchFixture f;
    f.config.shell = "dash";
    std::string file = f.home.path + "/job.sh";
    test::write_file(file, "echo hi\n");
    test::set_mode(file, 0644);

    REQUIRE(f.run({"-f", file}) == 0);
    REQUIRE(f.procs.runs.size() == 1);
    REQUIRE(f.procs.runs[0] == std::vector<std::string>{"dash", file});
}

TEST_CASE("dispatch: dry-run never spawns", "[dispatcher]") {
    DispatchFixture f;
    REQUIRE(f.run({"-n", "echo hello"}) == 0);
    REQUIRE(f.procs.call_count() == 0);
    REQUIRE(f.out.str() == "[DRYRUN] Would run command: echo hello\n");
}

TEST_CASE("dispatch: nothing requested", "[dispatcher]") {
    DispatchFixture f;
    REQUIRE(f.run({}) == 0);
    REQUIRE(f.out.str().empty());

    DispatchFixture verbose;
    test::write_file(verbose.env.os_release_path, "NAME=\"Arch Linux\"\n");
    REQUIRE(verbose.run({"-v"}) == 0);
    REQUIRE(verbose.out.str() ==
            "Detected/Selected OS: arch\n"
            "No run or dry-run argument provided. Doing nothing.\n");
}

TEST_CASE("dispatch: explicit --os is reported in verbose mode", "[dispatcher]") {
    DispatchFixture f;
    REQUIRE(f.run({"--os", "ubuntu", "-v", "--configs", "paths"}) == 0);
    REQUIRE(f.out.str().rfind("Detected/Selected OS: ubuntu\n", 0) == 0);
}

TEST_CASE("dispatch: dependency script ignores --os override", "[dispatcher]") {
    DispatchFixture f;
    test::write_file(f.env.os_release_path, "NAME=\"Ubuntu\"\n");
    REQUIRE(f.run({"--os", "arch", "--dependencies", "script"}) == 0);
    REQUIRE(f.out.str().find("sudo apt-get install systemctl") != std::string::npos);
    REQUIRE(f.out.str().find("pacman") == std::string::npos);
}
