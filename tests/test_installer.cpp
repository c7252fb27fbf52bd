#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "catch2/catch.hpp"
#include "numpad_setup/dry_run_host_system.hpp"
#include "numpad_setup/install_error.hpp"
#include "numpad_setup/installer.hpp"
#include "numpad_setup/logging_probe.hpp"
#include "numpad_setup/selection_prompt.hpp"
#include "test/fake_host_system.hpp"
#include "test/fake_probe.hpp"
#include "test/install_error_matcher.hpp"
#include "test/temp_dir.hpp"

using namespace numpad::setup;
using test::HasKind;

namespace {

const std::filesystem::path kSourceDir(NUMPAD_SETUP_SOURCE_DIR);

const char* kTemplate =
    "[Service]\n"
    "ExecStart=/usr/share/asus_touchpad_numpad-driver/asus_touchpad.py --model $LAYOUT "
    "--percentage-key $PERCENTAGE_KEY --numpad-delay $NUMPAD_DELAY --custom-key-delay $CUSTOM_KEY_DELAY\n";

std::string slurp(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream text;
    text << in.rdbuf();
    return text.str();
}

// Two DesignWare buses, two layouts, a template and a driver in a scratch
// tree; outputs point into the same tree.
InstallerConfig scratchConfig(const test::TempDir& dir) {
    dir.write("sys/i2c-0/name", "Synopsys DesignWare I2C adapter\n");
    dir.write("sys/i2c-1/name", "Synopsys DesignWare I2C adapter\n");
    dir.write("sys/i2c-2/name", "AMDGPU DM i2c hw bus 0\n");
    dir.write("src/layouts/ux433fa.toml", slurp(kSourceDir / "data" / "layouts" / "ux433fa.toml"));
    dir.write("src/layouts/m433ia.toml", slurp(kSourceDir / "data" / "layouts" / "m433ia.toml"));
    dir.write("src/asus_touchpad_numpad.service", kTemplate);
    dir.write("src/asus_touchpad.py", "#!/usr/bin/env python3\n");

    InstallerConfig config;
    config.paths.service_template = dir.path() / "src" / "asus_touchpad_numpad.service";
    config.paths.layouts_dir = dir.path() / "src" / "layouts";
    config.paths.driver = dir.path() / "src" / "asus_touchpad.py";
    config.paths.install_dir = dir.path() / "out" / "share";
    config.paths.log_dir = dir.path() / "out" / "log";
    config.paths.unit_dir = dir.path() / "out" / "systemd";
    config.paths.modules_load_dir = dir.path() / "out" / "modules-load.d";
    config.paths.i2c_sysfs_dir = dir.path() / "sys";
    config.paths.i2c_dev_dir = dir.path() / "dev";
    return config;
}

SelectionRequest ux433fa() {
    SelectionRequest request;
    request.model = "ux433fa";
    request.keyboard = "Qwerty";
    request.numpad_delay = "0.4";
    request.custom_key_delay = "0.4";
    return request;
}

struct CountingSource : public SelectionSource {
    int calls{0};
    std::optional<Selection> collect(const std::vector<std::string>& /*models*/) override {
        ++calls;
        return std::nullopt;
    }
};

bool ranCommand(const test::FakeHostSystem& host, const std::string& line) {
    auto lines = host.commandLines();
    return std::find(lines.begin(), lines.end(), line) != lines.end();
}

}  // namespace

SCENARIO("running the installer without root") {
    test::TempDir dir;
    test::FakeHostSystem host;
    test::FakeProbe probe;
    probe.responding = {0};
    host.privileged = false;
    host.commands = {"apt"};
    CountingSource source;

    Installer installer(scratchConfig(dir), host, probe);

    WHEN("running in any mode") {
        const bool install_deps = GENERATE(false, true);
        THEN("it fails on the permission check and does nothing else") {
            REQUIRE_THROWS_MATCHES(installer.run(install_deps, source), InstallError,
                                   HasKind(ErrorKind::Permission));
            REQUIRE(host.ran.empty());
            REQUIRE(host.looked_up.empty());
            REQUIRE_FALSE(host.touchedFilesystem());
            REQUIRE(probe.probed.empty());
            REQUIRE(source.calls == 0);
        }
    }
}

SCENARIO("a complete installation") {
    test::TempDir dir;
    test::FakeHostSystem host;
    test::FakeProbe probe;
    probe.responding = {1};
    auto config = scratchConfig(dir);
    PresetSelection source(ux433fa());

    Installer installer(config, host, probe);
    auto outcome = installer.run(false, source);

    THEN("the service is installed") {
        REQUIRE(outcome == RunOutcome::Installed);
    }
    THEN("the touchpad bus is the first one that answered") {
        REQUIRE(installer.touchpadInterface().has_value());
        REQUIRE(installer.touchpadInterface()->bus == 1);
        REQUIRE(probe.probed == std::vector<unsigned>{0, 1});
    }
    THEN("the unit file carries the four selected values") {
        const auto unit = config.paths.unit_dir / "asus_touchpad_numpad.service";
        REQUIRE(host.written.count(unit) == 1);
        REQUIRE(host.written.at(unit) ==
                "[Service]\n"
                "ExecStart=/usr/share/asus_touchpad_numpad-driver/asus_touchpad.py --model ux433fa "
                "--percentage-key 6 --numpad-delay 0.4 --custom-key-delay 0.4\n");
    }
    THEN("driver and every layout are installed") {
        const auto layouts_dir = config.paths.install_dir / "numpad_layouts";
        REQUIRE(host.installed.size() == 3);
        REQUIRE(host.installed[0].first == config.paths.driver);
        REQUIRE(host.installed[0].second == config.paths.install_dir);
        REQUIRE(host.installed[1].first.filename() == "m433ia.toml");
        REQUIRE(host.installed[2].first.filename() == "ux433fa.toml");
        REQUIRE(host.installed[1].second == layouts_dir);
        REQUIRE(std::find(host.directories.begin(), host.directories.end(), config.paths.log_dir) !=
                host.directories.end());
    }
    THEN("every layout is also written as a module the daemon can import") {
        const auto layouts_dir = config.paths.install_dir / "numpad_layouts";
        REQUIRE(host.written.count(layouts_dir / "m433ia.py") == 1);
        REQUIRE(host.written.count(layouts_dir / "ux433fa.py") == 1);
        const auto& module = host.written.at(layouts_dir / "ux433fa.py");
        REQUIRE(module.rfind("from evdev import ecodes\n", 0) == 0);
        REQUIRE(module.find("top_offset = 0.3\n") != std::string::npos);
    }
    THEN("i2c-dev is loaded now and on every boot") {
        REQUIRE(host.written.at(config.paths.modules_load_dir / "i2c-dev.conf") == "i2c-dev\n");
        REQUIRE(host.commandLines() == std::vector<std::string>{
                                           "modprobe i2c-dev",
                                           "systemctl enable asus_touchpad_numpad",
                                           "systemctl restart asus_touchpad_numpad",
                                       });
    }
}

SCENARIO("dependency installation") {
    test::TempDir dir;
    test::FakeHostSystem host;
    test::FakeProbe probe;
    probe.responding = {0};
    PresetSelection source(ux433fa());
    Installer installer(scratchConfig(dir), host, probe);

    GIVEN("pacman and dnf are available") {
        host.commands = {"pacman", "dnf"};
        installer.run(true, source);
        THEN("only pacman installs packages") {
            REQUIRE(ranCommand(host, "pacman --noconfirm -S python-evdev i2c-tools git"));
            REQUIRE_FALSE(ranCommand(host, "dnf -y install python3-evdev i2c-tools git"));
            REQUIRE(host.commandLines().front() == "pacman --noconfirm -S python-evdev i2c-tools git");
        }
    }
    GIVEN("all supported package managers are available") {
        host.commands = {"apt", "pacman", "dnf"};
        REQUIRE(installer.installDependencies() == std::optional<std::string>("apt"));
        THEN("apt is used and the others are not even looked up") {
            REQUIRE(host.commandLines() == std::vector<std::string>{
                                               "apt -y install python3-evdev i2c-tools git",
                                               "python3 -c import pip",
                                               "python3 -m pip install pyudev",
                                           });
            REQUIRE(host.looked_up == std::vector<std::string>{"apt"});
        }
    }
    GIVEN("no supported package manager") {
        REQUIRE_FALSE(installer.installDependencies().has_value());
        THEN("only pyudev is installed through pip") {
            REQUIRE(host.commandLines() == std::vector<std::string>{
                                               "python3 -c import pip",
                                               "python3 -m pip install pyudev",
                                           });
            REQUIRE(host.looked_up == std::vector<std::string>{"apt", "pacman", "dnf"});
        }
    }
    GIVEN("python3 without pip") {
        host.commands = {"apt"};
        host.exit_codes["python3 -c import pip"] = 1;
        installer.installDependencies();
        THEN("pyudev is skipped") {
            REQUIRE(ranCommand(host, "apt -y install python3-evdev i2c-tools git"));
            REQUIRE_FALSE(ranCommand(host, "python3 -m pip install pyudev"));
        }
    }
    GIVEN("a package manager that fails") {
        host.commands = {"dnf"};
        host.exit_codes["dnf -y install python3-evdev i2c-tools git"] = 1;
        host.exit_codes["python3 -m pip install pyudev"] = 1;
        THEN("the installation still goes on") {
            REQUIRE(installer.run(true, source) == RunOutcome::Installed);
        }
    }
    GIVEN("dependency mode is off") {
        host.commands = {"apt"};
        installer.run(false, source);
        THEN("no package manager is consulted") {
            REQUIRE(host.looked_up.empty());
            REQUIRE_FALSE(ranCommand(host, "apt -y install python3-evdev i2c-tools git"));
            REQUIRE_FALSE(ranCommand(host, "python3 -c import pip"));
        }
    }
}

SCENARIO("failures stop the installation where they happen") {
    test::TempDir dir;
    test::FakeHostSystem host;
    test::FakeProbe probe;
    probe.responding = {0};
    auto config = scratchConfig(dir);
    PresetSelection preset(ux433fa());

    GIVEN("modprobe fails") {
        host.exit_codes["modprobe i2c-dev"] = 1;
        Installer installer(config, host, probe);
        THEN("no interface is probed") {
            REQUIRE_THROWS_MATCHES(installer.run(false, preset), InstallError, HasKind(ErrorKind::ModuleLoad));
            REQUIRE(probe.probed.empty());
            REQUIRE_FALSE(host.touchedFilesystem());
        }
    }
    GIVEN("no DesignWare adapter") {
        config.controller = "Cadence";
        Installer installer(config, host, probe);
        THEN("the installation fails before probing") {
            REQUIRE_THROWS_MATCHES(installer.run(false, preset), InstallError, HasKind(ErrorKind::NoInterface));
            REQUIRE(probe.probed.empty());
        }
    }
    GIVEN("no bus answers the probe") {
        probe.responding.clear();
        Installer installer(config, host, probe);
        THEN("the touchpad is not found and nothing is written") {
            REQUIRE_THROWS_MATCHES(installer.run(false, preset), InstallError, HasKind(ErrorKind::DeviceNotFound));
            REQUIRE(probe.probed == std::vector<unsigned>{0, 1});
            REQUIRE_FALSE(host.touchedFilesystem());
        }
    }
    GIVEN("an invalid menu choice") {
        std::istringstream in("7\n");
        std::ostringstream out;
        SelectionPrompt prompt(in, out);
        Installer installer(config, host, probe);
        THEN("later steps never run") {
            REQUIRE_THROWS_MATCHES(installer.run(false, prompt), InstallError, HasKind(ErrorKind::InvalidOption));
            REQUIRE_FALSE(host.touchedFilesystem());
            REQUIRE(host.commandLines() == std::vector<std::string>{"modprobe i2c-dev"});
        }
    }
    GIVEN("an invalid delay") {
        std::istringstream in("1\n1\nabc\n");
        std::ostringstream out;
        SelectionPrompt prompt(in, out);
        Installer installer(config, host, probe);
        THEN("later steps never run") {
            REQUIRE_THROWS_MATCHES(installer.run(false, prompt), InstallError, HasKind(ErrorKind::InvalidDuration));
            REQUIRE_FALSE(host.touchedFilesystem());
        }
    }
    GIVEN("the user quits") {
        std::istringstream in("3\n");
        std::ostringstream out;
        SelectionPrompt prompt(in, out);
        Installer installer(config, host, probe);
        THEN("the run is cancelled without installing") {
            REQUIRE(installer.run(false, prompt) == RunOutcome::Cancelled);
            REQUIRE_FALSE(host.touchedFilesystem());
            REQUIRE(out.str().find("1) m433ia") != std::string::npos);
            REQUIRE(out.str().find("2) ux433fa") != std::string::npos);
            REQUIRE(out.str().find("3) Quit") != std::string::npos);
        }
    }
    GIVEN("a broken layout file for the chosen model") {
        dir.write("src/layouts/ux433fa.toml", "cols = 5\nrows = 4\nkeys = []\n");
        Installer installer(config, host, probe);
        THEN("the layout is rejected before anything is written") {
            REQUIRE_THROWS_MATCHES(installer.run(false, preset), InstallError, HasKind(ErrorKind::InvalidLayout));
            REQUIRE_FALSE(host.touchedFilesystem());
        }
    }
    GIVEN("a missing service template") {
        config.paths.service_template = dir.path() / "src" / "missing.service";
        Installer installer(config, host, probe);
        THEN("the installation fails on the template") {
            REQUIRE_THROWS_MATCHES(installer.run(false, preset), InstallError, HasKind(ErrorKind::FileInstall));
        }
    }
    GIVEN("a driver that cannot be installed") {
        host.fail_installs = true;
        Installer installer(config, host, probe);
        THEN("the already written unit file stays in place") {
            REQUIRE_THROWS_MATCHES(installer.run(false, preset), InstallError, HasKind(ErrorKind::FileInstall));
            REQUIRE(host.written.count(config.paths.unit_dir / "asus_touchpad_numpad.service") == 1);
            REQUIRE_FALSE(ranCommand(host, "systemctl enable asus_touchpad_numpad"));
        }
    }
    GIVEN("systemctl enable fails") {
        host.exit_codes["systemctl enable asus_touchpad_numpad"] = 1;
        Installer installer(config, host, probe);
        THEN("the service is never started and installed files are kept") {
            REQUIRE_THROWS_MATCHES(installer.run(false, preset), InstallError, HasKind(ErrorKind::ServiceEnable));
            REQUIRE_FALSE(ranCommand(host, "systemctl restart asus_touchpad_numpad"));
            REQUIRE(host.installed.size() == 3);
            REQUIRE(host.written.count(config.paths.modules_load_dir / "i2c-dev.conf") == 1);
        }
    }
    GIVEN("systemctl restart fails") {
        host.exit_codes["systemctl restart asus_touchpad_numpad"] = 5;
        Installer installer(config, host, probe);
        THEN("the failure is a start error") {
            REQUIRE_THROWS_MATCHES(installer.run(false, preset), InstallError, HasKind(ErrorKind::ServiceStart));
            REQUIRE(ranCommand(host, "systemctl enable asus_touchpad_numpad"));
        }
    }
}

TEST_CASE("a dry run leaves the target tree untouched") {
    test::TempDir dir;
    auto config = scratchConfig(dir);
    DryRunHostSystem host;
    LoggingProbe probe;
    PresetSelection source(ux433fa());

    Installer installer(config, host, probe);
    REQUIRE(installer.run(true, source) == RunOutcome::Installed);
    REQUIRE(installer.touchpadInterface()->bus == 0);
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "out"));
}
