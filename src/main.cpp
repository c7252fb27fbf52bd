#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "numpad_setup/command_line.hpp"
#include "numpad_setup/config_loader.hpp"
#include "numpad_setup/dry_run_host_system.hpp"
#include "numpad_setup/install_error.hpp"
#include "numpad_setup/installer.hpp"
#include "numpad_setup/logging_probe.hpp"
#include "numpad_setup/posix_host_system.hpp"
#include "numpad_setup/selection_prompt.hpp"

using numpad::setup::CommandLineOptions;
using numpad::setup::DryRunHostSystem;
using numpad::setup::HostSystem;
using numpad::setup::Installer;
using numpad::setup::InstallerConfig;
using numpad::setup::InstallError;
using numpad::setup::LoggingProbe;
using numpad::setup::PosixHostSystem;
using numpad::setup::PresetSelection;
using numpad::setup::SelectionPrompt;
using numpad::setup::SelectionSource;
using numpad::setup::TouchpadProbe;

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    try {
        PosixHostSystem posix_host;
        CommandLineOptions options;
        try {
            options = numpad::setup::readCommandLine(args, posix_host);
        } catch (const std::invalid_argument& ex) {
            std::cerr << ex.what() << '\n';
            numpad::setup::printUsage(std::cerr, argv[0]);
            return 1;
        }
        if (options.help) {
            numpad::setup::printUsage(std::cout, argv[0]);
            return 0;
        }

        InstallerConfig config = options.config_path.empty()
                                     ? numpad::setup::defaultConfig(std::filesystem::current_path())
                                     : numpad::setup::loadConfigFile(options.config_path);

        DryRunHostSystem dry_run_host;
        HostSystem& host = options.dry_run ? static_cast<HostSystem&>(dry_run_host) : posix_host;
        std::unique_ptr<TouchpadProbe> probe;
        if (options.dry_run) {
            probe = std::make_unique<LoggingProbe>();
        } else {
            probe = numpad::setup::createProbe(config.probe_backend, config.paths.i2c_dev_dir);
        }

        std::unique_ptr<SelectionSource> source;
        if (config.selection) {
            source = std::make_unique<PresetSelection>(*config.selection);
        } else {
            source = std::make_unique<SelectionPrompt>(std::cin, std::cout);
        }

        Installer installer(std::move(config), host, *probe);
        installer.run(options.install_deps, *source);
        return 0;
    } catch (const InstallError& err) {
        std::cerr << numpad::setup::formatInstallError(err) << '\n';
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return 1;
    }
}
