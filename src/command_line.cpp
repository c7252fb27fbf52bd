#include "numpad_setup/command_line.hpp"

#include <optional>
#include <stdexcept>

#include "numpad_setup/installer.hpp"

namespace numpad::setup {

CommandLineOptions readCommandLine(const std::vector<std::string>& args, const HostSystem& host) {
    CommandLineOptions options;
    std::optional<std::string> unknown;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "install_deps") {
            options.install_deps = true;
        } else if (arg == "--dry-run") {
            options.dry_run = true;
        } else if (arg == "--config" && i + 1 < args.size()) {
            options.config_path = args[++i];
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (!unknown) {
            unknown = arg;
        }
    }

    if (!options.dry_run) {
        requirePrivileges(host);
    }
    if (unknown) {
        throw std::invalid_argument("Unknown argument: " + *unknown);
    }
    return options;
}

void printUsage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " [install_deps] [--config FILE] [--dry-run]" << '\n'
        << "  install_deps     install python3-evdev, i2c-tools and pyudev" << '\n'
        << "  --config FILE    read paths and an optional [selection] from a TOML file" << '\n'
        << "  --dry-run        print every action instead of performing it" << '\n';
}

}  // namespace numpad::setup
