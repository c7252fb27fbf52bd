#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "numpad_setup/host_system.hpp"

namespace numpad::setup {

struct CommandLineOptions {
    bool install_deps{false};
    bool dry_run{false};
    bool help{false};
    std::string config_path;
};

// Parses argv[1..]. Unless --dry-run is given, the privilege check on host
// comes first and nothing else in args is acted on when it fails
// (InstallError Permission). Unknown arguments then throw
// std::invalid_argument.
[[nodiscard]] CommandLineOptions readCommandLine(const std::vector<std::string>& args, const HostSystem& host);

void printUsage(std::ostream& out, const std::string& program);

}  // namespace numpad::setup
