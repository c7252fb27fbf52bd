#include "numpad_setup/dry_run_host_system.hpp"

#include <iostream>

#include "numpad_setup/posix_host_system.hpp"

namespace numpad::setup {

bool DryRunHostSystem::isPrivileged() const {
    std::cout << "[DryRun] Skipping privilege check" << '\n';
    return true;
}

bool DryRunHostSystem::commandExists(const std::string& name) const {
    return PosixHostSystem::executableOnPath(name);
}

CommandResult DryRunHostSystem::run(const std::vector<std::string>& argv) {
    std::cout << "[DryRun] Would run:";
    for (const auto& arg : argv) {
        std::cout << ' ' << arg;
    }
    std::cout << '\n';
    return {};
}

bool DryRunHostSystem::createDirectories(const std::filesystem::path& path, std::string& /*error*/) {
    std::cout << "[DryRun] Would create directory " << path.string() << '\n';
    return true;
}

bool DryRunHostSystem::writeFile(const std::filesystem::path& path,
                                 const std::string& contents,
                                 std::string& /*error*/) {
    std::cout << "[DryRun] Would write " << path.string()
              << " (" << contents.size() << " bytes):" << '\n';
    std::cout << contents;
    if (!contents.empty() && contents.back() != '\n') {
        std::cout << '\n';
    }
    return true;
}

bool DryRunHostSystem::installFile(const std::filesystem::path& source,
                                   const std::filesystem::path& target_dir,
                                   std::string& /*error*/) {
    std::cout << "[DryRun] Would install " << source.string()
              << " into " << target_dir.string() << '\n';
    return true;
}

}  // namespace numpad::setup
