#pragma once

#include "numpad_setup/host_system.hpp"

namespace numpad::setup {

class PosixHostSystem : public HostSystem {
public:
    bool isPrivileged() const override;
    bool commandExists(const std::string& name) const override;
    CommandResult run(const std::vector<std::string>& argv) override;

    bool createDirectories(const std::filesystem::path& path, std::string& error) override;
    bool writeFile(const std::filesystem::path& path,
                   const std::string& contents,
                   std::string& error) override;
    bool installFile(const std::filesystem::path& source,
                     const std::filesystem::path& target_dir,
                     std::string& error) override;

    // Same lookup as `command -v` for external programs.
    static bool executableOnPath(const std::string& name);
};

}  // namespace numpad::setup
