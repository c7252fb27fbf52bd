#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace numpad::setup {

struct CommandResult {
    int exit_code{0};

    [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
};

// Every side effect the installer has on the machine goes through here.
class HostSystem {
public:
    virtual ~HostSystem() = default;

    virtual bool isPrivileged() const = 0;
    virtual bool commandExists(const std::string& name) const = 0;

    // Runs argv[0] from PATH without a shell; the child shares our terminal.
    // A command that cannot be started exits 127, one killed by a signal
    // 128 + signal.
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;

    virtual bool createDirectories(const std::filesystem::path& path, std::string& error) = 0;
    virtual bool writeFile(const std::filesystem::path& path,
                           const std::string& contents,
                           std::string& error) = 0;
    // Copies source into target_dir, replacing an existing file, mode 0755.
    virtual bool installFile(const std::filesystem::path& source,
                             const std::filesystem::path& target_dir,
                             std::string& error) = 0;
};

}  // namespace numpad::setup
