#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "numpad_setup/config_loader.hpp"
#include "numpad_setup/host_system.hpp"
#include "numpad_setup/i2c_bus.hpp"
#include "numpad_setup/selection.hpp"
#include "numpad_setup/touchpad_probe.hpp"

namespace numpad::setup {

struct PackageManager {
    std::string command;
    std::vector<std::string> install_argv;
};

// Checked in this order; the first one present is the only one used.
[[nodiscard]] const std::vector<PackageManager>& supportedPackageManagers();

inline const std::vector<std::string> kPipCheck = {"python3", "-c", "import pip"};
inline const std::vector<std::string> kPipInstall = {"python3", "-m", "pip", "install", "pyudev"};

// Throws InstallError(Permission) unless host runs with root privileges.
void requirePrivileges(const HostSystem& host);

enum class RunOutcome {
    Installed,
    Cancelled,
};

// Provisions the numpad driver. Each step either completes or throws
// InstallError; nothing done by earlier steps is undone.
class Installer {
public:
    Installer(InstallerConfig config, HostSystem& host, TouchpadProbe& probe);

    RunOutcome run(bool install_dependencies, SelectionSource& source);

    void checkPrivileges() const;
    // System packages through the first package manager found, then pyudev
    // through pip when python3 has it. Failing installs only warn. Returns
    // the package manager used, if any was found.
    std::optional<std::string> installDependencies();
    void loadKernelModule();
    [[nodiscard]] std::vector<I2cAdapter> findInterfaces() const;
    I2cAdapter detectTouchpad(const std::vector<I2cAdapter>& candidates);
    [[nodiscard]] std::optional<Selection> collectSelection(SelectionSource& source) const;
    std::filesystem::path renderService(const Selection& selection);
    void installFiles();
    void persistModuleLoad();
    void activateService();

    [[nodiscard]] const InstallerConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::optional<I2cAdapter>& touchpadInterface() const noexcept { return interface_; }

private:
    InstallerConfig config_;
    HostSystem& host_;
    TouchpadProbe& probe_;
    std::optional<I2cAdapter> interface_;

    [[nodiscard]] std::filesystem::path layoutsTargetDir() const;
    void runChecked(const std::vector<std::string>& argv);
};

}  // namespace numpad::setup
