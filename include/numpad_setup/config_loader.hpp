#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "numpad_setup/i2c_bus.hpp"
#include "numpad_setup/selection.hpp"
#include "numpad_setup/touchpad_probe.hpp"

namespace numpad::setup {

struct InstallPaths {
    // Inputs shipped next to the installer.
    std::filesystem::path service_template{"data/asus_touchpad_numpad.service"};
    std::filesystem::path layouts_dir{"data/layouts"};
    std::filesystem::path driver{"asus_touchpad.py"};

    // Outputs on the target system.
    std::filesystem::path install_dir{"/usr/share/asus_touchpad_numpad-driver"};
    std::filesystem::path log_dir{"/var/log/asus_touchpad_numpad-driver"};
    std::filesystem::path unit_dir{"/etc/systemd/system"};
    std::filesystem::path modules_load_dir{"/etc/modules-load.d"};

    // Kernel interfaces.
    std::filesystem::path i2c_sysfs_dir{"/sys/bus/i2c/devices"};
    std::filesystem::path i2c_dev_dir{"/dev"};
};

struct InstallerConfig {
    InstallPaths paths;
    std::string service_name{"asus_touchpad_numpad"};
    std::string kernel_module{"i2c-dev"};
    std::string controller{"DesignWare"};
    std::uint8_t touchpad_address{kTouchpadAddress};
    std::string probe_backend{"i2c-dev"};
    std::optional<SelectionRequest> selection;
};

// Built-in defaults with relative paths resolved against base_dir.
[[nodiscard]] InstallerConfig defaultConfig(const std::filesystem::path& base_dir);

// Reads a TOML file over the defaults; relative paths resolve against the
// file's directory. Throws std::runtime_error.
[[nodiscard]] InstallerConfig loadConfigFile(const std::filesystem::path& path);

// "i2c-dev" or "logging". Throws std::runtime_error for anything else.
[[nodiscard]] std::unique_ptr<TouchpadProbe> createProbe(const std::string& id,
                                                         const std::filesystem::path& dev_dir);

}  // namespace numpad::setup
