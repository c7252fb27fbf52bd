#include "numpad_setup/i2c_bus.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <regex>

#include "numpad_setup/install_error.hpp"
#include "numpad_setup/touchpad_probe.hpp"

namespace numpad::setup {

namespace {

std::string readFirstLine(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::string line;
    if (in) {
        std::getline(in, line);
    }
    return line;
}

}  // namespace

std::vector<I2cAdapter> enumerateAdapters(const std::filesystem::path& sysfs_dir,
                                          const std::string& controller) {
    std::vector<I2cAdapter> adapters;
    std::error_code ec;
    if (!std::filesystem::is_directory(sysfs_dir, ec)) {
        return adapters;
    }

    static const std::regex bus_pattern(R"(^i2c-([0-9]+)$)");
    for (auto& entry : std::filesystem::directory_iterator(sysfs_dir, ec)) {
        if (ec) break;
        const auto name = entry.path().filename().string();
        std::smatch match;
        if (!std::regex_match(name, match, bus_pattern)) continue;

        std::string adapter_name = readFirstLine(entry.path() / "name");
        if (adapter_name.find(controller) == std::string::npos) continue;

        adapters.push_back({static_cast<unsigned>(std::stoul(match[1].str())), std::move(adapter_name)});
    }

    std::sort(adapters.begin(), adapters.end(), [](const I2cAdapter& lhs, const I2cAdapter& rhs) {
        return lhs.bus < rhs.bus;
    });
    return adapters;
}

I2cAdapter detectTouchpad(const std::vector<I2cAdapter>& candidates,
                          TouchpadProbe& probe,
                          std::uint8_t address,
                          const std::vector<std::uint8_t>& payload) {
    if (candidates.empty()) {
        throw InstallError(ErrorKind::NoInterface,
                           "No interface i2c found. Make sure you have installed libevdev packages");
    }

    for (const auto& adapter : candidates) {
        std::cout << "Testing interface " << adapter.deviceName() << " : " << std::flush;
        std::string error;
        if (probe.probe(adapter.bus, address, payload, error)) {
            std::cout << "success" << '\n';
            return adapter;
        }
        std::cout << "failed";
        if (!error.empty()) {
            std::cout << " (" << error << ")";
        }
        std::cout << '\n';
    }

    throw InstallError(ErrorKind::DeviceNotFound,
                       "The detection was not successful. Touchpad not found.");
}

}  // namespace numpad::setup
