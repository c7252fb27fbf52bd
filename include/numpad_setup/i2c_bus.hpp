#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace numpad::setup {

class TouchpadProbe;

inline constexpr std::uint8_t kTouchpadAddress = 0x15;

// Switches the numpad backlight off; harmless on the touchpad and NAKed
// by anything else sitting at 0x15.
inline const std::vector<std::uint8_t> kBacklightOffCommand = {
    0x05, 0x00, 0x3d, 0x03, 0x06, 0x00, 0x07, 0x00, 0x0d, 0x14, 0x03, 0x00, 0xad};

struct I2cAdapter {
    unsigned bus{0};
    std::string name;

    [[nodiscard]] std::string deviceName() const { return "i2c-" + std::to_string(bus); }
};

// Adapters under sysfs_dir (i2c-N/name) whose name contains controller,
// ordered by bus number.
[[nodiscard]] std::vector<I2cAdapter> enumerateAdapters(const std::filesystem::path& sysfs_dir,
                                                        const std::string& controller);

// Returns the first adapter that acknowledges the probe. Later candidates
// are never touched. Throws InstallError (NoInterface, DeviceNotFound).
[[nodiscard]] I2cAdapter detectTouchpad(const std::vector<I2cAdapter>& candidates,
                                        TouchpadProbe& probe,
                                        std::uint8_t address = kTouchpadAddress,
                                        const std::vector<std::uint8_t>& payload = kBacklightOffCommand);

}  // namespace numpad::setup
