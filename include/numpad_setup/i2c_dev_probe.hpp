#pragma once

#include <filesystem>

#include "numpad_setup/touchpad_probe.hpp"

namespace numpad::setup {

// Talks to /dev/i2c-N through the i2c-dev character device.
class I2cDevProbe : public TouchpadProbe {
public:
    explicit I2cDevProbe(std::filesystem::path dev_dir = "/dev");

    bool probe(unsigned bus,
               std::uint8_t address,
               const std::vector<std::uint8_t>& payload,
               std::string& error) override;

private:
    std::filesystem::path dev_dir_;
};

}  // namespace numpad::setup
