#pragma once

#include "numpad_setup/touchpad_probe.hpp"

namespace numpad::setup {

// Prints the transfer instead of sending it; every bus acknowledges.
class LoggingProbe : public TouchpadProbe {
public:
    bool probe(unsigned bus,
               std::uint8_t address,
               const std::vector<std::uint8_t>& payload,
               std::string& error) override;
};

}  // namespace numpad::setup
