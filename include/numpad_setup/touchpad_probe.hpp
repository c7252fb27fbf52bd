#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace numpad::setup {

class TouchpadProbe {
public:
    virtual ~TouchpadProbe() = default;

    // One write transfer of payload to the 7-bit address on bus. On failure
    // error holds the reason.
    virtual bool probe(unsigned bus,
                       std::uint8_t address,
                       const std::vector<std::uint8_t>& payload,
                       std::string& error) = 0;
};

}  // namespace numpad::setup
