#include "numpad_setup/logging_probe.hpp"

#include <iomanip>
#include <iostream>

namespace numpad::setup {

bool LoggingProbe::probe(unsigned bus,
                         std::uint8_t address,
                         const std::vector<std::uint8_t>& payload,
                         std::string& /*error*/) {
    std::cout << '\n' << "[LoggingProbe] i2c-" << bus << " w" << payload.size() << "@0x"
              << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(address) << ':';
    for (auto byte : payload) {
        std::cout << " 0x" << std::setw(2) << static_cast<int>(byte);
    }
    std::cout << std::dec << std::setfill(' ') << '\n';
    return true;
}

}  // namespace numpad::setup
