#pragma once

#include <string>

namespace numpad::setup {

// Strips leading and trailing whitespace.
[[nodiscard]] std::string trim(const std::string& input);

}  // namespace numpad::setup
