#pragma once

#include <string>
#include <unordered_map>

#include "numpad_setup/selection.hpp"

namespace numpad::setup {

using TemplateVariables = std::unordered_map<std::string, std::string>;

// envsubst limited to the names in variables: $NAME and ${NAME} are
// replaced, any other '$' text is copied through.
[[nodiscard]] std::string renderTemplate(const std::string& text, const TemplateVariables& variables);

// LAYOUT, PERCENTAGE_KEY, NUMPAD_DELAY, CUSTOM_KEY_DELAY.
[[nodiscard]] TemplateVariables serviceVariables(const Selection& selection);

}  // namespace numpad::setup
