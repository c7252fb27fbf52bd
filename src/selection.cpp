#include "numpad_setup/selection.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

#include <linux/input-event-codes.h>

#include "numpad_setup/install_error.hpp"
#include "numpad_setup/string_util.hpp"

namespace numpad::setup {

namespace {

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

}  // namespace

const char* keyboardLayoutName(KeyboardLayout layout) noexcept {
    switch (layout) {
        case KeyboardLayout::Qwerty: return "Qwerty";
        case KeyboardLayout::Azerty: return "Azerty";
    }
    return "Qwerty";
}

KeyboardLayout parseKeyboardLayout(const std::string& name) {
    const auto key = lower(trim(name));
    if (key == "qwerty") return KeyboardLayout::Qwerty;
    if (key == "azerty") return KeyboardLayout::Azerty;
    throw InstallError(ErrorKind::InvalidOption, "invalid option " + name);
}

int percentageKeyCode(KeyboardLayout layout) noexcept {
    return layout == KeyboardLayout::Azerty ? KEY_APOSTROPHE : KEY_5;
}

double parseDelay(const std::string& text) {
    const std::string value = trim(text);
    // Decimal notation only; hex floats, inf and nan are rejected.
    std::istringstream iss(value);
    iss.imbue(std::locale::classic());
    double seconds = 0.0;
    char rest = 0;
    if (!value.empty() && (iss >> seconds) && !(iss >> rest) && std::isfinite(seconds) && seconds >= 0.0) {
        return seconds;
    }
    throw InstallError(ErrorKind::InvalidDuration, "invalid duration " + text);
}

std::string formatDelay(double seconds) {
    std::ostringstream oss;
    oss << std::setprecision(15) << seconds;
    return oss.str();
}

PresetSelection::PresetSelection(SelectionRequest request) : request_(std::move(request)) {}

std::optional<Selection> PresetSelection::collect(const std::vector<std::string>& models) {
    if (std::find(models.begin(), models.end(), request_.model) == models.end()) {
        throw InstallError(ErrorKind::InvalidOption, "invalid option " + request_.model);
    }

    Selection selection;
    selection.model = request_.model;
    selection.keyboard = parseKeyboardLayout(request_.keyboard);
    selection.numpad_delay = parseDelay(request_.numpad_delay);
    selection.custom_key_delay = parseDelay(request_.custom_key_delay);
    return selection;
}

}  // namespace numpad::setup
