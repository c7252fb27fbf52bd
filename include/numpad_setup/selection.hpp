#pragma once

#include <optional>
#include <string>
#include <vector>

namespace numpad::setup {

enum class KeyboardLayout {
    Qwerty,
    Azerty,
};

inline constexpr double kDefaultActivationDelay = 0.4;

struct Selection {
    std::string model;
    KeyboardLayout keyboard{KeyboardLayout::Qwerty};
    double numpad_delay{kDefaultActivationDelay};
    double custom_key_delay{kDefaultActivationDelay};
};

[[nodiscard]] const char* keyboardLayoutName(KeyboardLayout layout) noexcept;
// Case-insensitive. Throws InstallError(InvalidOption).
[[nodiscard]] KeyboardLayout parseKeyboardLayout(const std::string& name);
// Code the daemon sends for the '%' key: KEY_5 on qwerty, KEY_APOSTROPHE on azerty.
[[nodiscard]] int percentageKeyCode(KeyboardLayout layout) noexcept;

// Finite, non-negative seconds. Throws InstallError(InvalidDuration).
[[nodiscard]] double parseDelay(const std::string& text);
[[nodiscard]] std::string formatDelay(double seconds);

class SelectionSource {
public:
    virtual ~SelectionSource() = default;

    // std::nullopt when the user quits.
    virtual std::optional<Selection> collect(const std::vector<std::string>& models) = 0;
};

struct SelectionRequest {
    std::string model;
    std::string keyboard{"qwerty"};
    std::string numpad_delay{"0.4"};
    std::string custom_key_delay{"0.4"};
};

// Non-interactive source fed from the config file.
class PresetSelection : public SelectionSource {
public:
    explicit PresetSelection(SelectionRequest request);

    std::optional<Selection> collect(const std::vector<std::string>& models) override;

private:
    SelectionRequest request_;
};

}  // namespace numpad::setup
