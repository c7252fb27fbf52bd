#include "numpad_setup/selection_prompt.hpp"

#include <iostream>
#include <stdexcept>

#include "numpad_setup/install_error.hpp"
#include "numpad_setup/string_util.hpp"

namespace numpad::setup {

SelectionPrompt::SelectionPrompt(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

std::optional<std::size_t> SelectionPrompt::chooseFrom(const std::vector<std::string>& options,
                                                       const std::string& prompt) {
    const std::size_t quit_number = options.size() + 1;
    std::string line;
    while (true) {
        for (std::size_t i = 0; i < options.size(); ++i) {
            out_ << (i + 1) << ") " << options[i] << '\n';
        }
        out_ << quit_number << ") Quit" << '\n';
        out_ << prompt << std::flush;

        if (!std::getline(in_, line)) {
            out_ << '\n';
            throw InstallError(ErrorKind::InvalidOption, "invalid option (no input)");
        }

        const std::string reply = trim(line);
        if (reply.empty()) {
            continue;
        }

        unsigned long number = 0;
        if (reply.find_first_not_of("0123456789") == std::string::npos) {
            try {
                number = std::stoul(reply);
            } catch (const std::out_of_range&) {
                number = 0;
            }
        }
        if (number == 0 || number > quit_number) {
            throw InstallError(ErrorKind::InvalidOption, "invalid option " + reply);
        }
        if (number == quit_number) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(number - 1);
    }
}

double SelectionPrompt::askDelay(const std::string& question) {
    out_ << '\n' << question << '\n';
    out_ << "Activation delay (in seconds, usually " << formatDelay(kDefaultActivationDelay)
         << "): " << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        out_ << '\n';
    }
    return parseDelay(line);
}

std::optional<Selection> SelectionPrompt::collect(const std::vector<std::string>& models) {
    Selection selection;

    out_ << '\n' << "Select models keypad layout:" << '\n';
    auto model_index = chooseFrom(models, "Please enter your choice ");
    if (!model_index) {
        return std::nullopt;
    }
    selection.model = models[*model_index];

    out_ << '\n' << "What is your keyboard layout?" << '\n';
    const std::vector<std::string> keyboards = {keyboardLayoutName(KeyboardLayout::Qwerty),
                                                keyboardLayoutName(KeyboardLayout::Azerty)};
    auto keyboard_index = chooseFrom(keyboards, "Please enter your choice [1-3]: ");
    if (!keyboard_index) {
        return std::nullopt;
    }
    selection.keyboard = *keyboard_index == 0 ? KeyboardLayout::Qwerty : KeyboardLayout::Azerty;

    selection.numpad_delay =
        askDelay("Set how long the numpad key should be held down before it activates");
    selection.custom_key_delay =
        askDelay("Set how long the custom action key should be held down before it activates");
    return selection;
}

}  // namespace numpad::setup
