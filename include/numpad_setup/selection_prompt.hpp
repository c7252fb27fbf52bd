#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "numpad_setup/selection.hpp"

namespace numpad::setup {

// Numbered menus and prompts in the style of the shell `select` builtin.
class SelectionPrompt : public SelectionSource {
public:
    SelectionPrompt(std::istream& in, std::ostream& out);

    std::optional<Selection> collect(const std::vector<std::string>& models) override;

private:
    std::istream& in_;
    std::ostream& out_;

    // Index into options, or std::nullopt for the trailing Quit entry.
    std::optional<std::size_t> chooseFrom(const std::vector<std::string>& options,
                                          const std::string& prompt);
    double askDelay(const std::string& question);
};

}  // namespace numpad::setup
