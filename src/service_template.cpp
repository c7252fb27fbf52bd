#include "numpad_setup/service_template.hpp"

#include <cctype>

namespace numpad::setup {

namespace {

bool isNameStart(char ch) {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool isNameChar(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

}  // namespace

std::string renderTemplate(const std::string& text, const TemplateVariables& variables) {
    std::string out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        const char ch = text[pos];
        if (ch != '$' || pos + 1 >= text.size()) {
            out.push_back(ch);
            ++pos;
            continue;
        }

        const bool braced = text[pos + 1] == '{';
        const std::size_t name_begin = pos + (braced ? 2 : 1);
        if (name_begin >= text.size() || !isNameStart(text[name_begin])) {
            out.push_back(ch);
            ++pos;
            continue;
        }

        std::size_t name_end = name_begin;
        while (name_end < text.size() && isNameChar(text[name_end])) {
            ++name_end;
        }
        if (braced && (name_end >= text.size() || text[name_end] != '}')) {
            out.push_back(ch);
            ++pos;
            continue;
        }

        const std::size_t token_end = braced ? name_end + 1 : name_end;
        auto it = variables.find(text.substr(name_begin, name_end - name_begin));
        if (it == variables.end()) {
            out.append(text, pos, token_end - pos);
        } else {
            out.append(it->second);
        }
        pos = token_end;
    }
    return out;
}

TemplateVariables serviceVariables(const Selection& selection) {
    return {
        {"LAYOUT", selection.model},
        {"PERCENTAGE_KEY", std::to_string(percentageKeyCode(selection.keyboard))},
        {"NUMPAD_DELAY", formatDelay(selection.numpad_delay)},
        {"CUSTOM_KEY_DELAY", formatDelay(selection.custom_key_delay)},
    };
}

}  // namespace numpad::setup
