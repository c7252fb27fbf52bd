#include "numpad_setup/numpad_layout.hpp"

#define TOML_EXCEPTIONS 1
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

#include <libevdev/libevdev.h>

#include "numpad_setup/install_error.hpp"
#include "numpad_setup/string_util.hpp"

namespace numpad::setup {

namespace {

[[noreturn]] void layoutError(const std::filesystem::path& path, const std::string& what) {
    throw InstallError(ErrorKind::InvalidLayout, "Invalid layout " + path.string() + ": " + what);
}

std::size_t positiveSize(const toml::table& tbl, const char* key, const std::filesystem::path& path) {
    auto value = tbl[key].value<std::int64_t>();
    if (!value || *value <= 0) {
        layoutError(path, std::string("'") + key + "' must be a positive integer");
    }
    return static_cast<std::size_t>(*value);
}

int keycodeFromNode(const toml::node& node) {
    if (auto code = node.value<std::int64_t>()) {
        if (*code < 0 || *code > KEY_MAX) {
            throw std::runtime_error("Keycode out of range: " + std::to_string(*code));
        }
        return static_cast<int>(*code);
    }
    if (auto name = node.value<std::string>()) {
        return parseKeycodeToken(*name);
    }
    throw std::runtime_error("Keys must be names or integers");
}

}  // namespace

NumpadLayout::NumpadLayout(std::string model,
                           std::size_t cols,
                           std::size_t rows,
                           double top_offset,
                           std::vector<Row> keys)
    : model_(std::move(model)),
      cols_(cols),
      rows_(rows),
      top_offset_(top_offset),
      keys_(std::move(keys)) {}

int NumpadLayout::keyAt(std::size_t row, std::size_t col) const {
    return keys_.at(row).at(col);
}

NumpadLayout NumpadLayout::loadFromFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        layoutError(path, "file not found");
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        layoutError(path, std::string(err.description()));
    }

    const std::size_t cols = positiveSize(tbl, "cols", path);
    const std::size_t rows = positiveSize(tbl, "rows", path);
    double top_offset = 0.0;
    if (auto node = tbl["top_offset"]) {
        auto value = node.value<double>();
        if (!value) {
            layoutError(path, "'top_offset' must be a number");
        }
        top_offset = *value;
    }
    if (!std::isfinite(top_offset) || top_offset < 0.0) {
        layoutError(path, "'top_offset' must be a non-negative number");
    }

    const auto* key_rows = tbl["keys"].as_array();
    if (key_rows == nullptr) {
        layoutError(path, "missing 'keys' array");
    }
    if (key_rows->size() != rows) {
        layoutError(path, "expected " + std::to_string(rows) + " key rows, found " +
                              std::to_string(key_rows->size()));
    }

    std::vector<Row> keys;
    keys.reserve(rows);
    for (std::size_t r = 0; r < key_rows->size(); ++r) {
        const auto* row_node = key_rows->get(r)->as_array();
        if (row_node == nullptr || row_node->size() != cols) {
            layoutError(path, "row " + std::to_string(r) + " must hold " + std::to_string(cols) + " keys");
        }
        Row row;
        row.reserve(cols);
        for (const auto& key_node : *row_node) {
            try {
                row.push_back(keycodeFromNode(key_node));
            } catch (const std::runtime_error& err) {
                layoutError(path, "row " + std::to_string(r) + ": " + err.what());
            }
        }
        keys.push_back(std::move(row));
    }

    return NumpadLayout(path.stem().string(), cols, rows, top_offset, std::move(keys));
}

std::vector<std::filesystem::path> listLayoutFiles(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return files;
    }
    for (auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (ec) break;
        if (!entry.is_regular_file(ec)) continue;
        if (entry.path().extension() != kLayoutExtension) continue;
        files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<std::string> listLayoutModels(const std::filesystem::path& dir) {
    std::vector<std::string> models;
    for (const auto& file : listLayoutFiles(dir)) {
        models.push_back(file.stem().string());
    }
    return models;
}

std::string renderPythonLayout(const NumpadLayout& layout) {
    std::ostringstream offset;
    offset.imbue(std::locale::classic());
    offset << std::setprecision(15) << layout.topOffset();
    std::string top_offset = offset.str();
    if (top_offset.find_first_not_of("0123456789") == std::string::npos) {
        top_offset += ".0";
    }

    std::ostringstream out;
    out << "from evdev import ecodes" << '\n'
        << '\n'
        << "cols = " << layout.cols() << '\n'
        << "rows = " << layout.rows() << '\n'
        << "top_offset = " << top_offset << '\n'
        << '\n'
        << "keys = [" << '\n';
    for (std::size_t r = 0; r < layout.rows(); ++r) {
        out << "    [";
        for (std::size_t c = 0; c < layout.cols(); ++c) {
            if (c != 0) out << ", ";
            const int code = layout.keyAt(r, c);
            if (const char* name = libevdev_event_code_get_name(EV_KEY, static_cast<unsigned>(code))) {
                out << "ecodes." << name;
            } else {
                out << code;
            }
        }
        out << "]" << (r + 1 < layout.rows() ? "," : "") << '\n';
    }
    out << "]" << '\n';
    return out.str();
}

int parseKeycodeToken(const std::string& raw) {
    std::string token = trim(raw);
    if (token.empty()) {
        throw std::runtime_error("Empty keycode token");
    }
    std::string upper;
    upper.reserve(token.size());
    for (char ch : token) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    if (upper.rfind("KEY_", 0) == 0 || upper.rfind("BTN_", 0) == 0) {
        int code = libevdev_event_code_from_name(EV_KEY, upper.c_str());
        if (code >= 0) return code;
        throw std::runtime_error("Unknown keycode name: " + token);
    }
    char* end = nullptr;
    errno = 0;
    const long code = std::strtol(token.c_str(), &end, 10);
    if (errno == 0 && end != nullptr && *end == '\0' && code >= 0 && code <= KEY_MAX) {
        return static_cast<int>(code);
    }
    throw std::runtime_error("Invalid keycode token: " + token);
}

}  // namespace numpad::setup
