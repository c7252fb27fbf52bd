#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace numpad::setup {

// Key grid printed on a model's touchpad. Rows run top to bottom; the
// top_offset fraction of a row height at the top carries no keys.
class NumpadLayout {
public:
    using Row = std::vector<int>;

    NumpadLayout(std::string model,
                 std::size_t cols,
                 std::size_t rows,
                 double top_offset,
                 std::vector<Row> keys);

    // Throws InstallError(InvalidLayout).
    [[nodiscard]] static NumpadLayout loadFromFile(const std::filesystem::path& path);

    [[nodiscard]] const std::string& model() const noexcept { return model_; }
    [[nodiscard]] std::size_t cols() const noexcept { return cols_; }
    [[nodiscard]] std::size_t rows() const noexcept { return rows_; }
    [[nodiscard]] double topOffset() const noexcept { return top_offset_; }
    [[nodiscard]] int keyAt(std::size_t row, std::size_t col) const;

private:
    std::string model_;
    std::size_t cols_;
    std::size_t rows_;
    double top_offset_;
    std::vector<Row> keys_;
};

inline constexpr const char* kLayoutExtension = ".toml";

// Layout files in dir, sorted by file name.
[[nodiscard]] std::vector<std::filesystem::path> listLayoutFiles(const std::filesystem::path& dir);
// Model names (file stems) of listLayoutFiles(dir).
[[nodiscard]] std::vector<std::string> listLayoutModels(const std::filesystem::path& dir);

// The layout as a numpad_layouts.<model> module for the Python daemon:
// cols, rows, top_offset and keys as ecodes constants.
[[nodiscard]] std::string renderPythonLayout(const NumpadLayout& layout);

// evdev key name (KEY_*, BTN_*, any case) or decimal code. Throws
// std::runtime_error.
[[nodiscard]] int parseKeycodeToken(const std::string& raw);

}  // namespace numpad::setup
