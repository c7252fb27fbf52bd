#include "numpad_setup/config_loader.hpp"

#define TOML_EXCEPTIONS 1
#include <toml++/toml.hpp>

#include <sstream>
#include <stdexcept>
#include <string>

#include "numpad_setup/i2c_dev_probe.hpp"
#include "numpad_setup/logging_probe.hpp"

namespace numpad::setup {

namespace {

// --- Helper: Bridge TOML values to String ---
std::string tomlToString(const toml::node& node) {
    if (auto val = node.as_string()) return val->get();
    if (auto val = node.as_integer()) return std::to_string(val->get());
    if (auto val = node.as_floating_point()) {
        std::ostringstream oss;
        oss << val->get();
        return oss.str();
    }
    if (auto val = node.as_boolean()) return val->get() ? "true" : "false";
    throw std::runtime_error("Expected a scalar value");
}

std::filesystem::path resolve(const std::filesystem::path& base_dir, const std::filesystem::path& path) {
    if (path.empty() || path.is_absolute()) {
        return path;
    }
    return (base_dir / path).lexically_normal();
}

void resolveAll(InstallPaths& paths, const std::filesystem::path& base_dir) {
    for (auto* path : {&paths.service_template, &paths.layouts_dir, &paths.driver,
                       &paths.install_dir, &paths.log_dir, &paths.unit_dir,
                       &paths.modules_load_dir, &paths.i2c_sysfs_dir, &paths.i2c_dev_dir}) {
        *path = resolve(base_dir, *path);
    }
}

void readPath(toml::node_view<toml::node> table, const char* key, std::filesystem::path& out) {
    auto node = table[key];
    if (!node) return;
    auto value = node.value<std::string>();
    if (!value || value->empty()) {
        throw std::runtime_error(std::string("[paths] ") + key + " must be a non-empty string");
    }
    out = *value;
}

void readString(toml::node_view<toml::node> table,
                const char* section,
                const char* key,
                std::string& out) {
    auto node = table[key];
    if (!node) return;
    auto value = node.value<std::string>();
    if (!value || value->empty()) {
        throw std::runtime_error(std::string("[") + section + "] " + key + " must be a non-empty string");
    }
    out = *value;
}

bool isKnownProbe(const std::string& id) {
    return id == "i2c-dev" || id == "logging";
}

}  // namespace

InstallerConfig defaultConfig(const std::filesystem::path& base_dir) {
    InstallerConfig config;
    resolveAll(config.paths, base_dir);
    return config;
}

InstallerConfig loadConfigFile(const std::filesystem::path& path) {
    const auto file_path = std::filesystem::absolute(path);
    const auto root_dir = file_path.parent_path();

    toml::table tbl;
    try {
        tbl = toml::parse_file(file_path.string());
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("TOML Parse Error in " + file_path.string() + ": " +
                                 std::string(err.description()));
    }

    InstallerConfig config;

    if (auto paths = tbl["paths"]) {
        readPath(paths, "service_template", config.paths.service_template);
        readPath(paths, "layouts_dir", config.paths.layouts_dir);
        readPath(paths, "driver", config.paths.driver);
        readPath(paths, "install_dir", config.paths.install_dir);
        readPath(paths, "log_dir", config.paths.log_dir);
        readPath(paths, "unit_dir", config.paths.unit_dir);
        readPath(paths, "modules_load_dir", config.paths.modules_load_dir);
        readPath(paths, "i2c_sysfs_dir", config.paths.i2c_sysfs_dir);
        readPath(paths, "i2c_dev_dir", config.paths.i2c_dev_dir);
    }
    resolveAll(config.paths, root_dir);

    if (auto service = tbl["service"]) {
        readString(service, "service", "name", config.service_name);
        readString(service, "service", "kernel_module", config.kernel_module);
    }

    if (auto touchpad = tbl["touchpad"]) {
        readString(touchpad, "touchpad", "controller", config.controller);
        readString(touchpad, "touchpad", "probe", config.probe_backend);
        if (auto address = touchpad["address"]) {
            auto value = address.value<std::int64_t>();
            if (!value || *value < 0 || *value > 0x7f) {
                throw std::runtime_error("[touchpad] address must be a 7-bit integer");
            }
            config.touchpad_address = static_cast<std::uint8_t>(*value);
        }
    }
    if (!isKnownProbe(config.probe_backend)) {
        throw std::runtime_error("Unsupported probe: " + config.probe_backend);
    }

    if (auto selection = tbl["selection"].as_table()) {
        SelectionRequest request;
        try {
            for (auto& [key, value] : *selection) {
                const std::string name(key.str());
                if (name == "model") {
                    request.model = tomlToString(value);
                } else if (name == "keyboard") {
                    request.keyboard = tomlToString(value);
                } else if (name == "numpad_delay") {
                    request.numpad_delay = tomlToString(value);
                } else if (name == "custom_key_delay") {
                    request.custom_key_delay = tomlToString(value);
                } else {
                    throw std::runtime_error("unknown key '" + name + "'");
                }
            }
        } catch (const std::runtime_error& err) {
            throw std::runtime_error(std::string("[selection] ") + err.what());
        }
        if (request.model.empty()) {
            throw std::runtime_error("[selection] model is required");
        }
        config.selection = std::move(request);
    }

    return config;
}

std::unique_ptr<TouchpadProbe> createProbe(const std::string& id, const std::filesystem::path& dev_dir) {
    if (id == "logging") return std::make_unique<LoggingProbe>();
    if (id == "i2c-dev") return std::make_unique<I2cDevProbe>(dev_dir);
    throw std::runtime_error("Unsupported probe: " + id);
}

}  // namespace numpad::setup
