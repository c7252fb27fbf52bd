#include "numpad_setup/installer.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include "numpad_setup/install_error.hpp"
#include "numpad_setup/numpad_layout.hpp"
#include "numpad_setup/service_template.hpp"

namespace numpad::setup {

namespace {

std::string joinCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out.push_back(' ');
        out += arg;
    }
    return out;
}

}  // namespace

const std::vector<PackageManager>& supportedPackageManagers() {
    static const std::vector<PackageManager> managers = {
        {"apt", {"apt", "-y", "install", "python3-evdev", "i2c-tools", "git"}},
        {"pacman", {"pacman", "--noconfirm", "-S", "python-evdev", "i2c-tools", "git"}},
        {"dnf", {"dnf", "-y", "install", "python3-evdev", "i2c-tools", "git"}},
    };
    return managers;
}

Installer::Installer(InstallerConfig config, HostSystem& host, TouchpadProbe& probe)
    : config_(std::move(config)), host_(host), probe_(probe) {}

RunOutcome Installer::run(bool install_dependencies, SelectionSource& source) {
    checkPrivileges();

    if (install_dependencies) {
        installDependencies();
    }

    loadKernelModule();
    detectTouchpad(findInterfaces());

    auto selection = collectSelection(source);
    if (!selection) {
        std::cout << "Installation cancelled" << '\n';
        return RunOutcome::Cancelled;
    }

    renderService(*selection);
    installFiles();
    persistModuleLoad();
    activateService();
    return RunOutcome::Installed;
}

void requirePrivileges(const HostSystem& host) {
    if (!host.isPrivileged()) {
        throw InstallError(ErrorKind::Permission,
                           "Please run the installation script as root (using sudo for example)");
    }
}

void Installer::checkPrivileges() const {
    requirePrivileges(host_);
}

std::optional<std::string> Installer::installDependencies() {
    std::cout << "Installing dependencies" << '\n';
    std::optional<std::string> used;
    for (const auto& manager : supportedPackageManagers()) {
        if (!host_.commandExists(manager.command)) continue;

        std::cout << "Found " << manager.command << '\n';
        runChecked(manager.install_argv);
        used = manager.command;
        break;
    }
    if (!used) {
        std::cout << "No supported package manager found, skipping system packages" << '\n';
    }

    // The daemon also needs pyudev, which comes from pip.
    if (host_.run(kPipCheck).succeeded()) {
        std::cout << "Found pip" << '\n';
        runChecked(kPipInstall);
    }
    return used;
}

void Installer::runChecked(const std::vector<std::string>& argv) {
    auto result = host_.run(argv);
    if (!result.succeeded()) {
        std::cerr << "[Installer] '" << joinCommand(argv) << "' exited with status " << result.exit_code << '\n';
    }
}

void Installer::loadKernelModule() {
    auto result = host_.run({"modprobe", config_.kernel_module});
    if (!result.succeeded()) {
        throw InstallError(ErrorKind::ModuleLoad,
                           config_.kernel_module +
                               " module cannot be loaded correctly. Make sure you have installed i2c-tools package");
    }
}

std::vector<I2cAdapter> Installer::findInterfaces() const {
    auto adapters = enumerateAdapters(config_.paths.i2c_sysfs_dir, config_.controller);
    if (adapters.empty()) {
        throw InstallError(ErrorKind::NoInterface,
                           "No interface i2c found. Make sure you have installed libevdev packages");
    }
    return adapters;
}

I2cAdapter Installer::detectTouchpad(const std::vector<I2cAdapter>& candidates) {
    auto adapter = numpad::setup::detectTouchpad(candidates, probe_, config_.touchpad_address);
    interface_ = adapter;
    return adapter;
}

std::optional<Selection> Installer::collectSelection(SelectionSource& source) const {
    const auto models = listLayoutModels(config_.paths.layouts_dir);
    if (models.empty()) {
        throw InstallError(ErrorKind::InvalidLayout,
                           "No numpad layouts found in " + config_.paths.layouts_dir.string());
    }

    auto selection = source.collect(models);
    if (!selection) {
        return std::nullopt;
    }

    const auto layout = NumpadLayout::loadFromFile(config_.paths.layouts_dir /
                                                   (selection->model + kLayoutExtension));
    std::cout << "[Installer] Layout " << layout.model() << ": " << layout.rows() << " rows x "
              << layout.cols() << " columns, keyboard " << keyboardLayoutName(selection->keyboard)
              << '\n';
    return selection;
}

std::filesystem::path Installer::renderService(const Selection& selection) {
    std::ifstream in(config_.paths.service_template);
    if (!in) {
        throw InstallError(ErrorKind::FileInstall,
                           "Failed to open service template: " + config_.paths.service_template.string());
    }
    std::ostringstream text;
    text << in.rdbuf();

    const auto unit_path = config_.paths.unit_dir / (config_.service_name + ".service");
    std::cout << "Add asus touchpad service in " << config_.paths.unit_dir.string() << '\n';

    std::string error;
    if (!host_.writeFile(unit_path, renderTemplate(text.str(), serviceVariables(selection)), error)) {
        throw InstallError(ErrorKind::FileInstall, "Failed to write " + unit_path.string() + ": " + error);
    }
    return unit_path;
}

std::filesystem::path Installer::layoutsTargetDir() const {
    return config_.paths.install_dir / "numpad_layouts";
}

void Installer::installFiles() {
    std::string error;
    for (const auto& dir : {layoutsTargetDir(), config_.paths.log_dir}) {
        if (!host_.createDirectories(dir, error)) {
            throw InstallError(ErrorKind::FileInstall, "Failed to create " + dir.string() + ": " + error);
        }
    }

    if (!host_.installFile(config_.paths.driver, config_.paths.install_dir, error)) {
        throw InstallError(ErrorKind::FileInstall,
                           "Failed to install " + config_.paths.driver.string() + ": " + error);
    }

    for (const auto& file : listLayoutFiles(config_.paths.layouts_dir)) {
        if (!host_.installFile(file, layoutsTargetDir(), error)) {
            throw InstallError(ErrorKind::FileInstall, "Failed to install " + file.string() + ": " + error);
        }
        const auto layout = NumpadLayout::loadFromFile(file);
        const auto module = layoutsTargetDir() / (layout.model() + ".py");
        if (!host_.writeFile(module, renderPythonLayout(layout), error)) {
            throw InstallError(ErrorKind::FileInstall, "Failed to write " + module.string() + ": " + error);
        }
    }
}

void Installer::persistModuleLoad() {
    const auto conf = config_.paths.modules_load_dir / (config_.kernel_module + ".conf");
    std::string error;
    if (!host_.writeFile(conf, config_.kernel_module + "\n", error)) {
        throw InstallError(ErrorKind::FileInstall, "Failed to write " + conf.string() + ": " + error);
    }
}

void Installer::activateService() {
    const std::string unit = config_.service_name + ".service";

    if (!host_.run({"systemctl", "enable", config_.service_name}).succeeded()) {
        throw InstallError(ErrorKind::ServiceEnable, "Something went wrong while enabling " + unit);
    }
    std::cout << "Asus touchpad service enabled" << '\n';

    if (!host_.run({"systemctl", "restart", config_.service_name}).succeeded()) {
        throw InstallError(ErrorKind::ServiceStart, "Something went wrong while starting " + unit);
    }
    std::cout << "Asus touchpad service started" << '\n';
}

}  // namespace numpad::setup
