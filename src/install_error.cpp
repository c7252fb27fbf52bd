#include "numpad_setup/install_error.hpp"

namespace numpad::setup {

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Permission: return "PermissionError";
        case ErrorKind::ModuleLoad: return "ModuleLoadError";
        case ErrorKind::NoInterface: return "NoInterfaceError";
        case ErrorKind::DeviceNotFound: return "DeviceNotFoundError";
        case ErrorKind::InvalidOption: return "InvalidOptionError";
        case ErrorKind::InvalidDuration: return "InvalidDurationError";
        case ErrorKind::InvalidLayout: return "InvalidLayoutError";
        case ErrorKind::FileInstall: return "FileInstallError";
        case ErrorKind::ServiceEnable: return "ServiceEnableError";
        case ErrorKind::ServiceStart: return "ServiceStartError";
    }
    return "InstallError";
}

InstallError::InstallError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

std::string formatInstallError(const InstallError& error) {
    return std::string("[") + errorKindName(error.kind()) + "] " + error.what();
}

}  // namespace numpad::setup
