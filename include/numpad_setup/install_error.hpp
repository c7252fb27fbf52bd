#pragma once

#include <stdexcept>
#include <string>

namespace numpad::setup {

enum class ErrorKind {
    Permission,
    ModuleLoad,
    NoInterface,
    DeviceNotFound,
    InvalidOption,
    InvalidDuration,
    InvalidLayout,
    FileInstall,
    ServiceEnable,
    ServiceStart,
};

[[nodiscard]] const char* errorKindName(ErrorKind kind) noexcept;

// Terminal bring-up failure. Reported once on stderr, exit status 1.
class InstallError : public std::runtime_error {
public:
    InstallError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// "[PermissionError] message", the line printed for a failed run.
[[nodiscard]] std::string formatInstallError(const InstallError& error);

}  // namespace numpad::setup
