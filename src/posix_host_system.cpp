#include "numpad_setup/posix_host_system.hpp"

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

namespace numpad::setup {

namespace {

bool isExecutableFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

}  // namespace

bool PosixHostSystem::isPrivileged() const {
    return ::geteuid() == 0;
}

bool PosixHostSystem::commandExists(const std::string& name) const {
    return executableOnPath(name);
}

bool PosixHostSystem::executableOnPath(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    if (name.find('/') != std::string::npos) {
        return isExecutableFile(name);
    }

    const char* path_env = std::getenv("PATH");
    std::string search = (path_env && *path_env) ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream dirs(search);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        if (isExecutableFile(std::filesystem::path(dir) / name)) {
            return true;
        }
    }
    return false;
}

CommandResult PosixHostSystem::run(const std::vector<std::string>& argv) {
    CommandResult result;
    if (argv.empty()) {
        result.exit_code = 127;
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    std::cout.flush();
    std::cerr.flush();

    const pid_t pid = ::fork();
    if (pid < 0) {
        std::cerr << "[PosixHostSystem] fork: " << std::strerror(errno) << '\n';
        result.exit_code = 127;
        return result;
    }

    if (pid == 0) {
        ::execvp(args[0], args.data());
        const char* reason = std::strerror(errno);
        ::write(STDERR_FILENO, args[0], std::strlen(args[0]));
        ::write(STDERR_FILENO, ": ", 2);
        ::write(STDERR_FILENO, reason, std::strlen(reason));
        ::write(STDERR_FILENO, "\n", 1);
        ::_exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            std::cerr << "[PosixHostSystem] waitpid: " << std::strerror(errno) << '\n';
            result.exit_code = 127;
            return result;
        }
    }
    result.exit_code = decodeWaitStatus(status);
    return result;
}

bool PosixHostSystem::createDirectories(const std::filesystem::path& path, std::string& error) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    return true;
}

bool PosixHostSystem::writeFile(const std::filesystem::path& path,
                                const std::string& contents,
                                std::string& error) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = std::strerror(errno);
        return false;
    }
    out << contents;
    out.close();
    if (!out) {
        error = "write failed";
        return false;
    }
    return true;
}

bool PosixHostSystem::installFile(const std::filesystem::path& source,
                                  const std::filesystem::path& target_dir,
                                  std::string& error) {
    namespace fs = std::filesystem;
    const fs::path target = target_dir / source.filename();
    std::error_code ec;
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    fs::permissions(target,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace,
                    ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    return true;
}

}  // namespace numpad::setup
