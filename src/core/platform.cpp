/**
 * @file platform.cpp
 * @brief Platform detection from uname(2) and path normalization.
 * @author Dimitris Kafetzis
 */

#include "core/platform.hpp"

#include <cerrno>
#include <cstring>
#include <sys/utsname.h>
#include <vector>

namespace proc_sandbox {

Result<Platform> current_platform() {
    utsname info{};
    if (::uname(&info) != 0) {
        return Error{"uname failed: " + std::string(strerror(errno))};
    }

    std::string_view sys = info.sysname;
    std::string_view machine = info.machine;
    bool arm = machine == "aarch64" || machine == "arm64";
    bool x86 = machine == "x86_64" || machine == "amd64";

    if (sys == "Linux") {
        if (x86) return Platform::LinuxX86_64;
        if (arm) return Platform::LinuxArm64;
    } else if (sys == "Darwin") {
        if (x86) return Platform::MacosX86_64;
        if (arm) return Platform::MacosArm64;
    }
    return Error{"Unsupported platform: " + std::string(sys) + " " + std::string(machine)};
}

Result<Platform> platform_from_string(std::string_view name) {
    for (auto p : {Platform::LinuxX86_64, Platform::LinuxArm64,
                   Platform::MacosX86_64, Platform::MacosArm64}) {
        if (to_string(p) == name) return p;
    }
    return Error{ErrorKind::InvalidRequest,
                 "Unknown platform identifier: " + std::string(name)};
}

Result<std::string> normalize_relative_path(std::string_view path) {
    if (path.find('\0') != std::string_view::npos) {
        return Error{ErrorKind::InvalidRequest, "Path contains a NUL byte"};
    }
    if (!path.empty() && path.front() == '/') {
        return Error{ErrorKind::InvalidRequest,
                     "Absolute path is not allowed: " + std::string(path)};
    }

    std::vector<std::string_view> parts;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string_view::npos) next = path.size();
        auto part = path.substr(pos, next - pos);
        pos = next + 1;

        if (part.empty() || part == ".") continue;
        if (part == "..") {
            return Error{ErrorKind::InvalidRequest,
                         "Path escapes its root: " + std::string(path)};
        }
        parts.push_back(part);
    }

    std::string normalized;
    for (const auto& part : parts) {
        if (!normalized.empty()) normalized += '/';
        normalized += part;
    }
    return normalized;
}

}  // namespace proc_sandbox
