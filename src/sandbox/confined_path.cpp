/**
 * @file confined_path.cpp
 * @brief Component-by-component sandbox path walking.
 * @author Dimitris Kafetzis
 */

#include "sandbox/confined_path.hpp"

#include <system_error>

namespace proc_sandbox {

namespace fs = std::filesystem;

Result<void> create_confined_directories(const fs::path& root, std::string_view rel) {
    fs::path current = root;
    for (const auto& part : fs::path(rel)) {
        if (part.empty() || part == ".") continue;
        current /= part;

        std::error_code ec;
        auto status = fs::symlink_status(current, ec);
        if (status.type() == fs::file_type::not_found) {
            fs::create_directory(current, ec);
            if (ec) {
                return Error{ErrorKind::SandboxSetupError,
                             "Failed to create directory " + current.string() + ": " + ec.message()};
            }
            continue;
        }
        if (ec) {
            return Error{ErrorKind::SandboxSetupError,
                         "Failed to stat " + current.string() + ": " + ec.message()};
        }
        if (status.type() == fs::file_type::symlink) {
            return Error{ErrorKind::SandboxSetupError,
                         "Refusing to traverse symlink " + current.string()
                         + " while creating " + std::string(rel)};
        }
        if (status.type() != fs::file_type::directory) {
            return Error{ErrorKind::SandboxSetupError,
                         "Path component is not a directory: " + current.string()};
        }
    }
    return {};
}

bool has_symlinked_ancestor(const fs::path& root, std::string_view rel) {
    auto parent = fs::path(rel).parent_path();
    fs::path current = root;
    for (const auto& part : parent) {
        if (part.empty() || part == ".") continue;
        current /= part;

        std::error_code ec;
        auto status = fs::symlink_status(current, ec);
        if (status.type() == fs::file_type::symlink) return true;
        if (ec || status.type() != fs::file_type::directory) return false;
    }
    return false;
}

}  // namespace proc_sandbox
