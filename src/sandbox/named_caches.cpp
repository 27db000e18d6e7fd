/**
 * @file named_caches.cpp
 * @brief NamedCaches implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/named_caches.hpp"

#include "core/platform.hpp"
#include "sandbox/confined_path.hpp"

#include <system_error>

namespace proc_sandbox {

namespace fs = std::filesystem;

NamedCaches::NamedCaches(fs::path root) : root_(std::move(root)) {}

Result<std::string> NamedCaches::validate_name(std::string_view name) {
    if (name.empty() || name.size() > 255) {
        return Error{ErrorKind::InvalidCacheName,
                     "Cache name must be 1-255 characters: '" + std::string(name) + "'"};
    }
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
               || (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) {
            return Error{ErrorKind::InvalidCacheName,
                         "Cache names may only contain alphanumerics, '_' and '-': '"
                         + std::string(name) + "'"};
        }
    }
    return std::string(name);
}

Result<std::string> NamedCaches::validate_destination(std::string_view mount_path) {
    auto normalized = normalize_relative_path(mount_path);
    if (!normalized) {
        return normalized.error().with_kind(ErrorKind::InvalidCacheDestination,
                                            "Invalid cache destination");
    }
    if (normalized->empty()) {
        return Error{ErrorKind::InvalidCacheDestination,
                     "Cache destination must not be the sandbox root"};
    }
    return normalized;
}

Result<fs::path> NamedCaches::resolve(std::string_view name,
                                      std::string_view mount_path) const {
    auto valid_name = validate_name(name);
    if (!valid_name) return valid_name.error();
    auto valid_dest = validate_destination(mount_path);
    if (!valid_dest) return valid_dest.error();

    auto host_dir = root_ / *valid_name;
    std::error_code ec;
    fs::create_directories(host_dir, ec);
    if (ec) {
        return Error{ErrorKind::SandboxSetupError,
                     "Failed to create named cache " + host_dir.string() + ": " + ec.message()};
    }
    return host_dir;
}

Result<void> NamedCaches::mount(const fs::path& sandbox_root,
                                std::string_view name,
                                std::string_view mount_path) const {
    auto host_dir = resolve(name, mount_path);
    if (!host_dir) return host_dir.error();

    // resolve() already validated it; normalize again for the joined form.
    auto rel = *normalize_relative_path(mount_path);
    auto dest = sandbox_root / rel;

    auto parents = create_confined_directories(sandbox_root, fs::path(rel).parent_path().string());
    if (!parents) return parents;

    std::error_code ec;
    fs::create_directory_symlink(*host_dir, dest, ec);
    if (ec) {
        return Error{ErrorKind::SandboxSetupError,
                     "Failed to mount named cache '" + std::string(name) + "' at "
                     + dest.string() + ": " + ec.message()};
    }
    return {};
}

}  // namespace proc_sandbox
