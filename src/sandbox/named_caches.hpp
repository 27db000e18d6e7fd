/**
 * @file named_caches.hpp
 * @brief Stable host directories for append-only named caches.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace proc_sandbox {

/**
 * @brief Maps a cache name to `<root>/<name>` and links it into sandboxes.
 *
 * Cache directories are created on first use and never deleted here.
 * Concurrent executions sharing a name are not serialized; callers agree
 * to only append.
 */
class NamedCaches {
public:
    explicit NamedCaches(std::filesystem::path root);

    /// Accepts `[A-Za-z0-9_-]+`, at most 255 characters.
    static Result<std::string> validate_name(std::string_view name);

    /// Accepts a non-empty relative path that stays inside the sandbox.
    static Result<std::string> validate_destination(std::string_view mount_path);

    /**
     * @brief Validate both halves of the mapping and return the host
     *        directory, creating it if missing.
     */
    Result<std::filesystem::path> resolve(std::string_view name,
                                          std::string_view mount_path) const;

    /**
     * @brief Resolve, then symlink `<sandbox_root>/<mount_path>` to the host
     *        directory (creating the mount path's parents).
     */
    Result<void> mount(const std::filesystem::path& sandbox_root,
                       std::string_view name,
                       std::string_view mount_path) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
};

}  // namespace proc_sandbox
