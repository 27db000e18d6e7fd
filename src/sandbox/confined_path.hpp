/**
 * @file confined_path.hpp
 * @brief Symlink-aware traversal of sandbox-relative paths.
 * @author Dimitris Kafetzis
 *
 * normalize_relative_path() confines a path lexically. These helpers also
 * confine it physically: an intermediate component that is a symlink may
 * point anywhere on the host, so it is never created through or read
 * through.
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>
#include <string_view>

namespace proc_sandbox {

/**
 * @brief Create every component of @p rel under @p root, like `mkdir -p`.
 *
 * Existing real directories are reused. A component that is a symlink or a
 * non-directory fails with SandboxSetupError, and nothing is created past it.
 * @p rel must already be normalized; "" is a no-op.
 */
Result<void> create_confined_directories(const std::filesystem::path& root,
                                         std::string_view rel);

/**
 * @brief True when some proper ancestor of @p rel under @p root is a symlink.
 *
 * The final component is not inspected, so a declared output that is itself
 * a symlink is still reachable. Missing ancestors count as "no symlink".
 */
[[nodiscard]] bool has_symlinked_ancestor(const std::filesystem::path& root,
                                          std::string_view rel);

}  // namespace proc_sandbox
