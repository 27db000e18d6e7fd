/**
 * @file platform.hpp
 * @brief Host platform detection and relative path normalization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace proc_sandbox {

/**
 * @brief Detect the platform of the running host via uname(2).
 */
Result<Platform> current_platform();

/**
 * @brief Parse an identifier such as "linux_x86_64".
 */
Result<Platform> platform_from_string(std::string_view name);

/**
 * @brief Normalize a sandbox-relative path.
 *
 * Drops "." components and repeated slashes. Rejects absolute paths, ".."
 * components and embedded NULs, so the result can never resolve outside
 * the directory it is joined onto. An input of "" or "." yields "".
 */
Result<std::string> normalize_relative_path(std::string_view path);

}  // namespace proc_sandbox
