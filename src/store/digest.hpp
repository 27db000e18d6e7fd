/**
 * @file digest.hpp
 * @brief SHA-256 content fingerprints.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace proc_sandbox {

/**
 * @brief Compute the Digest (hex SHA-256 + length) of a byte string.
 */
Result<Digest> compute_digest(std::string_view bytes);

/**
 * @brief Lowercase hex encoding of raw bytes.
 */
std::string to_hex(std::string_view raw);

/**
 * @brief Check that a string is a well-formed lowercase hex SHA-256.
 */
[[nodiscard]] bool is_valid_hash(std::string_view hash) noexcept;

}  // namespace proc_sandbox
