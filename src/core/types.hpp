/**
 * @file types.hpp
 * @brief Fundamental types used throughout ProcSandbox.
 * @author Dimitris Kafetzis
 *
 * Defines Digest, Platform, ProcessRequest, ProcessResult and the other
 * shared vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace proc_sandbox {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using BuildId = std::string;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Lowercase hex SHA-256 of the empty byte string.
inline constexpr std::string_view kEmptyHash =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

// ─────────────────────────────────────────────
// Digest
// ─────────────────────────────────────────────

/**
 * @brief Content fingerprint of a blob or a canonically encoded directory.
 *
 * The canonical encoding of an empty directory is zero bytes, so the empty
 * blob and the empty tree share EMPTY_DIGEST.
 */
struct Digest {
    std::string hash{kEmptyHash};   ///< Lowercase hex SHA-256
    uint64_t size_bytes{0};

    [[nodiscard]] bool is_empty() const noexcept {
        return size_bytes == 0 && hash == kEmptyHash;
    }

    [[nodiscard]] std::string to_string() const {
        return hash + "/" + std::to_string(size_bytes);
    }

    auto operator<=>(const Digest&) const = default;
};

inline const Digest EMPTY_DIGEST{};

// ─────────────────────────────────────────────
// Platform
// ─────────────────────────────────────────────

enum class Platform : uint8_t {
    LinuxX86_64,
    LinuxArm64,
    MacosX86_64,
    MacosArm64
};

[[nodiscard]] constexpr std::string_view to_string(Platform platform) noexcept {
    switch (platform) {
        case Platform::LinuxX86_64: return "linux_x86_64";
        case Platform::LinuxArm64:  return "linux_arm64";
        case Platform::MacosX86_64: return "macos_x86_64";
        case Platform::MacosArm64:  return "macos_arm64";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Process Request
// ─────────────────────────────────────────────

/**
 * @brief Declarative description of one local process execution.
 *
 * All paths are relative to the sandbox root. The runner normalizes and
 * validates them before anything touches the filesystem.
 */
struct ProcessRequest {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;
    Digest input_digest{};

    std::set<std::string> output_files;
    std::set<std::string> output_directories;

    std::optional<std::string> working_directory;
    std::optional<std::chrono::milliseconds> timeout;

    /// Host directory exposed inside the sandbox at `.jdk`.
    std::optional<std::filesystem::path> jdk_home;

    /// Cache name -> mount path relative to the sandbox root.
    std::map<std::string, std::string> append_only_caches;

    std::string description;
};

/// Fixed sandbox-relative mount point for ProcessRequest::jdk_home.
inline constexpr std::string_view kJdkMountPoint = ".jdk";

// ─────────────────────────────────────────────
// Process Result
// ─────────────────────────────────────────────

/**
 * @brief Outcome of a process that ran to completion or was killed on timeout.
 *
 * A negative exit_code -N means "terminated by signal N". Carries no timing
 * data: two executions of the same request compare equal.
 */
struct ProcessResult {
    int exit_code{0};
    Digest stdout_digest{};
    Digest stderr_digest{};
    Digest output_directory{};
    Platform platform{Platform::LinuxX86_64};

    bool operator==(const ProcessResult&) const = default;
};

}  // namespace proc_sandbox
