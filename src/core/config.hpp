/**
 * @file config.hpp
 * @brief Runner configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace proc_sandbox {

struct SandboxConfig {
    std::filesystem::path root = "/tmp/proc_sandbox";
    bool cleanup = true;                ///< false = preserve every sandbox
};

struct NamedCachesConfig {
    std::filesystem::path root = "/tmp/proc_sandbox_caches";
};

struct ExecutorConfig {
    uint32_t thread_count = 0;          ///< 0 = hardware_concurrency
    uint32_t kill_grace_ms = 2000;      ///< SIGTERM -> SIGKILL escalation delay
};

struct PlatformConfig {
    std::string override_name;          ///< Empty = detect with uname(2)
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< Empty = log to stdout
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    SandboxConfig sandbox;
    NamedCachesConfig named_caches;
    ExecutorConfig executor;
    PlatformConfig platform;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace proc_sandbox
