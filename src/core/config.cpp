/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace proc_sandbox {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [sandbox]
        if (auto sandbox = tbl["sandbox"]; sandbox.is_table()) {
            config.sandbox.root = sandbox["root"].value_or(config.sandbox.root.string());
            config.sandbox.cleanup = sandbox["cleanup"].value_or(true);
        }

        // [named_caches]
        if (auto caches = tbl["named_caches"]; caches.is_table()) {
            config.named_caches.root =
                caches["root"].value_or(config.named_caches.root.string());
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            config.executor.thread_count = static_cast<uint32_t>(
                executor["thread_count"].value_or(int64_t{0}));
            config.executor.kill_grace_ms = static_cast<uint32_t>(
                executor["kill_grace_ms"].value_or(int64_t{2000}));
        }

        // [platform]
        if (auto platform = tbl["platform"]; platform.is_table()) {
            config.platform.override_name = platform["override"].value_or(std::string{});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace proc_sandbox
