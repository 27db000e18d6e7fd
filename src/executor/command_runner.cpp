/**
 * @file command_runner.cpp
 * @brief Request normalization and runner option helpers.
 * @author Dimitris Kafetzis
 */

#include "executor/command_runner.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <set>

namespace proc_sandbox {

namespace fs = std::filesystem;

namespace {

Result<std::set<std::string>> normalize_outputs(const std::set<std::string>& paths,
                                                std::string_view kind) {
    std::set<std::string> normalized;
    for (const auto& path : paths) {
        auto clean = normalize_relative_path(path);
        if (!clean) return clean.error();
        if (clean->empty()) {
            return Error{ErrorKind::InvalidRequest,
                         "Output " + std::string{kind} + " path '" + path + "' names the sandbox root"};
        }
        normalized.insert(std::move(*clean));
    }
    return normalized;
}

/// POSIX shell variable name: [A-Za-z_][A-Za-z0-9_]*. Anything else cannot
/// be exported from `__run.sh`.
bool is_env_name(std::string_view name) {
    if (name.empty()) return false;
    auto first = static_cast<unsigned char>(name.front());
    if (!std::isalpha(first) && first != '_') return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || uc == '_';
    });
}

}  // anonymous namespace

Result<RunnerOptions> RunnerOptions::from_config(const Config& config) {
    RunnerOptions options;
    options.sandbox_root = config.sandbox.root;
    options.named_caches_root = config.named_caches.root;
    options.cleanup = config.sandbox.cleanup;
    options.thread_count = config.executor.thread_count;
    options.kill_grace = std::chrono::milliseconds{config.executor.kill_grace_ms};

    if (!config.platform.override_name.empty()) {
        auto platform = platform_from_string(config.platform.override_name);
        if (!platform) return platform.error();
        options.platform_override = *platform;
    }
    return options;
}

Result<ProcessRequest> normalize_request(ProcessRequest request) {
    if (request.argv.empty()) {
        return Error{ErrorKind::InvalidRequest, "Process request has an empty argv"};
    }

    for (const auto& [name, value] : request.env) {
        if (!is_env_name(name)) {
            return Error{ErrorKind::InvalidRequest, "Invalid environment variable name '" + name + "'"};
        }
    }

    auto files = normalize_outputs(request.output_files, "file");
    if (!files) return files.error();
    auto dirs = normalize_outputs(request.output_directories, "directory");
    if (!dirs) return dirs.error();
    request.output_files = std::move(*files);
    request.output_directories = std::move(*dirs);

    if (request.working_directory) {
        auto workdir = normalize_relative_path(*request.working_directory);
        if (!workdir) return workdir.error();
        if (workdir->empty()) {
            request.working_directory.reset();
        } else {
            request.working_directory = std::move(*workdir);
        }
    }

    std::map<std::string, std::string> caches;
    for (const auto& [name, mount_path] : request.append_only_caches) {
        auto valid_name = NamedCaches::validate_name(name);
        if (!valid_name) return valid_name.error();
        auto destination = NamedCaches::validate_destination(mount_path);
        if (!destination) return destination.error();
        caches.emplace(std::move(*valid_name), std::move(*destination));
    }
    request.append_only_caches = std::move(caches);

    if (request.timeout && request.timeout->count() <= 0) {
        return Error{ErrorKind::InvalidRequest,
                     "Timeout must be positive, got " + std::to_string(request.timeout->count()) + "ms"};
    }
    return request;
}

std::string timeout_message(std::chrono::milliseconds timeout, std::string_view description) {
    auto seconds = std::chrono::duration<double>(timeout).count();
    return std::format("Exceeded timeout of {:.3f} seconds when executing local process: {}",
                       seconds, description);
}

fs::path working_directory(const fs::path& sandbox_root, const ProcessRequest& request) {
    if (!request.working_directory || request.working_directory->empty()) return sandbox_root;
    return sandbox_root / *request.working_directory;
}

}  // namespace proc_sandbox
