/**
 * @file sandbox_builder.hpp
 * @brief Ephemeral execution directories materialized from the store.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/named_caches.hpp"
#include "store/store.hpp"

#include <filesystem>
#include <string>

namespace proc_sandbox {

/**
 * @brief Creates and populates one sandbox per execution.
 *
 * Creation and population are separate steps so the caller can put the
 * directory under a SandboxGuard before anything else can fail.
 */
class SandboxBuilder {
public:
    SandboxBuilder(IDigestStore& store, const NamedCaches& caches,
                   std::filesystem::path base_root);

    /**
     * @brief Create a fresh `process-executionXXXXXX` directory under the
     *        base root (creating the base root if needed).
     */
    Result<std::filesystem::path> create_directory() const;

    /**
     * @brief Populate a sandbox for a normalized request.
     *
     * Materializes the input tree, pre-creates the parent chain of every
     * declared output, links `.jdk` and mounts named caches.
     */
    Result<void> prepare(const std::filesystem::path& sandbox_root,
                         const ProcessRequest& request) const;

    /**
     * @brief Write the tree rooted at @p digest into existing directory @p dest.
     */
    Result<void> materialize(const Digest& digest, const std::filesystem::path& dest) const;

    [[nodiscard]] const std::filesystem::path& base_root() const noexcept { return base_root_; }

private:
    Result<void> create_output_parents(const std::filesystem::path& sandbox_root,
                                       const ProcessRequest& request) const;

    IDigestStore& store_;
    const NamedCaches& caches_;
    std::filesystem::path base_root_;
};

/**
 * @brief Write bytes to a file, replacing it, with mode 0755 or 0644.
 */
Result<void> write_file(const std::filesystem::path& path, std::string_view bytes,
                        bool is_executable);

}  // namespace proc_sandbox
