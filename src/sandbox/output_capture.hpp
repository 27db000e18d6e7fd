/**
 * @file output_capture.hpp
 * @brief Snapshot declared outputs of a finished process into the store.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "store/store.hpp"
#include "store/tree.hpp"

#include <filesystem>
#include <set>
#include <string>

namespace proc_sandbox {

/**
 * @brief Collects declared output files and directories from a sandbox.
 *
 * Missing outputs are skipped, never reported. A declared file that lives
 * inside a declared directory is captured once.
 */
class OutputCapturer {
public:
    explicit OutputCapturer(IDigestStore& store);

    /**
     * @brief Capture outputs under @p sandbox_root and persist the merged tree.
     * @return The root digest, or EMPTY_DIGEST when nothing was captured.
     */
    Result<Digest> capture(const std::filesystem::path& sandbox_root,
                           const std::set<std::string>& output_files,
                           const std::set<std::string>& output_directories);

private:
    Result<void> capture_file(const std::filesystem::path& abs,
                              const std::string& rel, TreeBuilder& tree);
    Result<void> capture_directory(const std::filesystem::path& abs,
                                   const std::string& rel, TreeBuilder& tree);

    IDigestStore& store_;
};

/**
 * @brief Read a whole file into memory.
 */
Result<std::string> read_file(const std::filesystem::path& path);

}  // namespace proc_sandbox
