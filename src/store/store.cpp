/**
 * @file store.cpp
 * @brief Store-level tree helpers.
 * @author Dimitris Kafetzis
 */

#include "store/store.hpp"

#include <algorithm>

namespace proc_sandbox {

namespace {

Result<void> collect(IDigestStore& store, const Digest& digest,
                     const std::string& prefix, std::vector<TreeEntry>& out) {
    auto dir = store.load_directory(digest);
    if (!dir) return dir.error();

    for (const auto& file : dir->files) {
        out.push_back(TreeEntry{.path = prefix + file.name,
                                .digest = file.digest,
                                .is_executable = file.is_executable});
    }
    for (const auto& sub : dir->directories) {
        auto nested = collect(store, sub.digest, prefix + sub.name + "/", out);
        if (!nested) return nested;
    }
    return {};
}

}  // anonymous namespace

Result<std::vector<TreeEntry>> list_files(IDigestStore& store, const Digest& root) {
    std::vector<TreeEntry> entries;
    auto status = collect(store, root, "", entries);
    if (!status) return status.error();
    std::sort(entries.begin(), entries.end(),
              [](const TreeEntry& a, const TreeEntry& b) { return a.path < b.path; });
    return entries;
}

}  // namespace proc_sandbox
