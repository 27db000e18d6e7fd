/**
 * @file tree.hpp
 * @brief Directory tree model, canonical codec, and a mutable tree builder.
 * @author Dimitris Kafetzis
 *
 * A Directory is one level of a content-addressed tree: child files and
 * subdirectories are referenced by digest. TreeBuilder assembles a nested
 * tree from slash-separated paths and persists it bottom-up.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace proc_sandbox {

class IDigestStore;

// ─────────────────────────────────────────────
// Directory nodes
// ─────────────────────────────────────────────

struct FileNode {
    std::string name;
    Digest digest;
    bool is_executable{false};

    bool operator==(const FileNode&) const = default;
};

struct DirectoryNode {
    std::string name;
    Digest digest;

    bool operator==(const DirectoryNode&) const = default;
};

struct SymlinkNode {
    std::string name;
    std::string target;

    bool operator==(const SymlinkNode&) const = default;
};

/**
 * @brief One directory level. Canonical form: each list sorted by name,
 *        and a name appears in at most one list.
 */
struct Directory {
    std::vector<FileNode> files;
    std::vector<DirectoryNode> directories;
    std::vector<SymlinkNode> symlinks;

    [[nodiscard]] bool empty() const noexcept {
        return files.empty() && directories.empty() && symlinks.empty();
    }

    bool operator==(const Directory&) const = default;
};

// ─────────────────────────────────────────────
// Codec
// ─────────────────────────────────────────────

/**
 * @brief Canonical binary encoding of a Directory (all integers big-endian).
 *
 *   entry   := [1B kind][4B name_len][name] payload
 *   file    := [4B hash_len][hash][8B size][1B executable]
 *   dir     := [4B hash_len][hash][8B size]
 *   symlink := [4B target_len][target]
 *
 * Files come first, then directories, then symlinks, each sorted by name.
 * The empty directory encodes to zero bytes.
 */
struct TreeCodec {
    static std::string encode(const Directory& dir);
    static Result<Directory> decode(std::string_view bytes);

    static void put_u64(std::string& buf, uint64_t val);
    static void put_u32(std::string& buf, uint32_t val);
    static uint64_t get_u64(const unsigned char* p);
    static uint32_t get_u32(const unsigned char* p);
};

/**
 * @brief Check a single path component: non-empty, not "." or "..",
 *        no '/' and no NUL.
 */
[[nodiscard]] bool is_valid_entry_name(std::string_view name) noexcept;

// ─────────────────────────────────────────────
// TreeBuilder
// ─────────────────────────────────────────────

/**
 * @brief Mutable nested tree keyed by normalized relative paths.
 *
 * Adding the same entry twice is a no-op; intermediate directories are
 * created implicitly. Adding a file where a directory exists (or the
 * reverse) is an error.
 */
class TreeBuilder {
public:
    TreeBuilder();
    ~TreeBuilder();
    TreeBuilder(TreeBuilder&&) noexcept;
    TreeBuilder& operator=(TreeBuilder&&) noexcept;

    Result<void> add_file(std::string_view path, const Digest& digest, bool is_executable);
    Result<void> add_symlink(std::string_view path, std::string target);
    Result<void> add_directory(std::string_view path);

    [[nodiscard]] bool empty() const noexcept;

    /// Save every level to the store, children first; returns the root digest.
    Result<Digest> persist(IDigestStore& store) const;

private:
    struct Node;
    std::unique_ptr<Node> root_;

    Result<Node*> descend(std::string_view parent_path);
};

}  // namespace proc_sandbox
