/**
 * @file store.hpp
 * @brief Content-addressed store client contract.
 * @author Dimitris Kafetzis
 *
 * The execution core never owns a store: it consumes this interface, so a
 * disk-backed, remote or in-memory implementation can be injected. Virtual
 * dispatch is fine here; every call is dominated by hashing or I/O.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "store/tree.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace proc_sandbox {

/**
 * @brief Load/save blobs and directory levels by digest.
 *
 * Implementations must be safe for concurrent calls from several
 * executions. Loading EMPTY_DIGEST always succeeds (empty blob / empty tree).
 */
class IDigestStore {
public:
    virtual ~IDigestStore() = default;

    /// Fails with ErrorKind::NotFound if absent.
    virtual Result<std::string> load_bytes(const Digest& digest) = 0;

    /// Fails with ErrorKind::NotFound or ErrorKind::CorruptTree.
    virtual Result<Directory> load_directory(const Digest& digest) = 0;

    virtual Result<Digest> save_bytes(std::string_view bytes) = 0;
    virtual Result<Digest> save_directory(const Directory& dir) = 0;
};

/**
 * @brief A file reachable from a root tree, with its full relative path.
 */
struct TreeEntry {
    std::string path;
    Digest digest;
    bool is_executable{false};
};

/**
 * @brief Recursively list every file under a stored tree, in path order.
 *
 * Directories and symlinks are not listed; use load_directory for those.
 */
Result<std::vector<TreeEntry>> list_files(IDigestStore& store, const Digest& root);

}  // namespace proc_sandbox
