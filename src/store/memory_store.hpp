/**
 * @file memory_store.hpp
 * @brief In-process IDigestStore for tests and the demo CLI.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "store/store.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace proc_sandbox {

/**
 * @brief Hash map of digest -> bytes, guarded by a shared mutex.
 *
 * Directory levels are stored as their canonical encoding, so a tree and a
 * blob with identical bytes share one entry.
 */
class MemoryStore : public IDigestStore {
public:
    MemoryStore() = default;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    Result<std::string> load_bytes(const Digest& digest) override;
    Result<Directory> load_directory(const Digest& digest) override;
    Result<Digest> save_bytes(std::string_view bytes) override;
    Result<Digest> save_directory(const Directory& dir) override;

    [[nodiscard]] bool contains(const Digest& digest) const;
    [[nodiscard]] size_t entry_count() const;

private:
    std::unordered_map<std::string, std::string> blobs_;
    mutable std::shared_mutex mutex_;
};

}  // namespace proc_sandbox
