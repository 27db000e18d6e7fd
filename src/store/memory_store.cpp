/**
 * @file memory_store.cpp
 * @brief MemoryStore implementation.
 * @author Dimitris Kafetzis
 */

#include "store/memory_store.hpp"

#include "store/digest.hpp"

#include <mutex>

namespace proc_sandbox {

Result<std::string> MemoryStore::load_bytes(const Digest& digest) {
    if (digest.is_empty()) return std::string{};

    std::shared_lock lock(mutex_);
    auto it = blobs_.find(digest.hash);
    if (it == blobs_.end() || it->second.size() != digest.size_bytes) {
        return Error{ErrorKind::NotFound, "Blob not found in store: " + digest.to_string()};
    }
    return it->second;
}

Result<Directory> MemoryStore::load_directory(const Digest& digest) {
    auto bytes = load_bytes(digest);
    if (!bytes) {
        return Error{ErrorKind::NotFound, "Directory not found in store: " + digest.to_string()};
    }
    return TreeCodec::decode(*bytes);
}

Result<Digest> MemoryStore::save_bytes(std::string_view bytes) {
    auto digest = compute_digest(bytes);
    if (!digest) return digest.error().with_kind(ErrorKind::StorePersistError, "save_bytes");

    std::unique_lock lock(mutex_);
    blobs_.try_emplace(digest->hash, bytes);
    return digest;
}

Result<Digest> MemoryStore::save_directory(const Directory& dir) {
    return save_bytes(TreeCodec::encode(dir));
}

bool MemoryStore::contains(const Digest& digest) const {
    std::shared_lock lock(mutex_);
    auto it = blobs_.find(digest.hash);
    return it != blobs_.end() && it->second.size() == digest.size_bytes;
}

size_t MemoryStore::entry_count() const {
    std::shared_lock lock(mutex_);
    return blobs_.size();
}

}  // namespace proc_sandbox
