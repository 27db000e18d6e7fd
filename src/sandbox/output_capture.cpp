/**
 * @file output_capture.cpp
 * @brief OutputCapturer implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/output_capture.hpp"

#include "sandbox/confined_path.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace proc_sandbox {

namespace fs = std::filesystem;

namespace {

Error persist_error(const std::string& what, const fs::path& path, const std::error_code& ec) {
    return Error{ErrorKind::StorePersistError,
                 what + " " + path.string() + ": " + ec.message()};
}

bool owner_executable(const fs::file_status& status) {
    return (status.permissions() & fs::perms::owner_exec) != fs::perms::none;
}

}  // anonymous namespace

Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorKind::StorePersistError, "Failed to open " + path.string()};
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorKind::StorePersistError, "Failed to read " + path.string()};
    }
    return bytes;
}

OutputCapturer::OutputCapturer(IDigestStore& store) : store_(store) {}

Result<Digest> OutputCapturer::capture(const fs::path& sandbox_root,
                                       const std::set<std::string>& output_files,
                                       const std::set<std::string>& output_directories) {
    TreeBuilder tree;

    // Outputs reached through a symlinked ancestor live outside the sandbox
    // and are treated as absent.
    for (const auto& rel : output_directories) {
        if (has_symlinked_ancestor(sandbox_root, rel)) continue;
        auto abs = sandbox_root / rel;
        std::error_code ec;
        auto status = fs::symlink_status(abs, ec);
        if (ec || status.type() != fs::file_type::directory) continue;

        if (auto added = tree.add_directory(rel); !added) {
            return added.error().with_kind(ErrorKind::StorePersistError, "Output tree");
        }
        auto captured = capture_directory(abs, rel, tree);
        if (!captured) return captured.error();
    }

    for (const auto& rel : output_files) {
        if (has_symlinked_ancestor(sandbox_root, rel)) continue;
        auto captured = capture_file(sandbox_root / rel, rel, tree);
        if (!captured) return captured.error();
    }

    if (tree.empty()) return EMPTY_DIGEST;

    auto digest = tree.persist(store_);
    if (!digest) return digest.error().with_kind(ErrorKind::StorePersistError, "Output tree");
    return digest;
}

Result<void> OutputCapturer::capture_file(const fs::path& abs, const std::string& rel,
                                          TreeBuilder& tree) {
    std::error_code ec;
    auto status = fs::symlink_status(abs, ec);
    if (ec || status.type() == fs::file_type::not_found) return {};

    Result<void> added;
    if (status.type() == fs::file_type::symlink) {
        auto target = fs::read_symlink(abs, ec);
        if (ec) return persist_error("Failed to read symlink", abs, ec);
        added = tree.add_symlink(rel, target.string());
    } else if (status.type() == fs::file_type::regular) {
        auto bytes = read_file(abs);
        if (!bytes) return bytes.error();
        auto digest = store_.save_bytes(*bytes);
        if (!digest) return digest.error().with_kind(ErrorKind::StorePersistError, rel);
        added = tree.add_file(rel, *digest, owner_executable(status));
    } else {
        // Directories, sockets and devices declared as files are not captured.
        return {};
    }

    if (!added) return added.error().with_kind(ErrorKind::StorePersistError, "Output tree");
    return {};
}

Result<void> OutputCapturer::capture_directory(const fs::path& abs, const std::string& rel,
                                               TreeBuilder& tree) {
    std::error_code ec;
    fs::directory_iterator it(abs, ec);
    if (ec) return persist_error("Failed to list", abs, ec);

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        auto name = it->path().filename().string();
        auto child_rel = rel.empty() ? name : rel + "/" + name;
        auto status = it->symlink_status(ec);
        if (ec) return persist_error("Failed to stat", it->path(), ec);

        if (status.type() == fs::file_type::directory) {
            if (auto added = tree.add_directory(child_rel); !added) {
                return added.error().with_kind(ErrorKind::StorePersistError, "Output tree");
            }
            auto nested = capture_directory(it->path(), child_rel, tree);
            if (!nested) return nested;
        } else {
            auto captured = capture_file(it->path(), child_rel, tree);
            if (!captured) return captured;
        }
    }
    if (ec) return persist_error("Failed to iterate", abs, ec);
    return {};
}

}  // namespace proc_sandbox
