/**
 * @file fixtures.hpp
 * @brief Shared test data: file contents and small directory trees.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "store/memory_store.hpp"
#include "store/tree.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace proc_sandbox::testing {

inline const std::string kRoland = "European Burmese";
inline const std::string kCatnip = "catnip";

/// Store @p bytes and return their digest, failing the test on error.
inline Digest store_bytes(MemoryStore& store, const std::string& bytes) {
    auto digest = store.save_bytes(bytes);
    EXPECT_TRUE(digest.has_value());
    return digest ? *digest : Digest{};
}

inline Digest store_directory(MemoryStore& store, const Directory& dir) {
    auto digest = store.save_directory(dir);
    EXPECT_TRUE(digest.has_value());
    return digest ? *digest : Digest{};
}

/// {roland}
inline Digest containing_roland(MemoryStore& store) {
    Directory dir;
    dir.files.push_back(FileNode{.name = "roland", .digest = store_bytes(store, kRoland)});
    return store_directory(store, dir);
}

/// {cats/{roland}}
inline Digest nested(MemoryStore& store) {
    Directory dir;
    dir.directories.push_back(DirectoryNode{.name = "cats", .digest = containing_roland(store)});
    return store_directory(store, dir);
}

/// {cats/{roland}, treats}
inline Digest recursive(MemoryStore& store) {
    Directory dir;
    dir.files.push_back(FileNode{.name = "treats", .digest = store_bytes(store, kCatnip)});
    dir.directories.push_back(DirectoryNode{.name = "cats", .digest = containing_roland(store)});
    return store_directory(store, dir);
}

/// {falcons/} (an empty directory)
inline Digest containing_falcons_dir(MemoryStore& store) {
    Directory dir;
    dir.directories.push_back(DirectoryNode{.name = "falcons", .digest = store_directory(store, {})});
    return store_directory(store, dir);
}

/// {birds/{falcons/}, cats/{roland}}
inline Digest nested_dir_and_file(MemoryStore& store) {
    Directory dir;
    dir.directories.push_back(DirectoryNode{.name = "birds", .digest = containing_falcons_dir(store)});
    dir.directories.push_back(DirectoryNode{.name = "cats", .digest = containing_roland(store)});
    return store_directory(store, dir);
}

inline std::string slurp(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

/**
 * @brief Fresh scratch directory under the system temp dir, removed on TearDown.
 */
class ScratchDirTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        auto pattern = (std::filesystem::temp_directory_path() / "ps_test_XXXXXX").string();
        char* created = ::mkdtemp(pattern.data());
        ASSERT_NE(created, nullptr);
        temp_dir_ = created;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir_, ec);
    }
};

}  // namespace proc_sandbox::testing
