/**
 * @file test_named_caches.cpp
 * @brief Unit tests for named cache validation and mounting.
 */

#include "sandbox/named_caches.hpp"

#include "support/fixtures.hpp"

#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <vector>

using namespace proc_sandbox;
using proc_sandbox::testing::ScratchDirTest;

namespace fs = std::filesystem;

TEST(NamedCacheNameTest, AcceptsIdentifiers) {
    EXPECT_TRUE(NamedCaches::validate_name("geo").has_value());
    EXPECT_TRUE(NamedCaches::validate_name("pip_cache-3").has_value());
    EXPECT_TRUE(NamedCaches::validate_name(std::string(255, 'a')).has_value());
}

TEST(NamedCacheNameTest, RejectsBadNames) {
    for (const std::string& bad : std::vector<std::string>{"", "with space", "slash/name", "dot.name", "..",
                                                          std::string(256, 'a')}) {
        auto result = NamedCaches::validate_name(bad);
        ASSERT_FALSE(result.has_value()) << bad;
        EXPECT_EQ(result.error().kind, ErrorKind::InvalidCacheName);
    }
}

TEST(NamedCacheDestinationTest, NormalizesRelativePaths) {
    auto dest = NamedCaches::validate_destination("./.cache//geo/");
    ASSERT_TRUE(dest.has_value());
    EXPECT_EQ(*dest, ".cache/geo");
}

TEST(NamedCacheDestinationTest, RejectsEscapingPaths) {
    for (const std::string& bad : std::vector<std::string>{"", ".", "/abs/path", "../outside", "a/../../b"}) {
        auto result = NamedCaches::validate_destination(bad);
        ASSERT_FALSE(result.has_value()) << bad;
        EXPECT_EQ(result.error().kind, ErrorKind::InvalidCacheDestination);
    }
}

class NamedCachesTest : public ScratchDirTest {};

TEST_F(NamedCachesTest, ResolveIsStableAndCreatesDirectory) {
    NamedCaches caches(temp_dir_ / "caches");

    auto first = caches.resolve("geo", ".cache/geo");
    auto second = caches.resolve("geo", "elsewhere");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, temp_dir_ / "caches" / "geo");
    EXPECT_EQ(*first, *second);
    EXPECT_TRUE(fs::is_directory(*first));
}

TEST_F(NamedCachesTest, ResolveValidatesBeforeTouchingDisk) {
    NamedCaches caches(temp_dir_ / "caches");
    auto result = caches.resolve("bad name", ".cache");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidCacheName);
    EXPECT_FALSE(fs::exists(temp_dir_ / "caches"));
}

TEST_F(NamedCachesTest, MountLinksIntoSandbox) {
    NamedCaches caches(temp_dir_ / "caches");
    auto sandbox = temp_dir_ / "sandbox";
    fs::create_directories(sandbox);

    ASSERT_TRUE(caches.mount(sandbox, "geo", ".cache/geo"));
    auto mounted = sandbox / ".cache" / "geo";
    EXPECT_TRUE(fs::is_symlink(mounted));

    std::ofstream(mounted / "data") << "persisted";
    EXPECT_TRUE(fs::exists(temp_dir_ / "caches" / "geo" / "data"));
}
