/**
 * @file test_platform.cpp
 * @brief Unit tests for platform identifiers and relative path normalization.
 */

#include "core/platform.hpp"

#include <gtest/gtest.h>

using namespace proc_sandbox;

TEST(PlatformTest, CurrentPlatformIsKnown) {
    auto platform = current_platform();
    ASSERT_TRUE(platform.has_value()) << platform.error().message;
    auto round_trip = platform_from_string(to_string(*platform));
    ASSERT_TRUE(round_trip.has_value());
    EXPECT_EQ(*round_trip, *platform);
}

TEST(PlatformTest, ParseIdentifiers) {
    EXPECT_EQ(*platform_from_string("linux_x86_64"), Platform::LinuxX86_64);
    EXPECT_EQ(*platform_from_string("linux_arm64"), Platform::LinuxArm64);
    EXPECT_EQ(*platform_from_string("macos_x86_64"), Platform::MacosX86_64);
    EXPECT_EQ(*platform_from_string("macos_arm64"), Platform::MacosArm64);
}

TEST(PlatformTest, UnknownIdentifierIsInvalidRequest) {
    auto result = platform_from_string("windows_x86_64");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidRequest);
}

TEST(NormalizePathTest, DropsDotAndEmptyComponents) {
    EXPECT_EQ(*normalize_relative_path("cats/./roland"), "cats/roland");
    EXPECT_EQ(*normalize_relative_path("cats//roland/"), "cats/roland");
    EXPECT_EQ(*normalize_relative_path("./birds/falcons"), "birds/falcons");
}

TEST(NormalizePathTest, RootSpellingsNormalizeToEmpty) {
    EXPECT_EQ(*normalize_relative_path(""), "");
    EXPECT_EQ(*normalize_relative_path("."), "");
    EXPECT_EQ(*normalize_relative_path("./"), "");
}

TEST(NormalizePathTest, RejectsAbsolutePaths) {
    auto result = normalize_relative_path("/etc/passwd");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidRequest);
}

TEST(NormalizePathTest, RejectsParentTraversal) {
    EXPECT_FALSE(normalize_relative_path("../outside").has_value());
    EXPECT_FALSE(normalize_relative_path("cats/../../outside").has_value());
    EXPECT_FALSE(normalize_relative_path("cats/..").has_value());
}

TEST(NormalizePathTest, RejectsNulBytes) {
    std::string path{"cats\0roland", 11};
    EXPECT_FALSE(normalize_relative_path(path).has_value());
}
