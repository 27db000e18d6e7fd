/**
 * @file test_command_runner.cpp
 * @brief Unit tests for request normalization and runner helpers.
 */

#include "executor/command_runner.hpp"

#include <gtest/gtest.h>

using namespace proc_sandbox;

namespace {

ProcessRequest echo_request() {
    ProcessRequest request;
    request.argv = {"/bin/echo", "hi"};
    return request;
}

}  // anonymous namespace

TEST(NormalizeRequestTest, AcceptsMinimalRequest) {
    auto normalized = normalize_request(echo_request());
    ASSERT_TRUE(normalized.has_value()) << normalized.error().message;
    EXPECT_EQ(normalized->argv, echo_request().argv);
    EXPECT_FALSE(normalized->working_directory.has_value());
}

TEST(NormalizeRequestTest, RejectsEmptyArgv) {
    auto normalized = normalize_request(ProcessRequest{});
    ASSERT_FALSE(normalized.has_value());
    EXPECT_EQ(normalized.error().kind, ErrorKind::InvalidRequest);
}

TEST(NormalizeRequestTest, AcceptsShellIdentifierEnvNames) {
    auto request = echo_request();
    request.env = {{"PATH", "/bin"}, {"_private", "1"}, {"LC_ALL2", "C"}};
    EXPECT_TRUE(normalize_request(request).has_value());
}

TEST(NormalizeRequestTest, RejectsEnvNamesThatCannotBeExported) {
    for (const std::string name : {"", "A B", "X;touch y", "1ABC", "A=B", "$(id)", "A-B"}) {
        auto request = echo_request();
        request.env = {{name, "value"}};
        auto normalized = normalize_request(request);
        ASSERT_FALSE(normalized.has_value()) << "accepted '" << name << "'";
        EXPECT_EQ(normalized.error().kind, ErrorKind::InvalidRequest);
    }
}

TEST(NormalizeRequestTest, NormalizesOutputPaths) {
    auto request = echo_request();
    request.output_files = {"./cats//roland"};
    request.output_directories = {"birds/./falcons/"};

    auto normalized = normalize_request(request);
    ASSERT_TRUE(normalized.has_value()) << normalized.error().message;
    EXPECT_EQ(normalized->output_files, std::set<std::string>{"cats/roland"});
    EXPECT_EQ(normalized->output_directories, std::set<std::string>{"birds/falcons"});
}

TEST(NormalizeRequestTest, RejectsRootAndEscapingOutputs) {
    for (const std::string path : {".", "", "../up", "/abs", "a/../../b"}) {
        auto request = echo_request();
        request.output_files = {path};
        auto normalized = normalize_request(request);
        ASSERT_FALSE(normalized.has_value()) << "accepted '" << path << "'";
        EXPECT_EQ(normalized.error().kind, ErrorKind::InvalidRequest);
    }
}

TEST(NormalizeRequestTest, RootWorkingDirectoryBecomesNone) {
    auto request = echo_request();
    request.working_directory = "./";
    auto normalized = normalize_request(request);
    ASSERT_TRUE(normalized.has_value());
    EXPECT_FALSE(normalized->working_directory.has_value());
}

TEST(NormalizeRequestTest, RejectsNonPositiveTimeout) {
    auto request = echo_request();
    request.timeout = std::chrono::milliseconds{0};
    auto normalized = normalize_request(request);
    ASSERT_FALSE(normalized.has_value());
    EXPECT_EQ(normalized.error().kind, ErrorKind::InvalidRequest);
}

TEST(NormalizeRequestTest, ValidatesCaches) {
    auto request = echo_request();
    request.append_only_caches = {{"geo", "./.cache//geo"}};
    auto normalized = normalize_request(request);
    ASSERT_TRUE(normalized.has_value()) << normalized.error().message;
    EXPECT_EQ(normalized->append_only_caches.at("geo"), ".cache/geo");

    request.append_only_caches = {{"bad name", ".cache"}};
    normalized = normalize_request(request);
    ASSERT_FALSE(normalized.has_value());
    EXPECT_EQ(normalized.error().kind, ErrorKind::InvalidCacheName);
}

TEST(RunnerHelpersTest, TimeoutMessage) {
    EXPECT_EQ(timeout_message(std::chrono::milliseconds{500}, "fast"),
              "Exceeded timeout of 0.500 seconds when executing local process: fast");
}

TEST(RunnerHelpersTest, WorkingDirectory) {
    auto request = echo_request();
    EXPECT_EQ(working_directory("/sb", request), std::filesystem::path("/sb"));
    request.working_directory = "cats";
    EXPECT_EQ(working_directory("/sb", request), std::filesystem::path("/sb/cats"));
}

TEST(RunnerOptionsTest, DefaultCachesRootIsOutsideSandboxRoot) {
    RunnerOptions options;
    auto caches = options.named_caches_root.lexically_relative(options.sandbox_root);
    EXPECT_TRUE(caches.empty() || *caches.begin() == "..");
}
