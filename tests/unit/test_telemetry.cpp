/**
 * @file test_telemetry.cpp
 * @brief Unit tests for Logger, log sinks and MetricsCollector.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include "support/fixtures.hpp"

#include <gtest/gtest.h>

using namespace proc_sandbox;
using proc_sandbox::testing::ScratchDirTest;

namespace fs = std::filesystem;

TEST(LoggerTest, ParseLevels) {
    EXPECT_EQ(*parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(*parse_log_level("warn"), LogLevel::Warn);

    auto bad = parse_log_level("verbose");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().kind, ErrorKind::ConfigError);
}

TEST(LoggerTest, JsonEscape) {
    EXPECT_EQ(json_escape(R"(say "hi")"), R"(say \"hi\")");
    EXPECT_EQ(json_escape("a\nb\\c"), R"(a\nb\\c)");
    EXPECT_EQ(json_escape(std::string{"\x01", 1}), R"(\u0001)");
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    auto sink = std::make_unique<MemorySink>();
    auto* lines = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.error("also shown");

    auto written = lines->lines();
    ASSERT_EQ(written.size(), 2u);
    EXPECT_NE(written[0].find(R"("level":"warn")"), std::string::npos);
    EXPECT_NE(written[0].find(R"("msg":"shown")"), std::string::npos);
    EXPECT_NE(written[0].find(R"("ts":")"), std::string::npos);
}

TEST(MetricsCollectorTest, ProcessEvents) {
    auto sink = std::make_unique<MemorySink>();
    auto* lines = sink.get();
    MetricsCollector metrics(std::move(sink));

    metrics.record_process_started("build-1", "echo \"foo\"", "/bin/echo");
    metrics.record_process_finished("build-1", -15, true, Duration{1500});
    metrics.record_sandbox_disposed("/tmp/sb/process-execution1", true);
    metrics.record_custom("note", R"({"k":1})");

    auto written = lines->lines();
    ASSERT_EQ(written.size(), 4u);
    EXPECT_EQ(written[0], R"({"event":"process_started","build_id":"build-1",)"
                          R"("description":"echo \"foo\"","argv0":"/bin/echo"})");
    EXPECT_EQ(written[1], R"({"event":"process_finished","build_id":"build-1",)"
                          R"("exit_code":-15,"timed_out":true,"duration_us":1500})");
    EXPECT_EQ(written[2], R"({"event":"sandbox_disposed","path":"/tmp/sb/process-execution1",)"
                          R"("preserved":true})");
    EXPECT_EQ(written[3], R"({"event":"note","data":{"k":1}})");
}

class JsonFileSinkTest : public ScratchDirTest {};

TEST_F(JsonFileSinkTest, WritesNdjsonLines) {
    {
        JsonFileSink sink(temp_dir_, "events");
        sink.write(R"({"a":1})");
        sink.write(R"({"b":2})");
    }
    EXPECT_EQ(proc_sandbox::testing::slurp(temp_dir_ / "events.ndjson"),
              "{\"a\":1}\n{\"b\":2}\n");
}

TEST_F(JsonFileSinkTest, RotatesBySize) {
    // A zero-megabyte limit rotates before every write.
    JsonFileSink sink(temp_dir_, "events", 0, 2);
    sink.write("first");
    sink.write("second");
    sink.write("third");
    sink.flush();

    EXPECT_EQ(proc_sandbox::testing::slurp(temp_dir_ / "events.ndjson"), "third\n");
    EXPECT_EQ(proc_sandbox::testing::slurp(temp_dir_ / "events.1.ndjson"), "second\n");
    EXPECT_EQ(proc_sandbox::testing::slurp(temp_dir_ / "events.2.ndjson"), "first\n");
}
