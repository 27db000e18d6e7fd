/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <sstream>

namespace proc_sandbox {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_process_started(const BuildId& build_id,
                                              std::string_view description,
                                              std::string_view argv0) {
    std::ostringstream oss;
    oss << R"({"event":"process_started")"
        << R"(,"build_id":")" << json_escape(build_id) << "\""
        << R"(,"description":")" << json_escape(description) << "\""
        << R"(,"argv0":")" << json_escape(argv0) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_process_finished(const BuildId& build_id, int exit_code,
                                               bool timed_out, Duration elapsed) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(elapsed);
    std::ostringstream oss;
    oss << R"({"event":"process_finished")"
        << R"(,"build_id":")" << json_escape(build_id) << "\""
        << R"(,"exit_code":)" << exit_code
        << R"(,"timed_out":)" << (timed_out ? "true" : "false")
        << R"(,"duration_us":)" << micros.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_sandbox_disposed(const std::filesystem::path& path,
                                               bool preserved) {
    std::ostringstream oss;
    oss << R"({"event":"sandbox_disposed")"
        << R"(,"path":")" << json_escape(path.string()) << "\""
        << R"(,"preserved":)" << (preserved ? "true" : "false")
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace proc_sandbox
