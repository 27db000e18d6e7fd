/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for process executions.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string_view>

namespace proc_sandbox {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * Safe to share between concurrent executions.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_process_started(const BuildId& build_id, std::string_view description,
                                std::string_view argv0);
    void record_process_finished(const BuildId& build_id, int exit_code, bool timed_out,
                                 Duration elapsed);
    void record_sandbox_disposed(const std::filesystem::path& path, bool preserved);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace proc_sandbox
