/**
 * @file command_runner.hpp
 * @brief LocalCommandRunner: one sandboxed process execution, end to end.
 * @author Dimitris Kafetzis
 *
 * Ties the pieces of an execution together:
 *   1. Normalize the request and create a sandbox under a SandboxGuard
 *   2. Materialize inputs, pre-create output parents, mount caches
 *   3. Spawn the process and race its completion against the timeout
 *   4. Persist stdout/stderr and the captured output tree
 *   5. Dispose of the sandbox (delete, or preserve with `__run.sh`)
 *
 * Template-parameterized on SupervisorT so the OS process layer is chosen at
 * compile time (PosixSupervisor in production, a fake in tests).
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/platform.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/blocking_pool.hpp"
#include "executor/process_supervisor.hpp"
#include "sandbox/disposition.hpp"
#include "sandbox/named_caches.hpp"
#include "sandbox/output_capture.hpp"
#include "sandbox/sandbox_builder.hpp"
#include "store/store.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <filesystem>
#include <future>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <type_traits>

namespace proc_sandbox {

/**
 * @brief Runner settings, usually derived from a Config.
 */
struct RunnerOptions {
    std::filesystem::path sandbox_root = "/tmp/proc_sandbox";
    std::filesystem::path named_caches_root = "/tmp/proc_sandbox_caches";
    bool cleanup = true;
    std::optional<Platform> platform_override;
    uint32_t thread_count = 0;
    std::chrono::milliseconds kill_grace{2000};

    /// Fails with InvalidRequest when `platform.override` is not a known platform.
    static Result<RunnerOptions> from_config(const Config& config);
};

/**
 * @brief Per-call context supplied by the layer above.
 */
struct ExecutionContext {
    std::stop_token stop;                   ///< Cancels the execution when fired
    BuildId build_id;
    MetricsCollector* metrics = nullptr;    ///< Optional event sink
};

/**
 * @brief Validate a request and bring every relative path to canonical form.
 *
 * Rejects an empty argv, escaping or empty output paths, a non-positive
 * timeout, environment names that are not shell identifiers, and bad cache
 * names/destinations.
 */
Result<ProcessRequest> normalize_request(ProcessRequest request);

/// Synthesized stdout for a process killed by its timeout.
std::string timeout_message(std::chrono::milliseconds timeout, std::string_view description);

/// Absolute working directory of a normalized request inside @p sandbox_root.
std::filesystem::path working_directory(const std::filesystem::path& sandbox_root,
                                        const ProcessRequest& request);

/// Exit code reported for a process that was terminated by its timeout.
inline constexpr int kTimeoutExitCode = -15;

// ─────────────────────────────────────────────
// LocalCommandRunner
// ─────────────────────────────────────────────

template <ProcessSupervisorLike SupervisorT = PosixSupervisor>
class LocalCommandRunner {
public:
    LocalCommandRunner(IDigestStore& store, RunnerOptions options, Logger& logger);

    // Non-copyable, non-movable
    LocalCommandRunner(const LocalCommandRunner&) = delete;
    LocalCommandRunner& operator=(const LocalCommandRunner&) = delete;

    /**
     * @brief Run one process in a fresh sandbox.
     *
     * A timeout is not an error: it yields exit code -15 and a synthesized
     * stdout. Every other failure (bad request, setup, launch, persistence,
     * cancellation) is returned as an Error after the sandbox is disposed.
     */
    Result<ProcessResult> execute(const ProcessRequest& request,
                                  const ExecutionContext& ctx = {});

    // ── Accessors (for testing) ─────────────
    SupervisorT& supervisor() { return supervisor_; }
    const RunnerOptions& options() const { return options_; }
    BlockingPool& pool() { return pool_; }

private:
    static SupervisorT make_supervisor(const RunnerOptions& options);

    Result<Platform> resolve_platform() const;
    Result<ProcessResult> run_in_sandbox(const ProcessRequest& request,
                                         const std::filesystem::path& root,
                                         Platform platform,
                                         const ExecutionContext& ctx);
    Result<ProcessOutcome> supervise(const ProcessRequest& request,
                                     const std::filesystem::path& cwd,
                                     const ExecutionContext& ctx);

    IDigestStore& store_;
    RunnerOptions options_;
    Logger& logger_;
    SupervisorT supervisor_;
    NamedCaches caches_;
    SandboxBuilder builder_;
    BlockingPool pool_;
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <ProcessSupervisorLike SupervisorT>
LocalCommandRunner<SupervisorT>::LocalCommandRunner(IDigestStore& store,
                                                    RunnerOptions options,
                                                    Logger& logger)
    : store_(store)
    , options_(std::move(options))
    , logger_(logger)
    , supervisor_(make_supervisor(options_))
    , caches_(options_.named_caches_root)
    , builder_(store_, caches_, options_.sandbox_root)
    , pool_(options_.thread_count) {
}

template <ProcessSupervisorLike SupervisorT>
SupervisorT LocalCommandRunner<SupervisorT>::make_supervisor(const RunnerOptions& options) {
    if constexpr (std::is_constructible_v<SupervisorT, std::chrono::milliseconds>) {
        return SupervisorT{options.kill_grace};
    } else {
        return SupervisorT{};
    }
}

template <ProcessSupervisorLike SupervisorT>
Result<Platform> LocalCommandRunner<SupervisorT>::resolve_platform() const {
    if (options_.platform_override) return *options_.platform_override;
    return current_platform();
}

template <ProcessSupervisorLike SupervisorT>
Result<ProcessResult> LocalCommandRunner<SupervisorT>::execute(const ProcessRequest& request,
                                                               const ExecutionContext& ctx) {
    auto normalized = normalize_request(request);
    if (!normalized) {
        logger_.warn("Rejected request [" + ctx.build_id + "]: " + normalized.error().message);
        return normalized.error();
    }
    if (ctx.stop.stop_requested()) {
        return Error{ErrorKind::Cancelled, "Execution cancelled before start: " + request.description};
    }

    auto platform = resolve_platform();
    if (!platform) return platform.error();

    auto root = builder_.create_directory();
    if (!root) {
        logger_.warn("Sandbox creation failed [" + ctx.build_id + "]: " + root.error().message);
        return root.error();
    }
    logger_.debug("Created sandbox " + root->string());

    SandboxGuard guard(*root, options_.cleanup, logger_);
    guard.attach_request(*normalized, working_directory(*root, *normalized));

    auto result = run_in_sandbox(*normalized, *root, *platform, ctx);

    auto disposed = guard.finalize();
    if (!disposed) {
        logger_.warn("Sandbox disposal failed: " + disposed.error().message);
    } else if (ctx.metrics != nullptr) {
        ctx.metrics->record_sandbox_disposed(*root, !options_.cleanup);
    }

    if (!result) {
        logger_.warn("Execution failed [" + ctx.build_id + "] " + std::string{to_string(result.error().kind)}
                     + ": " + result.error().message);
    }
    return result;
}

template <ProcessSupervisorLike SupervisorT>
Result<ProcessResult> LocalCommandRunner<SupervisorT>::run_in_sandbox(
    const ProcessRequest& request,
    const std::filesystem::path& root,
    Platform platform,
    const ExecutionContext& ctx) {

    auto prepared = builder_.prepare(root, request);
    if (!prepared) return prepared.error();

    auto outcome = supervise(request, working_directory(root, request), ctx);
    if (!outcome) return outcome.error();

    auto stdout_digest = store_.save_bytes(outcome->stdout_bytes);
    if (!stdout_digest) {
        return stdout_digest.error().with_kind(ErrorKind::StorePersistError, "Failed to store stdout");
    }
    auto stderr_digest = store_.save_bytes(outcome->stderr_bytes);
    if (!stderr_digest) {
        return stderr_digest.error().with_kind(ErrorKind::StorePersistError, "Failed to store stderr");
    }

    OutputCapturer capturer(store_);
    auto output = capturer.capture(root, request.output_files, request.output_directories);
    if (!output) return output.error();

    return ProcessResult{
        .exit_code = outcome->exit_code,
        .stdout_digest = std::move(*stdout_digest),
        .stderr_digest = std::move(*stderr_digest),
        .output_directory = std::move(*output),
        .platform = platform,
    };
}

template <ProcessSupervisorLike SupervisorT>
Result<ProcessOutcome> LocalCommandRunner<SupervisorT>::supervise(
    const ProcessRequest& request,
    const std::filesystem::path& cwd,
    const ExecutionContext& ctx) {

    SpawnRequest spawn_request{
        .argv = request.argv,
        .env = request.env,
        .cwd = cwd,
    };

    if (ctx.metrics != nullptr) {
        ctx.metrics->record_process_started(ctx.build_id, request.description, request.argv.front());
    }
    logger_.debug("Spawning '" + request.argv.front() + "' in " + cwd.string());

    auto start = std::chrono::steady_clock::now();
    auto handle = supervisor_.spawn(spawn_request);
    if (!handle) return handle.error();
    auto& process = **handle;

    std::stop_source wait_stop;
    std::stop_callback link(ctx.stop, [&wait_stop] { wait_stop.request_stop(); });

    auto future = pool_.submit([this, &process, token = wait_stop.get_token()] {
        return supervisor_.wait(process, token);
    });

    bool timed_out = false;
    if (request.timeout &&
        future.wait_for(*request.timeout) == std::future_status::timeout) {
        // The process may finish between the deadline and the signal; only
        // a group that actually received SIGTERM counts as timed out.
        timed_out = supervisor_.terminate_group(process);
        wait_stop.request_stop();
    }

    ProcessOutcome outcome = future.get();
    auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);

    if (timed_out) {
        logger_.warn("Timed out after " + std::to_string(request.timeout->count()) + "ms: "
                     + request.description);
        outcome.exit_code = kTimeoutExitCode;
        outcome.stdout_bytes = timeout_message(*request.timeout, request.description);
    }

    if (ctx.metrics != nullptr) {
        ctx.metrics->record_process_finished(ctx.build_id, outcome.exit_code, timed_out, elapsed);
    }

    if (!timed_out && ctx.stop.stop_requested()) {
        return Error{ErrorKind::Cancelled, "Execution cancelled: " + request.description};
    }
    return outcome;
}

}  // namespace proc_sandbox
