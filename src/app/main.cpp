/**
 * @file main.cpp
 * @brief proc_sandbox command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Runs one process in a sandbox against an in-memory store:
 *   Config → Logger → MemoryStore → LocalCommandRunner → print result
 *
 * The child's stdout/stderr are replayed on our own streams; the summary
 * goes to stderr. The exit status mirrors the child's (128+N for signal N).
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/command_runner.hpp"
#include "store/memory_store.hpp"
#include "store/store.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace proc_sandbox;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

constexpr int kUsageExitCode = 2;
constexpr int kFailureExitCode = 1;
constexpr int kNotFoundExitCode = 127;

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> sandbox_root;
    bool keep_sandbox = false;
    std::optional<std::chrono::milliseconds> timeout;
    std::vector<std::string> output_files;
    std::vector<std::string> output_dirs;
    std::map<std::string, std::string> env;
    std::optional<std::string> cwd;
    std::string description;
    std::vector<std::string> command;
};

void print_usage() {
    std::cout << "Usage: proc_sandbox [OPTIONS] -- <program> [args...]\n"
              << "  --config <path>       Configuration file (TOML)\n"
              << "  --sandbox-root <dir>  Base directory for sandboxes\n"
              << "  --keep-sandbox        Preserve the sandbox and write __run.sh\n"
              << "  --timeout-ms <n>      Kill the process group after n milliseconds\n"
              << "  --output-file <path>  Capture a file (repeatable)\n"
              << "  --output-dir <path>   Capture a directory (repeatable)\n"
              << "  --env <K=V>           Set an environment variable (repeatable)\n"
              << "  --cwd <path>          Working directory relative to the sandbox\n"
              << "  --description <text>  Human-readable description\n"
              << "  --help, -h            Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--") {
            ++i;
            break;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else if (arg == "--keep-sandbox") {
            args.keep_sandbox = true;
        } else if (!has_value) {
            return Error{ErrorKind::InvalidRequest, "Missing value for " + arg};
        } else if (arg == "--config") {
            args.config_path = argv[++i];
        } else if (arg == "--sandbox-root") {
            args.sandbox_root = argv[++i];
        } else if (arg == "--timeout-ms") {
            std::string value = argv[++i];
            try {
                args.timeout = std::chrono::milliseconds{std::stoll(value)};
            } catch (const std::exception&) {
                return Error{ErrorKind::InvalidRequest, "Invalid --timeout-ms value: " + value};
            }
        } else if (arg == "--output-file") {
            args.output_files.emplace_back(argv[++i]);
        } else if (arg == "--output-dir") {
            args.output_dirs.emplace_back(argv[++i]);
        } else if (arg == "--env") {
            std::string pair = argv[++i];
            auto eq = pair.find('=');
            if (eq == std::string::npos) {
                return Error{ErrorKind::InvalidRequest, "Expected K=V for --env, got: " + pair};
            }
            args.env[pair.substr(0, eq)] = pair.substr(eq + 1);
        } else if (arg == "--cwd") {
            args.cwd = argv[++i];
        } else if (arg == "--description") {
            args.description = argv[++i];
        } else {
            return Error{ErrorKind::InvalidRequest, "Unknown option: " + arg};
        }
    }

    for (; i < argc; ++i) args.command.emplace_back(argv[i]);
    if (args.command.empty()) {
        return Error{ErrorKind::InvalidRequest, "No command given after --"};
    }
    return args;
}

std::unique_ptr<ILogSink> make_sink(const std::filesystem::path& log_dir, const std::string& prefix) {
    if (log_dir.empty()) return std::make_unique<StdoutSink>();
    return std::make_unique<JsonFileSink>(log_dir, prefix);
}

void print_outputs(IDigestStore& store, const Digest& root) {
    auto entries = list_files(store, root);
    if (!entries) {
        std::cerr << "  (could not list outputs: " << entries.error().message << ")\n";
        return;
    }
    for (const auto& entry : *entries) {
        std::cerr << "  " << entry.path << (entry.is_executable ? " [x]" : "")
                  << "  " << entry.digest.to_string() << "\n";
    }
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << "proc_sandbox: " << args.error().message << "\n";
        print_usage();
        return kUsageExitCode;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Load Configuration ───────────────────
    Config config = default_config();
    if (args->config_path) {
        auto loaded = load_config(*args->config_path);
        if (!loaded) {
            std::cerr << "proc_sandbox: " << loaded.error().message << "\n";
            return kFailureExitCode;
        }
        config = std::move(*loaded);
    }
    if (args->sandbox_root) config.sandbox.root = *args->sandbox_root;
    if (args->keep_sandbox) config.sandbox.cleanup = false;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "proc_sandbox: " << level.error().message << "\n";
        return kFailureExitCode;
    }

    auto options = RunnerOptions::from_config(config);
    if (!options) {
        std::cerr << "proc_sandbox: " << options.error().message << "\n";
        return kFailureExitCode;
    }

    // ── Initialize Logger & Telemetry ────────
    Logger logger(make_sink(config.telemetry.log_dir, "proc_sandbox"), *level);
    std::unique_ptr<ILogSink> metrics_sink;
    if (config.telemetry.log_dir.empty()) {
        metrics_sink = std::make_unique<NullSink>();
    } else {
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "metrics");
    }
    MetricsCollector metrics(std::move(metrics_sink));

    // ── Build Request ────────────────────────
    ProcessRequest request;
    request.argv = args->command;
    request.env = args->env;
    request.output_files.insert(args->output_files.begin(), args->output_files.end());
    request.output_directories.insert(args->output_dirs.begin(), args->output_dirs.end());
    request.working_directory = args->cwd;
    request.timeout = args->timeout;
    request.description = args->description.empty() ? args->command.front() : args->description;

    MemoryStore store;
    LocalCommandRunner<> runner(store, std::move(*options), logger);

    // Signal handlers only set a flag; this thread turns it into cancellation.
    std::stop_source cancel;
    std::jthread watcher([&cancel](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_shutdown_requested) {
                cancel.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    ExecutionContext ctx{
        .stop = cancel.get_token(),
        .build_id = "cli",
        .metrics = &metrics,
    };
    auto result = runner.execute(request, ctx);
    watcher.request_stop();
    metrics.flush();
    logger.flush();

    if (!result) {
        std::cerr << "proc_sandbox: " << result.error().message << "\n";
        return result.error().kind == ErrorKind::ExecutableNotFound ? kNotFoundExitCode
                                                                   : kFailureExitCode;
    }

    // ── Print Result ─────────────────────────
    auto out = store.load_bytes(result->stdout_digest);
    auto err = store.load_bytes(result->stderr_digest);
    if (out) std::cout << *out;
    if (err) std::cerr << *err;
    std::cout.flush();

    std::cerr << "exit_code: " << result->exit_code << "\n"
              << "platform:  " << to_string(result->platform) << "\n"
              << "stdout:    " << result->stdout_digest.to_string() << "\n"
              << "stderr:    " << result->stderr_digest.to_string() << "\n"
              << "outputs:   " << result->output_directory.to_string() << "\n";
    print_outputs(store, result->output_directory);

    if (result->exit_code < 0) return 128 + (-result->exit_code);
    return result->exit_code;
}
