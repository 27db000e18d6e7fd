/**
 * @file process_supervisor.hpp
 * @brief Spawn, supervise and group-kill native subprocesses.
 * @author Dimitris Kafetzis
 *
 * PosixSupervisor uses posix_spawn with POSIX_SPAWN_SETPGROUP so the child
 * leads its own process group, captures stdout/stderr through pipes, and
 * reaps it with waitpid. Satisfies ProcessSupervisorLike.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <sys/types.h>
#include <vector>

namespace proc_sandbox {

/**
 * @brief Everything the OS layer needs to start a child.
 */
struct SpawnRequest {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;     ///< Complete child environment
    std::filesystem::path cwd;                  ///< Absolute working directory
};

/**
 * @brief How a supervised child ended.
 */
struct ProcessOutcome {
    int exit_code{0};                   ///< -N when killed by signal N
    std::string stdout_bytes;
    std::string stderr_bytes;
    bool group_terminated{false};       ///< The supervisor signalled the group
};

// ─────────────────────────────────────────────
// PosixProcessHandle
// ─────────────────────────────────────────────

/**
 * @brief Live child process owned by one execution.
 *
 * Shared by reference between the thread blocked in wait() and the thread
 * racing it against a deadline; the cross-thread state is atomic. A handle
 * destroyed before wait() finished kills and reaps its process group.
 */
class PosixProcessHandle {
public:
    PosixProcessHandle(pid_t pid, int stdout_fd, int stderr_fd);
    ~PosixProcessHandle();

    PosixProcessHandle(const PosixProcessHandle&) = delete;
    PosixProcessHandle& operator=(const PosixProcessHandle&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] bool finished() const noexcept { return finished_.load(); }
    [[nodiscard]] bool termination_sent() const noexcept { return term_sent_ns_.load() != 0; }

private:
    friend class PosixSupervisor;

    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    std::atomic<bool> finished_{false};
    std::atomic<int64_t> term_sent_ns_{0};     ///< steady_clock time of SIGTERM, 0 = not sent
};

// ─────────────────────────────────────────────
// PosixSupervisor
// ─────────────────────────────────────────────

class PosixSupervisor {
public:
    using Handle = PosixProcessHandle;

    explicit PosixSupervisor(std::chrono::milliseconds kill_grace = std::chrono::milliseconds{2000});

    /**
     * @brief Resolve argv[0] and start the child.
     *
     * Fails with ExecutableNotFound (message starts "Failed to execute")
     * before forking when argv[0] cannot be resolved.
     */
    Result<std::unique_ptr<Handle>> spawn(const SpawnRequest& request) const;

    /**
     * @brief Drain both pipes, then reap the child.
     *
     * When @p stop fires the group receives SIGTERM (once); if pipes are
     * still open kill_grace later, it receives SIGKILL.
     */
    ProcessOutcome wait(Handle& handle, std::stop_token stop) const;

    /// SIGTERM the whole group. True only for the call that sent it.
    bool terminate_group(Handle& handle) const;

    /**
     * @brief Executable search as the child would see it.
     *
     * Names containing '/' are taken as-is (relative to @p cwd). Other names
     * are looked up in the PATH of @p env, or in default_search_path() when
     * @p env declares none. The host's own PATH is never consulted.
     */
    static Result<std::filesystem::path> resolve_executable(
        const std::string& name,
        const std::map<std::string, std::string>& env,
        const std::filesystem::path& cwd);

    /// The system default search path, `confstr(_CS_PATH)`.
    static std::string default_search_path();

private:
    std::chrono::milliseconds kill_grace_;
};

static_assert(ProcessSupervisorLike<PosixSupervisor>);

}  // namespace proc_sandbox
