/**
 * @file process_supervisor.cpp
 * @brief PosixSupervisor implementation (posix_spawn + poll + waitpid).
 * @author Dimitris Kafetzis
 */

#include "executor/process_supervisor.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace proc_sandbox {

namespace fs = std::filesystem;

namespace {

constexpr int kPollIntervalMs = 20;

int64_t steady_now_ns() {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    return std::max<int64_t>(ns, 1);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool is_executable_file(const fs::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

Error not_found(const std::string& name, std::string_view detail) {
    return Error{ErrorKind::ExecutableNotFound,
                 "Failed to execute: '" + name + "' " + std::string{detail}};
}

/// Read whatever is available on @p fd into @p out; closes the fd on EOF.
void drain_ready(int& fd, std::string& out) {
    std::array<char, 16384> buf{};
    while (true) {
        ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n > 0) {
            out.append(buf.data(), static_cast<size_t>(n));
            if (static_cast<size_t>(n) < buf.size()) return;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        close_fd(fd);
        return;
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// PosixProcessHandle
// ─────────────────────────────────────────────

PosixProcessHandle::PosixProcessHandle(pid_t pid, int stdout_fd, int stderr_fd)
    : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

PosixProcessHandle::~PosixProcessHandle() {
    if (!finished_.load()) {
        ::killpg(pid_, SIGKILL);
        while (::waitpid(pid_, nullptr, 0) < 0 && errno == EINTR) {}
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

// ─────────────────────────────────────────────
// PosixSupervisor
// ─────────────────────────────────────────────

PosixSupervisor::PosixSupervisor(std::chrono::milliseconds kill_grace)
    : kill_grace_(kill_grace) {}

std::string PosixSupervisor::default_search_path() {
    size_t len = ::confstr(_CS_PATH, nullptr, 0);
    if (len == 0) return "/bin:/usr/bin";
    std::string value(len, '\0');
    ::confstr(_CS_PATH, value.data(), len);
    value.resize(len - 1);  // drop the terminating NUL
    return value;
}

Result<fs::path> PosixSupervisor::resolve_executable(
    const std::string& name,
    const std::map<std::string, std::string>& env,
    const fs::path& cwd) {

    if (name.empty()) return not_found(name, "(empty program name)");

    if (name.find('/') != std::string::npos) {
        fs::path candidate{name};
        if (candidate.is_relative()) candidate = cwd / candidate;
        if (is_executable_file(candidate)) return candidate;
        return not_found(name, "(no executable file at " + candidate.string() + ")");
    }

    // Without a declared PATH, search the system default path as execvp
    // does. The child's environment is left as declared.
    auto it = env.find("PATH");
    std::string path_value = it != env.end() ? it->second : default_search_path();

    std::string_view search = path_value;
    while (true) {
        auto colon = search.find(':');
        std::string_view entry = search.substr(0, colon);
        if (!entry.empty()) {
            fs::path dir{std::string{entry}};
            if (dir.is_relative()) dir = cwd / dir;
            fs::path candidate = dir / name;
            if (is_executable_file(candidate)) return candidate;
        }
        if (colon == std::string_view::npos) break;
        search.remove_prefix(colon + 1);
    }
    return not_found(name, "(not found in PATH=" + path_value + ")");
}

Result<std::unique_ptr<PosixProcessHandle>> PosixSupervisor::spawn(
    const SpawnRequest& request) const {

    if (request.argv.empty()) {
        return Error{ErrorKind::InvalidRequest, "Cannot spawn an empty argv"};
    }

    auto exe = resolve_executable(request.argv.front(), request.env, request.cwd);
    if (!exe) return exe.error();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return Error{ErrorKind::SpawnFailed, std::string{"pipe2: "} + std::strerror(errno)};
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return Error{ErrorKind::SpawnFailed, std::string{"pipe2: "} + std::strerror(saved)};
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);
    posix_spawn_file_actions_addchdir_np(&actions, request.cwd.c_str());

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setpgroup(&attr, 0);

    // Children start with an empty signal mask and default dispositions,
    // whatever the host process installed.
    sigset_t no_signals;
    sigemptyset(&no_signals);
    posix_spawnattr_setsigmask(&attr, &no_signals);

    sigset_t default_signals;
    sigemptyset(&default_signals);
    for (int sig = 1; sig < SIGSYS; ++sig) {
        if (sig == SIGKILL || sig == SIGSTOP) continue;
        sigaddset(&default_signals, sig);
    }
    posix_spawnattr_setsigdefault(&attr, &default_signals);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK |
                                    POSIX_SPAWN_SETSIGDEF);

    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    env_storage.reserve(request.env.size());
    for (const auto& [key, value] : request.env) env_storage.push_back(key + "=" + value);
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& entry : env_storage) envp.push_back(entry.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    int rc = ::posix_spawn(&pid, exe->c_str(), &actions, &attr, argv.data(), envp.data());

    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    if (rc != 0) {
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        if (rc == ENOENT || rc == EACCES) {
            return not_found(request.argv.front(), std::string{"("} + std::strerror(rc) + ")");
        }
        return Error{ErrorKind::SpawnFailed,
                     "posix_spawn " + exe->string() + ": " + std::strerror(rc)};
    }

    ::fcntl(out_pipe[0], F_SETFL, ::fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, ::fcntl(err_pipe[0], F_GETFL) | O_NONBLOCK);

    return std::make_unique<PosixProcessHandle>(pid, out_pipe[0], err_pipe[0]);
}

ProcessOutcome PosixSupervisor::wait(PosixProcessHandle& handle, std::stop_token stop) const {
    ProcessOutcome outcome;
    bool killed = false;
    int status = 0;

    while (true) {
        if (stop.stop_requested()) {
            terminate_group(handle);
        }

        int64_t term_at = handle.term_sent_ns_.load();
        if (term_at != 0 && !killed) {
            auto elapsed = std::chrono::nanoseconds{steady_now_ns() - term_at};
            if (elapsed >= kill_grace_) {
                ::killpg(handle.pid_, SIGKILL);
                killed = true;
            }
        }

        if (handle.stdout_fd_ >= 0 || handle.stderr_fd_ >= 0) {
            std::array<pollfd, 2> fds{{
                {handle.stdout_fd_, POLLIN, 0},
                {handle.stderr_fd_, POLLIN, 0},
            }};
            int ready = ::poll(fds.data(), fds.size(), kPollIntervalMs);
            if (ready < 0 && errno != EINTR) {
                close_fd(handle.stdout_fd_);
                close_fd(handle.stderr_fd_);
                continue;
            }
            if (ready > 0) {
                if (fds[0].revents != 0) drain_ready(handle.stdout_fd_, outcome.stdout_bytes);
                if (fds[1].revents != 0) drain_ready(handle.stderr_fd_, outcome.stderr_bytes);
            }
            continue;
        }

        pid_t reaped = ::waitpid(handle.pid_, &status, WNOHANG);
        if (reaped == handle.pid_) break;
        if (reaped < 0 && errno != EINTR) {
            status = 0;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{kPollIntervalMs});
    }

    handle.finished_.store(true);

    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = -WTERMSIG(status);
    }
    outcome.group_terminated = handle.termination_sent();
    return outcome;
}

bool PosixSupervisor::terminate_group(PosixProcessHandle& handle) const {
    if (handle.finished_.load()) return false;

    int64_t expected = 0;
    if (!handle.term_sent_ns_.compare_exchange_strong(expected, steady_now_ns())) {
        return false;
    }
    ::killpg(handle.pid_, SIGTERM);
    return true;
}

}  // namespace proc_sandbox
