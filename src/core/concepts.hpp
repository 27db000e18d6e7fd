/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for ProcSandbox interfaces.
 * @author Dimitris Kafetzis
 *
 * Defines compile-time interface constraints for the OS-specific process
 * layer. The command runner is a template over a supervisor type, so a
 * platform variant is chosen at compile time with no virtual dispatch.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <memory>
#include <stop_token>

namespace proc_sandbox {

// Forward declarations
struct SpawnRequest;
struct ProcessOutcome;

// ─────────────────────────────────────────────
// ProcessSupervisorLike
// ─────────────────────────────────────────────

/**
 * @concept ProcessSupervisorLike
 * @brief Constrains types that can spawn, await and group-kill a process.
 *
 * - spawn() starts the child as the leader of a new process group.
 * - wait() blocks until the child is reaped and its pipes are drained. It
 *   must terminate the group itself when its stop token fires.
 * - terminate_group() signals the whole group and returns true only for
 *   the call that actually sent the signal.
 */
template <typename T>
concept ProcessSupervisorLike = requires(
    T supervisor,
    const SpawnRequest& request,
    typename T::Handle& handle,
    std::stop_token stop
) {
    { supervisor.spawn(request) } -> std::same_as<Result<std::unique_ptr<typename T::Handle>>>;
    { supervisor.wait(handle, stop) } -> std::same_as<ProcessOutcome>;
    { supervisor.terminate_group(handle) } -> std::same_as<bool>;
};

}  // namespace proc_sandbox
