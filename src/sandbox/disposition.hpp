/**
 * @file disposition.hpp
 * @brief Sandbox disposal: delete, or preserve with a reproduction script.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace proc_sandbox {

/// Name of the reproduction script written into preserved sandboxes.
inline constexpr std::string_view kRunScriptName = "__run.sh";

/**
 * @brief Quote a string for literal use as one POSIX shell word.
 *
 * Strings made only of `[A-Za-z0-9_@%+=:,./-]` are returned unchanged;
 * everything else is single-quoted with `'` rendered as `'\''`.
 */
std::string shell_escape(std::string_view word);

/**
 * @brief Render the `__run.sh` contents for a request.
 *
 * Exports every declared variable, changes into @p workdir and runs the
 * escaped argv.
 */
std::string render_run_script(const ProcessRequest& request,
                              const std::filesystem::path& workdir);

/**
 * @brief Scoped owner of one sandbox directory.
 *
 * Every exit path of an execution calls finalize() explicitly; the
 * destructor only finalizes a guard that was never finalized. With cleanup
 * the directory is removed; without it the directory stays where it was
 * created and receives `__run.sh` if a request was attached.
 */
class SandboxGuard {
public:
    SandboxGuard(std::filesystem::path root, bool cleanup, Logger& logger);
    ~SandboxGuard();

    SandboxGuard(const SandboxGuard&) = delete;
    SandboxGuard& operator=(const SandboxGuard&) = delete;

    /// Attach the request whose command line the reproduction script replays.
    void attach_request(const ProcessRequest& request, std::filesystem::path workdir);

    /**
     * @brief Delete or preserve the sandbox. Idempotent; only the first call acts.
     */
    Result<void> finalize();

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] bool cleanup() const noexcept { return cleanup_; }
    [[nodiscard]] bool finalized() const noexcept { return finalized_; }

private:
    Result<void> remove_tree();
    Result<void> preserve();

    std::filesystem::path root_;
    bool cleanup_;
    Logger& logger_;
    bool finalized_{false};

    std::optional<std::string> run_script_;
};

}  // namespace proc_sandbox
