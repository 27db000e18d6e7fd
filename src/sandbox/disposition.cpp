/**
 * @file disposition.cpp
 * @brief SandboxGuard and reproduction script rendering.
 * @author Dimitris Kafetzis
 */

#include "sandbox/disposition.hpp"

#include "sandbox/sandbox_builder.hpp"

#include <sstream>
#include <system_error>

namespace proc_sandbox {

namespace fs = std::filesystem;

namespace {

bool is_shell_safe(char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
        case '_': case '@': case '%': case '+': case '=':
        case ':': case ',': case '.': case '/': case '-':
            return true;
        default:
            return false;
    }
}

}  // anonymous namespace

std::string shell_escape(std::string_view word) {
    if (word.empty()) return "''";

    bool safe = true;
    for (char c : word) {
        if (!is_shell_safe(c)) {
            safe = false;
            break;
        }
    }
    if (safe) return std::string(word);

    std::string out;
    out.reserve(word.size() + 2);
    out += '\'';
    for (char c : word) {
        if (c == '\'') {
            // Close the quote, emit an escaped quote, reopen.
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

std::string render_run_script(const ProcessRequest& request, const fs::path& workdir) {
    std::ostringstream oss;
    oss << "#!/bin/bash\n"
        << "# Re-runs the process that executed in this sandbox.\n";
    for (const auto& [name, value] : request.env) {
        oss << "export " << name << "=" << shell_escape(value) << "\n";
    }
    oss << "cd " << shell_escape(workdir.string()) << "\n";

    bool first = true;
    for (const auto& arg : request.argv) {
        if (!first) oss << ' ';
        oss << shell_escape(arg);
        first = false;
    }
    oss << "\n";
    return oss.str();
}

// ─────────────────────────────────────────────
// SandboxGuard
// ─────────────────────────────────────────────

SandboxGuard::SandboxGuard(fs::path root, bool cleanup, Logger& logger)
    : root_(std::move(root)), cleanup_(cleanup), logger_(logger) {}

SandboxGuard::~SandboxGuard() {
    if (finalized_) return;
    auto result = finalize();
    if (!result) {
        logger_.warn("Sandbox disposal failed: " + result.error().message);
    }
}

void SandboxGuard::attach_request(const ProcessRequest& request, fs::path workdir) {
    run_script_ = render_run_script(request, workdir);
}

Result<void> SandboxGuard::finalize() {
    if (finalized_) return {};
    finalized_ = true;
    return cleanup_ ? remove_tree() : preserve();
}

Result<void> SandboxGuard::remove_tree() {
    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) {
        return Error{ErrorKind::SandboxSetupError,
                     "Failed to remove sandbox " + root_.string() + ": " + ec.message()};
    }
    logger_.debug("Removed sandbox " + root_.string());
    return {};
}

Result<void> SandboxGuard::preserve() {
    if (run_script_) {
        auto written = write_file(root_ / kRunScriptName, *run_script_, true);
        if (!written) return written;
    }
    logger_.info("Preserved sandbox " + root_.string());
    return {};
}

}  // namespace proc_sandbox
