/**
 * @file result.hpp
 * @brief Monadic error handling type for ProcSandbox.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Every
 * fallible step of an execution (materialization, spawn, capture, store
 * persistence) reports failure as a value carrying an ErrorKind, so the
 * runner can dispose of the sandbox and surface a failed execution
 * instead of unwinding through the process supervisor.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace proc_sandbox {

// ─────────────────────────────────────────────
// Error Kinds
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    Generic,
    NotFound,                 ///< Store has no blob/tree for a digest
    CorruptTree,              ///< Stored tree failed to decode
    MaterializationError,     ///< Input tree could not be written to the sandbox
    SandboxSetupError,        ///< Directory/symlink creation failed
    InvalidCacheName,
    InvalidCacheDestination,
    InvalidRequest,
    ExecutableNotFound,
    SpawnFailed,
    StorePersistError,
    Cancelled,
    ConfigError
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Generic:                 return "error";
        case ErrorKind::NotFound:                return "not_found";
        case ErrorKind::CorruptTree:             return "corrupt_tree";
        case ErrorKind::MaterializationError:    return "materialization_error";
        case ErrorKind::SandboxSetupError:       return "sandbox_setup_error";
        case ErrorKind::InvalidCacheName:        return "invalid_cache_name";
        case ErrorKind::InvalidCacheDestination: return "invalid_cache_destination";
        case ErrorKind::InvalidRequest:          return "invalid_request";
        case ErrorKind::ExecutableNotFound:      return "executable_not_found";
        case ErrorKind::SpawnFailed:             return "spawn_failed";
        case ErrorKind::StorePersistError:       return "store_persist_error";
        case ErrorKind::Cancelled:               return "cancelled";
        case ErrorKind::ConfigError:             return "config_error";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a kind and a descriptive message.
 */
struct Error {
    ErrorKind kind{ErrorKind::Generic};
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// Re-tag an error from a lower layer, prefixing context to its message.
    [[nodiscard]] Error with_kind(ErrorKind k, std::string_view context) const {
        return Error{k, std::string{context} + ": " + message};
    }
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 *
 * @note When C++23 std::expected becomes widely available on target
 *       compilers, this can be replaced with a type alias.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 *
 * Used when an operation can fail but has no return value on success.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorKind kind, std::string message) {
    return Result<T, E>(E{kind, std::move(message)});
}

}  // namespace proc_sandbox
