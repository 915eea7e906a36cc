/**
 * @file result.hpp
 * @brief Monadic error handling type for the sandbox core.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Low-level
 * components (images, domains, SSH) return typed errors; the job orchestrator
 * is the single place that converts them into terminal job states.
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

namespace vm_sandbox {

// ─────────────────────────────────────────────
// Error taxonomy
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    ImageError,          ///< Disk creation/deletion contract violation
    SecurityError,       ///< Path escaped its allowed root
    VMDefineError,
    VMStartError,
    VMStopError,
    VMUndefineError,
    DomainNotFound,
    HypervisorError,     ///< Any other hypervisor-reported failure
    AgentUnavailable,    ///< Guest agent did not answer
    SSHConnectError,
    SSHAuthError,
    SSHTransferError,
    SSHChannelError,
    InvalidArgument,
    QueueRejected,
    ConfigError,
    Internal
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ImageError:       return "ImageError";
        case ErrorCode::SecurityError:    return "SecurityError";
        case ErrorCode::VMDefineError:    return "VMDefineError";
        case ErrorCode::VMStartError:     return "VMStartError";
        case ErrorCode::VMStopError:      return "VMStopError";
        case ErrorCode::VMUndefineError:  return "VMUndefineError";
        case ErrorCode::DomainNotFound:   return "DomainNotFound";
        case ErrorCode::HypervisorError:  return "HypervisorError";
        case ErrorCode::AgentUnavailable: return "AgentUnavailable";
        case ErrorCode::SSHConnectError:  return "SSHConnectError";
        case ErrorCode::SSHAuthError:     return "SSHAuthError";
        case ErrorCode::SSHTransferError: return "SSHTransferError";
        case ErrorCode::SSHChannelError:  return "SSHChannelError";
        case ErrorCode::InvalidArgument:  return "InvalidArgument";
        case ErrorCode::QueueRejected:    return "QueueRejected";
        case ErrorCode::ConfigError:      return "ConfigError";
        case ErrorCode::Internal:         return "Internal";
    }
    return "Unknown";
}

/**
 * @brief Error type carrying a category code and a descriptive message.
 */
struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// Image, domain and hypervisor failures.
    [[nodiscard]] bool is_vm_error() const noexcept {
        switch (code) {
            case ErrorCode::ImageError:
            case ErrorCode::SecurityError:
            case ErrorCode::VMDefineError:
            case ErrorCode::VMStartError:
            case ErrorCode::VMStopError:
            case ErrorCode::VMUndefineError:
            case ErrorCode::DomainNotFound:
            case ErrorCode::HypervisorError:
            case ErrorCode::AgentUnavailable:
                return true;
            default:
                return false;
        }
    }

    [[nodiscard]] bool is_ssh_error() const noexcept {
        return code == ErrorCode::SSHConnectError
            || code == ErrorCode::SSHAuthError
            || code == ErrorCode::SSHTransferError
            || code == ErrorCode::SSHChannelError;
    }
};

/**
 * @brief Result<T, E>: value or error.
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
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

}  // namespace vm_sandbox
