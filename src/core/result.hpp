/**
 * @file result.hpp
 * @brief Monadic error handling type for runexec.
 *
 * Result<T, E> is the only error channel of the engine API: configuration,
 * spawn, limiter and output errors come back as values, never as
 * exceptions. Error carries a category so callers can tell "the process
 * never ran" (Config, Spawn) from "the process ran but its output could not
 * be recorded" (Io, with the exit code preserved).
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

namespace runexec {

enum class ErrorCode : uint8_t {
    Config,     ///< Invalid or contradictory limits/configuration
    Spawn,      ///< Executable missing, permission denied, fork failure
    Io,         ///< Output file could not be written
    Limiter,    ///< Resource limiter could not be set up or queried
    Internal    ///< OS call failed unexpectedly
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Config:   return "config";
        case ErrorCode::Spawn:    return "spawn";
        case ErrorCode::Io:       return "io";
        case ErrorCode::Limiter:  return "limiter";
        case ErrorCode::Internal: return "internal";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a category, a message and optional run context.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Internal};
    std::optional<int> exit_code;   ///< Set when the child ran before the failure

    explicit Error(std::string msg, ErrorCode c = ErrorCode::Internal)
        : message(std::move(msg)), code(c) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    [[nodiscard]] Error with_exit_code(int status) && {
        exit_code = status;
        return std::move(*this);
    }
};

/**
 * @brief Result<T, E> — holds either a success value or an error.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

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

    [[nodiscard]] E&& error() && {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(std::move(storage_));
    }

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that can fail but return nothing.
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

    [[nodiscard]] E&& error() && {
        if (has_value_) throw std::runtime_error("Result has no error");
        return std::move(*error_);
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(std::string message, ErrorCode code = ErrorCode::Internal) {
    return Result<T, E>(E{std::move(message), code});
}

}  // namespace runexec
