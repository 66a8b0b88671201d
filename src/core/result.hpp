/**
 * @file result.hpp
 * @brief Monadic error handling type for spawner.
 * @author Dimitris Kafetzis
 *
 * Result<T, E> is the primary error-handling mechanism. Operations against
 * the container runtime and the cluster API return it instead of throwing;
 * Error carries a coarse ErrorCode so that callers can absorb "not found"
 * outcomes without matching on message text.
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

namespace spawner {

enum class ErrorCode : uint8_t {
    Generic,
    Connection,     ///< Endpoint unreachable or connection dropped
    Timeout,
    Protocol,       ///< Malformed HTTP framing
    NotFound,       ///< Remote answered 404
    Conflict,       ///< Remote answered 409
    Api,            ///< Any other non-success status
    Parse           ///< Body could not be decoded
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Generic:    return "generic";
        case ErrorCode::Connection: return "connection";
        case ErrorCode::Timeout:    return "timeout";
        case ErrorCode::Protocol:   return "protocol";
        case ErrorCode::NotFound:   return "not_found";
        case ErrorCode::Conflict:   return "conflict";
        case ErrorCode::Api:        return "api";
        case ErrorCode::Parse:      return "parse";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a descriptive message.
 *
 * http_status is non-zero only when the error came from an HTTP response.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Generic};
    int http_status{0};

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg, int status = 0)
        : message(std::move(msg)), code(c), http_status(status) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    [[nodiscard]] bool is_not_found() const noexcept { return code == ErrorCode::NotFound; }
};

/**
 * @brief Result<T, E>: value or error.
 *
 * Holds either a success value of type T or an error of type E.
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
template <typename T>
Result<T> make_error(ErrorCode code, std::string message, int http_status = 0) {
    return Result<T>(Error{code, std::move(message), http_status});
}

/// Map an HTTP status to the ErrorCode used for non-success responses.
[[nodiscard]] constexpr ErrorCode error_code_for_status(int status) noexcept {
    switch (status) {
        case 404: return ErrorCode::NotFound;
        case 409: return ErrorCode::Conflict;
        default:  return ErrorCode::Api;
    }
}

}  // namespace spawner
