/**
 * @file result.hpp
 * @brief Error handling with Result<T, E> type
 *
 * Validation and job errors travel as values. Every fallible timeline,
 * history, caption and export operation returns a Result instead of
 * throwing.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "types.hpp"

namespace spl {

// ============================================================================
// Error Type
// ============================================================================

/// Error class holding an error code and optional message
class Error {
public:
    Error() : m_code(ErrorCode::Unknown) {}

    explicit Error(ErrorCode code) : m_code(code) {}

    Error(ErrorCode code, std::string message)
        : m_code(code), m_message(std::move(message)) {}

    ErrorCode code() const { return m_code; }
    const std::string& message() const { return m_message; }

    /// Taxonomy bucket this error belongs to
    ErrorCategory category() const { return errorCategory(m_code); }

    const char* what() const {
        if (!m_message.empty()) {
            return m_message.c_str();
        }
        return errorCodeToString(m_code);
    }

    /// Same code, message prefixed with the given context
    Error withContext(const std::string& context) const {
        return Error(m_code, context + ": " + what());
    }

    explicit operator bool() const { return m_code != ErrorCode::Ok; }

    bool operator==(const Error& other) const {
        return m_code == other.m_code && m_message == other.m_message;
    }

private:
    ErrorCode m_code;
    std::string m_message;
};

// ============================================================================
// Result<T, E> Template
// ============================================================================

/**
 * @brief Holds either a success value (T) or an error (E)
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_data(std::move(value)) {}
    Result(E error) : m_data(std::move(error)) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool isError() const { return std::holds_alternative<E>(m_data); }
    explicit operator bool() const { return ok(); }

    /// Get value reference (throws if error)
    T& value() & {
        if (!ok()) {
            throw std::runtime_error(std::get<E>(m_data).what());
        }
        return std::get<T>(m_data);
    }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(std::get<E>(m_data).what());
        }
        return std::get<T>(m_data);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error(std::get<E>(m_data).what());
        }
        return std::get<T>(std::move(m_data));
    }

    T valueOr(T defaultValue) const& {
        if (ok()) {
            return std::get<T>(m_data);
        }
        return defaultValue;
    }

    const T* valuePtr() const {
        if (ok()) {
            return &std::get<T>(m_data);
        }
        return nullptr;
    }

    /// Get error reference (throws if success)
    const E& error() const& {
        if (ok()) {
            throw std::logic_error("Result::error() called on success value");
        }
        return std::get<E>(m_data);
    }

    /// Map success value to new type
    template<typename F>
    auto map(F&& f) const -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (ok()) {
            return Result<U, E>(std::forward<F>(f)(std::get<T>(m_data)));
        }
        return Result<U, E>(std::get<E>(m_data));
    }

    /// Flat map (for chaining Result-returning functions)
    template<typename F>
    auto andThen(F&& f) const -> std::invoke_result_t<F, const T&> {
        using ResultType = std::invoke_result_t<F, const T&>;
        if (ok()) {
            return std::forward<F>(f)(std::get<T>(m_data));
        }
        return ResultType(std::get<E>(m_data));
    }

private:
    std::variant<T, E> m_data;
};

// ============================================================================
// Result<void, E> Specialization
// ============================================================================

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_error(std::nullopt) {}
    Result(E error) : m_error(std::move(error)) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    [[nodiscard]] bool ok() const { return !m_error.has_value(); }
    [[nodiscard]] bool isError() const { return m_error.has_value(); }
    explicit operator bool() const { return ok(); }

    const E& error() const& {
        if (!m_error.has_value()) {
            throw std::logic_error("Result::error() called on success");
        }
        return *m_error;
    }

private:
    std::optional<E> m_error;
};

// ============================================================================
// Helper Factory Functions
// ============================================================================

template<typename T>
inline Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
inline Result<T> Err(ErrorCode code) {
    return Result<T>(Error(code));
}

template<typename T = void>
inline Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error(code, std::move(message)));
}

template<typename T = void>
inline Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

} // namespace spl
