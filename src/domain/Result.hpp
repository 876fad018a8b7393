/**
 * @file Result.hpp
 * @brief Explicit success/error values passed between pipeline components.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace vaultbreakdown::domain {

/**
 * @enum ErrorKind
 * @brief Failure taxonomy shared by every stage of the pipeline.
 */
enum class ErrorKind {
    Access,         ///< Item unreadable or unstatable.
    Parse,          ///< Malformed input that could not be degraded.
    Planning,       ///< Empty, missing or unparseable plan.
    ToolExecution,  ///< A capability call failed.
    Persistence,    ///< State could not be written.
    LimitReached,   ///< An iteration or turn cap was hit.
    Cancelled,      ///< The cancellation token was triggered.
    Transport,      ///< The model or tool host could not be reached.
    Config          ///< Missing or invalid configuration.
};

/**
 * @struct Error
 * @brief Error kind plus a human readable message.
 */
struct Error {
    ErrorKind kind;
    std::string message;

    static std::string KindToString(ErrorKind k) {
        switch (k) {
            case ErrorKind::Access: return "access";
            case ErrorKind::Parse: return "parse";
            case ErrorKind::Planning: return "planning";
            case ErrorKind::ToolExecution: return "tool-execution";
            case ErrorKind::Persistence: return "persistence";
            case ErrorKind::LimitReached: return "limit-reached";
            case ErrorKind::Cancelled: return "cancelled";
            case ErrorKind::Transport: return "transport";
            case ErrorKind::Config: return "config";
        }
        return "unknown";
    }

    std::string describe() const {
        return KindToString(kind) + ": " + message;
    }
};

/**
 * @class Result
 * @brief Holds either a value of type T or an Error.
 */
template <typename T>
class Result {
public:
    Result(T value) : m_data(std::move(value)) {}
    Result(Error error) : m_data(std::move(error)) {}

    static Result Fail(ErrorKind kind, std::string message) {
        return Result(Error{kind, std::move(message)});
    }

    bool ok() const { return std::holds_alternative<T>(m_data); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(m_data); }
    T& value() { return std::get<T>(m_data); }
    const T& operator*() const { return value(); }
    T& operator*() { return value(); }
    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

    const Error& error() const { return std::get<Error>(m_data); }

private:
    std::variant<T, Error> m_data;
};

/**
 * @class Status
 * @brief Result without a value.
 */
class Status {
public:
    Status() = default;
    Status(Error error) : m_error(std::move(error)) {}

    static Status Ok() { return Status(); }
    static Status Fail(ErrorKind kind, std::string message) {
        return Status(Error{kind, std::move(message)});
    }

    bool ok() const { return !m_error.has_value(); }
    explicit operator bool() const { return ok(); }
    const Error& error() const { return *m_error; }

private:
    std::optional<Error> m_error;
};

} // namespace vaultbreakdown::domain
