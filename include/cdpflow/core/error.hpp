#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace cdpflow {

enum class ErrorCode {
    Unknown = 1,
    Cancelled,
    DeadlineExceeded,
    InvalidConfig,
    InvalidArgument,
    ActionFailed,
    UnexpectedOutcome,
    ConnectionFailed,
    ConnectionClosed,
    ProtocolError,
    SerializationError,
    BrowserError,
    NavigationError,
    IoError,
    InternalError,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

    /// True for errors that mean "the enclosing scope ended".
    [[nodiscard]] auto is_cancellation() const noexcept -> bool {
        return code_ == ErrorCode::Cancelled || code_ == ErrorCode::DeadlineExceeded;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Convert ErrorCode to its upper snake case name.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::Cancelled: return "CANCELLED";
        case ErrorCode::DeadlineExceeded: return "DEADLINE_EXCEEDED";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::ActionFailed: return "ACTION_FAILED";
        case ErrorCode::UnexpectedOutcome: return "UNEXPECTED_OUTCOME";
        case ErrorCode::ConnectionFailed: return "CONNECTION_FAILED";
        case ErrorCode::ConnectionClosed: return "CONNECTION_CLOSED";
        case ErrorCode::ProtocolError: return "PROTOCOL_ERROR";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::BrowserError: return "BROWSER_ERROR";
        case ErrorCode::NavigationError: return "NAVIGATION_ERROR";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

// GCC 14 ICE workaround for co_return std::unexpected(...) in coroutines.
// The wrapper defers the std::unexpected -> std::expected conversion to a
// user-defined conversion operator outside the coroutine frame.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=112341
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

/// Use co_return make_fail(err) instead of co_return std::unexpected(err).
inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }

/// Use co_return ok_result() instead of co_return Result<void>{}.
inline auto ok_result() -> Result<void> { return {}; }

} // namespace cdpflow
