#pragma once

/// @file auth_error.hpp
/// @brief Error type used with Result<T, AuthError>.

#include <string>
#include <string_view>
#include <utility>

#include "cgauth/foundation/error_code.hpp"

namespace cgauth::foundation {

/// Error carrying a categorized code, a caller-safe message and, for
/// internal faults, the correlation id under which the detail was logged.
class AuthError {
public:
    AuthError() = default;

    explicit AuthError(ErrorCode code)
        : code_(code) {}

    AuthError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    AuthError(ErrorCode code, std::string message, std::string correlationId)
        : code_(code),
          message_(std::move(message)),
          correlationId_(std::move(correlationId)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Message safe to return to the client. Never carries secrets.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// snake_case kind such as "invalid_credentials".
    [[nodiscard]] std::string_view kind() const noexcept {
        return errorKind(code_);
    }

    /// Correlation id of the logged fault (empty for domain errors).
    [[nodiscard]] std::string_view correlationId() const noexcept {
        return correlationId_;
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::string correlationId_;
};

} // namespace cgauth::foundation
