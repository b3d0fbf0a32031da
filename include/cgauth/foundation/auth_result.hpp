#pragma once

/// @file auth_result.hpp
/// @brief AuthResult<T> type alias used by every fallible operation.

#include "cgauth/core/result.hpp"
#include "cgauth/foundation/auth_error.hpp"

namespace cgauth::foundation {

/// Result type specialized with AuthError.
///
/// Example:
/// @code
///   AuthResult<UserId> resolve(std::string_view email) {
///       if (email.empty()) {
///           return AuthResult<UserId>::err(
///               AuthError(ErrorCode::InvalidArgument, "email is empty"));
///       }
///       ...
///   }
/// @endcode
template <typename T>
using AuthResult = cgauth::Result<T, AuthError>;

/// Shorthand for building an error result with a code and message.
template <typename T>
[[nodiscard]] AuthResult<T> fail(ErrorCode code, std::string message) {
    return AuthResult<T>::err(AuthError(code, std::move(message)));
}

}  // namespace cgauth::foundation
