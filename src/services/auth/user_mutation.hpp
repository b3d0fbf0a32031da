#pragma once

/// @file user_mutation.hpp
/// @brief Optimistic read-modify-write of a UserRecord.

#include "cgauth/foundation/auth_result.hpp"
#include "cgauth/service/user_repository.hpp"

#include <string>

namespace cgauth::service::detail {

/// Re-read the user, apply @p mutate to a copy and write it back with
/// compareAndUpdate, retrying on version conflicts.
///
/// @p mutate has the signature AuthResult<void>(UserRecord&) and is
/// re-evaluated against the fresh record on every attempt; returning an
/// error aborts without writing.
template <typename Mutator>
foundation::AuthResult<UserRecord> mutateUser(IUserRepository& users, UserId id,
                                              int maxAttempts, Timestamp now,
                                              Mutator&& mutate) {
    using foundation::AuthError;
    using foundation::AuthResult;
    using foundation::ErrorCode;

    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        auto current = users.findById(id);
        if (!current || current->isDeleted()) {
            return AuthResult<UserRecord>::err(
                AuthError(ErrorCode::NotFound, "user not found"));
        }

        UserRecord next = *current;
        auto applied = mutate(next);
        if (applied.hasError()) {
            return AuthResult<UserRecord>::err(applied.error());
        }
        next.updatedAt = now;

        if (users.compareAndUpdate(next, current->version)) {
            next.version = current->version + 1;
            return AuthResult<UserRecord>::ok(std::move(next));
        }
    }
    return AuthResult<UserRecord>::err(AuthError(
        ErrorCode::StoreConflict,
        "concurrent update of user " + std::to_string(id.value())));
}

}  // namespace cgauth::service::detail
