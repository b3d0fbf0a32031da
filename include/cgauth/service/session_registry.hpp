#pragma once

/// @file session_registry.hpp
/// @brief Opaque server-side sessions with enumeration and bulk revocation.

#include "cgauth/foundation/auth_result.hpp"
#include "cgauth/service/auth_types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cgauth::service {

class ISessionStore;

/// Creates, resolves and revokes sessions on top of an ISessionStore.
///
/// The raw bearer token is 32 random bytes (base64url) returned once from
/// create(); only its SHA-256 hash is stored.
class SessionRegistry {
public:
    SessionRegistry(SessionConfig config,
                    std::shared_ptr<ISessionStore> store,
                    foundation::Clock clock = foundation::systemClock());

    [[nodiscard]] foundation::AuthResult<IssuedSession> create(UserId userId,
                                                               const SessionContext& context);

    /// Find the active session for @p rawToken and mark it as used now.
    [[nodiscard]] foundation::AuthResult<SessionRecord> resolve(std::string_view rawToken);

    /// Revoke by id. Revoking an already revoked session succeeds.
    [[nodiscard]] foundation::AuthResult<void> revoke(SessionId sessionId);

    /// Revoke by id on behalf of @p userId; other users' sessions are
    /// reported as SessionNotFound.
    [[nodiscard]] foundation::AuthResult<void> revokeForUser(UserId userId, SessionId sessionId);

    /// Revoke every active session of @p userId; returns how many.
    std::size_t revokeAll(UserId userId);

    /// Active sessions, most recently active first.
    [[nodiscard]] std::vector<SessionRecord> listActive(UserId userId) const;

    /// First X-Forwarded-For hop, else the socket address, else 127.0.0.1.
    [[nodiscard]] static std::string clientIp(const SessionContext& context);

private:
    SessionConfig config_;
    std::shared_ptr<ISessionStore> store_;
    foundation::Clock clock_;
};

}  // namespace cgauth::service
