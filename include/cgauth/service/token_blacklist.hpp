#pragma once

/// @file token_blacklist.hpp
/// @brief Denylist of consumed or revoked token ids with TTL cleanup.

#include "cgauth/foundation/types.hpp"

#include <chrono>
#include <cstddef>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace cgauth::service {

/// In-memory denylist keyed by JWT id (jti).
///
/// Entries live until the token would have expired anyway and are purged
/// on a timer piggybacked on revoke(), so memory stays bounded.
///
/// Example:
/// @code
///   TokenBlacklist blacklist(std::chrono::seconds{300});
///   blacklist.revoke(claims.jti, claims.expiresAt);
///   blacklist.isRevoked(claims.jti);  // true
/// @endcode
class TokenBlacklist {
public:
    explicit TokenBlacklist(std::chrono::seconds cleanupInterval,
                            foundation::Clock clock = foundation::systemClock());

    /// Add @p jti until @p expiresAt.
    /// @return false if it was already present.
    bool revoke(std::string_view jti, foundation::Timestamp expiresAt);

    [[nodiscard]] bool isRevoked(std::string_view jti) const;

    /// Remove entries whose expiry has passed. Returns number removed.
    std::size_t cleanup();

    [[nodiscard]] std::size_t size() const;

private:
    std::size_t purgeExpiredLocked(foundation::Timestamp now);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, foundation::Timestamp> entries_;
    std::chrono::seconds cleanupInterval_;
    foundation::Clock clock_;
    foundation::Timestamp lastCleanup_;
};

} // namespace cgauth::service
