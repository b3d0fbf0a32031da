#pragma once

/// @file session_store.hpp
/// @brief Session persistence interface and in-memory implementation.
///
/// Rows are never deleted; revocation only sets revokedAt.

#include "cgauth/service/auth_types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cgauth::service {

class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    /// Persist a new session and return it with its assigned id.
    virtual SessionRecord insert(SessionRecord record) = 0;

    [[nodiscard]] virtual std::optional<SessionRecord> findByTokenHash(
        std::string_view tokenHash) const = 0;

    [[nodiscard]] virtual std::optional<SessionRecord> findById(SessionId id) const = 0;

    /// Set lastActiveAt. Returns false for unknown sessions.
    virtual bool touch(SessionId id, Timestamp at) = 0;

    /// Set revokedAt unless already set. Returns false for unknown sessions.
    virtual bool revoke(SessionId id, Timestamp at) = 0;

    /// Revoke every unrevoked session of @p userId; returns how many changed.
    virtual std::size_t revokeAllForUser(UserId userId, Timestamp at) = 0;

    /// Every session of @p userId, revoked or not.
    [[nodiscard]] virtual std::vector<SessionRecord> listForUser(UserId userId) const = 0;
};

/// Thread-safe in-memory session store.
class InMemorySessionStore : public ISessionStore {
public:
    SessionRecord insert(SessionRecord record) override;

    [[nodiscard]] std::optional<SessionRecord> findByTokenHash(
        std::string_view tokenHash) const override;

    [[nodiscard]] std::optional<SessionRecord> findById(SessionId id) const override;

    bool touch(SessionId id, Timestamp at) override;

    bool revoke(SessionId id, Timestamp at) override;

    std::size_t revokeAllForUser(UserId userId, Timestamp at) override;

    [[nodiscard]] std::vector<SessionRecord> listForUser(UserId userId) const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<SessionId, SessionRecord> sessions_;
    std::unordered_map<std::string, SessionId> byTokenHash_;
    uint64_t nextId_ = 1;
};

}  // namespace cgauth::service
