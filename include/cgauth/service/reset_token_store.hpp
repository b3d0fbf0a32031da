#pragma once

/// @file reset_token_store.hpp
/// @brief Storage of hashed password-reset tokens.

#include "cgauth/service/auth_types.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace cgauth::service {

class IResetTokenStore {
public:
    virtual ~IResetTokenStore() = default;

    virtual void put(const PasswordResetRecord& record) = 0;

    /// Atomically remove and return the record for @p tokenHash.
    virtual std::optional<PasswordResetRecord> take(std::string_view tokenHash) = 0;

    /// Drop every outstanding token of @p userId; returns how many.
    virtual std::size_t removeForUser(UserId userId) = 0;

    /// Drop records whose expiry is at or before @p now; returns how many.
    virtual std::size_t purgeExpired(Timestamp now) = 0;
};

/// Thread-safe in-memory reset token store.
class InMemoryResetTokenStore : public IResetTokenStore {
public:
    void put(const PasswordResetRecord& record) override;

    std::optional<PasswordResetRecord> take(std::string_view tokenHash) override;

    std::size_t removeForUser(UserId userId) override;

    std::size_t purgeExpired(Timestamp now) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PasswordResetRecord> records_;
};

}  // namespace cgauth::service
