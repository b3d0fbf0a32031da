#pragma once

/// @file user_repository.hpp
/// @brief User persistence interface and in-memory implementation.

#include "cgauth/foundation/auth_result.hpp"
#include "cgauth/service/auth_types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace cgauth::service {

/// Abstract interface for user persistence.
///
/// Implementations must be thread-safe, enforce uniqueness of username,
/// email and wallet address atomically on create, and increment
/// UserRecord::version on every successful write.
class IUserRepository {
public:
    virtual ~IUserRepository() = default;

    [[nodiscard]] virtual std::optional<UserRecord> findById(UserId id) const = 0;

    [[nodiscard]] virtual std::optional<UserRecord> findByUsername(
        std::string_view username) const = 0;

    /// Exact match; callers pass the lowercase form.
    [[nodiscard]] virtual std::optional<UserRecord> findByEmail(
        std::string_view email) const = 0;

    /// Exact match; callers pass the lowercase form.
    [[nodiscard]] virtual std::optional<UserRecord> findByWalletAddress(
        std::string_view address) const = 0;

    /// Insert a new user and return the stored record with its id.
    /// UserAlreadyExists if the username, email or wallet address is taken.
    virtual foundation::AuthResult<UserRecord> create(UserRecord record) = 0;

    /// Write only if the stored version still equals @p expectedVersion.
    /// Returns false on a version conflict or unknown user.
    virtual bool compareAndUpdate(const UserRecord& record,
                                  uint64_t expectedVersion) = 0;
};

/// Thread-safe in-memory user repository.
class InMemoryUserRepository : public IUserRepository {
public:
    [[nodiscard]] std::optional<UserRecord> findById(UserId id) const override;

    [[nodiscard]] std::optional<UserRecord> findByUsername(
        std::string_view username) const override;

    [[nodiscard]] std::optional<UserRecord> findByEmail(
        std::string_view email) const override;

    [[nodiscard]] std::optional<UserRecord> findByWalletAddress(
        std::string_view address) const override;

    foundation::AuthResult<UserRecord> create(UserRecord record) override;

    bool compareAndUpdate(const UserRecord& record,
                          uint64_t expectedVersion) override;

    [[nodiscard]] std::size_t size() const;

private:
    template <typename Pred>
    std::optional<UserRecord> findIf(Pred pred) const;

    mutable std::mutex mutex_;
    std::unordered_map<UserId, UserRecord> users_;
    uint64_t nextId_ = 1;
};

}  // namespace cgauth::service
