/// @file user_repository.cpp
/// @brief InMemoryUserRepository implementation.

#include "cgauth/service/user_repository.hpp"

namespace cgauth::service {

using cgauth::foundation::AuthError;
using cgauth::foundation::AuthResult;
using cgauth::foundation::ErrorCode;

template <typename Pred>
std::optional<UserRecord> InMemoryUserRepository::findIf(Pred pred) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, user] : users_) {
        if (pred(user)) {
            return user;
        }
    }
    return std::nullopt;
}

std::optional<UserRecord> InMemoryUserRepository::findById(UserId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<UserRecord> InMemoryUserRepository::findByUsername(
    std::string_view username) const {
    return findIf([&](const UserRecord& u) { return u.username == username; });
}

std::optional<UserRecord> InMemoryUserRepository::findByEmail(
    std::string_view email) const {
    if (email.empty()) {
        return std::nullopt;
    }
    return findIf([&](const UserRecord& u) { return u.email == email; });
}

std::optional<UserRecord> InMemoryUserRepository::findByWalletAddress(
    std::string_view address) const {
    return findIf([&](const UserRecord& u) {
        return u.walletAddress && *u.walletAddress == address;
    });
}

AuthResult<UserRecord> InMemoryUserRepository::create(UserRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, user] : users_) {
        if (user.username == record.username) {
            return AuthResult<UserRecord>::err(
                AuthError(ErrorCode::UserAlreadyExists, "username already taken"));
        }
        if (!record.email.empty() && user.email == record.email) {
            return AuthResult<UserRecord>::err(
                AuthError(ErrorCode::UserAlreadyExists, "email already registered"));
        }
        if (record.walletAddress && user.walletAddress == record.walletAddress) {
            return AuthResult<UserRecord>::err(
                AuthError(ErrorCode::UserAlreadyExists, "wallet already registered"));
        }
    }

    record.id = UserId(nextId_++);
    record.version = 1;
    users_.emplace(record.id, record);
    return AuthResult<UserRecord>::ok(std::move(record));
}

bool InMemoryUserRepository::compareAndUpdate(const UserRecord& record,
                                              uint64_t expectedVersion) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(record.id);
    if (it == users_.end() || it->second.version != expectedVersion) {
        return false;
    }
    it->second = record;
    it->second.version = expectedVersion + 1;
    return true;
}

std::size_t InMemoryUserRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.size();
}

} // namespace cgauth::service
