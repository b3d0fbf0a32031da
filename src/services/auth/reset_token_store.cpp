/// @file reset_token_store.cpp
/// @brief InMemoryResetTokenStore implementation.

#include "cgauth/service/reset_token_store.hpp"

namespace cgauth::service {

void InMemoryResetTokenStore::put(const PasswordResetRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.tokenHash] = record;
}

std::optional<PasswordResetRecord> InMemoryResetTokenStore::take(
    std::string_view tokenHash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(std::string(tokenHash));
    if (it == records_.end()) {
        return std::nullopt;
    }
    auto record = std::move(it->second);
    records_.erase(it);
    return record;
}

std::size_t InMemoryResetTokenStore::removeForUser(UserId userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second.userId == userId) {
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t InMemoryResetTokenStore::purgeExpired(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second.expiresAt <= now) {
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t InMemoryResetTokenStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace cgauth::service
