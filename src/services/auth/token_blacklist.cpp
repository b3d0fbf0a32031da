/// @file token_blacklist.cpp
/// @brief TokenBlacklist implementation with TTL-based auto-cleanup.

#include "cgauth/service/token_blacklist.hpp"

#include <mutex>

namespace cgauth::service {

TokenBlacklist::TokenBlacklist(std::chrono::seconds cleanupInterval,
                               foundation::Clock clock)
    : cleanupInterval_(cleanupInterval),
      clock_(std::move(clock)),
      lastCleanup_(clock_()) {}

bool TokenBlacklist::revoke(std::string_view jti, foundation::Timestamp expiresAt) {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = entries_.emplace(std::string(jti), expiresAt);

    auto now = clock_();
    if (now - lastCleanup_ >= cleanupInterval_) {
        purgeExpiredLocked(now);
    }
    return inserted;
}

bool TokenBlacklist::isRevoked(std::string_view jti) const {
    std::shared_lock lock(mutex_);
    return entries_.find(std::string(jti)) != entries_.end();
}

std::size_t TokenBlacklist::cleanup() {
    std::unique_lock lock(mutex_);
    return purgeExpiredLocked(clock_());
}

std::size_t TokenBlacklist::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

std::size_t TokenBlacklist::purgeExpiredLocked(foundation::Timestamp now) {
    lastCleanup_ = now;
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second <= now) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

}  // namespace cgauth::service
