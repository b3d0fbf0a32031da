/// @file challenge_store.cpp
/// @brief InMemoryChallengeStore implementation.

#include "cgauth/service/challenge_store.hpp"

namespace cgauth::service {

std::optional<WalletChallenge> InMemoryChallengeStore::find(
    std::string_view address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = challenges_.find(std::string(address));
    if (it == challenges_.end()) {
        return std::nullopt;
    }
    return it->second;
}

WalletChallenge InMemoryChallengeStore::findOrRotate(
    const WalletChallenge& candidate, std::chrono::seconds maxAge) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = challenges_.find(candidate.address);
    if (it != challenges_.end() &&
        candidate.issuedAt - it->second.issuedAt <= maxAge) {
        return it->second;
    }
    challenges_[candidate.address] = candidate;
    return candidate;
}

bool InMemoryChallengeStore::consume(std::string_view address,
                                     std::string_view nonce) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = challenges_.find(std::string(address));
    if (it == challenges_.end() || it->second.nonce != nonce) {
        return false;
    }
    challenges_.erase(it);
    return true;
}

std::size_t InMemoryChallengeStore::purgeExpired(Timestamp now, std::chrono::seconds maxAge) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t dropped = 0;
    for (auto it = challenges_.begin(); it != challenges_.end();) {
        if (now - it->second.issuedAt > maxAge) {
            it = challenges_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

std::size_t InMemoryChallengeStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return challenges_.size();
}

}  // namespace cgauth::service
