/// @file rate_limiter.cpp
/// @brief Sliding-window RateLimiter implementation.

#include "cgauth/service/rate_limiter.hpp"

namespace cgauth::service {

RateLimiter::RateLimiter(uint32_t maxAttempts, std::chrono::seconds window,
                         foundation::Clock clock)
    : maxAttempts_(maxAttempts), window_(window), clock_(std::move(clock)) {}

bool RateLimiter::allow(const std::string& key) {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto& timestamps = attempts_[key];
    purgeExpired(timestamps, now);

    if (timestamps.size() >= static_cast<std::size_t>(maxAttempts_)) {
        return false;
    }
    timestamps.push_back(now);
    return true;
}

uint32_t RateLimiter::remaining(const std::string& key) const {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attempts_.find(key);
    if (it == attempts_.end()) {
        return maxAttempts_;
    }

    auto timestamps = it->second;
    purgeExpired(timestamps, now);

    auto used = static_cast<uint32_t>(timestamps.size());
    return (used >= maxAttempts_) ? 0u : (maxAttempts_ - used);
}

std::size_t RateLimiter::compact() {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t dropped = 0;
    for (auto it = attempts_.begin(); it != attempts_.end();) {
        purgeExpired(it->second, now);
        if (it->second.empty()) {
            it = attempts_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

void RateLimiter::purgeExpired(std::deque<foundation::Timestamp>& timestamps,
                               foundation::Timestamp now) const {
    auto cutoff = now - window_;
    while (!timestamps.empty() && timestamps.front() <= cutoff) {
        timestamps.pop_front();
    }
}

}  // namespace cgauth::service
