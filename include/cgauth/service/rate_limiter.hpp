#pragma once

/// @file rate_limiter.hpp
/// @brief Sliding-window limiter behind the reset-mail and breach-log
///        cooldowns.

#include "cgauth/foundation/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cgauth::service {

/// Sliding-window rate limiter keyed by an arbitrary string.
///
/// A cooldown is the special case of one attempt per window.
///
/// Example:
/// @code
///   RateLimiter resendCooldown(1, std::chrono::seconds{60});
///   if (!resendCooldown.allow(email)) {
///       // too soon
///   }
/// @endcode
class RateLimiter {
public:
    RateLimiter(uint32_t maxAttempts, std::chrono::seconds window,
                foundation::Clock clock = foundation::systemClock());

    /// Record an attempt for @p key.
    /// Returns true if allowed, false if the window is already full.
    [[nodiscard]] bool allow(const std::string& key);

    /// Attempts still allowed for @p key in the current window.
    [[nodiscard]] uint32_t remaining(const std::string& key) const;

    /// Drop keys whose windows are empty. Returns how many were dropped.
    std::size_t compact();

private:
    void purgeExpired(std::deque<foundation::Timestamp>& timestamps,
                      foundation::Timestamp now) const;

    uint32_t maxAttempts_;
    std::chrono::seconds window_;
    foundation::Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<foundation::Timestamp>> attempts_;
};

} // namespace cgauth::service
