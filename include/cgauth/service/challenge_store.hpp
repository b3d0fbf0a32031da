#pragma once

/// @file challenge_store.hpp
/// @brief Wallet challenge persistence: at most one challenge per address.

#include "cgauth/service/auth_types.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace cgauth::service {

/// Abstract interface for wallet challenge storage.
///
/// Implementations must make findOrRotate() and consume() atomic with
/// respect to each other; consume() is the replay barrier.
class IChallengeStore {
public:
    virtual ~IChallengeStore() = default;

    [[nodiscard]] virtual std::optional<WalletChallenge> find(
        std::string_view address) const = 0;

    /// Return the stored challenge for candidate.address if it is younger
    /// than @p maxAge at candidate.issuedAt; otherwise store @p candidate
    /// and return it.
    virtual WalletChallenge findOrRotate(const WalletChallenge& candidate,
                                         std::chrono::seconds maxAge) = 0;

    /// Delete the challenge only if its nonce still equals @p nonce.
    /// Exactly one of several concurrent callers observes true.
    virtual bool consume(std::string_view address, std::string_view nonce) = 0;

    /// Drop challenges issued more than @p maxAge before @p now.
    /// Returns how many were dropped.
    virtual std::size_t purgeExpired(Timestamp now, std::chrono::seconds maxAge) = 0;
};

/// Thread-safe in-memory challenge store.
class InMemoryChallengeStore : public IChallengeStore {
public:
    [[nodiscard]] std::optional<WalletChallenge> find(
        std::string_view address) const override;

    WalletChallenge findOrRotate(const WalletChallenge& candidate,
                                 std::chrono::seconds maxAge) override;

    bool consume(std::string_view address, std::string_view nonce) override;

    std::size_t purgeExpired(Timestamp now, std::chrono::seconds maxAge) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, WalletChallenge> challenges_;
};

}  // namespace cgauth::service
