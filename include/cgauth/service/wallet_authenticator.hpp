#pragma once

/// @file wallet_authenticator.hpp
/// @brief Challenge/response login with secp256k1 personal-sign signatures.

#include "cgauth/foundation/auth_result.hpp"
#include "cgauth/service/auth_types.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace cgauth::service {

class IChallengeStore;
class IUserRepository;

/// Outcome of a successful wallet verification.
struct WalletVerification {
    UserRecord user;
    /// True if the account was created by this verification.
    bool provisioned = false;
};

/// Issues single-use nonces per wallet address and verifies signatures
/// over the challenge message built from them.
///
/// A challenge is consumed by an atomic conditional delete, so a captured
/// signature can be replayed successfully at most once.
class WalletChallengeAuthenticator {
public:
    WalletChallengeAuthenticator(WalletConfig config,
                                 std::shared_ptr<IChallengeStore> challenges,
                                 std::shared_ptr<IUserRepository> users,
                                 foundation::Clock clock = foundation::systemClock());

    /// Return the current nonce for @p address, creating or rotating it
    /// when absent or stale.
    [[nodiscard]] foundation::AuthResult<WalletChallenge> issueChallenge(
        std::string_view address);

    /// Verify @p signature over the pending challenge of @p address and
    /// resolve (or provision) the wallet's user.
    [[nodiscard]] foundation::AuthResult<WalletVerification> verify(std::string_view address,
                                                                    std::string_view signature);

    /// Exact message a wallet must sign for @p nonce.
    [[nodiscard]] std::string challengeMessage(std::string_view nonce) const;

    /// Drop challenges older than the configured lifetime.
    std::size_t purgeExpiredChallenges();

private:
    foundation::AuthResult<WalletVerification> resolveUser(const std::string& address);

    WalletConfig config_;
    std::shared_ptr<IChallengeStore> challenges_;
    std::shared_ptr<IUserRepository> users_;
    foundation::Clock clock_;
};

}  // namespace cgauth::service
