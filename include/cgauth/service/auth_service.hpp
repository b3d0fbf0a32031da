#pragma once

/// @file auth_service.hpp
/// @brief Facade over the authenticators, token issuer and session registry.

#include "cgauth/foundation/auth_result.hpp"
#include "cgauth/service/auth_types.hpp"
#include "cgauth/service/credentials.hpp"
#include "cgauth/service/password_authenticator.hpp"
#include "cgauth/service/wallet_authenticator.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cgauth::foundation {
class JobScheduler;
}  // namespace cgauth::foundation

namespace cgauth::service {

class IBreachRangeClient;
class IChallengeStore;
class IResetTokenStore;
class ISessionStore;
class IUserRepository;
class PasswordHasher;
class RateLimiter;
class SecondFactorEngine;
class SessionRegistry;
class TokenBlacklist;
class TokenIssuer;

/// Storage and collaborators the service is built on.
struct AuthBackends {
    std::shared_ptr<IUserRepository> users;
    std::shared_ptr<IChallengeStore> challenges;
    std::shared_ptr<ISessionStore> sessions;
    std::shared_ptr<IResetTokenStore> resetTokens;
    std::shared_ptr<PasswordHasher> hasher;
    /// Optional; breach checks are skipped without it.
    std::shared_ptr<IBreachRangeClient> breachClient;
    /// Optional; background breach checks run inline without it.
    std::shared_ptr<foundation::JobScheduler> scheduler;

    /// Thread-safe in-memory stores and an interactive-cost hasher.
    static AuthBackends inMemory();
};

/// Result of a full login: verified principal, token pair and session.
struct LoginResult {
    Principal principal;
    TokenPair tokens;
    IssuedSession session;
};

/// Counts from one AuthService::runMaintenance() pass.
struct MaintenanceReport {
    std::size_t blacklistEntries = 0;
    std::size_t challenges = 0;
    std::size_t resetTokens = 0;
    std::size_t limiterKeys = 0;
};

/// First factor passed for a user with the second factor on.
struct PendingSecondFactor {
    UserId userId;
    /// Single-use; present it in a SecondFactorCredential.
    std::string token;
    std::chrono::seconds expiresIn{};
};

/// Entry point of the auth core.
///
/// Credentials are dispatched to the matching authenticator; the resulting
/// principal is turned into tokens and a session. Ban, deactivation,
/// password reset and second factor disable revoke every session of the
/// affected user.
///
/// Example:
/// @code
///   AuthService auth(config, AuthBackends::inMemory());
///   auth.registerUser({"alice@example.com", "alice", "Sup3r$ecret"});
///   auto login = auth.login(PasswordCredential{"alice@example.com", "Sup3r$ecret"},
///                           std::nullopt, SessionContext{"curl/8.0"});
/// @endcode
class AuthService {
public:
    AuthService(AuthConfig config, AuthBackends backends,
                foundation::Clock clock = foundation::systemClock());

    ~AuthService();

    AuthService(const AuthService&) = delete;
    AuthService& operator=(const AuthService&) = delete;

    /// Check every section of @p config before constructing a service.
    [[nodiscard]] static foundation::AuthResult<void> validateConfig(const AuthConfig& config);

    // -- Credentials ----------------------------------------------------------

    [[nodiscard]] foundation::AuthResult<UserRecord> registerUser(
        const RegistrationRequest& request);

    /// Verify a single credential without issuing anything.
    [[nodiscard]] foundation::AuthResult<Principal> authenticate(const Credential& credential);

    /// Verify a password or wallet credential and hand out the pending
    /// token for the second factor step. Fails with TotpNotEnabled if the
    /// user has no second factor.
    [[nodiscard]] foundation::AuthResult<PendingSecondFactor> beginSecondFactor(
        const Credential& firstFactor);

    /// Verify @p credential, demand the second factor where enabled, then
    /// mint tokens and create a session.
    ///
    /// @param secondFactorCode TOTP or backup code; required with
    ///        second_factor_required if the user has the second factor on.
    [[nodiscard]] foundation::AuthResult<LoginResult> login(
        const Credential& credential,
        const std::optional<std::string>& secondFactorCode,
        const SessionContext& context);

    // -- Wallet ---------------------------------------------------------------

    [[nodiscard]] foundation::AuthResult<WalletChallenge> issueChallenge(std::string_view address);

    [[nodiscard]] foundation::AuthResult<WalletVerification> verifyWallet(
        std::string_view address, std::string_view signature);

    [[nodiscard]] std::string challengeMessage(std::string_view nonce) const;

    // -- Second factor --------------------------------------------------------

    [[nodiscard]] foundation::AuthResult<SecondFactorSetup> setupSecondFactor(UserId userId);

    [[nodiscard]] foundation::AuthResult<void> enableSecondFactor(
        UserId userId, std::string_view code, std::string_view secretBase64,
        const std::vector<std::string>& backupCodes);

    [[nodiscard]] foundation::AuthResult<void> verifySecondFactor(UserId userId,
                                                                  std::string_view code);

    [[nodiscard]] foundation::AuthResult<std::size_t> disableSecondFactor(UserId userId,
                                                                          std::string_view code);

    [[nodiscard]] foundation::AuthResult<std::vector<std::string>> regenerateBackupCodes(
        UserId userId, std::string_view code);

    [[nodiscard]] foundation::AuthResult<std::size_t> useBackupCode(UserId userId,
                                                                    std::string_view code);

    [[nodiscard]] foundation::AuthResult<SecondFactorStatus> secondFactorStatus(
        UserId userId) const;

    // -- Tokens ---------------------------------------------------------------

    [[nodiscard]] foundation::AuthResult<TokenPair> mintTokens(const Principal& principal) const;

    [[nodiscard]] foundation::AuthResult<TokenPair> refreshTokens(std::string_view refreshToken);

    [[nodiscard]] foundation::AuthResult<TokenClaims> verifyAccessToken(
        std::string_view accessToken) const;

    /// Denylist a token until its natural expiry.
    [[nodiscard]] foundation::AuthResult<void> revokeToken(std::string_view token);

    /// Drop expired denylist entries. @return Entries removed.
    std::size_t cleanupTokenBlacklist();

    /// Periodic housekeeping: expired denylist entries, wallet challenges
    /// and reset tokens, and idle rate limiter keys.
    MaintenanceReport runMaintenance();

    // -- Sessions -------------------------------------------------------------

    [[nodiscard]] foundation::AuthResult<IssuedSession> createSession(
        UserId userId, const SessionContext& context);

    [[nodiscard]] foundation::AuthResult<SessionRecord> resolveSession(std::string_view rawToken);

    /// Revoke one session owned by @p userId.
    [[nodiscard]] foundation::AuthResult<void> revokeSession(UserId userId, SessionId sessionId);

    std::size_t revokeAllSessions(UserId userId);

    [[nodiscard]] std::vector<SessionRecord> listSessions(UserId userId) const;

    // -- Account state --------------------------------------------------------

    /// Ban @p userId, permanently if @p until is empty, and revoke every
    /// session. @return Sessions revoked.
    [[nodiscard]] foundation::AuthResult<std::size_t> banUser(
        UserId userId, std::string reason, std::optional<Timestamp> until = std::nullopt);

    [[nodiscard]] foundation::AuthResult<void> unbanUser(UserId userId);

    /// Soft-delete @p userId and revoke every session. @return Sessions revoked.
    [[nodiscard]] foundation::AuthResult<std::size_t> deactivateUser(UserId userId);

    // -- Password reset -------------------------------------------------------

    [[nodiscard]] foundation::AuthResult<std::optional<std::string>> requestPasswordReset(
        std::string_view email);

    [[nodiscard]] foundation::AuthResult<void> resetPassword(std::string_view rawToken,
                                                             std::string_view newPassword,
                                                             std::string_view confirmation);

private:
    foundation::AuthResult<Principal> authenticateSecondFactor(
        const SecondFactorCredential& credential);
    foundation::AuthResult<void> checkSecondFactor(UserId userId, std::string_view code);

    AuthConfig config_;
    foundation::Clock clock_;
    std::shared_ptr<IUserRepository> users_;
    std::shared_ptr<SessionRegistry> sessions_;
    std::shared_ptr<TokenBlacklist> blacklist_;
    std::unique_ptr<TokenIssuer> tokens_;
    std::unique_ptr<PasswordAuthenticator> passwords_;
    std::unique_ptr<WalletChallengeAuthenticator> wallets_;
    std::unique_ptr<SecondFactorEngine> secondFactor_;
    /// Code attempts per pending token id.
    std::unique_ptr<RateLimiter> secondFactorAttempts_;
};

}  // namespace cgauth::service
