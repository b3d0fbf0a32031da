#pragma once

/// @file password_authenticator.hpp
/// @brief Email/password registration, login and password reset.

#include "cgauth/foundation/auth_result.hpp"
#include "cgauth/service/auth_types.hpp"
#include "cgauth/service/rate_limiter.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cgauth::foundation {
class JobScheduler;
}  // namespace cgauth::foundation

namespace cgauth::service {

class BreachChecker;
class IResetTokenStore;
class IUserRepository;
class PasswordHasher;
class SessionRegistry;

/// Input for account registration.
struct RegistrationRequest {
    std::string email;
    std::string username;
    std::string password;
};

/// Password based account lifecycle.
///
/// Failed logins never reveal whether an email is registered: unknown
/// and deleted accounts run a dummy hash verification and return the same
/// invalid_credentials error as a wrong password.
class PasswordAuthenticator {
public:
    /// @param breachChecker Optional; breach checking is skipped when null.
    /// @param scheduler Optional; background breach checks run inline when null.
    PasswordAuthenticator(PasswordConfig config,
                          std::shared_ptr<IUserRepository> users,
                          std::shared_ptr<IResetTokenStore> resetTokens,
                          std::shared_ptr<PasswordHasher> hasher,
                          std::shared_ptr<SessionRegistry> sessions,
                          std::shared_ptr<BreachChecker> breachChecker = nullptr,
                          std::shared_ptr<foundation::JobScheduler> scheduler = nullptr,
                          foundation::Clock clock = foundation::systemClock());

    ~PasswordAuthenticator();

    PasswordAuthenticator(const PasswordAuthenticator&) = delete;
    PasswordAuthenticator& operator=(const PasswordAuthenticator&) = delete;

    /// Create an account. Email is normalized to lowercase before the
    /// uniqueness check.
    [[nodiscard]] foundation::AuthResult<UserRecord> registerUser(
        const RegistrationRequest& request);

    /// Verify email and password. Bans are checked only after the password
    /// matched.
    [[nodiscard]] foundation::AuthResult<UserRecord> authenticate(std::string_view email,
                                                                  std::string_view password);

    /// Issue a single-use reset token for @p email.
    ///
    /// Returns an empty optional for unknown emails so callers can respond
    /// identically either way. The raw token is meant for out-of-band
    /// delivery; only its hash is stored.
    [[nodiscard]] foundation::AuthResult<std::optional<std::string>> requestPasswordReset(
        std::string_view email);

    /// Consume a reset token and replace the password. Every session of
    /// the user is revoked on success.
    [[nodiscard]] foundation::AuthResult<void> resetPassword(std::string_view rawToken,
                                                             std::string_view newPassword,
                                                             std::string_view confirmation);

    /// Drop reset tokens past their expiry.
    std::size_t purgeExpiredResetTokens();

    /// Forget cooldown keys whose windows have passed. Returns keys dropped.
    std::size_t compactCooldowns();

private:
    void scheduleBackgroundBreachCheck(UserId userId, std::string password);

    PasswordConfig config_;
    std::shared_ptr<IUserRepository> users_;
    std::shared_ptr<IResetTokenStore> resetTokens_;
    std::shared_ptr<PasswordHasher> hasher_;
    std::shared_ptr<SessionRegistry> sessions_;
    std::shared_ptr<BreachChecker> breachChecker_;
    std::shared_ptr<foundation::JobScheduler> scheduler_;
    foundation::Clock clock_;
    RateLimiter resetCooldown_;
    std::shared_ptr<RateLimiter> findingCooldown_;
};

}  // namespace cgauth::service
