/// @file password_authenticator.cpp
/// @brief PasswordAuthenticator implementation.

#include "cgauth/service/password_authenticator.hpp"

#include "cgauth/foundation/auth_logger.hpp"
#include "cgauth/foundation/job_scheduler.hpp"
#include "cgauth/service/breach_checker.hpp"
#include "cgauth/service/input_validator.hpp"
#include "cgauth/service/password_hasher.hpp"
#include "cgauth/service/reset_token_store.hpp"
#include "cgauth/service/session_registry.hpp"
#include "cgauth/service/user_repository.hpp"

#include "crypto_utils.hpp"
#include "user_mutation.hpp"

namespace cgauth::service {

using cgauth::foundation::AuthError;
using cgauth::foundation::AuthResult;
using cgauth::foundation::ErrorCode;
using cgauth::foundation::LogCategory;
using cgauth::foundation::LogContext;
using cgauth::foundation::LogLevel;

namespace {

constexpr std::size_t kResetTokenBytes = 32;
constexpr int kMaxPasswordWriteAttempts = 5;

AuthError invalidCredentials() {
    return AuthError(ErrorCode::InvalidCredentials, "invalid email or password");
}

LogContext userContext(UserId id) {
    LogContext ctx;
    ctx.userId = id;
    return ctx;
}

/// Log a breach finding unless one was logged for this user within the
/// cooldown window. The password itself is never logged.
void reportFinding(RateLimiter& cooldown, UserId userId, uint64_t count) {
    if (!cooldown.allow(std::to_string(userId.value()))) {
        return;
    }
    auto ctx = userContext(userId);
    ctx.extra["breach_count"] = std::to_string(count);
    CGAUTH_LOG_CTX(LogLevel::Warning, LogCategory::Breach,
                   "password found in breach corpus", ctx);
}

}  // anonymous namespace

PasswordAuthenticator::PasswordAuthenticator(PasswordConfig config,
                                             std::shared_ptr<IUserRepository> users,
                                             std::shared_ptr<IResetTokenStore> resetTokens,
                                             std::shared_ptr<PasswordHasher> hasher,
                                             std::shared_ptr<SessionRegistry> sessions,
                                             std::shared_ptr<BreachChecker> breachChecker,
                                             std::shared_ptr<foundation::JobScheduler> scheduler,
                                             foundation::Clock clock)
    : config_(config),
      users_(std::move(users)),
      resetTokens_(std::move(resetTokens)),
      hasher_(std::move(hasher)),
      sessions_(std::move(sessions)),
      breachChecker_(std::move(breachChecker)),
      scheduler_(std::move(scheduler)),
      clock_(std::move(clock)),
      resetCooldown_(1, config_.resetResendCooldown, clock_) {
    if (breachChecker_) {
        findingCooldown_ = std::make_shared<RateLimiter>(
            1, breachChecker_->config().findingLogCooldown, clock_);
    }
}

PasswordAuthenticator::~PasswordAuthenticator() = default;

// -- Registration -------------------------------------------------------------

AuthResult<UserRecord> PasswordAuthenticator::registerUser(const RegistrationRequest& request) {
    if (auto v = InputValidator::validateUsername(request.username); !v) {
        return foundation::fail<UserRecord>(ErrorCode::InvalidUsername, v.message);
    }
    auto email = InputValidator::normalizeEmail(request.email);
    if (auto v = InputValidator::validateEmail(email); !v) {
        return foundation::fail<UserRecord>(ErrorCode::InvalidEmail, v.message);
    }
    if (auto v = InputValidator::validatePassword(request.password, config_.minPasswordLength);
        !v) {
        return foundation::fail<UserRecord>(ErrorCode::WeakPassword, v.message);
    }

    if (users_->findByEmail(email)) {
        return foundation::fail<UserRecord>(ErrorCode::UserAlreadyExists,
                                            "email already registered");
    }
    if (users_->findByUsername(request.username)) {
        return foundation::fail<UserRecord>(ErrorCode::UserAlreadyExists,
                                            "username already taken");
    }

    auto policy = breachChecker_ ? breachChecker_->config().policy : BreachPolicy::Disabled;
    if (policy == BreachPolicy::Reject) {
        auto count = breachChecker_->breachCount(request.password);
        if (count && breachChecker_->exceedsThreshold(*count)) {
            return foundation::fail<UserRecord>(
                ErrorCode::BreachedPassword,
                "password has appeared in a data breach, choose another");
        }
    }

    auto hashed = hasher_->hash(request.password);
    if (!hashed) {
        return AuthResult<UserRecord>::err(hashed.error());
    }

    auto now = clock_();
    UserRecord record;
    record.username = request.username;
    record.email = email;
    record.passwordHash = std::move(hashed.value());
    record.createdAt = now;
    record.updatedAt = now;

    auto created = users_->create(std::move(record));
    if (!created) {
        return created;
    }

    CGAUTH_LOG_CTX(LogLevel::Info, LogCategory::Password, "user registered",
                   userContext(created.value().id));

    if (policy == BreachPolicy::Background) {
        scheduleBackgroundBreachCheck(created.value().id, request.password);
    }
    return created;
}

void PasswordAuthenticator::scheduleBackgroundBreachCheck(UserId userId, std::string password) {
    auto checker = breachChecker_;
    auto cooldown = findingCooldown_;
    auto job = [checker, cooldown, userId, password = std::move(password)]() {
        auto count = checker->breachCount(password);
        if (count && checker->exceedsThreshold(*count)) {
            reportFinding(*cooldown, userId, *count);
        }
    };

    if (!scheduler_) {
        job();
        return;
    }
    auto scheduled = scheduler_->schedule("breach_check", std::move(job));
    if (!scheduled) {
        auto ctx = userContext(userId);
        ctx.extra["reason"] = std::string(scheduled.error().message());
        CGAUTH_LOG_CTX(LogLevel::Warning, LogCategory::Breach,
                       "breach check not scheduled", ctx);
    }
}

// -- Login --------------------------------------------------------------------

AuthResult<UserRecord> PasswordAuthenticator::authenticate(std::string_view email,
                                                           std::string_view password) {
    auto normalized = InputValidator::normalizeEmail(email);
    auto user = users_->findByEmail(normalized);

    if (!user || user->isDeleted() || user->passwordHash.empty()) {
        hasher_->dummyVerify(password);
        return AuthResult<UserRecord>::err(invalidCredentials());
    }
    if (!hasher_->verify(password, user->passwordHash)) {
        CGAUTH_LOG_CTX(LogLevel::Debug, LogCategory::Password, "password mismatch",
                       userContext(user->id));
        return AuthResult<UserRecord>::err(invalidCredentials());
    }

    auto now = clock_();
    if (user->isBannedAt(now)) {
        return foundation::fail<UserRecord>(ErrorCode::AccountBanned, "account is banned");
    }

    if (hasher_->needsRehash(user->passwordHash)) {
        auto rehashed = hasher_->hash(password);
        if (rehashed) {
            auto expected = user->passwordHash;
            auto upgraded = detail::mutateUser(
                *users_, user->id, 1, now,
                [&](UserRecord& r) -> AuthResult<void> {
                    if (r.passwordHash != expected) {
                        return foundation::fail<void>(ErrorCode::StoreConflict,
                                                      "password changed concurrently");
                    }
                    r.passwordHash = rehashed.value();
                    return AuthResult<void>::ok();
                });
            if (upgraded) {
                user = std::move(upgraded.value());
            } else {
                CGAUTH_LOG_CTX(LogLevel::Debug, LogCategory::Password,
                               "password rehash skipped", userContext(user->id));
            }
        }
    }
    return AuthResult<UserRecord>::ok(std::move(*user));
}

// -- Password reset -----------------------------------------------------------

AuthResult<std::optional<std::string>> PasswordAuthenticator::requestPasswordReset(
    std::string_view email) {
    using ResetResult = AuthResult<std::optional<std::string>>;

    auto normalized = InputValidator::normalizeEmail(email);
    auto user = users_->findByEmail(normalized);
    if (!user || user->isDeleted()) {
        CGAUTH_LOG(LogLevel::Debug, LogCategory::Password,
                   "password reset requested for unknown email");
        return ResetResult::ok(std::nullopt);
    }

    if (!resetCooldown_.allow(normalized)) {
        return ResetResult::err(
            AuthError(ErrorCode::RateLimited, "password reset requested too recently"));
    }

    auto raw = detail::secureRandomBytes(kResetTokenBytes);
    if (!raw) {
        return ResetResult::err(foundation::internalFault(
            LogCategory::Password, "CSPRNG unavailable for reset token", userContext(user->id)));
    }
    auto token = detail::base64urlEncode(raw->data(), raw->size());

    auto now = clock_();
    PasswordResetRecord record;
    record.tokenHash = detail::hashToken(token);
    record.userId = user->id;
    record.createdAt = now;
    record.expiresAt = now + config_.resetTokenTtl;
    resetTokens_->put(record);

    CGAUTH_LOG_CTX(LogLevel::Info, LogCategory::Password, "password reset token issued",
                   userContext(user->id));
    return ResetResult::ok(std::optional<std::string>(std::move(token)));
}

AuthResult<void> PasswordAuthenticator::resetPassword(std::string_view rawToken,
                                                      std::string_view newPassword,
                                                      std::string_view confirmation) {
    if (newPassword != confirmation) {
        return foundation::fail<void>(ErrorCode::PasswordMismatch,
                                      "password confirmation does not match");
    }
    if (auto v = InputValidator::validatePassword(newPassword, config_.minPasswordLength); !v) {
        return foundation::fail<void>(ErrorCode::WeakPassword, v.message);
    }

    auto record = resetTokens_->take(detail::hashToken(rawToken));
    if (!record) {
        return foundation::fail<void>(ErrorCode::InvalidToken, "invalid reset token");
    }
    auto now = clock_();
    if (now >= record->expiresAt) {
        return foundation::fail<void>(ErrorCode::TokenExpired, "reset token has expired");
    }

    auto hashed = hasher_->hash(newPassword);
    if (!hashed) {
        return AuthResult<void>::err(hashed.error());
    }

    auto updated = detail::mutateUser(*users_, record->userId, kMaxPasswordWriteAttempts, now,
                                      [&](UserRecord& r) -> AuthResult<void> {
                                          r.passwordHash = hashed.value();
                                          return AuthResult<void>::ok();
                                      });
    if (!updated) {
        if (updated.error().code() == ErrorCode::NotFound) {
            return foundation::fail<void>(ErrorCode::InvalidToken, "invalid reset token");
        }
        return AuthResult<void>::err(updated.error());
    }

    auto revoked = sessions_->revokeAll(record->userId);
    resetTokens_->removeForUser(record->userId);

    auto ctx = userContext(record->userId);
    ctx.extra["sessions_revoked"] = std::to_string(revoked);
    CGAUTH_LOG_CTX(LogLevel::Info, LogCategory::Password, "password reset completed", ctx);
    return AuthResult<void>::ok();
}

// -- Maintenance --------------------------------------------------------------

std::size_t PasswordAuthenticator::purgeExpiredResetTokens() {
    return resetTokens_->purgeExpired(clock_());
}

std::size_t PasswordAuthenticator::compactCooldowns() {
    auto dropped = resetCooldown_.compact();
    if (findingCooldown_) {
        dropped += findingCooldown_->compact();
    }
    return dropped;
}

}  // namespace cgauth::service
