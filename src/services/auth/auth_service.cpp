/// @file auth_service.cpp
/// @brief AuthService implementation.

#include "cgauth/service/auth_service.hpp"

#include "cgauth/foundation/auth_logger.hpp"
#include "cgauth/foundation/job_scheduler.hpp"
#include "cgauth/service/breach_checker.hpp"
#include "cgauth/service/challenge_store.hpp"
#include "cgauth/service/input_validator.hpp"
#include "cgauth/service/password_hasher.hpp"
#include "cgauth/service/rate_limiter.hpp"
#include "cgauth/service/reset_token_store.hpp"
#include "cgauth/service/second_factor_engine.hpp"
#include "cgauth/service/session_registry.hpp"
#include "cgauth/service/session_store.hpp"
#include "cgauth/service/token_blacklist.hpp"
#include "cgauth/service/token_issuer.hpp"
#include "cgauth/service/user_repository.hpp"

#include "user_mutation.hpp"

#include <type_traits>

namespace cgauth::service {

using cgauth::foundation::AuthError;
using cgauth::foundation::AuthResult;
using cgauth::foundation::ErrorCode;
using cgauth::foundation::LogCategory;
using cgauth::foundation::LogContext;
using cgauth::foundation::LogLevel;

namespace {

constexpr int kMaxAccountWriteAttempts = 5;

template <typename>
inline constexpr bool kAlwaysFalse = false;

Principal toPrincipal(const UserRecord& user) {
    return Principal{user.id, user.username, user.secondFactorEnabled()};
}

LogContext userContext(UserId id) {
    LogContext ctx;
    ctx.userId = id;
    return ctx;
}

}  // anonymous namespace

AuthBackends AuthBackends::inMemory() {
    AuthBackends backends;
    backends.users = std::make_shared<InMemoryUserRepository>();
    backends.challenges = std::make_shared<InMemoryChallengeStore>();
    backends.sessions = std::make_shared<InMemorySessionStore>();
    backends.resetTokens = std::make_shared<InMemoryResetTokenStore>();
    backends.hasher = std::make_shared<PasswordHasher>();
    return backends;
}

AuthService::AuthService(AuthConfig config, AuthBackends backends, foundation::Clock clock)
    : config_(std::move(config)), clock_(std::move(clock)), users_(backends.users) {
    if (!backends.hasher) {
        backends.hasher = std::make_shared<PasswordHasher>();
    }

    sessions_ = std::make_shared<SessionRegistry>(config_.session, backends.sessions, clock_);
    blacklist_ = std::make_shared<TokenBlacklist>(config_.token.blacklistCleanupInterval, clock_);
    tokens_ = std::make_unique<TokenIssuer>(config_.token, users_, blacklist_, clock_);

    std::shared_ptr<BreachChecker> breachChecker;
    if (backends.breachClient && config_.breach.policy != BreachPolicy::Disabled) {
        breachChecker = std::make_shared<BreachChecker>(config_.breach, backends.breachClient);
    }
    passwords_ = std::make_unique<PasswordAuthenticator>(
        config_.password, users_, backends.resetTokens, backends.hasher, sessions_,
        std::move(breachChecker), backends.scheduler, clock_);

    wallets_ = std::make_unique<WalletChallengeAuthenticator>(config_.wallet, backends.challenges,
                                                              users_, clock_);
    secondFactor_ = std::make_unique<SecondFactorEngine>(config_.secondFactor, users_, sessions_,
                                                         clock_);
    secondFactorAttempts_ = std::make_unique<RateLimiter>(
        config_.secondFactor.maxLoginAttempts, config_.token.secondFactorTokenTtl, clock_);
}

AuthService::~AuthService() = default;

AuthResult<void> AuthService::validateConfig(const AuthConfig& config) {
    if (auto r = TokenIssuer::validateConfig(config.token); !r) {
        return r;
    }
    if (auto r = SecondFactorEngine::validateConfig(config.secondFactor); !r) {
        return r;
    }
    if (config.wallet.appName.empty() || config.wallet.challengeTtl.count() <= 0) {
        return foundation::fail<void>(ErrorCode::InvalidArgument,
                                      "wallet app name and challenge ttl are required");
    }
    if (config.session.ttl.count() <= 0) {
        return foundation::fail<void>(ErrorCode::InvalidArgument, "session ttl must be positive");
    }
    if (config.password.minPasswordLength == 0 ||
        config.password.minPasswordLength > InputValidator::kMaxPasswordLength ||
        config.password.resetTokenTtl.count() <= 0) {
        return foundation::fail<void>(ErrorCode::InvalidArgument,
                                      "invalid password or reset token setting");
    }
    return AuthResult<void>::ok();
}

// -- Credentials ------------------------------------------------------------

AuthResult<UserRecord> AuthService::registerUser(const RegistrationRequest& request) {
    return passwords_->registerUser(request);
}

AuthResult<Principal> AuthService::authenticate(const Credential& credential) {
    return std::visit(
        [this](const auto& c) -> AuthResult<Principal> {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, PasswordCredential>) {
                auto user = passwords_->authenticate(c.email, c.password);
                if (!user) {
                    return AuthResult<Principal>::err(user.error());
                }
                return AuthResult<Principal>::ok(toPrincipal(user.value()));
            } else if constexpr (std::is_same_v<T, WalletCredential>) {
                auto verified = wallets_->verify(c.address, c.signature);
                if (!verified) {
                    return AuthResult<Principal>::err(verified.error());
                }
                return AuthResult<Principal>::ok(toPrincipal(verified.value().user));
            } else if constexpr (std::is_same_v<T, SecondFactorCredential>) {
                return authenticateSecondFactor(c);
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled credential type");
            }
        },
        credential);
}

AuthResult<PendingSecondFactor> AuthService::beginSecondFactor(const Credential& firstFactor) {
    if (std::holds_alternative<SecondFactorCredential>(firstFactor)) {
        return foundation::fail<PendingSecondFactor>(ErrorCode::InvalidArgument,
                                                     "a first factor credential is required");
    }
    auto principal = authenticate(firstFactor);
    if (!principal) {
        return AuthResult<PendingSecondFactor>::err(principal.error());
    }
    if (!principal.value().secondFactorEnabled) {
        return foundation::fail<PendingSecondFactor>(ErrorCode::TotpNotEnabled,
                                                     "second factor is not enabled");
    }

    auto token = tokens_->mintSecondFactorToken(principal.value());
    if (!token) {
        return AuthResult<PendingSecondFactor>::err(token.error());
    }
    CGAUTH_LOG_CTX(LogLevel::Debug, LogCategory::SecondFactor, "second factor pending",
                   userContext(principal.value().id));
    return AuthResult<PendingSecondFactor>::ok(PendingSecondFactor{
        principal.value().id, std::move(token).value(), config_.token.secondFactorTokenTtl});
}

AuthResult<Principal> AuthService::authenticateSecondFactor(
    const SecondFactorCredential& credential) {
    auto claims = tokens_->verifySecondFactorToken(credential.pendingToken);
    if (!claims) {
        return AuthResult<Principal>::err(claims.error());
    }
    auto userId = parseSubject(claims.value().subject);
    if (!userId) {
        return foundation::fail<Principal>(ErrorCode::InvalidToken, "token subject is invalid");
    }

    auto user = users_->findById(*userId);
    if (!user || user->isDeleted()) {
        return foundation::fail<Principal>(ErrorCode::InvalidCredentials, "invalid credentials");
    }
    if (user->isBannedAt(clock_())) {
        return foundation::fail<Principal>(ErrorCode::AccountBanned, "account is banned");
    }

    const auto& jti = claims.value().jti;
    auto ctx = userContext(user->id);
    if (!secondFactorAttempts_->allow(jti)) {
        // Out of attempts: the pending token is dead either way.
        auto burned = tokens_->consume(claims.value());
        ctx.extra["token_burned"] = burned ? "true" : "false";
        CGAUTH_LOG_CTX(LogLevel::Warning, LogCategory::SecondFactor,
                       "second factor attempts exhausted", ctx);
        return foundation::fail<Principal>(ErrorCode::RateLimited,
                                           "too many second factor attempts");
    }
    if (auto checked = checkSecondFactor(user->id, credential.code); !checked) {
        ctx.extra["attempts_left"] = std::to_string(secondFactorAttempts_->remaining(jti));
        CGAUTH_LOG_CTX(LogLevel::Info, LogCategory::SecondFactor, "second factor code rejected",
                       ctx);
        return AuthResult<Principal>::err(checked.error());
    }
    if (auto consumed = tokens_->consume(claims.value()); !consumed) {
        return AuthResult<Principal>::err(consumed.error());
    }
    return AuthResult<Principal>::ok(toPrincipal(*user));
}

AuthResult<void> AuthService::checkSecondFactor(UserId userId, std::string_view code) {
    auto totp = secondFactor_->verify(userId, code);
    if (totp || totp.error().code() != ErrorCode::InvalidCode) {
        return totp;
    }

    auto backup = secondFactor_->useBackupCode(userId, code);
    if (backup) {
        return AuthResult<void>::ok();
    }
    if (backup.error().code() == ErrorCode::NoBackupCodes) {
        return AuthResult<void>::err(totp.error());
    }
    return AuthResult<void>::err(backup.error());
}

AuthResult<LoginResult> AuthService::login(const Credential& credential,
                                           const std::optional<std::string>& secondFactorCode,
                                           const SessionContext& context) {
    auto principal = authenticate(credential);
    if (!principal) {
        return AuthResult<LoginResult>::err(principal.error());
    }

    bool secondFactorPresented = std::holds_alternative<SecondFactorCredential>(credential);
    if (principal.value().secondFactorEnabled && !secondFactorPresented) {
        if (!secondFactorCode) {
            return foundation::fail<LoginResult>(ErrorCode::SecondFactorRequired,
                                                 "second factor code required");
        }
        if (auto checked = checkSecondFactor(principal.value().id, *secondFactorCode);
            !checked) {
            return AuthResult<LoginResult>::err(checked.error());
        }
    }

    auto tokens = tokens_->mint(principal.value());
    if (!tokens) {
        return AuthResult<LoginResult>::err(tokens.error());
    }
    auto session = sessions_->create(principal.value().id, context);
    if (!session) {
        return AuthResult<LoginResult>::err(session.error());
    }

    LoginResult result;
    result.principal = std::move(principal.value());
    result.tokens = std::move(tokens.value());
    result.session = std::move(session.value());
    return AuthResult<LoginResult>::ok(std::move(result));
}

// -- Wallet -----------------------------------------------------------------

AuthResult<WalletChallenge> AuthService::issueChallenge(std::string_view address) {
    return wallets_->issueChallenge(address);
}

AuthResult<WalletVerification> AuthService::verifyWallet(std::string_view address,
                                                         std::string_view signature) {
    return wallets_->verify(address, signature);
}

std::string AuthService::challengeMessage(std::string_view nonce) const {
    return wallets_->challengeMessage(nonce);
}

// -- Second factor ----------------------------------------------------------

AuthResult<SecondFactorSetup> AuthService::setupSecondFactor(UserId userId) {
    return secondFactor_->setup(userId);
}

AuthResult<void> AuthService::enableSecondFactor(UserId userId, std::string_view code,
                                                 std::string_view secretBase64,
                                                 const std::vector<std::string>& backupCodes) {
    return secondFactor_->enable(userId, code, secretBase64, backupCodes);
}

AuthResult<void> AuthService::verifySecondFactor(UserId userId, std::string_view code) {
    return secondFactor_->verify(userId, code);
}

AuthResult<std::size_t> AuthService::disableSecondFactor(UserId userId, std::string_view code) {
    return secondFactor_->disable(userId, code);
}

AuthResult<std::vector<std::string>> AuthService::regenerateBackupCodes(UserId userId,
                                                                       std::string_view code) {
    return secondFactor_->regenerateBackupCodes(userId, code);
}

AuthResult<std::size_t> AuthService::useBackupCode(UserId userId, std::string_view code) {
    return secondFactor_->useBackupCode(userId, code);
}

AuthResult<SecondFactorStatus> AuthService::secondFactorStatus(UserId userId) const {
    return secondFactor_->status(userId);
}

// -- Tokens -----------------------------------------------------------------

AuthResult<TokenPair> AuthService::mintTokens(const Principal& principal) const {
    return tokens_->mint(principal);
}

AuthResult<TokenPair> AuthService::refreshTokens(std::string_view refreshToken) {
    return tokens_->refresh(refreshToken);
}

AuthResult<TokenClaims> AuthService::verifyAccessToken(std::string_view accessToken) const {
    return tokens_->verify(accessToken);
}

AuthResult<void> AuthService::revokeToken(std::string_view token) {
    return tokens_->revoke(token);
}

std::size_t AuthService::cleanupTokenBlacklist() {
    return blacklist_->cleanup();
}

MaintenanceReport AuthService::runMaintenance() {
    MaintenanceReport report;
    report.blacklistEntries = blacklist_->cleanup();
    report.challenges = wallets_->purgeExpiredChallenges();
    report.resetTokens = passwords_->purgeExpiredResetTokens();
    report.limiterKeys = passwords_->compactCooldowns() + secondFactorAttempts_->compact();

    LogContext ctx;
    ctx.extra["blacklist"] = std::to_string(report.blacklistEntries);
    ctx.extra["challenges"] = std::to_string(report.challenges);
    ctx.extra["reset_tokens"] = std::to_string(report.resetTokens);
    ctx.extra["limiter_keys"] = std::to_string(report.limiterKeys);
    CGAUTH_LOG_CTX(LogLevel::Debug, LogCategory::Core, "maintenance pass", ctx);
    return report;
}

// -- Sessions ---------------------------------------------------------------

AuthResult<IssuedSession> AuthService::createSession(UserId userId,
                                                     const SessionContext& context) {
    return sessions_->create(userId, context);
}

AuthResult<SessionRecord> AuthService::resolveSession(std::string_view rawToken) {
    return sessions_->resolve(rawToken);
}

AuthResult<void> AuthService::revokeSession(UserId userId, SessionId sessionId) {
    return sessions_->revokeForUser(userId, sessionId);
}

std::size_t AuthService::revokeAllSessions(UserId userId) {
    return sessions_->revokeAll(userId);
}

std::vector<SessionRecord> AuthService::listSessions(UserId userId) const {
    return sessions_->listActive(userId);
}

// -- Account state ----------------------------------------------------------

AuthResult<std::size_t> AuthService::banUser(UserId userId, std::string reason,
                                             std::optional<Timestamp> until) {
    auto now = clock_();
    auto updated = detail::mutateUser(*users_, userId, kMaxAccountWriteAttempts, now,
                                      [&](UserRecord& r) -> AuthResult<void> {
                                          r.bannedAt = now;
                                          r.bannedUntil = until;
                                          r.banReason = reason;
                                          return AuthResult<void>::ok();
                                      });
    if (!updated) {
        return AuthResult<std::size_t>::err(updated.error());
    }

    auto revoked = sessions_->revokeAll(userId);
    auto ctx = userContext(userId);
    ctx.extra["sessions_revoked"] = std::to_string(revoked);
    ctx.extra["permanent"] = until ? "false" : "true";
    CGAUTH_LOG_CTX(LogLevel::Info, LogCategory::Core, "user banned", ctx);
    return AuthResult<std::size_t>::ok(revoked);
}

AuthResult<void> AuthService::unbanUser(UserId userId) {
    auto updated = detail::mutateUser(*users_, userId, kMaxAccountWriteAttempts, clock_(),
                                      [](UserRecord& r) -> AuthResult<void> {
                                          r.bannedAt.reset();
                                          r.bannedUntil.reset();
                                          r.banReason.clear();
                                          return AuthResult<void>::ok();
                                      });
    if (!updated) {
        return AuthResult<void>::err(updated.error());
    }
    CGAUTH_LOG_CTX(LogLevel::Info, LogCategory::Core, "user unbanned", userContext(userId));
    return AuthResult<void>::ok();
}

AuthResult<std::size_t> AuthService::deactivateUser(UserId userId) {
    auto now = clock_();
    auto updated = detail::mutateUser(*users_, userId, kMaxAccountWriteAttempts, now,
                                      [&](UserRecord& r) -> AuthResult<void> {
                                          r.deletedAt = now;
                                          return AuthResult<void>::ok();
                                      });
    if (!updated) {
        return AuthResult<std::size_t>::err(updated.error());
    }

    auto revoked = sessions_->revokeAll(userId);
    auto ctx = userContext(userId);
    ctx.extra["sessions_revoked"] = std::to_string(revoked);
    CGAUTH_LOG_CTX(LogLevel::Info, LogCategory::Core, "user deactivated", ctx);
    return AuthResult<std::size_t>::ok(revoked);
}

// -- Password reset ---------------------------------------------------------

AuthResult<std::optional<std::string>> AuthService::requestPasswordReset(std::string_view email) {
    return passwords_->requestPasswordReset(email);
}

AuthResult<void> AuthService::resetPassword(std::string_view rawToken,
                                            std::string_view newPassword,
                                            std::string_view confirmation) {
    return passwords_->resetPassword(rawToken, newPassword, confirmation);
}

}  // namespace cgauth::service
