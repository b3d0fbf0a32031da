/// @file second_factor_engine.cpp
/// @brief SecondFactorEngine implementation.

#include "cgauth/service/second_factor_engine.hpp"

#include "cgauth/foundation/auth_logger.hpp"
#include "cgauth/service/session_registry.hpp"
#include "cgauth/service/totp.hpp"
#include "cgauth/service/user_repository.hpp"

#include "crypto_utils.hpp"
#include "user_mutation.hpp"

#include <algorithm>

namespace cgauth::service {

using cgauth::foundation::AuthError;
using cgauth::foundation::AuthResult;
using cgauth::foundation::ErrorCode;
using cgauth::foundation::LogCategory;
using cgauth::foundation::LogContext;
using cgauth::foundation::LogLevel;

namespace {

constexpr std::size_t kBackupCodeChars = 8;

LogContext userContext(UserId id) {
    LogContext ctx;
    ctx.userId = id;
    return ctx;
}

AuthError notEnabled() {
    return AuthError(ErrorCode::TotpNotEnabled, "second factor is not enabled");
}

AuthError invalidCode() {
    return AuthError(ErrorCode::InvalidCode, "invalid verification code");
}

bool isBackupCodeShape(std::string_view normalized) {
    if (normalized.size() != kBackupCodeChars) {
        return false;
    }
    std::string_view alphabet(detail::kBase32Alphabet);
    return normalized.find_first_not_of(alphabet) == std::string_view::npos;
}

/// Index of the hash matching @p candidate, scanning the whole list.
std::optional<std::size_t> findBackupCode(const std::vector<std::string>& hashes,
                                          const std::string& candidate) {
    std::optional<std::size_t> match;
    for (std::size_t i = 0; i < hashes.size(); ++i) {
        if (detail::constantTimeEqual(hashes[i], candidate) && !match) {
            match = i;
        }
    }
    return match;
}

void clearSecondFactor(UserRecord& user) {
    user.totpSecretEncrypted.reset();
    user.backupCodeHashes.clear();
    user.totpEnabledAt.reset();
}

}  // anonymous namespace

SecondFactorEngine::SecondFactorEngine(SecondFactorConfig config,
                                       std::shared_ptr<IUserRepository> users,
                                       std::shared_ptr<SessionRegistry> sessions,
                                       foundation::Clock clock)
    : config_(std::move(config)),
      users_(std::move(users)),
      sessions_(std::move(sessions)),
      clock_(std::move(clock)),
      encryptionKey_(detail::sha256("totp_encryption:" + config_.encryptionKey)) {}

AuthResult<void> SecondFactorEngine::validateConfig(const SecondFactorConfig& config) {
    if (config.encryptionKey.empty()) {
        return foundation::fail<void>(ErrorCode::InvalidArgument,
                                      "second factor encryption key is empty");
    }
    if (config.backupCodeCount == 0) {
        return foundation::fail<void>(ErrorCode::InvalidArgument,
                                      "backup code count must be positive");
    }
    if (config.driftSteps < 0 || config.maxWriteRetries < 1 || config.maxLoginAttempts == 0) {
        return foundation::fail<void>(ErrorCode::InvalidArgument,
                                      "invalid second factor drift or retry setting");
    }
    return AuthResult<void>::ok();
}

std::string SecondFactorEngine::hashBackupCode(std::string_view code) {
    auto digest = detail::sha256(totp::normalizeCode(code));
    return detail::base64Encode(digest.data(), digest.size());
}

AuthResult<std::vector<std::string>> SecondFactorEngine::generateBackupCodes() const {
    std::vector<std::string> codes;
    codes.reserve(config_.backupCodeCount);
    for (std::size_t i = 0; i < config_.backupCodeCount; ++i) {
        auto random = detail::secureRandomBytes(kBackupCodeChars);
        if (!random) {
            return AuthResult<std::vector<std::string>>::err(foundation::internalFault(
                LogCategory::SecondFactor, "CSPRNG unavailable for backup codes"));
        }
        std::string code;
        code.reserve(kBackupCodeChars + 1);
        for (std::size_t j = 0; j < kBackupCodeChars; ++j) {
            if (j == kBackupCodeChars / 2) {
                code.push_back('-');
            }
            code.push_back(detail::kBase32Alphabet[(*random)[j] & 0x1F]);
        }
        codes.push_back(std::move(code));
    }
    return AuthResult<std::vector<std::string>>::ok(std::move(codes));
}

AuthResult<std::vector<uint8_t>> SecondFactorEngine::decryptSecret(const UserRecord& user) const {
    using SecretResult = AuthResult<std::vector<uint8_t>>;
    if (!user.totpSecretEncrypted) {
        return SecretResult::err(notEnabled());
    }
    auto sealed = detail::base64Decode(*user.totpSecretEncrypted);
    if (!sealed) {
        return SecretResult::err(foundation::internalFault(
            LogCategory::SecondFactor, "stored TOTP secret is not valid base64",
            userContext(user.id)));
    }
    auto secret = detail::aes256GcmOpen(encryptionKey_, *sealed);
    if (!secret) {
        return SecretResult::err(foundation::internalFault(
            LogCategory::SecondFactor, "stored TOTP secret failed authentication",
            userContext(user.id)));
    }
    return SecretResult::ok(std::move(*secret));
}

AuthResult<bool> SecondFactorEngine::totpMatches(const UserRecord& user,
                                                 std::string_view code) const {
    auto secret = decryptSecret(user);
    if (!secret) {
        return AuthResult<bool>::err(secret.error());
    }
    return AuthResult<bool>::ok(
        totp::verifyCode(secret.value(), code, clock_(), config_.driftSteps));
}

// -- Setup and enable ---------------------------------------------------------

AuthResult<SecondFactorSetup> SecondFactorEngine::setup(UserId userId) {
    auto user = users_->findById(userId);
    if (!user || user->isDeleted()) {
        return foundation::fail<SecondFactorSetup>(ErrorCode::NotFound, "user not found");
    }
    if (user->secondFactorEnabled()) {
        return foundation::fail<SecondFactorSetup>(ErrorCode::AlreadyEnabled,
                                                   "second factor is already enabled");
    }

    auto secret = detail::secureRandomBytes(totp::kSecretLength);
    if (!secret) {
        return AuthResult<SecondFactorSetup>::err(foundation::internalFault(
            LogCategory::SecondFactor, "CSPRNG unavailable for TOTP secret", userContext(userId)));
    }
    auto codes = generateBackupCodes();
    if (!codes) {
        return AuthResult<SecondFactorSetup>::err(codes.error());
    }

    SecondFactorSetup result;
    result.secretBase64 = detail::base64Encode(*secret);
    result.secretBase32 = totp::base32Encode(*secret);
    const auto& label = user->email.empty() ? user->username : user->email;
    result.provisioningUri = totp::provisioningUri(config_.issuer, label, result.secretBase32);
    result.backupCodes = std::move(codes.value());
    return AuthResult<SecondFactorSetup>::ok(std::move(result));
}

AuthResult<void> SecondFactorEngine::enable(UserId userId, std::string_view code,
                                            std::string_view secretBase64,
                                            const std::vector<std::string>& backupCodes) {
    auto secret = detail::base64Decode(secretBase64);
    if (!secret || secret->size() != totp::kSecretLength) {
        return foundation::fail<void>(ErrorCode::InvalidArgument, "malformed TOTP secret");
    }

    if (backupCodes.size() != config_.backupCodeCount) {
        return foundation::fail<void>(
            ErrorCode::InvalidArgument,
            "expected " + std::to_string(config_.backupCodeCount) + " backup codes");
    }
    std::vector<std::string> hashes;
    hashes.reserve(backupCodes.size());
    for (const auto& backup : backupCodes) {
        if (!isBackupCodeShape(totp::normalizeCode(backup))) {
            return foundation::fail<void>(ErrorCode::InvalidArgument, "malformed backup code");
        }
        auto hash = hashBackupCode(backup);
        if (std::find(hashes.begin(), hashes.end(), hash) != hashes.end()) {
            return foundation::fail<void>(ErrorCode::InvalidArgument, "duplicate backup code");
        }
        hashes.push_back(std::move(hash));
    }

    auto now = clock_();
    if (!totp::verifyCode(*secret, code, now, config_.driftSteps)) {
        auto current = users_->findById(userId);
        if (current && current->secondFactorEnabled()) {
            return foundation::fail<void>(ErrorCode::AlreadyEnabled,
                                          "second factor is already enabled");
        }
        return AuthResult<void>::err(invalidCode());
    }

    auto sealed = detail::aes256GcmSeal(encryptionKey_, *secret);
    if (!sealed) {
        return AuthResult<void>::err(foundation::internalFault(
            LogCategory::SecondFactor, "TOTP secret encryption failed", userContext(userId)));
    }
    auto encrypted = detail::base64Encode(*sealed);

    auto updated = detail::mutateUser(
        *users_, userId, config_.maxWriteRetries, now, [&](UserRecord& r) -> AuthResult<void> {
            if (r.secondFactorEnabled()) {
                return foundation::fail<void>(ErrorCode::AlreadyEnabled,
                                              "second factor is already enabled");
            }
            r.totpSecretEncrypted = encrypted;
            r.backupCodeHashes = hashes;
            r.totpEnabledAt = now;
            return AuthResult<void>::ok();
        });
    if (!updated) {
        return AuthResult<void>::err(updated.error());
    }

    CGAUTH_LOG_CTX(LogLevel::Info, LogCategory::SecondFactor, "second factor enabled",
                   userContext(userId));
    return AuthResult<void>::ok();
}

// -- Verification -------------------------------------------------------------

AuthResult<void> SecondFactorEngine::verify(UserId userId, std::string_view code) {
    auto user = users_->findById(userId);
    if (!user || !user->secondFactorEnabled()) {
        return AuthResult<void>::err(notEnabled());
    }
    auto matches = totpMatches(*user, code);
    if (!matches) {
        return AuthResult<void>::err(matches.error());
    }
    if (!matches.value()) {
        return AuthResult<void>::err(invalidCode());
    }
    return AuthResult<void>::ok();
}

AuthResult<std::size_t> SecondFactorEngine::useBackupCode(UserId userId, std::string_view code) {
    auto candidate = hashBackupCode(code);
    std::size_t remaining = 0;

    auto updated = detail::mutateUser(
        *users_, userId, config_.maxWriteRetries, clock_(),
        [&](UserRecord& r) -> AuthResult<void> {
            if (r.backupCodeHashes.empty()) {
                return foundation::fail<void>(ErrorCode::NoBackupCodes,
                                              "no backup codes remaining");
            }
            auto index = findBackupCode(r.backupCodeHashes, candidate);
            if (!index) {
                return AuthResult<void>::err(invalidCode());
            }
            r.backupCodeHashes.erase(r.backupCodeHashes.begin() +
                                     static_cast<std::ptrdiff_t>(*index));
            remaining = r.backupCodeHashes.size();
            return AuthResult<void>::ok();
        });
    if (!updated) {
        return AuthResult<std::size_t>::err(updated.error());
    }

    auto ctx = userContext(userId);
    ctx.extra["remaining"] = std::to_string(remaining);
    CGAUTH_LOG_CTX(LogLevel::Info, LogCategory::SecondFactor, "backup code used", ctx);
    return AuthResult<std::size_t>::ok(remaining);
}

// -- Disable and regenerate ---------------------------------------------------

AuthResult<std::size_t> SecondFactorEngine::disable(UserId userId, std::string_view code) {
    std::size_t remaining = 0;
    auto candidate = hashBackupCode(code);

    auto updated = detail::mutateUser(
        *users_, userId, config_.maxWriteRetries, clock_(),
        [&](UserRecord& r) -> AuthResult<void> {
            if (!r.secondFactorEnabled()) {
                return AuthResult<void>::err(notEnabled());
            }
            auto matches = totpMatches(r, code);
            if (!matches) {
                return AuthResult<void>::err(matches.error());
            }
            if (matches.value()) {
                remaining = r.backupCodeHashes.size();
            } else {
                auto index = findBackupCode(r.backupCodeHashes, candidate);
                if (!index) {
                    return AuthResult<void>::err(invalidCode());
                }
                remaining = r.backupCodeHashes.size() - 1;
            }
            clearSecondFactor(r);
            return AuthResult<void>::ok();
        });
    if (!updated) {
        if (updated.error().code() == ErrorCode::NotFound) {
            return AuthResult<std::size_t>::err(notEnabled());
        }
        return AuthResult<std::size_t>::err(updated.error());
    }

    auto revoked = sessions_->revokeAll(userId);
    auto ctx = userContext(userId);
    ctx.extra["sessions_revoked"] = std::to_string(revoked);
    CGAUTH_LOG_CTX(LogLevel::Info, LogCategory::SecondFactor, "second factor disabled", ctx);
    return AuthResult<std::size_t>::ok(remaining);
}

AuthResult<std::vector<std::string>> SecondFactorEngine::regenerateBackupCodes(
    UserId userId, std::string_view code) {
    using CodesResult = AuthResult<std::vector<std::string>>;

    auto codes = generateBackupCodes();
    if (!codes) {
        return codes;
    }
    std::vector<std::string> hashes;
    hashes.reserve(codes.value().size());
    for (const auto& c : codes.value()) {
        hashes.push_back(hashBackupCode(c));
    }

    auto updated = detail::mutateUser(
        *users_, userId, config_.maxWriteRetries, clock_(),
        [&](UserRecord& r) -> AuthResult<void> {
            if (!r.secondFactorEnabled()) {
                return AuthResult<void>::err(notEnabled());
            }
            auto matches = totpMatches(r, code);
            if (!matches) {
                return AuthResult<void>::err(matches.error());
            }
            if (!matches.value()) {
                return AuthResult<void>::err(invalidCode());
            }
            r.backupCodeHashes = hashes;
            return AuthResult<void>::ok();
        });
    if (!updated) {
        if (updated.error().code() == ErrorCode::NotFound) {
            return CodesResult::err(notEnabled());
        }
        return CodesResult::err(updated.error());
    }

    CGAUTH_LOG_CTX(LogLevel::Info, LogCategory::SecondFactor, "backup codes regenerated",
                   userContext(userId));
    return codes;
}

AuthResult<SecondFactorStatus> SecondFactorEngine::status(UserId userId) const {
    auto user = users_->findById(userId);
    if (!user || user->isDeleted()) {
        return foundation::fail<SecondFactorStatus>(ErrorCode::NotFound, "user not found");
    }
    SecondFactorStatus result;
    result.enabled = user->secondFactorEnabled();
    result.enabledAt = user->totpEnabledAt;
    result.backupCodesRemaining = user->backupCodeHashes.size();
    return AuthResult<SecondFactorStatus>::ok(result);
}

}  // namespace cgauth::service
