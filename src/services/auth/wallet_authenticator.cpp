/// @file wallet_authenticator.cpp
/// @brief WalletChallengeAuthenticator implementation.

#include "cgauth/service/wallet_authenticator.hpp"

#include "cgauth/foundation/auth_logger.hpp"
#include "cgauth/service/challenge_store.hpp"
#include "cgauth/service/user_repository.hpp"
#include "cgauth/service/wallet_crypto.hpp"

#include "crypto_utils.hpp"

namespace cgauth::service {

using cgauth::foundation::AuthError;
using cgauth::foundation::AuthResult;
using cgauth::foundation::ErrorCode;
using cgauth::foundation::LogCategory;
using cgauth::foundation::LogContext;
using cgauth::foundation::LogLevel;

namespace {

constexpr std::size_t kNonceBytes = 32;
constexpr std::size_t kUsernameHexChars = 8;
constexpr int kMaxUsernameAttempts = 100;

AuthError invalidSignature() {
    return AuthError(ErrorCode::InvalidSignature, "signature does not match wallet address");
}

LogContext walletContext(std::string_view address) {
    LogContext ctx;
    ctx.extra["wallet"] = std::string(address);
    return ctx;
}

}  // anonymous namespace

WalletChallengeAuthenticator::WalletChallengeAuthenticator(
    WalletConfig config, std::shared_ptr<IChallengeStore> challenges,
    std::shared_ptr<IUserRepository> users, foundation::Clock clock)
    : config_(std::move(config)),
      challenges_(std::move(challenges)),
      users_(std::move(users)),
      clock_(std::move(clock)) {}

std::string WalletChallengeAuthenticator::challengeMessage(std::string_view nonce) const {
    return wallet::challengeMessage(config_.appName, nonce);
}

std::size_t WalletChallengeAuthenticator::purgeExpiredChallenges() {
    return challenges_->purgeExpired(clock_(), config_.challengeTtl);
}

AuthResult<WalletChallenge> WalletChallengeAuthenticator::issueChallenge(
    std::string_view address) {
    auto normalized = wallet::normalizeAddress(address);
    if (!normalized) {
        return foundation::fail<WalletChallenge>(
            ErrorCode::InvalidArgument, "wallet address must be 0x followed by 40 hex digits");
    }

    auto nonceBytes = detail::secureRandomBytes(kNonceBytes);
    if (!nonceBytes) {
        return AuthResult<WalletChallenge>::err(foundation::internalFault(
            LogCategory::Wallet, "CSPRNG unavailable for wallet nonce"));
    }

    WalletChallenge candidate;
    candidate.address = *normalized;
    candidate.nonce = detail::toHex(nonceBytes->data(), nonceBytes->size());
    candidate.issuedAt = clock_();

    auto current = challenges_->findOrRotate(candidate, config_.challengeTtl);
    if (current.nonce == candidate.nonce) {
        CGAUTH_LOG_CTX(LogLevel::Debug, LogCategory::Wallet, "wallet challenge issued",
                       walletContext(current.address));
    }
    return AuthResult<WalletChallenge>::ok(std::move(current));
}

AuthResult<WalletVerification> WalletChallengeAuthenticator::verify(std::string_view address,
                                                                    std::string_view signature) {
    auto normalized = wallet::normalizeAddress(address);
    if (!normalized) {
        return AuthResult<WalletVerification>::err(invalidSignature());
    }

    auto challenge = challenges_->find(*normalized);
    if (!challenge) {
        return foundation::fail<WalletVerification>(ErrorCode::ChallengeNotFound,
                                                    "no pending challenge for wallet");
    }
    if (clock_() - challenge->issuedAt > config_.challengeTtl) {
        return foundation::fail<WalletVerification>(ErrorCode::ChallengeExpired,
                                                    "wallet challenge has expired");
    }

    auto parsed = wallet::parseSignature(signature);
    if (!parsed) {
        return AuthResult<WalletVerification>::err(invalidSignature());
    }
    auto digest = wallet::personalSignDigest(challengeMessage(challenge->nonce));
    if (!digest) {
        return AuthResult<WalletVerification>::err(
            foundation::internalFault(LogCategory::Wallet, "KECCAK-256 digest unavailable"));
    }
    auto recovered = wallet::recoverAddress(*digest, *parsed);
    if (!recovered || *recovered != *normalized) {
        CGAUTH_LOG_CTX(LogLevel::Debug, LogCategory::Wallet, "wallet signature rejected",
                       walletContext(*normalized));
        return AuthResult<WalletVerification>::err(invalidSignature());
    }

    if (!challenges_->consume(*normalized, challenge->nonce)) {
        return foundation::fail<WalletVerification>(ErrorCode::ChallengeNotFound,
                                                    "wallet challenge already used");
    }
    return resolveUser(*normalized);
}

AuthResult<WalletVerification> WalletChallengeAuthenticator::resolveUser(
    const std::string& address) {
    auto now = clock_();
    for (int attempt = 0; attempt < kMaxUsernameAttempts; ++attempt) {
        if (auto existing = users_->findByWalletAddress(address)) {
            if (existing->isDeleted()) {
                return foundation::fail<WalletVerification>(ErrorCode::InvalidCredentials,
                                                            "account is not active");
            }
            if (existing->isBannedAt(now)) {
                return foundation::fail<WalletVerification>(ErrorCode::AccountBanned,
                                                            "account is banned");
            }
            return AuthResult<WalletVerification>::ok({std::move(*existing), false});
        }

        // "0x" prefix skipped.
        std::string username = "wallet_" + address.substr(2, kUsernameHexChars);
        if (attempt > 0) {
            username += "_" + std::to_string(attempt + 1);
        }
        if (users_->findByUsername(username)) {
            continue;
        }

        UserRecord record;
        record.username = username;
        record.walletAddress = address;
        record.createdAt = now;
        record.updatedAt = now;

        auto created = users_->create(std::move(record));
        if (created) {
            auto ctx = walletContext(address);
            ctx.userId = created.value().id;
            CGAUTH_LOG_CTX(LogLevel::Info, LogCategory::Wallet, "wallet user provisioned", ctx);
            return AuthResult<WalletVerification>::ok({std::move(created.value()), true});
        }
        if (created.error().code() != ErrorCode::UserAlreadyExists) {
            return AuthResult<WalletVerification>::err(created.error());
        }
        // Lost a race on the username or the wallet; the next pass re-checks both.
    }
    return AuthResult<WalletVerification>::err(foundation::internalFault(
        LogCategory::Wallet, "no free username for wallet user", walletContext(address)));
}

}  // namespace cgauth::service
