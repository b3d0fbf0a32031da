/// @file auth_flow_test.cpp
/// @brief End-to-end flows through AuthService: wallet provisioning,
///        second factor teardown, bans and password recovery.

#include <gtest/gtest.h>

#include "cgauth/foundation/error_code.hpp"
#include "cgauth/service/auth_service.hpp"
#include "cgauth/service/challenge_store.hpp"
#include "cgauth/service/password_hasher.hpp"
#include "cgauth/service/reset_token_store.hpp"
#include "cgauth/service/session_store.hpp"
#include "cgauth/service/token_issuer.hpp"
#include "cgauth/service/totp.hpp"
#include "cgauth/service/user_repository.hpp"

#include "crypto_utils.hpp"
#include "support/auth_test_support.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace cgauth::service;
using cgauth::foundation::ErrorCode;
using cgauth::test::ManualClock;
using cgauth::test::TestWallet;
using namespace std::chrono_literals;

// =============================================================================
// Fixture: AuthService over in-memory backends and a manual clock
// =============================================================================

class AuthFlowTest : public ::testing::Test {
protected:
    void SetUp() override {
        AuthConfig config;
        config.token.signingKey = "integration-test-key-at-least-32-bytes-long!";
        config.token.accessTokenTtl = 600s;
        config.token.refreshTokenTtl = 3600s;
        config.secondFactor.encryptionKey = "integration-encryption-key";
        config.secondFactor.backupCodeCount = 5;
        ASSERT_TRUE(AuthService::validateConfig(config).hasValue());

        users_ = std::make_shared<InMemoryUserRepository>();
        AuthBackends backends;
        backends.users = users_;
        backends.challenges = std::make_shared<InMemoryChallengeStore>();
        backends.sessions = std::make_shared<InMemorySessionStore>();
        backends.resetTokens = std::make_shared<InMemoryResetTokenStore>();
        backends.hasher = std::make_shared<PasswordHasher>(PasswordHasher::Cost::minimum());

        auth_ = std::make_unique<AuthService>(config, backends, clock_.clock());
    }

    std::string totpNow(const std::string& secretBase64) {
        auto secret = detail::base64Decode(secretBase64);
        return totp::generateCode(*secret, totp::counterAt(clock_.now()));
    }

    ManualClock clock_;
    std::shared_ptr<InMemoryUserRepository> users_;
    std::unique_ptr<AuthService> auth_;
};

// =============================================================================
// Wallet sign-in
// =============================================================================

TEST_F(AuthFlowTest, WalletSignInProvisionsUserAndMintsTokens) {
    TestWallet wallet("4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318");
    const std::string address = "0x2C7536E3605D9C16A7A3D7B1898E529396A65C23";

    auto challenge = auth_->issueChallenge(address);
    ASSERT_TRUE(challenge.hasValue());
    auto signature = wallet.sign(auth_->challengeMessage(challenge.value().nonce));

    auto login = auth_->login(WalletCredential{address, signature}, std::nullopt,
                              SessionContext{"wallet-app/1.0", "203.0.113.9, 10.0.0.1", "10.0.0.1"});
    ASSERT_TRUE(login.hasValue());
    const auto& result = login.value();

    auto stored = users_->findById(result.principal.id);
    ASSERT_TRUE(stored.has_value());
    ASSERT_TRUE(stored->walletAddress.has_value());
    EXPECT_EQ(*stored->walletAddress, wallet.address());
    EXPECT_EQ(stored->username, "wallet_2c7536e3");
    EXPECT_EQ(result.session.session.ipAddress, "203.0.113.9");

    auto claims = auth_->verifyAccessToken(result.tokens.accessToken);
    ASSERT_TRUE(claims.hasValue());
    auto subject = parseSubject(claims.value().subject);
    ASSERT_TRUE(subject.has_value());
    EXPECT_TRUE(*subject == result.principal.id);

    // The same signature cannot sign in twice.
    auto replay = auth_->login(WalletCredential{address, signature}, std::nullopt,
                               SessionContext{});
    ASSERT_TRUE(replay.hasError());
    EXPECT_EQ(replay.error().code(), ErrorCode::ChallengeNotFound);

    // A second challenge signs into the same account.
    auto next = auth_->issueChallenge(address).value();
    auto again = auth_->login(
        WalletCredential{address, wallet.sign(auth_->challengeMessage(next.nonce))},
        std::nullopt, SessionContext{});
    ASSERT_TRUE(again.hasValue());
    EXPECT_TRUE(again.value().principal.id == result.principal.id);
    EXPECT_EQ(users_->size(), 1u);
}

// =============================================================================
// Second factor teardown
// =============================================================================

TEST_F(AuthFlowTest, DisablingWithBackupCodeRevokesEverySession) {
    auto user = auth_->registerUser({"carol@example.com", "carol", "C4rol!secret"});
    ASSERT_TRUE(user.hasValue());
    auto id = user.value().id;

    auto setup = auth_->setupSecondFactor(id).value();
    ASSERT_EQ(setup.backupCodes.size(), 5u);
    ASSERT_TRUE(auth_->enableSecondFactor(id, totpNow(setup.secretBase64), setup.secretBase64,
                                          setup.backupCodes)
                    .hasValue());

    PasswordCredential credential{"carol@example.com", "C4rol!secret"};
    auto first = auth_->login(credential, totpNow(setup.secretBase64), SessionContext{});
    auto second = auth_->login(credential, totpNow(setup.secretBase64), SessionContext{});
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());
    ASSERT_EQ(auth_->listSessions(id).size(), 2u);

    auto remaining = auth_->disableSecondFactor(id, setup.backupCodes[3]);
    ASSERT_TRUE(remaining.hasValue());
    EXPECT_EQ(remaining.value(), 4u);

    EXPECT_TRUE(auth_->listSessions(id).empty());
    EXPECT_EQ(auth_->resolveSession(first.value().session.rawToken).error().code(),
              ErrorCode::SessionNotFound);

    auto status = auth_->secondFactorStatus(id).value();
    EXPECT_FALSE(status.enabled);
    EXPECT_EQ(status.backupCodesRemaining, 0u);

    // Password alone is enough again.
    EXPECT_TRUE(auth_->login(credential, std::nullopt, SessionContext{}).hasValue());
}

// =============================================================================
// Bans
// =============================================================================

TEST_F(AuthFlowTest, BannedUserLosesAllSessions) {
    auto user = auth_->registerUser({"dave@example.com", "dave", "D4ve!secret"});
    ASSERT_TRUE(user.hasValue());
    auto id = user.value().id;

    PasswordCredential credential{"dave@example.com", "D4ve!secret"};
    std::vector<LoginResult> logins;
    for (int i = 0; i < 3; ++i) {
        auto login = auth_->login(credential, std::nullopt,
                                  SessionContext{"device-" + std::to_string(i), {}, {}});
        ASSERT_TRUE(login.hasValue());
        logins.push_back(std::move(login.value()));
        clock_.advance(1s);
    }
    auto listed = auth_->listSessions(id);
    ASSERT_EQ(listed.size(), 3u);
    EXPECT_EQ(listed.front().userAgent, "device-2");

    auto revoked = auth_->banUser(id, "terms violation");
    ASSERT_TRUE(revoked.hasValue());
    EXPECT_EQ(revoked.value(), 3u);
    EXPECT_EQ(auth_->revokeAllSessions(id), 0u);
    EXPECT_TRUE(auth_->listSessions(id).empty());

    for (const auto& login : logins) {
        EXPECT_EQ(auth_->resolveSession(login.session.rawToken).error().code(),
                  ErrorCode::SessionNotFound);
    }
    EXPECT_EQ(auth_->refreshTokens(logins[0].tokens.refreshToken).error().code(),
              ErrorCode::AccountBanned);

    auto stored = users_->findById(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->banReason, "terms violation");
    EXPECT_FALSE(stored->bannedUntil.has_value());
}

// =============================================================================
// Password recovery
// =============================================================================

TEST_F(AuthFlowTest, PasswordRecoveryEndsOtherSessions) {
    auto user = auth_->registerUser({"erin@example.com", "erin", "Er1n!secret"});
    ASSERT_TRUE(user.hasValue());
    auto id = user.value().id;

    auto session = auth_->login(PasswordCredential{"erin@example.com", "Er1n!secret"},
                                std::nullopt, SessionContext{});
    ASSERT_TRUE(session.hasValue());

    auto token = auth_->requestPasswordReset("ERIN@example.com");
    ASSERT_TRUE(token.hasValue());
    ASSERT_TRUE(token.value().has_value());

    ASSERT_TRUE(auth_->resetPassword(*token.value(), "N3w!Er1nPass", "N3w!Er1nPass").hasValue());
    EXPECT_TRUE(auth_->listSessions(id).empty());
    EXPECT_EQ(auth_->login(PasswordCredential{"erin@example.com", "Er1n!secret"}, std::nullopt,
                           SessionContext{})
                  .error().code(),
              ErrorCode::InvalidCredentials);
    EXPECT_TRUE(auth_->login(PasswordCredential{"erin@example.com", "N3w!Er1nPass"},
                             std::nullopt, SessionContext{})
                    .hasValue());
}
