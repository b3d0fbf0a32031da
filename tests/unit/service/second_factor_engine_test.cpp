#include <gtest/gtest.h>

#include "cgauth/service/second_factor_engine.hpp"
#include "cgauth/service/session_registry.hpp"
#include "cgauth/service/session_store.hpp"
#include "cgauth/service/totp.hpp"
#include "cgauth/service/user_repository.hpp"

#include "crypto_utils.hpp"
#include "support/auth_test_support.hpp"

#include <cctype>
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace cgauth::service;
using cgauth::foundation::ErrorCode;
using cgauth::test::ManualClock;
using namespace std::chrono_literals;

namespace {

/// base64 of the RFC 6238 test secret "12345678901234567890".
constexpr const char* kFixedSecret = "MTIzNDU2Nzg5MDEyMzQ1Njc4OTA=";

std::vector<std::string> fixedBackupCodes() {
    return {"AAAA-AAAB", "AAAA-AAAC", "AAAA-AAAD", "AAAA-AAAE", "AAAA-AAAF"};
}

}  // namespace

class SecondFactorEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        users_ = std::make_shared<InMemoryUserRepository>();
        sessions_ = std::make_shared<SessionRegistry>(
            SessionConfig{}, std::make_shared<InMemorySessionStore>(), clock_.clock());

        config_.issuer = "CGraph";
        config_.encryptionKey = "unit-test-encryption-key";
        config_.backupCodeCount = 5;
        engine_ = std::make_unique<SecondFactorEngine>(config_, users_, sessions_, clock_.clock());

        UserRecord record;
        record.username = "alice";
        record.email = "alice@example.com";
        userId_ = users_->create(record).value().id;
    }

    std::string codeFor(const std::string& secretBase64, int stepOffset = 0) {
        auto secret = detail::base64Decode(secretBase64);
        EXPECT_TRUE(secret.has_value());
        auto counter = static_cast<int64_t>(totp::counterAt(clock_.now())) + stepOffset;
        return totp::generateCode(*secret, static_cast<uint64_t>(counter));
    }

    /// Run setup + enable and return the setup material.
    SecondFactorSetup enableForUser() {
        auto setup = engine_->setup(userId_);
        EXPECT_TRUE(setup.hasValue());
        auto material = setup.value();
        auto enabled = engine_->enable(userId_, codeFor(material.secretBase64),
                                       material.secretBase64, material.backupCodes);
        EXPECT_TRUE(enabled.hasValue());
        return material;
    }

    ManualClock clock_;
    SecondFactorConfig config_;
    std::shared_ptr<InMemoryUserRepository> users_;
    std::shared_ptr<SessionRegistry> sessions_;
    std::unique_ptr<SecondFactorEngine> engine_;
    UserId userId_;
};

// ===========================================================================
// Configuration
// ===========================================================================

TEST(SecondFactorConfigTest, Validation) {
    SecondFactorConfig config;
    EXPECT_TRUE(SecondFactorEngine::validateConfig(config).hasError());
    config.encryptionKey = "k";
    EXPECT_TRUE(SecondFactorEngine::validateConfig(config).hasValue());
    config.backupCodeCount = 0;
    EXPECT_TRUE(SecondFactorEngine::validateConfig(config).hasError());
    config.backupCodeCount = 10;
    config.maxWriteRetries = 0;
    EXPECT_TRUE(SecondFactorEngine::validateConfig(config).hasError());
}

TEST(SecondFactorConfigTest, BackupCodeHashIgnoresFormatting) {
    EXPECT_EQ(SecondFactorEngine::hashBackupCode("abcd-efgh"),
              SecondFactorEngine::hashBackupCode("ABCDEFGH"));
    EXPECT_NE(SecondFactorEngine::hashBackupCode("ABCDEFGH"),
              SecondFactorEngine::hashBackupCode("ABCDEFGI"));
}

// ===========================================================================
// Setup
// ===========================================================================

TEST_F(SecondFactorEngineTest, SetupProducesMaterialWithoutPersisting) {
    auto setup = engine_->setup(userId_);
    ASSERT_TRUE(setup.hasValue());
    const auto& material = setup.value();

    auto secret = detail::base64Decode(material.secretBase64);
    ASSERT_TRUE(secret.has_value());
    EXPECT_EQ(secret->size(), totp::kSecretLength);
    EXPECT_EQ(material.secretBase32, totp::base32Encode(*secret));
    EXPECT_EQ(material.provisioningUri.rfind("otpauth://totp/CGraph:alice%40example.com?secret=", 0),
              0u);

    ASSERT_EQ(material.backupCodes.size(), 5u);
    std::set<std::string> unique(material.backupCodes.begin(), material.backupCodes.end());
    EXPECT_EQ(unique.size(), 5u);
    for (const auto& code : material.backupCodes) {
        ASSERT_EQ(code.size(), 9u);
        EXPECT_EQ(code[4], '-');
    }

    EXPECT_FALSE(users_->findById(userId_)->secondFactorEnabled());
}

TEST_F(SecondFactorEngineTest, SetupUnknownUser) {
    EXPECT_EQ(engine_->setup(UserId(999)).error().code(), ErrorCode::NotFound);
}

// ===========================================================================
// Enable
// ===========================================================================

TEST_F(SecondFactorEngineTest, EnableStoresEncryptedSecretAndHashes) {
    auto material = enableForUser();
    auto user = *users_->findById(userId_);

    ASSERT_TRUE(user.secondFactorEnabled());
    EXPECT_NE(*user.totpSecretEncrypted, material.secretBase64);
    EXPECT_EQ(user.totpEnabledAt, clock_.now());
    ASSERT_EQ(user.backupCodeHashes.size(), 5u);
    EXPECT_EQ(user.backupCodeHashes[0], SecondFactorEngine::hashBackupCode(material.backupCodes[0]));

    EXPECT_EQ(engine_->setup(userId_).error().code(), ErrorCode::AlreadyEnabled);
}

TEST_F(SecondFactorEngineTest, EnableRejectsWrongCode) {
    ASSERT_EQ(codeFor(kFixedSecret), "921300");
    auto result = engine_->enable(userId_, "000000", kFixedSecret, fixedBackupCodes());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidCode);
    EXPECT_FALSE(users_->findById(userId_)->secondFactorEnabled());
}

TEST_F(SecondFactorEngineTest, EnableAcceptsOneStepOfDrift) {
    ASSERT_EQ(codeFor(kFixedSecret, -1), "276857");
    EXPECT_TRUE(engine_->enable(userId_, "276857", kFixedSecret, fixedBackupCodes()).hasValue());
}

TEST_F(SecondFactorEngineTest, EnableAcceptsOneStepAhead) {
    ASSERT_EQ(codeFor(kFixedSecret, 1), "732303");
    EXPECT_TRUE(engine_->enable(userId_, "732303", kFixedSecret, fixedBackupCodes()).hasValue());
}

TEST_F(SecondFactorEngineTest, EnableRejectsTwoStepsOfDrift) {
    ASSERT_EQ(codeFor(kFixedSecret, -2), "713364");
    ASSERT_EQ(codeFor(kFixedSecret, 2), "136087");

    EXPECT_EQ(engine_->enable(userId_, "713364", kFixedSecret, fixedBackupCodes()).error().code(),
              ErrorCode::InvalidCode);
    EXPECT_EQ(engine_->enable(userId_, "136087", kFixedSecret, fixedBackupCodes()).error().code(),
              ErrorCode::InvalidCode);
    EXPECT_FALSE(users_->findById(userId_)->secondFactorEnabled());
}

TEST_F(SecondFactorEngineTest, EnableRejectsDuplicateBackupCodes) {
    auto codes = fixedBackupCodes();
    codes[4] = "aaaa-aaab";  // same code as codes[0] once normalized
    auto result = engine_->enable(userId_, codeFor(kFixedSecret), kFixedSecret, codes);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_FALSE(users_->findById(userId_)->secondFactorEnabled());
}

TEST_F(SecondFactorEngineTest, EnableRequiresConfiguredBackupCodeCount) {
    auto code = codeFor(kFixedSecret);
    EXPECT_EQ(engine_->enable(userId_, code, kFixedSecret, {}).error().code(),
              ErrorCode::InvalidArgument);

    auto tooFew = fixedBackupCodes();
    tooFew.pop_back();
    EXPECT_EQ(engine_->enable(userId_, code, kFixedSecret, tooFew).error().code(),
              ErrorCode::InvalidArgument);

    auto tooMany = fixedBackupCodes();
    tooMany.push_back("AAAA-AAAG");
    EXPECT_EQ(engine_->enable(userId_, code, kFixedSecret, tooMany).error().code(),
              ErrorCode::InvalidArgument);

    EXPECT_TRUE(engine_->enable(userId_, code, kFixedSecret, fixedBackupCodes()).hasValue());
}

TEST_F(SecondFactorEngineTest, EnableRejectsMalformedMaterial) {
    auto material = engine_->setup(userId_).value();
    auto code = codeFor(material.secretBase64);

    EXPECT_EQ(engine_->enable(userId_, code, "c2hvcnQ=", material.backupCodes).error().code(),
              ErrorCode::InvalidArgument);
    auto badShape = material.backupCodes;
    badShape[1] = "BAD";
    EXPECT_EQ(engine_->enable(userId_, code, material.secretBase64, badShape).error().code(),
              ErrorCode::InvalidArgument);
}

TEST_F(SecondFactorEngineTest, EnableTwiceReportsAlreadyEnabled) {
    auto material = enableForUser();
    auto again = engine_->enable(userId_, codeFor(material.secretBase64), material.secretBase64,
                                 material.backupCodes);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyEnabled);
}

// ===========================================================================
// Verify
// ===========================================================================

TEST_F(SecondFactorEngineTest, VerifyWithinDrift) {
    auto material = enableForUser();
    EXPECT_TRUE(engine_->verify(userId_, codeFor(material.secretBase64)).hasValue());
    EXPECT_TRUE(engine_->verify(userId_, codeFor(material.secretBase64, -1)).hasValue());
    EXPECT_TRUE(engine_->verify(userId_, codeFor(material.secretBase64, 1)).hasValue());
}

TEST_F(SecondFactorEngineTest, VerifyFailures) {
    EXPECT_EQ(engine_->verify(userId_, "921300").error().code(), ErrorCode::TotpNotEnabled);

    ASSERT_TRUE(engine_->enable(userId_, "921300", kFixedSecret, fixedBackupCodes()).hasValue());
    EXPECT_EQ(engine_->verify(userId_, "713364").error().code(), ErrorCode::InvalidCode);
    EXPECT_EQ(engine_->verify(userId_, "136087").error().code(), ErrorCode::InvalidCode);
    EXPECT_EQ(engine_->verify(userId_, "12345").error().code(), ErrorCode::InvalidCode);

    // Two steps later the code used at enable time is outside the window.
    clock_.advance(60s);
    EXPECT_EQ(engine_->verify(userId_, "921300").error().code(), ErrorCode::InvalidCode);
    EXPECT_TRUE(engine_->verify(userId_, "136087").hasValue());
}

// ===========================================================================
// Backup codes
// ===========================================================================

TEST_F(SecondFactorEngineTest, BackupCodeIsSingleUse) {
    auto material = enableForUser();
    auto first = engine_->useBackupCode(userId_, material.backupCodes[2]);
    ASSERT_TRUE(first.hasValue());
    EXPECT_EQ(first.value(), 4u);

    auto again = engine_->useBackupCode(userId_, material.backupCodes[2]);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::InvalidCode);
}

TEST_F(SecondFactorEngineTest, BackupCodeAcceptsLooseFormatting) {
    auto material = enableForUser();
    std::string loose = material.backupCodes[0];
    loose.erase(4, 1);
    for (auto& c : loose) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    EXPECT_TRUE(engine_->useBackupCode(userId_, loose).hasValue());
}

TEST_F(SecondFactorEngineTest, ExhaustedBackupCodes) {
    auto material = enableForUser();
    for (const auto& code : material.backupCodes) {
        ASSERT_TRUE(engine_->useBackupCode(userId_, code).hasValue());
    }
    EXPECT_EQ(engine_->useBackupCode(userId_, material.backupCodes[0]).error().code(),
              ErrorCode::NoBackupCodes);
}

TEST_F(SecondFactorEngineTest, RegenerateReplacesCodes) {
    auto material = enableForUser();
    auto fresh = engine_->regenerateBackupCodes(userId_, codeFor(material.secretBase64));
    ASSERT_TRUE(fresh.hasValue());
    EXPECT_EQ(fresh.value().size(), 5u);

    EXPECT_EQ(engine_->useBackupCode(userId_, material.backupCodes[0]).error().code(),
              ErrorCode::InvalidCode);
    EXPECT_TRUE(engine_->useBackupCode(userId_, fresh.value()[0]).hasValue());
}

TEST_F(SecondFactorEngineTest, RegenerateRequiresTotp) {
    EXPECT_EQ(engine_->regenerateBackupCodes(userId_, "123456").error().code(),
              ErrorCode::TotpNotEnabled);
    auto material = enableForUser();
    EXPECT_EQ(engine_->regenerateBackupCodes(userId_, material.backupCodes[0]).error().code(),
              ErrorCode::InvalidCode);
}

// ===========================================================================
// Disable and status
// ===========================================================================

TEST_F(SecondFactorEngineTest, DisableWithTotpRevokesSessions) {
    auto material = enableForUser();
    ASSERT_TRUE(sessions_->create(userId_, SessionContext{}).hasValue());

    auto remaining = engine_->disable(userId_, codeFor(material.secretBase64));
    ASSERT_TRUE(remaining.hasValue());
    EXPECT_EQ(remaining.value(), 5u);
    EXPECT_TRUE(sessions_->listActive(userId_).empty());

    auto user = *users_->findById(userId_);
    EXPECT_FALSE(user.secondFactorEnabled());
    EXPECT_TRUE(user.backupCodeHashes.empty());
    EXPECT_FALSE(user.totpEnabledAt.has_value());
}

TEST_F(SecondFactorEngineTest, DisableWithBackupCode) {
    auto material = enableForUser();
    auto remaining = engine_->disable(userId_, material.backupCodes[1]);
    ASSERT_TRUE(remaining.hasValue());
    EXPECT_EQ(remaining.value(), 4u);
}

TEST_F(SecondFactorEngineTest, DisableFailures) {
    EXPECT_EQ(engine_->disable(userId_, "123456").error().code(), ErrorCode::TotpNotEnabled);
    EXPECT_EQ(engine_->disable(UserId(999), "123456").error().code(), ErrorCode::TotpNotEnabled);

    enableForUser();
    EXPECT_EQ(engine_->disable(userId_, "ZZZZ-ZZZZ").error().code(), ErrorCode::InvalidCode);
    EXPECT_TRUE(users_->findById(userId_)->secondFactorEnabled());
}

TEST_F(SecondFactorEngineTest, Status) {
    auto before = engine_->status(userId_);
    ASSERT_TRUE(before.hasValue());
    EXPECT_FALSE(before.value().enabled);

    auto material = enableForUser();
    ASSERT_TRUE(engine_->useBackupCode(userId_, material.backupCodes[0]).hasValue());

    auto after = engine_->status(userId_);
    ASSERT_TRUE(after.hasValue());
    EXPECT_TRUE(after.value().enabled);
    EXPECT_EQ(after.value().enabledAt, clock_.now());
    EXPECT_EQ(after.value().backupCodesRemaining, 4u);

    EXPECT_EQ(engine_->status(UserId(999)).error().code(), ErrorCode::NotFound);
}

TEST_F(SecondFactorEngineTest, WrongEncryptionKeyCannotReadSecret) {
    auto material = enableForUser();
    auto otherConfig = config_;
    otherConfig.encryptionKey = "different-key";
    SecondFactorEngine other(otherConfig, users_, sessions_, clock_.clock());

    auto result = other.verify(userId_, codeFor(material.secretBase64));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InternalError);
}
