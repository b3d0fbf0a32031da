#include <gtest/gtest.h>

#include "cgauth/core/result.hpp"
#include "cgauth/foundation/auth_error.hpp"
#include "cgauth/foundation/auth_result.hpp"
#include "cgauth/foundation/error_code.hpp"

#include <string>

using namespace cgauth::foundation;

// ===========================================================================
// ErrorCode metadata
// ===========================================================================

TEST(ErrorCodeTest, SubsystemFromRange) {
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidCredentials), "Auth");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidSignature), "Wallet");
    EXPECT_EQ(errorSubsystem(ErrorCode::NoBackupCodes), "SecondFactor");
    EXPECT_EQ(errorSubsystem(ErrorCode::TokenRevoked), "Token");
    EXPECT_EQ(errorSubsystem(ErrorCode::SessionNotFound), "Session");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobNotFound), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::StoreConflict), "Storage");
}

TEST(ErrorCodeTest, KindsAreSnakeCase) {
    EXPECT_EQ(errorKind(ErrorCode::InvalidCredentials), "invalid_credentials");
    EXPECT_EQ(errorKind(ErrorCode::ChallengeNotFound), "challenge_not_found");
    EXPECT_EQ(errorKind(ErrorCode::SecondFactorRequired), "second_factor_required");
}

// ===========================================================================
// AuthError
// ===========================================================================

TEST(AuthErrorTest, DefaultIsUnknown) {
    AuthError error;
    EXPECT_FALSE(error.isSuccess());
    EXPECT_EQ(error.code(), ErrorCode::Unknown);
    EXPECT_TRUE(error.correlationId().empty());
}

TEST(AuthErrorTest, CarriesCodeMessageAndCorrelationId) {
    AuthError error(ErrorCode::InternalError, "internal error (ref abc)", "abc");
    EXPECT_FALSE(error.isSuccess());
    EXPECT_EQ(error.message(), "internal error (ref abc)");
    EXPECT_EQ(error.correlationId(), "abc");
    EXPECT_EQ(error.subsystem(), "General");
}

// ===========================================================================
// Result
// ===========================================================================

TEST(ResultTest, OkHoldsValue) {
    auto r = AuthResult<int>::ok(42);
    ASSERT_TRUE(r.hasValue());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, ErrHoldsError) {
    auto r = fail<int>(ErrorCode::NotFound, "missing");
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::NotFound);
    EXPECT_EQ(r.valueOr(7), 7);
}

TEST(ResultTest, VoidResult) {
    auto ok = AuthResult<void>::ok();
    EXPECT_TRUE(ok.hasValue());

    auto bad = fail<void>(ErrorCode::InvalidCode, "nope");
    EXPECT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().kind(), "invalid_code");
}

TEST(ResultTest, AndThenChainsAndShortCircuits) {
    auto doubled = AuthResult<int>::ok(21).andThen(
        [](int v) { return AuthResult<std::string>::ok(std::to_string(v * 2)); });
    ASSERT_TRUE(doubled.hasValue());
    EXPECT_EQ(doubled.value(), "42");

    bool called = false;
    auto skipped = fail<int>(ErrorCode::TokenExpired, "expired").andThen([&](int v) {
        called = true;
        return AuthResult<int>::ok(v);
    });
    EXPECT_FALSE(called);
    ASSERT_TRUE(skipped.hasError());
    EXPECT_EQ(skipped.error().code(), ErrorCode::TokenExpired);
}

TEST(ResultTest, MapTransformsValueOnly) {
    auto length = AuthResult<std::string>::ok("abcd").map(
        [](std::string s) { return s.size(); });
    ASSERT_TRUE(length.hasValue());
    EXPECT_EQ(length.value(), 4u);

    auto failed = fail<std::string>(ErrorCode::NotFound, "gone").map(
        [](std::string s) { return s.size(); });
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().message(), "gone");
}
