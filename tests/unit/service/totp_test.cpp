#include <gtest/gtest.h>

#include "cgauth/service/totp.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace cgauth::service::totp;
using cgauth::foundation::Timestamp;

namespace {

std::vector<uint8_t> rfcSecret() {
    std::string ascii = "12345678901234567890";
    return {ascii.begin(), ascii.end()};
}

Timestamp at(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

}  // namespace

// ---------------------------------------------------------------------------
// Code generation (RFC 6238 appendix B, SHA1)
// ---------------------------------------------------------------------------

TEST(TotpTest, Rfc6238EightDigitVectors) {
    auto secret = rfcSecret();
    EXPECT_EQ(generateCode(secret, counterAt(at(59)), 8), "94287082");
    EXPECT_EQ(generateCode(secret, counterAt(at(1111111109)), 8), "07081804");
    EXPECT_EQ(generateCode(secret, counterAt(at(1234567890)), 8), "89005924");
}

TEST(TotpTest, SixDigitCodeIsSuffix) {
    EXPECT_EQ(generateCode(rfcSecret(), 1), "287082");
    EXPECT_EQ(generateCode(rfcSecret(), counterAt(at(1111111109))), "081804");
}

TEST(TotpTest, CounterAt) {
    EXPECT_EQ(counterAt(at(0)), 0u);
    EXPECT_EQ(counterAt(at(29)), 0u);
    EXPECT_EQ(counterAt(at(30)), 1u);
    EXPECT_EQ(counterAt(at(59)), 1u);
}

// ---------------------------------------------------------------------------
// Verification
// ---------------------------------------------------------------------------

TEST(TotpTest, VerifyCurrentStep) {
    EXPECT_TRUE(verifyCode(rfcSecret(), "287082", at(59)));
    EXPECT_TRUE(verifyCode(rfcSecret(), "287 082", at(59)));
    EXPECT_TRUE(verifyCode(rfcSecret(), "287-082", at(59)));
}

TEST(TotpTest, VerifyToleratesOneStepOfDrift) {
    auto secret = rfcSecret();
    auto code = generateCode(secret, 100);
    EXPECT_TRUE(verifyCode(secret, code, at(99 * 30)));
    EXPECT_TRUE(verifyCode(secret, code, at(101 * 30)));
    EXPECT_FALSE(verifyCode(secret, code, at(102 * 30)));
    EXPECT_FALSE(verifyCode(secret, code, at(101 * 30), 0));
}

TEST(TotpTest, VerifyRejectsMalformedCodes) {
    auto secret = rfcSecret();
    EXPECT_FALSE(verifyCode(secret, "", at(59)));
    EXPECT_FALSE(verifyCode(secret, "28708", at(59)));
    EXPECT_FALSE(verifyCode(secret, "2870822", at(59)));
    EXPECT_FALSE(verifyCode(secret, "28708a", at(59)));
}

TEST(TotpTest, NormalizeCode) {
    EXPECT_EQ(normalizeCode("ab cd-ef"), "ABCDEF");
    EXPECT_EQ(normalizeCode("  "), "");
}

// ---------------------------------------------------------------------------
// Encoding and provisioning
// ---------------------------------------------------------------------------

TEST(TotpTest, Base32OfRfcSecret) {
    EXPECT_EQ(base32Encode(rfcSecret()), "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ");
    auto decoded = base32Decode("gezdgnbvgy3tqojqgezdgnbvgy3tqojq");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, rfcSecret());
}

TEST(TotpTest, ProvisioningUriEscapesLabel) {
    auto uri = provisioningUri("CGraph", "alice@example.com", "GEZDGNBV");
    EXPECT_EQ(uri,
              "otpauth://totp/CGraph:alice%40example.com?secret=GEZDGNBV"
              "&issuer=CGraph&algorithm=SHA1&digits=6&period=30");
}
