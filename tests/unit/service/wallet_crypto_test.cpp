#include <gtest/gtest.h>

#include "cgauth/service/wallet_crypto.hpp"

#include "crypto_utils.hpp"
#include "support/auth_test_support.hpp"

#include <string>

using namespace cgauth::service::wallet;
using cgauth::service::detail::toHex;
using cgauth::test::TestWallet;

namespace {

constexpr const char* kKnownKey =
    "4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318";
constexpr const char* kKnownAddress = "0x2c7536e3605d9c16a7a3d7b1898e529396a65c23";
constexpr const char* kKnownSignature =
    "0x55e96a2fc55e20e9753d229fcf0da8bd92b99fdd29c547f06c5c1db4ba8bac04"
    "1d5aa9d0eb516beda305b1fe809d0022350396f7993957136a895554c2be9d091b";

std::string nonce64() { return std::string(64, 'a'); }

}  // namespace

// ===========================================================================
// Address handling
// ===========================================================================

TEST(WalletCryptoTest, NormalizeAddressLowercases) {
    auto addr = normalizeAddress("0x2C7536E3605D9C16A7A3D7B1898E529396A65C23");
    ASSERT_TRUE(addr.has_value());
    EXPECT_EQ(*addr, kKnownAddress);
}

TEST(WalletCryptoTest, NormalizeAddressRejectsBadInput) {
    EXPECT_FALSE(normalizeAddress("").has_value());
    EXPECT_FALSE(normalizeAddress("2c7536e3605d9c16a7a3d7b1898e529396a65c23").has_value());
    EXPECT_FALSE(normalizeAddress("0x2c7536e3605d9c16a7a3d7b1898e529396a65c2").has_value());
    EXPECT_FALSE(normalizeAddress("0x2c7536e3605d9c16a7a3d7b1898e529396a65cz3").has_value());
}

TEST(WalletCryptoTest, AddressOfPrivateKeyOne) {
    TestWallet wallet(std::string(63, '0') + "1");
    EXPECT_EQ(wallet.address(), "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
}

// ===========================================================================
// Message format
// ===========================================================================

TEST(WalletCryptoTest, ChallengeMessageFormat) {
    auto msg = challengeMessage("CGraph", nonce64());
    EXPECT_EQ(msg, "Sign this message to authenticate with CGraph.\n\nNonce: " + nonce64());
    EXPECT_EQ(msg.size(), 119u);
}

TEST(WalletCryptoTest, PersonalSignDigestVector) {
    auto digest = personalSignDigest(challengeMessage("CGraph", nonce64())).value();
    EXPECT_EQ(toHex(digest),
              "f9195b767445e451c9588ec5b1a4a47b33189c1036b0e0f64429e7872402609b");
}

// ===========================================================================
// Signature parsing
// ===========================================================================

TEST(WalletCryptoTest, ParseSignatureAcceptsBothVForms) {
    auto sig = parseSignature(kKnownSignature);
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->recoveryId, 0);

    std::string raw = std::string(kKnownSignature).substr(2);
    raw.replace(128, 2, "01");
    auto low = parseSignature(raw);
    ASSERT_TRUE(low.has_value());
    EXPECT_EQ(low->recoveryId, 1);
}

TEST(WalletCryptoTest, ParseSignatureRejectsMalformed) {
    std::string good = kKnownSignature;
    EXPECT_FALSE(parseSignature("").has_value());
    EXPECT_FALSE(parseSignature(good.substr(0, good.size() - 2)).has_value());
    EXPECT_FALSE(parseSignature(good + "00").has_value());

    std::string badHex = good;
    badHex[10] = 'g';
    EXPECT_FALSE(parseSignature(badHex).has_value());

    std::string badV = good;
    badV.replace(badV.size() - 2, 2, "1d");
    EXPECT_FALSE(parseSignature(badV).has_value());
}

// ===========================================================================
// Recovery
// ===========================================================================

TEST(WalletCryptoTest, RecoverKnownSignature) {
    auto digest = personalSignDigest(challengeMessage("CGraph", nonce64())).value();
    auto sig = parseSignature(kKnownSignature);
    ASSERT_TRUE(sig.has_value());

    auto recovered = recoverAddress(digest, *sig);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, kKnownAddress);
}

TEST(WalletCryptoTest, RecoverFromDifferentMessageYieldsOtherAddress) {
    auto digest = personalSignDigest(challengeMessage("CGraph", std::string(64, 'b'))).value();
    auto sig = parseSignature(kKnownSignature);
    ASSERT_TRUE(sig.has_value());

    auto recovered = recoverAddress(digest, *sig);
    if (recovered) {
        EXPECT_NE(*recovered, kKnownAddress);
    }
}

TEST(WalletCryptoTest, RecoverRejectsZeroScalars) {
    auto digest = personalSignDigest("hello").value();
    RecoverableSignature sig;
    EXPECT_FALSE(recoverAddress(digest, sig).has_value());
}

TEST(WalletCryptoTest, SignedByTestWalletRecoversToItsAddress) {
    TestWallet wallet(kKnownKey);
    EXPECT_EQ(wallet.address(), kKnownAddress);

    auto message = challengeMessage("CGraph", std::string(64, 'c'));
    auto sig = parseSignature(wallet.sign(message));
    ASSERT_TRUE(sig.has_value());

    auto recovered = recoverAddress(personalSignDigest(message).value(), *sig);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, kKnownAddress);
}
