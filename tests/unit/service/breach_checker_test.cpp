#include <gtest/gtest.h>

#include "cgauth/service/breach_checker.hpp"

#include "support/auth_test_support.hpp"
#include "support/mock_logger.hpp"

#include <memory>

using namespace cgauth::service;
using cgauth::test::FakeBreachClient;
using cgauth::test::ScopedMockLogger;

namespace {

BreachCheckConfig thresholdOf(uint64_t threshold) {
    BreachCheckConfig config;
    config.policy = BreachPolicy::Reject;
    config.threshold = threshold;
    return config;
}

}  // namespace

// ===========================================================================
// Range body parsing
// ===========================================================================

TEST(BreachCheckerParseTest, Sha1HexIsUppercase) {
    EXPECT_EQ(BreachChecker::sha1Hex("password"), "5BAA61E4C9B93F3F0682250B6CF8331B7EE68FD8");
}

TEST(BreachCheckerParseTest, FindsSuffixInCrlfBody) {
    std::string body =
        "0018A45C4D1DEF81644B54AB7F969B88D65:1\r\n"
        "1E4C9B93F3F0682250B6CF8331B7EE68FD8:3861493\r\n"
        "011053FD0102E94D6AE2F8B83D76FAF94F6:12\r\n";
    EXPECT_EQ(BreachChecker::findSuffixCount(body, "1E4C9B93F3F0682250B6CF8331B7EE68FD8"),
              3861493u);
    EXPECT_EQ(BreachChecker::findSuffixCount(body, "011053FD0102E94D6AE2F8B83D76FAF94F6"), 12u);
}

TEST(BreachCheckerParseTest, FindsSuffixInLfBodyIgnoringCase) {
    std::string body = "abcdef:7\nABCDEF0:9";
    EXPECT_EQ(BreachChecker::findSuffixCount(body, "ABCDEF"), 7u);
    EXPECT_EQ(BreachChecker::findSuffixCount(body, "abcdef0"), 9u);
}

TEST(BreachCheckerParseTest, MissingOrGarbledEntriesCountZero) {
    EXPECT_EQ(BreachChecker::findSuffixCount("", "ABC"), 0u);
    EXPECT_EQ(BreachChecker::findSuffixCount("ABD:4\r\n", "ABC"), 0u);
    EXPECT_EQ(BreachChecker::findSuffixCount("ABC:x\r\n", "ABC"), 0u);
    EXPECT_EQ(BreachChecker::findSuffixCount("no colon here", "ABC"), 0u);
}

// ===========================================================================
// Lookups through the client
// ===========================================================================

TEST(BreachCheckerTest, OnlyPrefixLeavesProcess) {
    auto client = std::make_shared<FakeBreachClient>();
    client->addPassword("password", 42);
    BreachChecker checker(thresholdOf(1), client);

    auto count = checker.breachCount("password");
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 42u);
    EXPECT_EQ(client->lastPrefix(), "5BAA6");
    EXPECT_EQ(client->requests(), 1u);
}

TEST(BreachCheckerTest, UnknownPasswordCountsZero) {
    auto client = std::make_shared<FakeBreachClient>();
    client->addPassword("password", 42);
    BreachChecker checker(thresholdOf(1), client);

    auto count = checker.breachCount("Un1que!phrase-x");
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 0u);
}

TEST(BreachCheckerTest, UnavailableServiceFailsOpenAndLogs) {
    ScopedMockLogger mock;
    auto client = std::make_shared<FakeBreachClient>();
    client->setUnavailable(true);
    BreachChecker checker(thresholdOf(1), client);

    EXPECT_FALSE(checker.breachCount("password").has_value());
    EXPECT_TRUE(mock->contains("breach range service unavailable"));
}

TEST(BreachCheckerTest, NoClientMeansUnavailable) {
    BreachChecker checker(thresholdOf(1), nullptr);
    EXPECT_FALSE(checker.breachCount("password").has_value());
}

TEST(BreachCheckerTest, Threshold) {
    BreachChecker checker(thresholdOf(10), nullptr);
    EXPECT_FALSE(checker.exceedsThreshold(0));
    EXPECT_FALSE(checker.exceedsThreshold(9));
    EXPECT_TRUE(checker.exceedsThreshold(10));

    BreachChecker zero(thresholdOf(0), nullptr);
    EXPECT_FALSE(zero.exceedsThreshold(0));
    EXPECT_TRUE(zero.exceedsThreshold(1));
}
