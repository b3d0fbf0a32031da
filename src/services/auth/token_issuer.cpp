/// @file token_issuer.cpp
/// @brief TokenIssuer implementation with HS256 and RS256 signing.

#include "cgauth/service/token_issuer.hpp"

#include "cgauth/foundation/auth_logger.hpp"
#include "cgauth/service/token_blacklist.hpp"
#include "cgauth/service/user_repository.hpp"

#include "crypto_utils.hpp"
#include "rsa_utils.hpp"

#include <charconv>
#include <sstream>
#include <string>
#include <vector>

namespace cgauth::service {

using cgauth::foundation::AuthError;
using cgauth::foundation::AuthResult;
using cgauth::foundation::ErrorCode;
using cgauth::foundation::LogCategory;
using cgauth::foundation::LogContext;
using cgauth::foundation::LogLevel;

// ---------------------------------------------------------------------------
// Minimal JSON helpers for the flat claim objects we produce
// ---------------------------------------------------------------------------
namespace {

constexpr std::string_view kHs256Header = R"({"alg":"HS256","typ":"JWT"})";
constexpr std::string_view kRs256Header = R"({"alg":"RS256","typ":"JWT"})";
constexpr std::size_t kMinHs256KeyLength = 32;

std::string jsonQuote(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    out.push_back('"');
    return out;
}

foundation::Timestamp fromEpoch(int64_t epoch) {
    return foundation::Timestamp(std::chrono::seconds(epoch));
}

/// Split a compact JWS into exactly three segments.
std::optional<std::vector<std::string_view>> splitCompact(std::string_view token) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = token.find('.', start);
        if (pos == std::string_view::npos) {
            parts.push_back(token.substr(start));
            break;
        }
        parts.push_back(token.substr(start, pos - start));
        start = pos + 1;
    }
    if (parts.size() != 3 || parts[0].empty() || parts[1].empty()) {
        return std::nullopt;
    }
    return parts;
}

std::optional<std::string> extractJsonString(std::string_view json, std::string_view key) {
    std::string needle = "\"" + std::string(key) + "\":\"";
    auto pos = json.find(needle);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    pos += needle.size();
    auto end = json.find('"', pos);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(json.substr(pos, end - pos));
}

std::optional<int64_t> extractJsonInt(std::string_view json, std::string_view key) {
    std::string needle = "\"" + std::string(key) + "\":";
    auto pos = json.find(needle);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    pos += needle.size();
    while (pos < json.size() && (json[pos] == ' ' || json[pos] == '\t')) {
        ++pos;
    }
    int64_t result = 0;
    auto [ptr, ec] = std::from_chars(json.data() + pos, json.data() + json.size(), result);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return result;
}

AuthResult<TokenClaims> malformed(std::string message) {
    return AuthResult<TokenClaims>::err(
        AuthError(ErrorCode::TokenMalformed, std::move(message)));
}

}  // anonymous namespace

std::optional<UserId> parseSubject(std::string_view subject) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(subject.data(), subject.data() + subject.size(), value);
    if (ec != std::errc{} || ptr != subject.data() + subject.size() || value == 0) {
        return std::nullopt;
    }
    return UserId(value);
}

// ---------------------------------------------------------------------------
// TokenIssuer
// ---------------------------------------------------------------------------

TokenIssuer::TokenIssuer(TokenConfig config,
                         std::shared_ptr<IUserRepository> users,
                         std::shared_ptr<TokenBlacklist> blacklist,
                         foundation::Clock clock)
    : config_(std::move(config)),
      users_(std::move(users)),
      blacklist_(std::move(blacklist)),
      clock_(std::move(clock)) {}

AuthResult<void> TokenIssuer::validateConfig(const TokenConfig& config) {
    if (config.accessTokenTtl.count() <= 0 || config.refreshTokenTtl.count() <= 0 ||
        config.secondFactorTokenTtl.count() <= 0) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::InvalidArgument, "token lifetimes must be positive"));
    }
    if (config.algorithm == JwtAlgorithm::HS256) {
        if (config.signingKey.size() < kMinHs256KeyLength) {
            return AuthResult<void>::err(
                AuthError(ErrorCode::InvalidArgument,
                          "HS256 signing key must be at least 32 bytes"));
        }
        return AuthResult<void>::ok();
    }
    if (!detail::loadPrivateKey(config.rsaPrivateKeyPem) ||
        !detail::loadPublicKey(config.rsaPublicKeyPem)) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::InvalidArgument, "RS256 key pair does not parse"));
    }
    return AuthResult<void>::ok();
}

AuthResult<std::string> TokenIssuer::sign(TokenType type, const Principal& principal,
                                          std::chrono::seconds ttl) const {
    const bool useRs256 = (config_.algorithm == JwtAlgorithm::RS256);
    auto encodedHeader = detail::base64urlEncode(useRs256 ? kRs256Header : kHs256Header);

    auto jtiBytes = detail::secureRandomBytes(16);
    if (!jtiBytes) {
        return AuthResult<std::string>::err(
            foundation::internalFault(LogCategory::Token, "CSPRNG unavailable for token id"));
    }

    auto now = clock_();
    std::ostringstream payload;
    payload << "{\"iss\":" << jsonQuote(config_.issuer)
            << ",\"sub\":" << jsonQuote(std::to_string(principal.id.value()))
            << ",\"typ\":" << jsonQuote(tokenTypeName(type))
            << ",\"jti\":" << jsonQuote(detail::toHex(jtiBytes->data(), jtiBytes->size()))
            << ",\"iat\":" << foundation::toUnixSeconds(now)
            << ",\"exp\":" << foundation::toUnixSeconds(now + ttl) << "}";

    std::string signingInput = encodedHeader + "." + detail::base64urlEncode(payload.str());

    if (useRs256) {
        auto sig = detail::rsaSha256Sign(config_.rsaPrivateKeyPem, signingInput);
        if (!sig) {
            return AuthResult<std::string>::err(
                foundation::internalFault(LogCategory::Token, "RS256 signing failed"));
        }
        return AuthResult<std::string>::ok(
            signingInput + "." + detail::base64urlEncode(sig->data(), sig->size()));
    }

    auto mac = detail::hmacSha256(config_.signingKey, signingInput);
    return AuthResult<std::string>::ok(
        signingInput + "." + detail::base64urlEncode(mac.data(), mac.size()));
}

AuthResult<TokenPair> TokenIssuer::mint(const Principal& principal) const {
    auto access = sign(TokenType::Access, principal, config_.accessTokenTtl);
    if (!access) {
        return AuthResult<TokenPair>::err(access.error());
    }
    auto refreshToken = sign(TokenType::Refresh, principal, config_.refreshTokenTtl);
    if (!refreshToken) {
        return AuthResult<TokenPair>::err(refreshToken.error());
    }

    TokenPair pair;
    pair.accessToken = std::move(access).value();
    pair.refreshToken = std::move(refreshToken).value();
    pair.accessExpiresIn = config_.accessTokenTtl;
    pair.refreshExpiresIn = config_.refreshTokenTtl;
    return AuthResult<TokenPair>::ok(std::move(pair));
}

AuthResult<TokenClaims> TokenIssuer::decode(std::string_view token) const {
    auto parts = splitCompact(token);
    if (!parts) {
        return malformed("malformed token: expected three segments");
    }
    const auto& segments = *parts;

    auto headerJson = detail::base64urlDecodeString(segments[0]);
    if (!headerJson) {
        return malformed("malformed token header encoding");
    }
    auto alg = extractJsonString(*headerJson, "alg");
    if (!alg) {
        return malformed("token header has no alg");
    }

    // Only the configured algorithm is accepted.
    const bool expectRs256 = (config_.algorithm == JwtAlgorithm::RS256);
    if (*alg != (expectRs256 ? "RS256" : "HS256")) {
        return malformed("unsupported token algorithm: " + *alg);
    }

    auto sigBytes = detail::base64urlDecode(segments[2]);
    if (!sigBytes || sigBytes->empty()) {
        return malformed("malformed token signature encoding");
    }

    std::string signingInput(token.substr(0, segments[0].size() + 1 + segments[1].size()));
    if (expectRs256) {
        if (!detail::rsaSha256Verify(config_.rsaPublicKeyPem, signingInput, *sigBytes)) {
            return AuthResult<TokenClaims>::err(
                AuthError(ErrorCode::InvalidToken, "invalid token signature"));
        }
    } else {
        auto expectedMac = detail::hmacSha256(config_.signingKey, signingInput);
        auto expectedSig = detail::base64urlEncode(expectedMac.data(), expectedMac.size());
        if (!detail::constantTimeEqual(expectedSig, segments[2])) {
            return AuthResult<TokenClaims>::err(
                AuthError(ErrorCode::InvalidToken, "invalid token signature"));
        }
    }

    auto payloadJson = detail::base64urlDecodeString(segments[1]);
    if (!payloadJson || payloadJson->empty() || payloadJson->front() != '{') {
        return malformed("malformed token payload");
    }

    auto sub = extractJsonString(*payloadJson, "sub");
    auto typ = extractJsonString(*payloadJson, "typ");
    auto jti = extractJsonString(*payloadJson, "jti");
    auto iat = extractJsonInt(*payloadJson, "iat");
    auto exp = extractJsonInt(*payloadJson, "exp");
    if (!sub || !typ || !jti || !iat || !exp) {
        return malformed("token is missing required claims");
    }

    TokenClaims claims;
    if (*typ == "access") {
        claims.type = TokenType::Access;
    } else if (*typ == "refresh") {
        claims.type = TokenType::Refresh;
    } else if (*typ == "second_factor") {
        claims.type = TokenType::SecondFactor;
    } else {
        return malformed("unknown token type: " + *typ);
    }
    claims.subject = std::move(*sub);
    claims.jti = std::move(*jti);
    claims.issuer = extractJsonString(*payloadJson, "iss").value_or("");
    claims.issuedAt = fromEpoch(*iat);
    claims.expiresAt = fromEpoch(*exp);

    if (clock_() >= claims.expiresAt) {
        return AuthResult<TokenClaims>::err(
            AuthError(ErrorCode::TokenExpired, "token has expired"));
    }
    return AuthResult<TokenClaims>::ok(std::move(claims));
}

AuthResult<TokenClaims> TokenIssuer::verify(std::string_view accessToken) const {
    auto claims = decode(accessToken);
    if (!claims) {
        return claims;
    }
    if (claims.value().type != TokenType::Access) {
        return AuthResult<TokenClaims>::err(
            AuthError(ErrorCode::TokenWrongType, "expected an access token"));
    }
    if (blacklist_ && blacklist_->isRevoked(claims.value().jti)) {
        return AuthResult<TokenClaims>::err(
            AuthError(ErrorCode::TokenRevoked, "token has been revoked"));
    }
    return claims;
}

AuthResult<TokenPair> TokenIssuer::refresh(std::string_view refreshToken) {
    auto decoded = decode(refreshToken);
    if (!decoded) {
        return AuthResult<TokenPair>::err(decoded.error());
    }
    const auto& claims = decoded.value();
    if (claims.type != TokenType::Refresh) {
        return AuthResult<TokenPair>::err(
            AuthError(ErrorCode::TokenWrongType, "expected a refresh token"));
    }

    auto userId = parseSubject(claims.subject);
    LogContext ctx;
    if (userId) {
        ctx.userId = *userId;
    }

    if (blacklist_ && blacklist_->isRevoked(claims.jti)) {
        CGAUTH_LOG_CTX(LogLevel::Warning, LogCategory::Token,
                       "refresh token reuse rejected", ctx);
        return AuthResult<TokenPair>::err(
            AuthError(ErrorCode::TokenRevoked, "refresh token already used"));
    }

    std::optional<UserRecord> user;
    if (userId) {
        user = users_->findById(*userId);
    }
    if (!user || user->isDeleted()) {
        return AuthResult<TokenPair>::err(
            AuthError(ErrorCode::InvalidToken, "token subject does not exist"));
    }
    if (user->isBannedAt(clock_())) {
        return AuthResult<TokenPair>::err(
            AuthError(ErrorCode::AccountBanned, "account is banned"));
    }

    // Whoever inserts the id first owns the rotation.
    if (blacklist_ && !blacklist_->revoke(claims.jti, claims.expiresAt)) {
        CGAUTH_LOG_CTX(LogLevel::Warning, LogCategory::Token,
                       "concurrent refresh token reuse rejected", ctx);
        return AuthResult<TokenPair>::err(
            AuthError(ErrorCode::TokenRevoked, "refresh token already used"));
    }

    Principal principal{user->id, user->username, user->secondFactorEnabled()};
    CGAUTH_LOG_CTX(LogLevel::Debug, LogCategory::Token, "refresh token rotated", ctx);
    return mint(principal);
}

AuthResult<std::string> TokenIssuer::mintSecondFactorToken(const Principal& principal) const {
    return sign(TokenType::SecondFactor, principal, config_.secondFactorTokenTtl);
}

AuthResult<TokenClaims> TokenIssuer::verifySecondFactorToken(std::string_view token) const {
    auto claims = decode(token);
    if (!claims) {
        return claims;
    }
    if (claims.value().type != TokenType::SecondFactor) {
        return AuthResult<TokenClaims>::err(
            AuthError(ErrorCode::TokenWrongType, "expected a second factor token"));
    }
    if (blacklist_ && blacklist_->isRevoked(claims.value().jti)) {
        return AuthResult<TokenClaims>::err(
            AuthError(ErrorCode::TokenRevoked, "second factor token already used"));
    }
    return claims;
}

AuthResult<void> TokenIssuer::consume(const TokenClaims& claims) {
    if (blacklist_ && !blacklist_->revoke(claims.jti, claims.expiresAt)) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::TokenRevoked, "token already used"));
    }
    return AuthResult<void>::ok();
}

AuthResult<void> TokenIssuer::revoke(std::string_view token) {
    auto claims = decode(token);
    if (!claims) {
        return AuthResult<void>::err(claims.error());
    }
    if (blacklist_) {
        blacklist_->revoke(claims.value().jti, claims.value().expiresAt);
    }
    return AuthResult<void>::ok();
}

}  // namespace cgauth::service
