#pragma once

/// @file token_issuer.hpp
/// @brief JWT access/refresh token minting, verification and rotation.
///
/// Compact JWS (RFC 7519) signed with HS256 or RS256:
///   base64url(header) . base64url(payload) . base64url(signature)
/// Payload: {"iss":"cgraph","sub":"<id>","typ":"access|refresh|second_factor",
///           "jti":"<hex>","iat":N,"exp":N}

#include "cgauth/foundation/auth_result.hpp"
#include "cgauth/service/auth_types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cgauth::service {

class IUserRepository;
class TokenBlacklist;

/// Stateless token issuer. The signing configuration is fixed at
/// construction; the only mutable state is the shared refresh denylist.
///
/// Refresh tokens are single-use: refresh() denylists the presented token
/// id until its natural expiry, so a replay yields TokenRevoked.
///
/// Example:
/// @code
///   TokenConfig config;
///   config.signingKey = "0123456789abcdef0123456789abcdef";
///   TokenIssuer issuer(config, users, blacklist);
///   auto pair = issuer.mint(principal);
///   auto claims = issuer.verify(pair.value().accessToken);
/// @endcode
class TokenIssuer {
public:
    TokenIssuer(TokenConfig config,
                std::shared_ptr<IUserRepository> users,
                std::shared_ptr<TokenBlacklist> blacklist,
                foundation::Clock clock = foundation::systemClock());

    /// Check the configuration is usable: an HS256 key of at least 32
    /// bytes, or an RS256 key pair that parses.
    [[nodiscard]] static foundation::AuthResult<void> validateConfig(const TokenConfig& config);

    /// Mint an access + refresh pair for @p principal.
    [[nodiscard]] foundation::AuthResult<TokenPair> mint(const Principal& principal) const;

    /// Exchange a refresh token for a new pair, consuming the old one.
    [[nodiscard]] foundation::AuthResult<TokenPair> refresh(std::string_view refreshToken);

    /// Verify an access token and return its claims.
    [[nodiscard]] foundation::AuthResult<TokenClaims> verify(std::string_view accessToken) const;

    /// Mint the short-lived token that binds a passed first factor to the
    /// second factor step. It is accepted nowhere else.
    [[nodiscard]] foundation::AuthResult<std::string> mintSecondFactorToken(
        const Principal& principal) const;

    /// Verify a pending second factor token without consuming it.
    [[nodiscard]] foundation::AuthResult<TokenClaims> verifySecondFactorToken(
        std::string_view token) const;

    /// Denylist @p claims so the token is single-use. Fails with
    /// TokenRevoked if another caller consumed it first.
    [[nodiscard]] foundation::AuthResult<void> consume(const TokenClaims& claims);

    /// Denylist any valid token until it expires (logout).
    [[nodiscard]] foundation::AuthResult<void> revoke(std::string_view token);

    [[nodiscard]] const TokenConfig& config() const noexcept { return config_; }

private:
    /// Structure, algorithm, signature and expiry checks shared by every
    /// entry point.
    [[nodiscard]] foundation::AuthResult<TokenClaims> decode(std::string_view token) const;

    [[nodiscard]] foundation::AuthResult<std::string> sign(TokenType type,
                                                           const Principal& principal,
                                                           std::chrono::seconds ttl) const;

    TokenConfig config_;
    std::shared_ptr<IUserRepository> users_;
    std::shared_ptr<TokenBlacklist> blacklist_;
    foundation::Clock clock_;
};

/// Parse the numeric principal id carried in a token subject.
[[nodiscard]] std::optional<UserId> parseSubject(std::string_view subject);

}  // namespace cgauth::service
