#pragma once

/// @file auth_types.hpp
/// @brief Records, token structures and configuration of the auth core.

#include "cgauth/foundation/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cgauth::service {

using cgauth::foundation::SessionId;
using cgauth::foundation::Timestamp;
using cgauth::foundation::UserId;

// -- User model ---------------------------------------------------------------

/// Persisted user account. Never hard-deleted; see deletedAt.
///
/// Email and wallet address are stored lowercase. The password hash is an
/// Argon2id encoded string; it is empty for wallet-only accounts.
struct UserRecord {
    UserId id;
    std::string username;
    std::string email;
    std::string passwordHash;
    std::optional<std::string> walletAddress;

    /// base64(iv || tag || ciphertext) of the TOTP secret.
    std::optional<std::string> totpSecretEncrypted;
    /// base64 SHA-256 of each normalized, unused backup code.
    std::vector<std::string> backupCodeHashes;
    std::optional<Timestamp> totpEnabledAt;

    std::optional<Timestamp> bannedAt;
    /// Absent with bannedAt set means a permanent ban.
    std::optional<Timestamp> bannedUntil;
    std::string banReason;
    std::optional<Timestamp> deletedAt;

    Timestamp createdAt{};
    Timestamp updatedAt{};

    /// Bumped by the repository on every successful write.
    uint64_t version = 0;

    [[nodiscard]] bool isDeleted() const noexcept { return deletedAt.has_value(); }

    [[nodiscard]] bool isBannedAt(Timestamp now) const noexcept {
        if (!bannedAt) {
            return false;
        }
        return !bannedUntil || *bannedUntil > now;
    }

    [[nodiscard]] bool secondFactorEnabled() const noexcept {
        return totpSecretEncrypted.has_value();
    }
};

/// Verified identity produced by an authenticator.
struct Principal {
    UserId id;
    std::string username;
    bool secondFactorEnabled = false;
};

// -- Tokens -------------------------------------------------------------------

enum class TokenType : uint8_t {
    Access,
    Refresh,
    SecondFactor  ///< Pending login: first factor passed, code still owed.
};

constexpr std::string_view tokenTypeName(TokenType type) {
    switch (type) {
        case TokenType::Access: return "access";
        case TokenType::Refresh: return "refresh";
        case TokenType::SecondFactor: return "second_factor";
    }
    return "unknown";
}

/// Decoded JWT claims.
struct TokenClaims {
    std::string subject;  ///< Principal id ("sub").
    TokenType type = TokenType::Access;
    std::string jti;
    std::string issuer;
    Timestamp issuedAt{};
    Timestamp expiresAt{};
};

/// Access + refresh token pair.
struct TokenPair {
    std::string accessToken;
    std::string refreshToken;
    std::chrono::seconds accessExpiresIn{};
    std::chrono::seconds refreshExpiresIn{};
};

// -- Sessions -----------------------------------------------------------------

/// Request metadata captured when a session is created.
struct SessionContext {
    std::string userAgent;
    /// Raw X-Forwarded-For header, if the request carried one.
    std::optional<std::string> forwardedFor;
    /// Address of the peer socket.
    std::optional<std::string> remoteAddress;
};

/// Persisted session. The raw token is never stored, only its hash.
struct SessionRecord {
    SessionId id;
    UserId userId;
    std::string tokenHash;
    std::string userAgent;
    std::string ipAddress;
    Timestamp createdAt{};
    Timestamp lastActiveAt{};
    Timestamp expiresAt{};
    std::optional<Timestamp> revokedAt;

    [[nodiscard]] bool isActiveAt(Timestamp now) const noexcept {
        return !revokedAt && expiresAt > now;
    }
};

/// A freshly created session together with the raw bearer token.
/// The raw token is handed to the client once and never persisted.
struct IssuedSession {
    SessionRecord session;
    std::string rawToken;
};

// -- Wallet challenges --------------------------------------------------------

struct WalletChallenge {
    std::string address;  ///< Lowercase "0x" + 40 hex.
    std::string nonce;    ///< 64 lowercase hex characters.
    Timestamp issuedAt{};
};

// -- Password reset -----------------------------------------------------------

struct PasswordResetRecord {
    std::string tokenHash;
    UserId userId;
    Timestamp createdAt{};
    Timestamp expiresAt{};
};

// -- Second factor ------------------------------------------------------------

/// Material returned by a setup call. Nothing is persisted at this stage.
struct SecondFactorSetup {
    std::string secretBase64;
    std::string secretBase32;
    std::string provisioningUri;
    std::vector<std::string> backupCodes;
};

struct SecondFactorStatus {
    bool enabled = false;
    std::optional<Timestamp> enabledAt;
    std::size_t backupCodesRemaining = 0;
};

// -- Configuration ------------------------------------------------------------

enum class JwtAlgorithm : uint8_t {
    HS256,  ///< HMAC-SHA256 with a shared secret.
    RS256   ///< RSA-SHA256 with a PEM key pair.
};

/// Immutable signing configuration handed to TokenIssuer.
struct TokenConfig {
    JwtAlgorithm algorithm = JwtAlgorithm::HS256;
    std::string signingKey;
    std::string rsaPrivateKeyPem;
    std::string rsaPublicKeyPem;
    std::string issuer = "cgraph";
    std::chrono::seconds accessTokenTtl{900};
    std::chrono::seconds refreshTokenTtl{2592000};
    /// Lifetime of the pending token handed out between the two factors.
    std::chrono::seconds secondFactorTokenTtl{300};
    std::chrono::seconds blacklistCleanupInterval{300};
};

enum class BreachPolicy : uint8_t {
    Disabled,
    Background,  ///< Check after registration, log findings only.
    Reject       ///< Check before registration, refuse breached passwords.
};

struct BreachCheckConfig {
    BreachPolicy policy = BreachPolicy::Disabled;
    /// Minimum breach count that counts as a finding.
    uint64_t threshold = 1;
    std::chrono::milliseconds timeout{2000};
    /// HTTPS range service queried as GET /range/<prefix>.
    std::string host = "api.pwnedpasswords.com";
    std::string port = "443";
    /// Minimum interval between two logged findings for the same user.
    std::chrono::seconds findingLogCooldown{3600};
};

struct PasswordConfig {
    uint32_t minPasswordLength = 8;
    std::chrono::seconds resetTokenTtl{3600};
    std::chrono::seconds resetResendCooldown{60};
};

struct WalletConfig {
    std::string appName = "CGraph";
    std::chrono::seconds challengeTtl{300};
};

struct SecondFactorConfig {
    std::string issuer = "CGraph";
    /// Key material for the at-rest encryption of TOTP secrets.
    std::string encryptionKey;
    std::size_t backupCodeCount = 10;
    /// Accepted clock drift in 30 second steps on each side.
    int driftSteps = 1;
    /// Attempts at an optimistic-concurrency write before giving up.
    int maxWriteRetries = 5;
    /// Codes accepted against one pending login token before it is burned.
    uint32_t maxLoginAttempts = 5;
};

struct SessionConfig {
    std::chrono::seconds ttl{30 * 24 * 3600};
};

/// Aggregate configuration of the auth core.
struct AuthConfig {
    TokenConfig token;
    PasswordConfig password;
    BreachCheckConfig breach;
    WalletConfig wallet;
    SecondFactorConfig secondFactor;
    SessionConfig session;
};

}  // namespace cgauth::service
