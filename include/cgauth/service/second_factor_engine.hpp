#pragma once

/// @file second_factor_engine.hpp
/// @brief TOTP second factor with single-use backup codes.

#include "cgauth/foundation/auth_result.hpp"
#include "cgauth/service/auth_types.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cgauth::service {

class IUserRepository;
class SessionRegistry;

/// Second factor lifecycle: disabled -> pending setup -> enabled -> disabled.
///
/// Secrets are kept encrypted (AES-256-GCM) on the user record and backup
/// codes only as hashes. Every write goes through compareAndUpdate on the
/// record version, so a backup code can be spent at most once even under
/// concurrent requests.
class SecondFactorEngine {
public:
    SecondFactorEngine(SecondFactorConfig config,
                       std::shared_ptr<IUserRepository> users,
                       std::shared_ptr<SessionRegistry> sessions,
                       foundation::Clock clock = foundation::systemClock());

    /// Check that the configuration can be used to construct an engine.
    [[nodiscard]] static foundation::AuthResult<void> validateConfig(
        const SecondFactorConfig& config);

    /// Generate a fresh secret, provisioning URI and backup codes.
    /// Nothing is persisted until enable().
    [[nodiscard]] foundation::AuthResult<SecondFactorSetup> setup(UserId userId);

    /// Persist @p secretBase64 and @p backupCodes once @p code proves the
    /// authenticator app was configured with that secret.
    [[nodiscard]] foundation::AuthResult<void> enable(UserId userId, std::string_view code,
                                                      std::string_view secretBase64,
                                                      const std::vector<std::string>& backupCodes);

    [[nodiscard]] foundation::AuthResult<void> verify(UserId userId, std::string_view code);

    /// Turn the second factor off with a TOTP code or an unused backup code
    /// and revoke every session of the user.
    ///
    /// @return Backup codes that were left before the set was cleared.
    [[nodiscard]] foundation::AuthResult<std::size_t> disable(UserId userId,
                                                              std::string_view code);

    /// Replace the backup code set. Requires a valid TOTP code.
    [[nodiscard]] foundation::AuthResult<std::vector<std::string>> regenerateBackupCodes(
        UserId userId, std::string_view code);

    /// Spend one backup code. @return Codes remaining afterwards.
    [[nodiscard]] foundation::AuthResult<std::size_t> useBackupCode(UserId userId,
                                                                    std::string_view code);

    [[nodiscard]] foundation::AuthResult<SecondFactorStatus> status(UserId userId) const;

    /// base64 SHA-256 of the normalized (uppercase, no separators) code.
    [[nodiscard]] static std::string hashBackupCode(std::string_view code);

private:
    foundation::AuthResult<std::vector<std::string>> generateBackupCodes() const;
    foundation::AuthResult<std::vector<uint8_t>> decryptSecret(const UserRecord& user) const;
    foundation::AuthResult<bool> totpMatches(const UserRecord& user, std::string_view code) const;

    SecondFactorConfig config_;
    std::shared_ptr<IUserRepository> users_;
    std::shared_ptr<SessionRegistry> sessions_;
    foundation::Clock clock_;
    std::array<uint8_t, 32> encryptionKey_{};
};

}  // namespace cgauth::service
