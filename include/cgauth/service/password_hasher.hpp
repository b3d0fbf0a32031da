#pragma once

/// @file password_hasher.hpp
/// @brief Argon2id password hashing via libsodium.

#include "cgauth/foundation/auth_result.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace cgauth::service {

/// Argon2id hashing producing self-describing encoded strings
/// ("$argon2id$v=19$m=...,t=...,p=1$salt$hash").
///
/// Also owns a reference hash of the same cost so that logins for unknown
/// accounts can burn the same CPU and memory as a real verification.
///
/// Example:
/// @code
///   PasswordHasher hasher;
///   auto encoded = hasher.hash("Secr3t!pass");
///   bool ok = hasher.verify("Secr3t!pass", encoded.value());
/// @endcode
class PasswordHasher {
public:
    /// Argon2id work factors.
    struct Cost {
        unsigned long long opsLimit;
        std::size_t memLimit;

        /// libsodium's interactive profile.
        static Cost interactive();
        /// Smallest permitted cost; for tests only.
        static Cost minimum();
    };

    explicit PasswordHasher(Cost cost = Cost::interactive());
    virtual ~PasswordHasher() = default;

    /// Hash @p password with a fresh random salt.
    /// InternalError if libsodium is unavailable or out of memory.
    [[nodiscard]] foundation::AuthResult<std::string> hash(std::string_view password) const;

    /// Verify @p password against an encoded hash. Malformed or empty
    /// hashes never verify.
    [[nodiscard]] virtual bool verify(std::string_view password,
                                      std::string_view encoded) const;

    /// Verification against the internal reference hash; result discarded.
    virtual void dummyVerify(std::string_view password) const;

    /// True if @p encoded was produced with different work factors.
    [[nodiscard]] bool needsRehash(std::string_view encoded) const;

private:
    Cost cost_;
    bool ready_ = false;
    std::string referenceHash_;
};

}  // namespace cgauth::service
