/// @file password_hasher.cpp
/// @brief PasswordHasher implementation on libsodium crypto_pwhash.

#include "cgauth/service/password_hasher.hpp"

#include "cgauth/foundation/auth_logger.hpp"

#include <sodium.h>

#include <string>

namespace cgauth::service {

using cgauth::foundation::AuthResult;
using cgauth::foundation::LogCategory;

PasswordHasher::Cost PasswordHasher::Cost::interactive() {
    return {crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE};
}

PasswordHasher::Cost PasswordHasher::Cost::minimum() {
    return {crypto_pwhash_OPSLIMIT_MIN, crypto_pwhash_MEMLIMIT_MIN};
}

PasswordHasher::PasswordHasher(Cost cost) : cost_(cost) {
    // sodium_init() is idempotent: 0 on first success, 1 if already done.
    if (sodium_init() < 0) {
        CGAUTH_LOG_ERROR(LogCategory::Password, "libsodium initialisation failed");
        return;
    }
    ready_ = true;

    unsigned char seed[16];
    randombytes_buf(seed, sizeof(seed));
    auto reference = hash(std::string(reinterpret_cast<const char*>(seed), sizeof(seed)));
    if (reference.hasValue()) {
        referenceHash_ = std::move(reference).value();
    }
}

AuthResult<std::string> PasswordHasher::hash(std::string_view password) const {
    if (!ready_) {
        return AuthResult<std::string>::err(
            foundation::internalFault(LogCategory::Password,
                                      "password hashing requested without libsodium"));
    }
    char out[crypto_pwhash_STRBYTES];
    if (crypto_pwhash_str(out, password.data(), password.size(),
                          cost_.opsLimit, cost_.memLimit) != 0) {
        return AuthResult<std::string>::err(
            foundation::internalFault(LogCategory::Password,
                                      "crypto_pwhash_str failed (likely out of memory)"));
    }
    return AuthResult<std::string>::ok(std::string(out));
}

bool PasswordHasher::verify(std::string_view password, std::string_view encoded) const {
    if (!ready_ || encoded.empty() || encoded.size() >= crypto_pwhash_STRBYTES) {
        return false;
    }
    std::string stored(encoded);
    return crypto_pwhash_str_verify(stored.c_str(), password.data(), password.size()) == 0;
}

void PasswordHasher::dummyVerify(std::string_view password) const {
    if (referenceHash_.empty()) {
        return;
    }
    // Result intentionally unused: only the work matters.
    (void)verify(password, referenceHash_);
}

bool PasswordHasher::needsRehash(std::string_view encoded) const {
    if (encoded.empty() || encoded.size() >= crypto_pwhash_STRBYTES) {
        return true;
    }
    std::string stored(encoded);
    return crypto_pwhash_str_needs_rehash(stored.c_str(), cost_.opsLimit,
                                          cost_.memLimit) != 0;
}

}  // namespace cgauth::service
