#pragma once

/// @file credentials.hpp
/// @brief Closed set of credentials accepted by AuthService.

#include "cgauth/service/auth_types.hpp"

#include <string>
#include <variant>

namespace cgauth::service {

/// Email and password.
struct PasswordCredential {
    std::string email;
    std::string password;
};

/// Wallet address and a 65-byte r||s||v signature (hex) over the pending
/// challenge message.
struct WalletCredential {
    std::string address;
    std::string signature;
};

/// TOTP or backup code, bound to the pending token that
/// AuthService::beginSecondFactor issued after the first factor.
struct SecondFactorCredential {
    std::string pendingToken;
    std::string code;
};

using Credential = std::variant<PasswordCredential, WalletCredential, SecondFactorCredential>;

}  // namespace cgauth::service
