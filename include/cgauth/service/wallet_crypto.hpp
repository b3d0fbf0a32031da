#pragma once

/// @file wallet_crypto.hpp
/// @brief Ethereum personal-sign primitives: Keccak-256, message digest,
///        signature parsing and secp256k1 public key recovery.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cgauth::service::wallet {

/// Keccak-256 (Ethereum variant) of @p data. std::nullopt if the crypto
/// provider lacks the digest.
[[nodiscard]] std::optional<std::array<uint8_t, 32>> keccak256(std::string_view data);

/// Lowercase @p address and check it is "0x" followed by 40 hex digits.
[[nodiscard]] std::optional<std::string> normalizeAddress(std::string_view address);

/// The exact text a wallet is asked to sign for @p nonce.
[[nodiscard]] std::string challengeMessage(std::string_view appName,
                                           std::string_view nonce);

/// Keccak-256 of "\x19Ethereum Signed Message:\n" + len(message) + message.
[[nodiscard]] std::optional<std::array<uint8_t, 32>> personalSignDigest(
    std::string_view message);

/// 65-byte r || s || v signature split into its parts.
struct RecoverableSignature {
    std::array<uint8_t, 32> r{};
    std::array<uint8_t, 32> s{};
    int recoveryId = 0;  ///< 0 or 1.
};

/// Parse a hex signature with optional "0x" prefix.
///
/// Exactly 130 hex characters are required. v values of 27 and above are
/// shifted down by 27; anything other than 0 or 1 afterwards is rejected.
[[nodiscard]] std::optional<RecoverableSignature> parseSignature(std::string_view hex);

/// Recover the signer's address ("0x" + 40 lowercase hex) from a 32-byte
/// digest and signature. std::nullopt if no valid public key results.
[[nodiscard]] std::optional<std::string> recoverAddress(
    const std::array<uint8_t, 32>& digest, const RecoverableSignature& signature);

}  // namespace cgauth::service::wallet
