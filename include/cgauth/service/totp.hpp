#pragma once

/// @file totp.hpp
/// @brief RFC 6238 time-based one-time codes (HMAC-SHA1, 30 s, 6 digits).

#include "cgauth/foundation/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cgauth::service::totp {

inline constexpr int kDigits = 6;
inline constexpr int64_t kStepSeconds = 30;
inline constexpr std::size_t kSecretLength = 20;

/// RFC 4226 HOTP value of @p secret at @p counter, zero-padded.
[[nodiscard]] std::string generateCode(const std::vector<uint8_t>& secret,
                                       uint64_t counter, int digits = kDigits);

/// Time step containing @p at.
[[nodiscard]] uint64_t counterAt(foundation::Timestamp at);

/// True if @p code matches any step within +/- @p driftSteps of @p now.
/// Spaces and dashes inside @p code are ignored.
[[nodiscard]] bool verifyCode(const std::vector<uint8_t>& secret,
                              std::string_view code,
                              foundation::Timestamp now,
                              int driftSteps = 1);

/// Uppercase @p code and drop spaces and dashes.
[[nodiscard]] std::string normalizeCode(std::string_view code);

[[nodiscard]] std::string base32Encode(const std::vector<uint8_t>& data);
[[nodiscard]] std::optional<std::vector<uint8_t>> base32Decode(std::string_view text);

/// otpauth:// URI understood by authenticator apps.
[[nodiscard]] std::string provisioningUri(std::string_view issuer,
                                          std::string_view label,
                                          std::string_view base32Secret);

}  // namespace cgauth::service::totp
