/// @file totp.cpp
/// @brief TOTP code generation and verification.

#include "cgauth/service/totp.hpp"

#include "crypto_utils.hpp"

#include <cctype>
#include <string>

namespace cgauth::service::totp {

namespace {

/// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string percentEncode(std::string_view text) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '.' || c == '_' || c == '~') {
            out.push_back(c);
        } else {
            out.push_back('%');
            out.push_back(hex[(uc >> 4) & 0x0F]);
            out.push_back(hex[uc & 0x0F]);
        }
    }
    return out;
}

}  // anonymous namespace

std::string generateCode(const std::vector<uint8_t>& secret, uint64_t counter,
                         int digits) {
    uint8_t message[8];
    for (int i = 7; i >= 0; --i) {
        message[i] = static_cast<uint8_t>(counter & 0xFF);
        counter >>= 8;
    }
    auto mac = detail::hmacSha1(secret, message, sizeof(message));

    // Dynamic truncation (RFC 4226 section 5.3).
    auto offset = static_cast<std::size_t>(mac[19] & 0x0F);
    uint32_t binary = (static_cast<uint32_t>(mac[offset] & 0x7F) << 24) |
                      (static_cast<uint32_t>(mac[offset + 1]) << 16) |
                      (static_cast<uint32_t>(mac[offset + 2]) << 8) |
                      static_cast<uint32_t>(mac[offset + 3]);

    uint32_t modulus = 1;
    for (int i = 0; i < digits; ++i) {
        modulus *= 10;
    }
    auto value = std::to_string(binary % modulus);
    if (value.size() < static_cast<std::size_t>(digits)) {
        value.insert(0, static_cast<std::size_t>(digits) - value.size(), '0');
    }
    return value;
}

uint64_t counterAt(foundation::Timestamp at) {
    auto seconds = foundation::toUnixSeconds(at);
    return seconds < 0 ? 0 : static_cast<uint64_t>(seconds / kStepSeconds);
}

std::string normalizeCode(std::string_view code) {
    std::string out;
    out.reserve(code.size());
    for (char c : code) {
        if (c == ' ' || c == '-' || c == '\t') {
            continue;
        }
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

bool verifyCode(const std::vector<uint8_t>& secret, std::string_view code,
                foundation::Timestamp now, int driftSteps) {
    auto normalized = normalizeCode(code);
    if (normalized.size() != static_cast<std::size_t>(kDigits)) {
        return false;
    }
    for (char c : normalized) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    auto current = static_cast<int64_t>(counterAt(now));
    bool matched = false;
    // No early exit: every window in the drift range is compared.
    for (int64_t step = current - driftSteps; step <= current + driftSteps; ++step) {
        if (step < 0) {
            continue;
        }
        auto expected = generateCode(secret, static_cast<uint64_t>(step));
        if (detail::constantTimeEqual(expected, normalized)) {
            matched = true;
        }
    }
    return matched;
}

std::string base32Encode(const std::vector<uint8_t>& data) {
    return detail::base32Encode(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> base32Decode(std::string_view text) {
    return detail::base32Decode(text);
}

std::string provisioningUri(std::string_view issuer, std::string_view label,
                            std::string_view base32Secret) {
    auto encodedIssuer = percentEncode(issuer);
    std::string uri = "otpauth://totp/";
    uri += encodedIssuer;
    uri += ':';
    uri += percentEncode(label);
    uri += "?secret=";
    uri += base32Secret;
    uri += "&issuer=";
    uri += encodedIssuer;
    uri += "&algorithm=SHA1&digits=6&period=30";
    return uri;
}

}  // namespace cgauth::service::totp
