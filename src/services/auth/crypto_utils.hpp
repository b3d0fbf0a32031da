#pragma once

/// @file crypto_utils.hpp
/// @brief Internal cryptographic helpers: digests, HMAC, AES-256-GCM,
///        secure randomness and the text encodings used on the wire.
///
/// Digest, MAC, cipher and RNG primitives come from OpenSSL; the encodings
/// are small portable routines.

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cgauth::service::detail {

using Bytes = std::vector<uint8_t>;

inline const uint8_t* asBytes(std::string_view s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

// =============================================================================
// Digests and MACs
// =============================================================================

[[nodiscard]] inline std::array<uint8_t, 32> sha256(const uint8_t* data, std::size_t length) {
    std::array<uint8_t, 32> digest{};
    unsigned int outLen = 0;
    EVP_Digest(data, length, digest.data(), &outLen, EVP_sha256(), nullptr);
    return digest;
}

[[nodiscard]] inline std::array<uint8_t, 32> sha256(std::string_view input) {
    return sha256(asBytes(input), input.size());
}

[[nodiscard]] inline std::array<uint8_t, 20> sha1(std::string_view input) {
    std::array<uint8_t, 20> digest{};
    unsigned int outLen = 0;
    EVP_Digest(input.data(), input.size(), digest.data(), &outLen, EVP_sha1(), nullptr);
    return digest;
}

/// Keccak-256 with the original Keccak padding, as Ethereum uses it (not
/// SHA3-256). Fetched from the OpenSSL 3.2+ default provider; nullopt if
/// the provider does not offer it.
[[nodiscard]] inline std::optional<std::array<uint8_t, 32>> keccak256(const uint8_t* data,
                                                                      std::size_t length) {
    using MdPtr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
    static const MdPtr md(EVP_MD_fetch(nullptr, "KECCAK-256", nullptr), &EVP_MD_free);
    if (!md) {
        return std::nullopt;
    }

    std::array<uint8_t, 32> digest{};
    unsigned int outLen = 0;
    if (EVP_Digest(data, length, digest.data(), &outLen, md.get(), nullptr) != 1 ||
        outLen != digest.size()) {
        return std::nullopt;
    }
    return digest;
}

[[nodiscard]] inline std::optional<std::array<uint8_t, 32>> keccak256(std::string_view input) {
    return keccak256(asBytes(input), input.size());
}

[[nodiscard]] inline std::array<uint8_t, 32> hmacSha256(std::string_view key,
                                                        std::string_view message) {
    std::array<uint8_t, 32> mac{};
    unsigned int outLen = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         asBytes(message), message.size(), mac.data(), &outLen);
    return mac;
}

[[nodiscard]] inline std::array<uint8_t, 20> hmacSha1(const Bytes& key,
                                                      const uint8_t* message,
                                                      std::size_t length) {
    std::array<uint8_t, 20> mac{};
    unsigned int outLen = 0;
    HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()),
         message, length, mac.data(), &outLen);
    return mac;
}

// =============================================================================
// Base64 / Base64URL (RFC 4648 sections 4 and 5)
// =============================================================================

namespace b64 {

inline constexpr char kStandard[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
inline constexpr char kUrlSafe[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

inline std::string encode(const uint8_t* data, std::size_t length,
                          const char* table, bool pad) {
    std::string result;
    result.reserve(((length + 2) / 3) * 4);

    for (std::size_t i = 0; i < length; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < length) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < length) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }

        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        if (i + 1 < length) {
            result.push_back(table[(n >> 6) & 0x3F]);
        } else if (pad) {
            result.push_back('=');
        }
        if (i + 2 < length) {
            result.push_back(table[n & 0x3F]);
        } else if (pad) {
            result.push_back('=');
        }
    }
    return result;
}

/// Decode; returns std::nullopt on any character outside @p table.
inline std::optional<Bytes> decode(std::string_view input, const char* table) {
    int lookup[256];
    std::fill(std::begin(lookup), std::end(lookup), -1);
    for (int i = 0; i < 64; ++i) {
        lookup[static_cast<unsigned char>(table[i])] = i;
    }

    Bytes result;
    result.reserve((input.size() * 3) / 4);

    uint32_t buf = 0;
    int bits = 0;
    std::size_t i = 0;
    for (; i < input.size(); ++i) {
        char c = input[i];
        if (c == '=') {
            break;
        }
        int val = lookup[static_cast<unsigned char>(c)];
        if (val < 0) {
            return std::nullopt;
        }
        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }
    for (; i < input.size(); ++i) {
        if (input[i] != '=') {
            return std::nullopt;
        }
    }
    return result;
}

}  // namespace b64

[[nodiscard]] inline std::string base64Encode(const uint8_t* data, std::size_t length) {
    return b64::encode(data, length, b64::kStandard, true);
}

[[nodiscard]] inline std::string base64Encode(const Bytes& data) {
    return base64Encode(data.data(), data.size());
}

[[nodiscard]] inline std::optional<Bytes> base64Decode(std::string_view input) {
    return b64::decode(input, b64::kStandard);
}

/// Encode bytes to base64url without padding.
[[nodiscard]] inline std::string base64urlEncode(const uint8_t* data, std::size_t length) {
    return b64::encode(data, length, b64::kUrlSafe, false);
}

[[nodiscard]] inline std::string base64urlEncode(std::string_view input) {
    return base64urlEncode(asBytes(input), input.size());
}

[[nodiscard]] inline std::optional<Bytes> base64urlDecode(std::string_view input) {
    return b64::decode(input, b64::kUrlSafe);
}

[[nodiscard]] inline std::optional<std::string> base64urlDecodeString(std::string_view input) {
    auto bytes = base64urlDecode(input);
    if (!bytes) {
        return std::nullopt;
    }
    return std::string(bytes->begin(), bytes->end());
}

/// base64url SHA-256 of @p input: the stored form of every bearer secret.
[[nodiscard]] inline std::string hashToken(std::string_view input) {
    auto digest = sha256(input);
    return base64urlEncode(digest.data(), digest.size());
}

// =============================================================================
// Hex
// =============================================================================

[[nodiscard]] inline std::string toHex(const uint8_t* data, std::size_t length,
                                       bool upper = false) {
    const char* hexChars = upper ? "0123456789ABCDEF" : "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(hexChars[(data[i] >> 4) & 0x0F]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

template <std::size_t N>
[[nodiscard]] std::string toHex(const std::array<uint8_t, N>& data, bool upper = false) {
    return toHex(data.data(), data.size(), upper);
}

inline int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

/// Decode an even-length hex string (either case).
[[nodiscard]] inline std::optional<Bytes> fromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

// =============================================================================
// Base32 (RFC 4648 section 6, no padding)
// =============================================================================

inline constexpr char kBase32Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

[[nodiscard]] inline std::string base32Encode(const uint8_t* data, std::size_t length) {
    std::string out;
    out.reserve((length * 8 + 4) / 5);
    uint32_t buf = 0;
    int bits = 0;
    for (std::size_t i = 0; i < length; ++i) {
        buf = (buf << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kBase32Alphabet[(buf >> bits) & 0x1F]);
        }
    }
    if (bits > 0) {
        out.push_back(kBase32Alphabet[(buf << (5 - bits)) & 0x1F]);
    }
    return out;
}

/// Decode base32, ignoring padding, spaces and letter case.
[[nodiscard]] inline std::optional<Bytes> base32Decode(std::string_view input) {
    Bytes out;
    uint32_t buf = 0;
    int bits = 0;
    for (char c : input) {
        if (c == '=' || c == ' ') {
            continue;
        }
        auto uc = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        int val = -1;
        if (uc >= 'A' && uc <= 'Z') {
            val = uc - 'A';
        } else if (uc >= '2' && uc <= '7') {
            val = uc - '2' + 26;
        }
        if (val < 0) {
            return std::nullopt;
        }
        buf = (buf << 5) | static_cast<uint32_t>(val);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }
    return out;
}

// =============================================================================
// Randomness and comparison
// =============================================================================

/// @p numBytes from the OpenSSL CSPRNG, or std::nullopt if it is unavailable.
[[nodiscard]] inline std::optional<Bytes> secureRandomBytes(std::size_t numBytes) {
    Bytes buf(numBytes);
    if (numBytes > 0 && RAND_bytes(buf.data(), static_cast<int>(numBytes)) != 1) {
        return std::nullopt;
    }
    return buf;
}

[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// =============================================================================
// AES-256-GCM
// =============================================================================

inline constexpr std::size_t kGcmIvLength = 16;
inline constexpr std::size_t kGcmTagLength = 16;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

/// Encrypt with a fresh random IV. Output layout: iv || tag || ciphertext.
[[nodiscard]] inline std::optional<Bytes> aes256GcmSeal(const std::array<uint8_t, 32>& key,
                                                        const Bytes& plaintext) {
    auto iv = secureRandomBytes(kGcmIvLength);
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!iv || !ctx) {
        return std::nullopt;
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(kGcmIvLength), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv->data()) != 1) {
        return std::nullopt;
    }

    Bytes ciphertext(plaintext.size() + 16);
    int outLen = 0;
    int total = 0;
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &outLen,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        return std::nullopt;
    }
    total = outLen;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &outLen) != 1) {
        return std::nullopt;
    }
    total += outLen;
    ciphertext.resize(static_cast<std::size_t>(total));

    std::array<uint8_t, kGcmTagLength> tag{};
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(kGcmTagLength), tag.data()) != 1) {
        return std::nullopt;
    }

    Bytes out;
    out.reserve(kGcmIvLength + kGcmTagLength + ciphertext.size());
    out.insert(out.end(), iv->begin(), iv->end());
    out.insert(out.end(), tag.begin(), tag.end());
    out.insert(out.end(), ciphertext.begin(), ciphertext.end());
    return out;
}

/// Decrypt iv || tag || ciphertext; std::nullopt on tag mismatch or bad layout.
[[nodiscard]] inline std::optional<Bytes> aes256GcmOpen(const std::array<uint8_t, 32>& key,
                                                        const Bytes& sealed) {
    if (sealed.size() < kGcmIvLength + kGcmTagLength) {
        return std::nullopt;
    }
    const uint8_t* iv = sealed.data();
    Bytes tag(sealed.begin() + kGcmIvLength,
              sealed.begin() + kGcmIvLength + kGcmTagLength);
    const uint8_t* ct = sealed.data() + kGcmIvLength + kGcmTagLength;
    auto ctLen = sealed.size() - kGcmIvLength - kGcmTagLength;

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::nullopt;
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(kGcmIvLength), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1) {
        return std::nullopt;
    }

    Bytes plaintext(ctLen + 16);
    int outLen = 0;
    int total = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &outLen, ct,
                          static_cast<int>(ctLen)) != 1) {
        return std::nullopt;
    }
    total = outLen;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(kGcmTagLength), tag.data()) != 1) {
        return std::nullopt;
    }
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &outLen) != 1) {
        return std::nullopt;
    }
    total += outLen;
    plaintext.resize(static_cast<std::size_t>(total));
    return plaintext;
}

}  // namespace cgauth::service::detail
