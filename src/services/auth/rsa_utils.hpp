#pragma once

/// @file rsa_utils.hpp
/// @brief RSA-SHA256 signing and verification using the OpenSSL 3 EVP API.
///
/// Keys are loaded from PEM strings through memory BIOs; no file I/O.

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace cgauth::service::detail {

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

/// Parse a PEM private key; nullptr if it does not parse.
[[nodiscard]] inline PkeyPtr loadPrivateKey(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }
    return PkeyPtr(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
}

/// Parse a PEM SubjectPublicKeyInfo; nullptr if it does not parse.
[[nodiscard]] inline PkeyPtr loadPublicKey(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }
    return PkeyPtr(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
}

/// Sign @p message with RSA-SHA256.
/// @return Raw signature bytes, or std::nullopt on failure.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> rsaSha256Sign(
    std::string_view privateKeyPem, std::string_view message) {
    auto pkey = loadPrivateKey(privateKeyPem);
    MdCtxPtr mdCtx(EVP_MD_CTX_new());
    if (!pkey || !mdCtx) {
        return std::nullopt;
    }

    if (EVP_DigestSignInit(mdCtx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1 ||
        EVP_DigestSignUpdate(mdCtx.get(),
                             reinterpret_cast<const unsigned char*>(message.data()),
                             message.size()) != 1) {
        return std::nullopt;
    }

    std::size_t sigLen = 0;
    if (EVP_DigestSignFinal(mdCtx.get(), nullptr, &sigLen) != 1) {
        return std::nullopt;
    }
    std::vector<uint8_t> signature(sigLen);
    if (EVP_DigestSignFinal(mdCtx.get(), signature.data(), &sigLen) != 1) {
        return std::nullopt;
    }
    signature.resize(sigLen);
    return signature;
}

/// Verify an RSA-SHA256 signature.
[[nodiscard]] inline bool rsaSha256Verify(std::string_view publicKeyPem,
                                          std::string_view message,
                                          const std::vector<uint8_t>& signature) {
    auto pkey = loadPublicKey(publicKeyPem);
    MdCtxPtr mdCtx(EVP_MD_CTX_new());
    if (!pkey || !mdCtx) {
        return false;
    }

    if (EVP_DigestVerifyInit(mdCtx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1 ||
        EVP_DigestVerifyUpdate(mdCtx.get(),
                               reinterpret_cast<const unsigned char*>(message.data()),
                               message.size()) != 1) {
        return false;
    }
    return EVP_DigestVerifyFinal(mdCtx.get(), signature.data(), signature.size()) == 1;
}

}  // namespace cgauth::service::detail
