/// @file wallet_crypto.cpp
/// @brief secp256k1 recovery on OpenSSL EC/BN and the personal-sign format.

#include "cgauth/service/wallet_crypto.hpp"

#include "crypto_utils.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace cgauth::service::wallet {

namespace {

struct BnDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};
struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
struct GroupDeleter {
    void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};
struct PointDeleter {
    void operator()(EC_POINT* point) const { EC_POINT_free(point); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

BnPtr toBignum(const std::array<uint8_t, 32>& bytes) {
    return BnPtr(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
}

/// 1 <= value < order
bool inScalarRange(const BIGNUM* value, const BIGNUM* order) {
    return !BN_is_zero(value) && !BN_is_negative(value) && BN_cmp(value, order) < 0;
}

}  // anonymous namespace

std::optional<std::array<uint8_t, 32>> keccak256(std::string_view data) {
    return detail::keccak256(data);
}

std::optional<std::string> normalizeAddress(std::string_view address) {
    if (address.size() != 42 || address[0] != '0' ||
        (address[1] != 'x' && address[1] != 'X')) {
        return std::nullopt;
    }
    std::string out = "0x";
    out.reserve(42);
    for (char c : address.substr(2)) {
        if (detail::hexValue(c) < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string challengeMessage(std::string_view appName, std::string_view nonce) {
    std::string msg = "Sign this message to authenticate with ";
    msg += appName;
    msg += ".\n\nNonce: ";
    msg += nonce;
    return msg;
}

std::optional<std::array<uint8_t, 32>> personalSignDigest(std::string_view message) {
    std::string prefixed = "\x19" "Ethereum Signed Message:\n";
    prefixed += std::to_string(message.size());
    prefixed += message;
    return detail::keccak256(prefixed);
}

std::optional<RecoverableSignature> parseSignature(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 130) {
        return std::nullopt;
    }
    auto bytes = detail::fromHex(hex);
    if (!bytes) {
        return std::nullopt;
    }

    RecoverableSignature sig;
    std::copy(bytes->begin(), bytes->begin() + 32, sig.r.begin());
    std::copy(bytes->begin() + 32, bytes->begin() + 64, sig.s.begin());
    int v = (*bytes)[64];
    if (v >= 27) {
        v -= 27;
    }
    if (v != 0 && v != 1) {
        return std::nullopt;
    }
    sig.recoveryId = v;
    return sig;
}

// ---------------------------------------------------------------------------
// recoverAddress()
//
// R = (r, y) with y parity taken from the recovery id, then
// Q = r^-1 * (s*R - e*G) = (-e * r^-1) * G + (s * r^-1) * R.
// ---------------------------------------------------------------------------
std::optional<std::string> recoverAddress(const std::array<uint8_t, 32>& digest,
                                          const RecoverableSignature& signature) {
    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    BnCtxPtr ctx(BN_CTX_new());
    if (!group || !ctx) {
        return std::nullopt;
    }

    const BIGNUM* order = EC_GROUP_get0_order(group.get());
    auto r = toBignum(signature.r);
    auto s = toBignum(signature.s);
    auto e = toBignum(digest);
    if (!order || !r || !s || !e) {
        return std::nullopt;
    }
    if (!inScalarRange(r.get(), order) || !inScalarRange(s.get(), order)) {
        return std::nullopt;
    }

    PointPtr rPoint(EC_POINT_new(group.get()));
    if (!rPoint ||
        EC_POINT_set_compressed_coordinates(group.get(), rPoint.get(), r.get(),
                                            signature.recoveryId, ctx.get()) != 1 ||
        EC_POINT_is_on_curve(group.get(), rPoint.get(), ctx.get()) != 1) {
        return std::nullopt;
    }

    BnPtr rInv(BN_new());
    BnPtr u1(BN_new());
    BnPtr u2(BN_new());
    BnPtr zero(BN_new());
    if (!rInv || !u1 || !u2 || !zero) {
        return std::nullopt;
    }
    BN_zero(zero.get());
    if (!BN_mod_inverse(rInv.get(), r.get(), order, ctx.get()) ||
        BN_mod_sub(u1.get(), zero.get(), e.get(), order, ctx.get()) != 1 ||
        BN_mod_mul(u1.get(), u1.get(), rInv.get(), order, ctx.get()) != 1 ||
        BN_mod_mul(u2.get(), s.get(), rInv.get(), order, ctx.get()) != 1) {
        return std::nullopt;
    }

    PointPtr q(EC_POINT_new(group.get()));
    if (!q ||
        EC_POINT_mul(group.get(), q.get(), u1.get(), rPoint.get(), u2.get(),
                     ctx.get()) != 1 ||
        EC_POINT_is_at_infinity(group.get(), q.get()) == 1) {
        return std::nullopt;
    }

    std::array<uint8_t, 65> encoded{};
    auto len = EC_POINT_point2oct(group.get(), q.get(), POINT_CONVERSION_UNCOMPRESSED,
                                  encoded.data(), encoded.size(), ctx.get());
    if (len != encoded.size()) {
        return std::nullopt;
    }

    // Address: last 20 bytes of Keccak-256 over X || Y (without the 0x04 tag).
    auto hash = detail::keccak256(encoded.data() + 1, 64);
    if (!hash) {
        return std::nullopt;
    }
    return "0x" + detail::toHex(hash->data() + 12, 20);
}

}  // namespace cgauth::service::wallet
