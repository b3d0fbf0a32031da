#pragma once

/// @file auth_test_support.hpp
/// @brief Manual clock, wallet signer and fakes shared by the auth tests.

#include "cgauth/foundation/types.hpp"
#include "cgauth/service/breach_checker.hpp"
#include "cgauth/service/user_repository.hpp"
#include "cgauth/service/wallet_crypto.hpp"

#include "crypto_utils.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace cgauth::test {

// ---------------------------------------------------------------------------
// ManualClock
// ---------------------------------------------------------------------------

/// Clock that only moves when told to. Copies share the same time.
class ManualClock {
public:
    explicit ManualClock(std::chrono::seconds sinceEpoch = std::chrono::seconds(1'700'000'000))
        : state_(std::make_shared<State>()) {
        state_->now = foundation::Timestamp(sinceEpoch);
    }

    [[nodiscard]] foundation::Clock clock() const {
        auto state = state_;
        return [state]() {
            std::lock_guard lock(state->mutex);
            return state->now;
        };
    }

    [[nodiscard]] foundation::Timestamp now() const {
        std::lock_guard lock(state_->mutex);
        return state_->now;
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        std::lock_guard lock(state_->mutex);
        state_->now += std::chrono::duration_cast<foundation::Timestamp::duration>(delta);
    }

private:
    struct State {
        std::mutex mutex;
        foundation::Timestamp now;
    };
    std::shared_ptr<State> state_;
};

// ---------------------------------------------------------------------------
// TestWallet: secp256k1 key that produces personal-sign signatures
// ---------------------------------------------------------------------------

class TestWallet {
public:
    /// @param privateKeyHex 64 hex characters.
    explicit TestWallet(std::string privateKeyHex) : privateKeyHex_(std::move(privateKeyHex)) {}

    /// Lowercase "0x" address of the key.
    [[nodiscard]] std::string address() const {
        Ctx c;
        auto d = priv();
        PointPtr pub(EC_POINT_new(c.group.get()));
        if (!pub || EC_POINT_mul(c.group.get(), pub.get(), d.get(), nullptr, nullptr,
                                 c.bn.get()) != 1) {
            throw std::runtime_error("public key derivation failed");
        }
        std::array<uint8_t, 65> encoded{};
        EC_POINT_point2oct(c.group.get(), pub.get(), POINT_CONVERSION_UNCOMPRESSED,
                           encoded.data(), encoded.size(), c.bn.get());
        auto hash = service::wallet::keccak256(std::string_view(
            reinterpret_cast<const char*>(encoded.data() + 1), 64)).value();
        return "0x" + service::detail::toHex(hash.data() + 12, 20);
    }

    /// 0x-prefixed r || s || v (v = 27 + recovery id) over the personal-sign
    /// digest of @p message.
    [[nodiscard]] std::string sign(std::string_view message) const {
        Ctx c;
        auto digest = service::wallet::personalSignDigest(message).value();
        const BIGNUM* n = EC_GROUP_get0_order(c.group.get());
        auto d = priv();
        BnPtr e(BN_bin2bn(digest.data(), static_cast<int>(digest.size()), nullptr));

        for (;;) {
            BnPtr k(BN_new());
            BnPtr x(BN_new());
            BnPtr y(BN_new());
            BnPtr r(BN_new());
            BnPtr s(BN_new());
            BnPtr kInv(BN_new());
            PointPtr rPoint(EC_POINT_new(c.group.get()));

            if (BN_priv_rand_range(k.get(), n) != 1 || BN_is_zero(k.get())) {
                continue;
            }
            EC_POINT_mul(c.group.get(), rPoint.get(), k.get(), nullptr, nullptr, c.bn.get());
            EC_POINT_get_affine_coordinates(c.group.get(), rPoint.get(), x.get(), y.get(),
                                            c.bn.get());
            if (BN_cmp(x.get(), n) >= 0) {
                continue;
            }
            BN_copy(r.get(), x.get());
            if (BN_is_zero(r.get())) {
                continue;
            }

            // s = k^-1 * (e + r*d) mod n
            BN_mod_mul(s.get(), r.get(), d.get(), n, c.bn.get());
            BN_mod_add(s.get(), s.get(), e.get(), n, c.bn.get());
            BN_mod_inverse(kInv.get(), k.get(), n, c.bn.get());
            BN_mod_mul(s.get(), s.get(), kInv.get(), n, c.bn.get());
            if (BN_is_zero(s.get())) {
                continue;
            }

            std::array<uint8_t, 65> sig{};
            BN_bn2binpad(r.get(), sig.data(), 32);
            BN_bn2binpad(s.get(), sig.data() + 32, 32);
            sig[64] = static_cast<uint8_t>(27 + (BN_is_odd(y.get()) ? 1 : 0));
            return "0x" + service::detail::toHex(sig.data(), sig.size());
        }
    }

private:
    struct BnDeleter {
        void operator()(BIGNUM* bn) const { BN_free(bn); }
    };
    struct BnCtxDeleter {
        void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
    };
    struct GroupDeleter {
        void operator()(EC_GROUP* g) const { EC_GROUP_free(g); }
    };
    struct PointDeleter {
        void operator()(EC_POINT* p) const { EC_POINT_free(p); }
    };
    using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
    using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

    struct Ctx {
        std::unique_ptr<EC_GROUP, GroupDeleter> group{EC_GROUP_new_by_curve_name(NID_secp256k1)};
        std::unique_ptr<BN_CTX, BnCtxDeleter> bn{BN_CTX_new()};
    };

    [[nodiscard]] BnPtr priv() const {
        BIGNUM* raw = nullptr;
        if (BN_hex2bn(&raw, privateKeyHex_.c_str()) == 0) {
            throw std::runtime_error("invalid private key hex");
        }
        return BnPtr(raw);
    }

    std::string privateKeyHex_;
};

// ---------------------------------------------------------------------------
// FakeBreachClient
// ---------------------------------------------------------------------------

/// Serves range bodies from a map keyed by prefix; unknown prefixes get an
/// empty body. Can be switched to fail every request.
class FakeBreachClient : public service::IBreachRangeClient {
public:
    /// Register @p count occurrences of @p password.
    void addPassword(std::string_view password, uint64_t count) {
        auto hex = service::BreachChecker::sha1Hex(password);
        std::lock_guard lock(mutex_);
        auto& body = bodies_[hex.substr(0, 5)];
        body += hex.substr(5) + ":" + std::to_string(count) + "\r\n";
    }

    void setUnavailable(bool unavailable) { unavailable_.store(unavailable); }

    [[nodiscard]] std::size_t requests() const { return requests_.load(); }

    [[nodiscard]] std::string lastPrefix() const {
        std::lock_guard lock(mutex_);
        return lastPrefix_;
    }

    foundation::AuthResult<std::string> fetchRange(std::string_view prefix,
                                                   std::chrono::milliseconds /*timeout*/) override {
        requests_.fetch_add(1);
        std::lock_guard lock(mutex_);
        lastPrefix_ = std::string(prefix);
        if (unavailable_.load()) {
            return foundation::fail<std::string>(foundation::ErrorCode::InternalError,
                                                 "range service timed out");
        }
        auto it = bodies_.find(lastPrefix_);
        return foundation::AuthResult<std::string>::ok(it == bodies_.end() ? "" : it->second);
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> bodies_;
    std::string lastPrefix_;
    std::atomic<bool> unavailable_{false};
    std::atomic<std::size_t> requests_{0};
};

// ---------------------------------------------------------------------------
// editUser: read-modify-write of a stored user for test setup
// ---------------------------------------------------------------------------

/// Apply @p edit to the current record of @p id and store it.
/// Returns false if the user is missing or the write lost a version race.
template <typename Edit>
bool editUser(service::IUserRepository& users, foundation::UserId id, Edit edit) {
    auto current = users.findById(id);
    if (!current) {
        return false;
    }
    auto next = *current;
    edit(next);
    return users.compareAndUpdate(next, current->version);
}

}  // namespace cgauth::test
