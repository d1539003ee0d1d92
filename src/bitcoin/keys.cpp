#include "bitcoin/keys.hpp"
#include "utils/crypto.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <memory>

namespace btcfi {
namespace bitcoin {

namespace {

struct GroupDeleter { void operator()(EC_GROUP* g) const { EC_GROUP_free(g); } };
struct PointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct BnDeleter { void operator()(BIGNUM* b) const { BN_free(b); } };
struct CtxDeleter { void operator()(BN_CTX* c) const { BN_CTX_free(c); } };

using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using CtxPtr = std::unique_ptr<BN_CTX, CtxDeleter>;

// Curve handle plus scratch context for one call
struct Curve {
    GroupPtr group{EC_GROUP_new_by_curve_name(NID_secp256k1)};
    CtxPtr ctx{BN_CTX_new()};
    BnPtr order{BN_new()};
    BnPtr field{BN_new()};

    bool init() {
        if (!group || !ctx || !order || !field) return false;
        return EC_GROUP_get_order(group.get(), order.get(), ctx.get()) == 1 &&
               EC_GROUP_get_curve(group.get(), field.get(), nullptr, nullptr, ctx.get()) == 1;
    }
};

// BIP340 lift_x: the point with the given x and even y
PointPtr lift_x(const Curve& curve, const XOnlyPubKey& x_bytes) {
    BnPtr x(BN_bin2bn(x_bytes.data(), static_cast<int>(x_bytes.size()), nullptr));
    PointPtr point(EC_POINT_new(curve.group.get()));
    if (!x || !point) {
        return nullptr;
    }
    // OpenSSL reduces x mod p; BIP340 rejects it instead
    if (BN_cmp(x.get(), curve.field.get()) >= 0) {
        return nullptr;
    }
    if (EC_POINT_set_compressed_coordinates(curve.group.get(), point.get(), x.get(), 0,
                                            curve.ctx.get()) != 1) {
        return nullptr;
    }
    return point;
}

// x coordinate and y parity of a finite point
bool point_to_xonly(const Curve& curve, const EC_POINT* point, XOnlyPubKey& out, bool& odd) {
    if (EC_POINT_is_at_infinity(curve.group.get(), point)) {
        return false;
    }
    BnPtr x(BN_new());
    BnPtr y(BN_new());
    if (!x || !y) {
        return false;
    }
    if (EC_POINT_get_affine_coordinates(curve.group.get(), point, x.get(), y.get(),
                                        curve.ctx.get()) != 1) {
        return false;
    }
    if (BN_bn2binpad(x.get(), out.data(), static_cast<int>(out.size())) < 0) {
        return false;
    }
    odd = BN_is_odd(y.get()) != 0;
    return true;
}

// Hash interpreted as a big-endian integer
BnPtr hash_to_bn(const Hash256& h) {
    return BnPtr(BN_bin2bn(h.data(), static_cast<int>(h.size()), nullptr));
}

// 33-byte compressed encoding of lift_x(x)
Bytes even_y_encoding(const XOnlyPubKey& x) {
    Bytes out;
    out.reserve(33);
    out.push_back(0x02);
    out.insert(out.end(), x.begin(), x.end());
    return out;
}

} // namespace

bool is_valid_xonly(const XOnlyPubKey& key) {
    Curve curve;
    if (!curve.init()) {
        return false;
    }
    return lift_x(curve, key) != nullptr;
}

std::optional<XOnlyPubKey> aggregate_keys(const std::vector<XOnlyPubKey>& keys) {
    if (keys.empty()) {
        return std::nullopt;
    }

    Curve curve;
    if (!curve.init()) {
        return std::nullopt;
    }

    // L = H_agglist(pk_1 || ... || pk_u)
    Bytes list;
    list.reserve(keys.size() * 33);
    for (const auto& key : keys) {
        Bytes enc = even_y_encoding(key);
        list.insert(list.end(), enc.begin(), enc.end());
    }
    Hash256 list_hash = crypto::tagged_hash("KeyAgg list", list);

    // Second distinct key gets coefficient 1
    const XOnlyPubKey* second = nullptr;
    for (size_t i = 1; i < keys.size(); ++i) {
        if (keys[i] != keys[0]) {
            second = &keys[i];
            break;
        }
    }

    PointPtr sum(EC_POINT_new(curve.group.get()));
    if (!sum || EC_POINT_set_to_infinity(curve.group.get(), sum.get()) != 1) {
        return std::nullopt;
    }

    for (const auto& key : keys) {
        PointPtr point = lift_x(curve, key);
        if (!point) {
            return std::nullopt;
        }

        BnPtr coeff;
        if (second != nullptr && key == *second) {
            coeff.reset(BN_dup(BN_value_one()));
        } else {
            Bytes msg(list_hash.begin(), list_hash.end());
            Bytes enc = even_y_encoding(key);
            msg.insert(msg.end(), enc.begin(), enc.end());
            coeff = hash_to_bn(crypto::tagged_hash("KeyAgg coefficient", msg));
            if (coeff && BN_nnmod(coeff.get(), coeff.get(), curve.order.get(), curve.ctx.get()) != 1) {
                return std::nullopt;
            }
        }
        if (!coeff) {
            return std::nullopt;
        }

        PointPtr term(EC_POINT_new(curve.group.get()));
        if (!term ||
            EC_POINT_mul(curve.group.get(), term.get(), nullptr, point.get(), coeff.get(),
                         curve.ctx.get()) != 1 ||
            EC_POINT_add(curve.group.get(), sum.get(), sum.get(), term.get(),
                         curve.ctx.get()) != 1) {
            return std::nullopt;
        }
    }

    XOnlyPubKey result{};
    bool odd = false;
    if (!point_to_xonly(curve, sum.get(), result, odd)) {
        return std::nullopt;
    }
    return result;
}

std::optional<TweakedKey> taproot_tweak(const XOnlyPubKey& internal_key,
                                        const std::optional<Hash256>& merkle_root) {
    Curve curve;
    if (!curve.init()) {
        return std::nullopt;
    }

    PointPtr internal = lift_x(curve, internal_key);
    if (!internal) {
        return std::nullopt;
    }

    Bytes msg(internal_key.begin(), internal_key.end());
    if (merkle_root) {
        msg.insert(msg.end(), merkle_root->begin(), merkle_root->end());
    }
    BnPtr tweak = hash_to_bn(crypto::tagged_hash("TapTweak", msg));
    if (!tweak || BN_cmp(tweak.get(), curve.order.get()) >= 0) {
        return std::nullopt;
    }

    // Q = t*G + 1*P
    PointPtr output(EC_POINT_new(curve.group.get()));
    if (!output ||
        EC_POINT_mul(curve.group.get(), output.get(), tweak.get(), internal.get(),
                     BN_value_one(), curve.ctx.get()) != 1) {
        return std::nullopt;
    }

    TweakedKey tweaked;
    if (!point_to_xonly(curve, output.get(), tweaked.output_key, tweaked.parity)) {
        return std::nullopt;
    }
    return tweaked;
}

} // namespace bitcoin
} // namespace btcfi
