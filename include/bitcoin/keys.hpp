#pragma once

#include <vector>
#include <optional>
#include "common/types.hpp"

namespace btcfi {
namespace bitcoin {

/**
 * Output of a BIP341 key tweak.
 */
struct TweakedKey {
    XOnlyPubKey output_key{};
    bool parity{false};  // true if Q has odd y
};

// True if the bytes are the x coordinate of a point on secp256k1 (BIP340 lift_x succeeds)
bool is_valid_xonly(const XOnlyPubKey& key);

/**
 * BIP327 KeyAgg over x-only keys (each lifted to even y), in the order given.
 * Returns the x-only aggregate, or nullopt if any key is invalid or the sum is infinity.
 */
std::optional<XOnlyPubKey> aggregate_keys(const std::vector<XOnlyPubKey>& keys);

/**
 * BIP341 taproot tweak: Q = lift_x(P) + int(TapTweak(P || root)) * G.
 * Without a merkle root the tweak commits to P alone.
 */
std::optional<TweakedKey> taproot_tweak(const XOnlyPubKey& internal_key,
                                        const std::optional<Hash256>& merkle_root);

} // namespace bitcoin
} // namespace btcfi
