#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"
#include "bitcoin/script.hpp"

namespace btcfi {
namespace bitcoin {

/**
 * Decoded segwit address (BIP173 bech32 for v0, BIP350 bech32m for v1+).
 */
struct SegwitAddress {
    std::string hrp;
    int version{0};
    Bytes program;
};

// Encode a witness program. Returns empty string for invalid programs.
std::string encode_segwit_address(const std::string& hrp, int version, const Bytes& program);

// Decode and validate an address for the expected human readable part
std::optional<SegwitAddress> decode_segwit_address(const std::string& hrp, const std::string& address);

// P2TR address for a 32-byte output key
std::string encode_taproot_address(Network network, const XOnlyPubKey& output_key);

// scriptPubKey for an address on the given network
std::optional<Script> address_to_script(Network network, const std::string& address);

} // namespace bitcoin
} // namespace btcfi
