#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "common/types.hpp"

namespace btcfi {
namespace crypto {

/**
 * SHA256 of arbitrary bytes.
 */
Hash256 sha256(const uint8_t* data, size_t len);
Hash256 sha256(const Bytes& data);
Hash256 sha256(const std::string& data);

/**
 * Double SHA256 (transaction ids).
 */
Hash256 sha256d(const Bytes& data);

/**
 * BIP340 tagged hash: SHA256(SHA256(tag) || SHA256(tag) || msg).
 */
Hash256 tagged_hash(const std::string& tag, const Bytes& msg);

/**
 * Hex encoding.
 */
std::string hex_encode(const uint8_t* data, size_t len);
std::string hex_encode(const Bytes& data);
std::string hex_encode(const Hash256& data);

// Returns an empty vector for odd-length or non-hex input
Bytes hex_decode(const std::string& hex);

// Parses exactly 32 bytes of hex, false otherwise
bool parse_hash256(const std::string& hex, Hash256& out);

/**
 * Generate random bytes.
 */
Bytes random_bytes(size_t count);

/**
 * Generate random hex string.
 */
std::string random_hex(size_t bytes);

} // namespace crypto
} // namespace btcfi
