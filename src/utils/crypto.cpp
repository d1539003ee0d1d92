#include "utils/crypto.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <stdexcept>
#include <sstream>
#include <iomanip>

namespace btcfi {
namespace crypto {

Hash256 sha256(const uint8_t* data, size_t len) {
    Hash256 out{};
    unsigned int out_len = 0;
    if (EVP_Digest(data, len, out.data(), &out_len, EVP_sha256(), nullptr) != 1 ||
        out_len != out.size()) {
        throw std::runtime_error("SHA256 digest failed");
    }
    return out;
}

Hash256 sha256(const Bytes& data) {
    return sha256(data.data(), data.size());
}

Hash256 sha256(const std::string& data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Hash256 sha256d(const Bytes& data) {
    Hash256 first = sha256(data);
    return sha256(first.data(), first.size());
}

Hash256 tagged_hash(const std::string& tag, const Bytes& msg) {
    Hash256 tag_hash = sha256(tag);

    Bytes buf;
    buf.reserve(64 + msg.size());
    buf.insert(buf.end(), tag_hash.begin(), tag_hash.end());
    buf.insert(buf.end(), tag_hash.begin(), tag_hash.end());
    buf.insert(buf.end(), msg.begin(), msg.end());

    return sha256(buf);
}

std::string hex_encode(const uint8_t* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string hex_encode(const Bytes& data) {
    return hex_encode(data.data(), data.size());
}

std::string hex_encode(const Hash256& data) {
    return hex_encode(data.data(), data.size());
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Bytes hex_decode(const std::string& hex) {
    Bytes result;
    if (hex.length() % 2 != 0) {
        return result;
    }

    result.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Bytes{};
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }

    return result;
}

bool parse_hash256(const std::string& hex, Hash256& out) {
    Bytes raw = hex_decode(hex);
    if (raw.size() != out.size()) {
        return false;
    }
    std::copy(raw.begin(), raw.end(), out.begin());
    return true;
}

Bytes random_bytes(size_t count) {
    Bytes bytes(count);
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return bytes;
}

std::string random_hex(size_t bytes) {
    return hex_encode(random_bytes(bytes));
}

} // namespace crypto
} // namespace btcfi
