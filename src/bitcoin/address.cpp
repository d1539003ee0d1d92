#include "bitcoin/address.hpp"
#include <array>

namespace btcfi {
namespace bitcoin {

namespace {

const char* BECH32_CHARSET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

constexpr uint32_t BECH32_CONST = 1;
constexpr uint32_t BECH32M_CONST = 0x2bc830a3;

constexpr std::array<uint32_t, 5> BECH32_GEN = {
    0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3
};

enum class Encoding {
    INVALID,
    BECH32,
    BECH32M
};

uint32_t polymod(const Bytes& values) {
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint32_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        for (int i = 0; i < 5; ++i) {
            if ((top >> i) & 1) {
                chk ^= BECH32_GEN[static_cast<size_t>(i)];
            }
        }
    }
    return chk;
}

Bytes hrp_expand(const std::string& hrp) {
    Bytes result;
    result.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        result.push_back(static_cast<uint8_t>(static_cast<uint8_t>(c) >> 5));
    }
    result.push_back(0);
    for (char c : hrp) {
        result.push_back(static_cast<uint8_t>(c & 0x1f));
    }
    return result;
}

Bytes create_checksum(const std::string& hrp, const Bytes& data, Encoding encoding) {
    Bytes values = hrp_expand(hrp);
    values.insert(values.end(), data.begin(), data.end());
    values.insert(values.end(), 6, 0);

    uint32_t constant = encoding == Encoding::BECH32M ? BECH32M_CONST : BECH32_CONST;
    uint32_t mod = polymod(values) ^ constant;

    Bytes checksum(6);
    for (size_t i = 0; i < 6; ++i) {
        checksum[i] = static_cast<uint8_t>((mod >> (5 * (5 - i))) & 31);
    }
    return checksum;
}

Encoding verify_checksum(const std::string& hrp, const Bytes& data) {
    Bytes values = hrp_expand(hrp);
    values.insert(values.end(), data.begin(), data.end());
    uint32_t check = polymod(values);
    if (check == BECH32_CONST) return Encoding::BECH32;
    if (check == BECH32M_CONST) return Encoding::BECH32M;
    return Encoding::INVALID;
}

bool convert_bits(Bytes& out, const Bytes& in, int from_bits, int to_bits, bool pad) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t max_v = (1u << to_bits) - 1;

    for (uint8_t value : in) {
        if (value >> from_bits) {
            return false;
        }
        acc = (acc << from_bits) | value;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & max_v));
        }
    }

    if (pad) {
        if (bits > 0) {
            out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & max_v));
        }
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & max_v)) {
        return false;
    }

    return true;
}

int decode_char(char c) {
    for (int i = 0; i < 32; ++i) {
        if (BECH32_CHARSET[i] == c) {
            return i;
        }
    }
    return -1;
}

bool valid_program(int version, const Bytes& program) {
    if (version < 0 || version > 16) return false;
    if (program.size() < 2 || program.size() > 40) return false;
    if (version == 0 && program.size() != 20 && program.size() != 32) return false;
    return true;
}

} // namespace

std::string encode_segwit_address(const std::string& hrp, int version, const Bytes& program) {
    if (!valid_program(version, program)) {
        return "";
    }

    Bytes data;
    data.push_back(static_cast<uint8_t>(version));
    if (!convert_bits(data, program, 8, 5, true)) {
        return "";
    }

    Encoding encoding = version == 0 ? Encoding::BECH32 : Encoding::BECH32M;
    Bytes checksum = create_checksum(hrp, data, encoding);

    std::string result = hrp + "1";
    result.reserve(result.size() + data.size() + checksum.size());
    for (uint8_t v : data) result.push_back(BECH32_CHARSET[v]);
    for (uint8_t v : checksum) result.push_back(BECH32_CHARSET[v]);
    return result;
}

std::optional<SegwitAddress> decode_segwit_address(const std::string& hrp, const std::string& address) {
    if (address.size() < 8 || address.size() > 90) {
        return std::nullopt;
    }

    bool has_upper = false;
    bool has_lower = false;
    std::string lower;
    lower.reserve(address.size());
    for (char c : address) {
        if (c < 33 || c > 126) return std::nullopt;
        if (c >= 'A' && c <= 'Z') {
            has_upper = true;
            lower.push_back(static_cast<char>(c - 'A' + 'a'));
        } else {
            if (c >= 'a' && c <= 'z') has_lower = true;
            lower.push_back(c);
        }
    }
    if (has_upper && has_lower) {
        return std::nullopt;
    }

    size_t sep = lower.rfind('1');
    if (sep == std::string::npos || sep < 1 || sep + 7 > lower.size()) {
        return std::nullopt;
    }
    if (lower.substr(0, sep) != hrp) {
        return std::nullopt;
    }

    Bytes data;
    for (size_t i = sep + 1; i < lower.size(); ++i) {
        int v = decode_char(lower[i]);
        if (v < 0) return std::nullopt;
        data.push_back(static_cast<uint8_t>(v));
    }

    Encoding encoding = verify_checksum(hrp, data);
    if (encoding == Encoding::INVALID) {
        return std::nullopt;
    }

    data.resize(data.size() - 6);
    if (data.empty()) {
        return std::nullopt;
    }

    SegwitAddress decoded;
    decoded.hrp = hrp;
    decoded.version = data[0];

    Bytes payload(data.begin() + 1, data.end());
    if (!convert_bits(decoded.program, payload, 5, 8, false)) {
        return std::nullopt;
    }
    if (!valid_program(decoded.version, decoded.program)) {
        return std::nullopt;
    }

    // v0 must use bech32, v1+ must use bech32m
    if ((decoded.version == 0) != (encoding == Encoding::BECH32)) {
        return std::nullopt;
    }

    return decoded;
}

std::string encode_taproot_address(Network network, const XOnlyPubKey& output_key) {
    return encode_segwit_address(bech32_hrp(network), 1,
                                 Bytes(output_key.begin(), output_key.end()));
}

std::optional<Script> address_to_script(Network network, const std::string& address) {
    auto decoded = decode_segwit_address(bech32_hrp(network), address);
    if (!decoded) {
        return std::nullopt;
    }
    return witness_program_script(decoded->version, decoded->program);
}

} // namespace bitcoin
} // namespace btcfi
