#include "bitcoin/script.hpp"
#include "utils/crypto.hpp"
#include <cstdlib>

namespace btcfi {
namespace bitcoin {

Script& Script::op(Opcode opcode) {
    bytes_.push_back(static_cast<uint8_t>(opcode));
    return *this;
}

Script& Script::push_data(const uint8_t* data, size_t len) {
    if (len < OP_PUSHDATA1) {
        bytes_.push_back(static_cast<uint8_t>(len));
    } else if (len <= 0xff) {
        bytes_.push_back(OP_PUSHDATA1);
        bytes_.push_back(static_cast<uint8_t>(len));
    } else if (len <= 0xffff) {
        bytes_.push_back(OP_PUSHDATA2);
        bytes_.push_back(static_cast<uint8_t>(len & 0xff));
        bytes_.push_back(static_cast<uint8_t>((len >> 8) & 0xff));
    } else {
        bytes_.push_back(OP_PUSHDATA4);
        for (int i = 0; i < 4; i++) {
            bytes_.push_back(static_cast<uint8_t>((len >> (8 * i)) & 0xff));
        }
    }
    bytes_.insert(bytes_.end(), data, data + len);
    return *this;
}

Script& Script::push_data(const Bytes& data) {
    return push_data(data.data(), data.size());
}

Script& Script::push_data(const Hash256& data) {
    return push_data(data.data(), data.size());
}

Script& Script::push_int(int64_t value) {
    if (value == 0) {
        bytes_.push_back(OP_0);
    } else if (value == -1) {
        bytes_.push_back(OP_1NEGATE);
    } else if (value >= 1 && value <= 16) {
        bytes_.push_back(static_cast<uint8_t>(OP_1 + (value - 1)));
    } else {
        push_data(encode_script_num(value));
    }
    return *this;
}

std::string Script::to_hex() const {
    return crypto::hex_encode(bytes_);
}

Bytes encode_script_num(int64_t value) {
    Bytes result;
    if (value == 0) {
        return result;
    }

    bool negative = value < 0;
    uint64_t abs_value = negative ? static_cast<uint64_t>(-(value + 1)) + 1
                                  : static_cast<uint64_t>(value);

    while (abs_value) {
        result.push_back(static_cast<uint8_t>(abs_value & 0xff));
        abs_value >>= 8;
    }

    // Highest bit carries the sign; add a byte if it is already used
    if (result.back() & 0x80) {
        result.push_back(negative ? 0x80 : 0x00);
    } else if (negative) {
        result.back() |= 0x80;
    }

    return result;
}

Script witness_program_script(int version, const Bytes& program) {
    Script script;
    if (version == 0) {
        script.op(OP_0);
    } else {
        script.op(static_cast<Opcode>(OP_1 + (version - 1)));
    }
    script.push_data(program);
    return script;
}

bool is_p2tr(const Script& script) {
    const Bytes& b = script.bytes();
    return b.size() == 34 && b[0] == OP_1 && b[1] == 0x20;
}

} // namespace bitcoin
} // namespace btcfi
