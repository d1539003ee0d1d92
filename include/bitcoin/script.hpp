#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include "common/types.hpp"

namespace btcfi {
namespace bitcoin {

// Opcodes used by the option scripts
enum Opcode : uint8_t {
    OP_0 = 0x00,
    OP_PUSHDATA1 = 0x4c,
    OP_PUSHDATA2 = 0x4d,
    OP_PUSHDATA4 = 0x4e,
    OP_1NEGATE = 0x4f,
    OP_1 = 0x51,
    OP_16 = 0x60,
    OP_IF = 0x63,
    OP_ELSE = 0x67,
    OP_ENDIF = 0x68,
    OP_VERIFY = 0x69,
    OP_DROP = 0x75,
    OP_DUP = 0x76,
    OP_SIZE = 0x82,
    OP_EQUAL = 0x87,
    OP_EQUALVERIFY = 0x88,
    OP_SHA256 = 0xa8,
    OP_CHECKSIG = 0xac,
    OP_CHECKSIGVERIFY = 0xad,
    OP_CHECKLOCKTIMEVERIFY = 0xb1
};

// Max size of a single stack element (also applies to tapscript)
constexpr size_t MAX_SCRIPT_ELEMENT_SIZE = 520;

/**
 * Script assembler. Pushes use minimal encodings so the result is
 * standard under tapscript MINIMALDATA rules.
 */
class Script {
public:
    Script() = default;
    explicit Script(Bytes raw) : bytes_(std::move(raw)) {}

    Script& op(Opcode opcode);
    Script& push_data(const uint8_t* data, size_t len);
    Script& push_data(const Bytes& data);
    Script& push_data(const Hash256& data);
    Script& push_int(int64_t value);

    const Bytes& bytes() const { return bytes_; }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

    std::string to_hex() const;

    bool operator==(const Script& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Script& other) const { return bytes_ != other.bytes_; }

private:
    Bytes bytes_;
};

// CScriptNum encoding (little-endian, sign bit in the last byte)
Bytes encode_script_num(int64_t value);

// OP_n followed by a push of the witness program
Script witness_program_script(int version, const Bytes& program);

// True for OP_1 <32 bytes>
bool is_p2tr(const Script& script);

} // namespace bitcoin
} // namespace btcfi
