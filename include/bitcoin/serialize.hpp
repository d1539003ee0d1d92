#pragma once

#include <cstdint>
#include <utility>
#include "common/types.hpp"

namespace btcfi {
namespace bitcoin {

/**
 * Append-only writer for Bitcoin wire encoding (little-endian integers,
 * CompactSize length prefixes).
 */
class ByteWriter {
public:
    ByteWriter() = default;

    void write_u8(uint8_t v);
    void write_u32_le(uint32_t v);
    void write_u64_le(uint64_t v);
    void write_i32_le(int32_t v);

    // CompactSize: 1, 3, 5 or 9 bytes
    void write_compact_size(uint64_t v);

    void write_bytes(const uint8_t* data, size_t len);
    void write_bytes(const Bytes& data);
    void write_hash(const Hash256& h);

    // CompactSize length followed by the bytes
    void write_var_bytes(const Bytes& data);

    const Bytes& data() const { return buf_; }
    Bytes release() { return std::move(buf_); }
    size_t size() const { return buf_.size(); }

private:
    Bytes buf_;
};

// Size of the CompactSize prefix for a given length
size_t compact_size_length(uint64_t v);

} // namespace bitcoin
} // namespace btcfi
