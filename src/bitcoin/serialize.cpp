#include "bitcoin/serialize.hpp"

namespace btcfi {
namespace bitcoin {

void ByteWriter::write_u8(uint8_t v) {
    buf_.push_back(v);
}

void ByteWriter::write_u32_le(uint32_t v) {
    for (int i = 0; i < 4; i++) {
        buf_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
    }
}

void ByteWriter::write_u64_le(uint64_t v) {
    for (int i = 0; i < 8; i++) {
        buf_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
    }
}

void ByteWriter::write_i32_le(int32_t v) {
    write_u32_le(static_cast<uint32_t>(v));
}

void ByteWriter::write_compact_size(uint64_t v) {
    if (v < 0xfd) {
        write_u8(static_cast<uint8_t>(v));
    } else if (v <= 0xffff) {
        write_u8(0xfd);
        buf_.push_back(static_cast<uint8_t>(v & 0xff));
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
    } else if (v <= 0xffffffff) {
        write_u8(0xfe);
        write_u32_le(static_cast<uint32_t>(v));
    } else {
        write_u8(0xff);
        write_u64_le(v);
    }
}

void ByteWriter::write_bytes(const uint8_t* data, size_t len) {
    buf_.insert(buf_.end(), data, data + len);
}

void ByteWriter::write_bytes(const Bytes& data) {
    buf_.insert(buf_.end(), data.begin(), data.end());
}

void ByteWriter::write_hash(const Hash256& h) {
    buf_.insert(buf_.end(), h.begin(), h.end());
}

void ByteWriter::write_var_bytes(const Bytes& data) {
    write_compact_size(data.size());
    write_bytes(data);
}

size_t compact_size_length(uint64_t v) {
    if (v < 0xfd) return 1;
    if (v <= 0xffff) return 3;
    if (v <= 0xffffffff) return 5;
    return 9;
}

} // namespace bitcoin
} // namespace btcfi
