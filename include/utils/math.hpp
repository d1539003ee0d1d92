#pragma once

#include <cstdint>
#include <limits>

namespace btcfi {

/**
 * floor(a * b / c) with a 128-bit intermediate. Saturates at UINT64_MAX;
 * returns 0 when c is 0.
 */
inline uint64_t mul_div(uint64_t a, uint64_t b, uint64_t c) {
    if (c == 0) {
        return 0;
    }
    unsigned __int128 product = static_cast<unsigned __int128>(a) * b;
    unsigned __int128 quotient = product / c;
    if (quotient > std::numeric_limits<uint64_t>::max()) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(quotient);
}

} // namespace btcfi
