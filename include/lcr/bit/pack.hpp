#pragma once

#include <cstdint>
#include <cstring>

namespace lcr {
namespace bit {

// ============================================================================
// load_word
// ============================================================================

// Unaligned 8-byte load in host order. Used by word-at-a-time scans where
// the byte order inside the word does not matter.
inline uint64_t load_word(const void* p) noexcept {
    uint64_t v;
    std::memcpy(&v, p, sizeof(v));
    return v;
}

// Broadcasts a byte into all 8 lanes of a word
constexpr uint64_t broadcast8(uint8_t b) noexcept {
    return uint64_t(b) * 0x0101010101010101ull;
}

// Mask of the high bit of every lane
inline constexpr uint64_t HIGH_BITS = broadcast8(0x80);


// ============================================================================
// Big-endian fixed-width fields
// ============================================================================

// Writes the low 48 bits of `v` as 6 big-endian bytes
constexpr void store_be48(uint8_t* out, uint64_t v) noexcept {
    out[0] = uint8_t(v >> 40);
    out[1] = uint8_t(v >> 32);
    out[2] = uint8_t(v >> 24);
    out[3] = uint8_t(v >> 16);
    out[4] = uint8_t(v >> 8);
    out[5] = uint8_t(v);
}

// Reads 6 big-endian bytes into the low 48 bits of the result
constexpr uint64_t load_be48(const uint8_t* in) noexcept {
    return (uint64_t(in[0]) << 40) |
           (uint64_t(in[1]) << 32) |
           (uint64_t(in[2]) << 24) |
           (uint64_t(in[3]) << 16) |
           (uint64_t(in[4]) << 8)  |
            uint64_t(in[5]);
}

} // namespace bit
} // namespace lcr
