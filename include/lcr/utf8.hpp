#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace lcr {
namespace utf8 {

// -----------------------------------------------------------------------------
// Strict UTF-8 code point decoding
// -----------------------------------------------------------------------------
//
// Malformed input never yields an ASCII code point: a bad lead byte, a missing
// or wrong continuation byte, an overlong form, a surrogate or a value beyond
// U+10FFFF decodes to REPLACEMENT and consumes exactly one byte. Lead bytes are
// therefore always visited, whatever garbage precedes them.
// -----------------------------------------------------------------------------

inline constexpr char32_t REPLACEMENT = 0xFFFD;

struct Decoded {
    char32_t    cp;
    std::size_t len;
};

[[nodiscard]] constexpr bool is_continuation(uint8_t b) noexcept {
    return (b & 0xC0) == 0x80;
}

[[nodiscard]] constexpr Decoded decode(std::string_view s, std::size_t pos) noexcept {
    const auto lead = static_cast<uint8_t>(s[pos]);
    if (lead < 0x80) {
        return {lead, 1};
    }

    std::size_t len = 0;
    char32_t cp = 0;
    char32_t min = 0;
    if ((lead & 0xE0) == 0xC0)      { len = 2; cp = lead & 0x1F; min = 0x80; }
    else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; min = 0x800; }
    else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; min = 0x10000; }
    else {
        return {REPLACEMENT, 1};
    }

    if (pos + len > s.size()) {
        return {REPLACEMENT, 1};
    }
    for (std::size_t i = 1; i < len; ++i) {
        const auto cc = static_cast<uint8_t>(s[pos + i]);
        if (!is_continuation(cc)) {
            return {REPLACEMENT, 1};
        }
        cp = (cp << 6) | (cc & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return {REPLACEMENT, 1};
    }
    return {cp, len};
}

// Calls fn(cp) for every code point of `s`; stops early when fn returns false
template <typename Fn>
constexpr bool for_each(std::string_view s, Fn&& fn) {
    std::size_t pos = 0;
    while (pos < s.size()) {
        const Decoded d = decode(s, pos);
        if (!fn(d.cp)) {
            return false;
        }
        pos += d.len;
    }
    return true;
}

} // namespace utf8
} // namespace lcr
