#include "twinkit/codec/native.hpp"

#include <array>

#include "lcr/bit/pack.hpp"

namespace twinkit::codec {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

constexpr char BASE64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// 0xFF marks bytes outside the alphabet. Valid entries never set the high bit,
// so OR-ing lookups over a whole input tells whether any byte was invalid.
constexpr std::uint8_t INVALID = 0xFF;

constexpr auto HEX_VALUE = [] {
    std::array<std::uint8_t, 256> t{};
    t.fill(INVALID);
    for (int c = '0'; c <= '9'; ++c) t[c] = static_cast<std::uint8_t>(c - '0');
    for (int c = 'a'; c <= 'f'; ++c) t[c] = static_cast<std::uint8_t>(c - 'a' + 10);
    for (int c = 'A'; c <= 'F'; ++c) t[c] = static_cast<std::uint8_t>(c - 'A' + 10);
    return t;
}();

constexpr auto BASE64_VALUE = [] {
    std::array<std::uint8_t, 256> t{};
    t.fill(INVALID);
    for (std::uint8_t i = 0; i < 64; ++i) {
        t[static_cast<unsigned char>(BASE64_ALPHABET[i])] = i;
    }
    return t;
}();

inline std::uint8_t u8(char c) noexcept {
    return static_cast<std::uint8_t>(c);
}

// OR of table lookups over the whole range; high bit set means "invalid"
template <std::size_t N>
inline std::uint8_t scan(const std::array<std::uint8_t, N>& table, std::string_view text) noexcept {
    std::uint8_t acc = 0;
    for (char c : text) {
        acc |= table[u8(c)];
    }
    return acc;
}

} // namespace


// ============================================================================
// Hex
// ============================================================================

void Native::hex_encode(BytesView bytes, std::string& out) {
    out.resize(bytes.size() * 2);
    char* dst = out.data();
    for (std::uint8_t b : bytes) {
        *dst++ = HEX_DIGITS[b >> 4];
        *dst++ = HEX_DIGITS[b & 0x0F];
    }
}

Error Native::hex_decode(std::string_view text, Bytes& out) {
    if ((text.size() & 1u) != 0 || (scan(HEX_VALUE, text) & 0x80) != 0) {
        return Error::FormatError;
    }
    out.resize(text.size() / 2);
    const char* src = text.data();
    for (std::uint8_t& b : out) {
        b = static_cast<std::uint8_t>((HEX_VALUE[u8(src[0])] << 4) | HEX_VALUE[u8(src[1])]);
        src += 2;
    }
    return Error::None;
}


// ============================================================================
// Base64
// ============================================================================

void Native::base64_encode(BytesView bytes, std::string& out) {
    const std::size_t n = bytes.size();
    out.resize(((n + 2) / 3) * 4);
    char* dst = out.data();
    const std::uint8_t* src = bytes.data();

    std::size_t i = 0;
    for (; i + 3 <= n; i += 3, src += 3) {
        dst[0] = BASE64_ALPHABET[src[0] >> 2];
        dst[1] = BASE64_ALPHABET[((src[0] & 0x03) << 4) | (src[1] >> 4)];
        dst[2] = BASE64_ALPHABET[((src[1] & 0x0F) << 2) | (src[2] >> 6)];
        dst[3] = BASE64_ALPHABET[src[2] & 0x3F];
        dst += 4;
    }

    switch (n - i) {
        case 1:
            dst[0] = BASE64_ALPHABET[src[0] >> 2];
            dst[1] = BASE64_ALPHABET[(src[0] & 0x03) << 4];
            dst[2] = '=';
            dst[3] = '=';
            break;
        case 2:
            dst[0] = BASE64_ALPHABET[src[0] >> 2];
            dst[1] = BASE64_ALPHABET[((src[0] & 0x03) << 4) | (src[1] >> 4)];
            dst[2] = BASE64_ALPHABET[(src[1] & 0x0F) << 2];
            dst[3] = '=';
            break;
        default:
            break;
    }
}

Error Native::base64_decode(std::string_view text, Bytes& out) {
    const std::size_t n = text.size();
    if ((n & 3u) != 0) {
        return Error::FormatError;
    }
    if (n == 0) {
        out.clear();
        return Error::None;
    }

    const std::size_t padding = (text[n - 1] == '=') ? ((text[n - 2] == '=') ? 2 : 1) : 0;
    // '=' is not in the table, so a stray pad inside the body fails here too
    if ((scan(BASE64_VALUE, text.substr(0, n - padding)) & 0x80) != 0) {
        return Error::FormatError;
    }

    out.resize((n / 4) * 3 - padding);
    std::uint8_t* dst = out.data();
    const char* src = text.data();

    const std::size_t full = (padding == 0) ? n : n - 4;
    for (std::size_t i = 0; i < full; i += 4, src += 4) {
        const std::uint32_t group = (std::uint32_t(BASE64_VALUE[u8(src[0])]) << 18) |
                                    (std::uint32_t(BASE64_VALUE[u8(src[1])]) << 12) |
                                    (std::uint32_t(BASE64_VALUE[u8(src[2])]) << 6)  |
                                     std::uint32_t(BASE64_VALUE[u8(src[3])]);
        dst[0] = static_cast<std::uint8_t>(group >> 16);
        dst[1] = static_cast<std::uint8_t>(group >> 8);
        dst[2] = static_cast<std::uint8_t>(group);
        dst += 3;
    }

    if (padding != 0) {
        std::uint32_t group = (std::uint32_t(BASE64_VALUE[u8(src[0])]) << 18) |
                              (std::uint32_t(BASE64_VALUE[u8(src[1])]) << 12);
        if (padding == 1) {
            group |= std::uint32_t(BASE64_VALUE[u8(src[2])]) << 6;
        }
        dst[0] = static_cast<std::uint8_t>(group >> 16);
        if (padding == 1) {
            dst[1] = static_cast<std::uint8_t>(group >> 8);
        }
    }
    return Error::None;
}


// ============================================================================
// Text classification (byte level; UTF-8 structure makes this exact)
// ============================================================================

bool Native::is_ascii(std::string_view text) noexcept {
    const char* p = text.data();
    std::size_t n = text.size();
    for (; n >= 8; n -= 8, p += 8) {
        if ((lcr::bit::load_word(p) & lcr::bit::HIGH_BITS) != 0) {
            return false;
        }
    }
    for (; n > 0; --n, ++p) {
        if (u8(*p) >= 0x80) {
            return false;
        }
    }
    return true;
}

bool Native::is_hex(std::string_view text) noexcept {
    return !text.empty() && (scan(HEX_VALUE, text) & 0x80) == 0;
}

// U+0590..U+05FF is exactly D6 90..D6 BF and D7 80..D7 BF
bool Native::is_hebrew(std::string_view text) noexcept {
    const char* p = text.data();
    const std::size_t n = text.size();
    std::size_t i = 0;
    while (i + 1 < n) {
        if (i + 8 <= n && (lcr::bit::load_word(p + i) & lcr::bit::HIGH_BITS) == 0) {
            i += 8;
            continue;
        }
        const std::uint8_t lead = u8(p[i]);
        const std::uint8_t next = u8(p[i + 1]);
        if ((lead == 0xD6 && next >= 0x90 && next <= 0xBF) ||
            (lead == 0xD7 && (next & 0xC0) == 0x80)) {
            return true;
        }
        ++i;
    }
    return false;
}

void Native::filter_ascii(std::string_view text, std::string& out) {
    out.clear();
    out.reserve(text.size());
    const char* p = text.data();
    std::size_t n = text.size();
    while (n > 0) {
        if (n >= 8 && (lcr::bit::load_word(p) & lcr::bit::HIGH_BITS) == 0) {
            out.append(p, 8);
            p += 8;
            n -= 8;
            continue;
        }
        if (u8(*p) < 0x80) {
            out.push_back(*p);
        }
        ++p;
        --n;
    }
}

void Native::extract_digits(std::string_view text, std::string& out) {
    out.clear();
    for (char c : text) {
        if (static_cast<std::uint8_t>(u8(c) - '0') < 10) {
            out.push_back(c);
        }
    }
}

} // namespace twinkit::codec
