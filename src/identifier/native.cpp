#include "twinkit/identifier/backend.hpp"

#include "lcr/bit/pack.hpp"

namespace twinkit::identifier {

using namespace config::identifier;

namespace {

constexpr char LOWER[] = "0123456789abcdef";
constexpr char UPPER[] = "0123456789ABCDEF";

// -1 for anything that is not a hex digit
constexpr signed char nibble(char c) noexcept {
    if (c >= '0' && c <= '9') return static_cast<signed char>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<signed char>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<signed char>(c - 'A' + 10);
    return -1;
}

} // namespace

void Native::layout_v7(std::uint64_t unix_ms, const Entropy& e, Uuid& out) noexcept {
    lcr::bit::store_be48(out.data(), unix_ms);
    out[6] = static_cast<std::uint8_t>(0x70 | (e[0] & 0x0F));
    out[7] = e[1];
    out[8] = static_cast<std::uint8_t>(0x80 | (e[2] & 0x3F));
    for (std::size_t i = 3; i < ENTROPY_BYTES; ++i) {
        out[6 + i] = e[i];
    }
}

void Native::format(const Uuid& id, LetterCase casing, std::string& out) {
    const char* digits = (casing == LetterCase::Upper) ? UPPER : LOWER;
    out.resize(UUID_TEXT_LENGTH);
    char* dst = out.data();
    for (std::size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            *dst++ = '-';
        }
        *dst++ = digits[id[i] >> 4];
        *dst++ = digits[id[i] & 0x0F];
    }
}

Error Native::parse_unix_ms(std::string_view text, std::uint64_t& out) {
    // Timestamp digits are paired into the 6 big-endian bytes they encode
    std::uint8_t stamp[TIMESTAMP_HEX_DIGITS / 2]{};
    std::size_t count = 0;
    bool bad_digit = false;
    for (char c : text) {
        if (c == '-') {
            continue;
        }
        if (count < TIMESTAMP_HEX_DIGITS) {
            const signed char v = nibble(c);
            bad_digit |= (v < 0);
            std::uint8_t& byte = stamp[count / 2];
            byte = static_cast<std::uint8_t>((byte << 4) | (v & 0x0F));
        }
        ++count;
    }
    if (count != UUID_HEX_DIGITS || bad_digit) {
        return Error::FormatError;
    }
    out = lcr::bit::load_be48(stamp);
    return Error::None;
}

} // namespace twinkit::identifier
