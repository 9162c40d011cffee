#include "twinkit/identifier/backend.hpp"

#include <charconv>
#include <format>
#include <iterator>

namespace twinkit::identifier {

using namespace config::identifier;

void Fallback::layout_v7(std::uint64_t unix_ms, const Entropy& e, Uuid& out) noexcept {
    // hi: unix_ts_ms(48) | ver(4) | rand_a(12)
    const std::uint64_t rand_a = (std::uint64_t(e[0] & 0x0F) << 8) | e[1];
    const std::uint64_t hi = ((unix_ms & 0xFFFFFFFFFFFFull) << 16) |
                             (std::uint64_t{0x7} << 12) |
                             rand_a;

    // lo: var(2) | rand_b(62)
    std::uint64_t rand_b = e[2] & 0x3F;
    for (std::size_t i = 3; i < ENTROPY_BYTES; ++i) {
        rand_b = (rand_b << 8) | e[i];
    }
    const std::uint64_t lo = (std::uint64_t{0x2} << 62) | rand_b;

    for (std::size_t i = 0; i < 8; ++i) {
        out[i]     = static_cast<std::uint8_t>(hi >> (56 - 8 * i));
        out[8 + i] = static_cast<std::uint8_t>(lo >> (56 - 8 * i));
    }
}

void Fallback::format(const Uuid& id, LetterCase casing, std::string& out) {
    out.clear();
    out.reserve(UUID_TEXT_LENGTH);
    for (std::size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        if (casing == LetterCase::Upper) {
            std::format_to(std::back_inserter(out), "{:02X}", id[i]);
        } else {
            std::format_to(std::back_inserter(out), "{:02x}", id[i]);
        }
    }
}

Error Fallback::parse_unix_ms(std::string_view text, std::uint64_t& out) {
    std::string digits;
    digits.reserve(text.size());
    for (char c : text) {
        if (c != '-') {
            digits.push_back(c);
        }
    }
    if (digits.size() != UUID_HEX_DIGITS) {
        return Error::FormatError;
    }

    std::uint64_t value = 0;
    const char* first = digits.data();
    const char* last = first + TIMESTAMP_HEX_DIGITS;
    auto [ptr, ec] = std::from_chars(first, last, value, 16);
    if (ec != std::errc{} || ptr != last) {
        return Error::FormatError;
    }
    out = value;
    return Error::None;
}

} // namespace twinkit::identifier
