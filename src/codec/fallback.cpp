#include "twinkit/codec/fallback.hpp"

#include <charconv>
#include <format>
#include <iterator>

#include "lcr/utf8.hpp"

namespace twinkit::codec {

namespace {

constexpr std::string_view BASE64_ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr bool is_hex_digit(char32_t c) noexcept {
    return (c >= '0' && c <= '9') ||
           (c >= 'a' && c <= 'f') ||
           (c >= 'A' && c <= 'F');
}

constexpr bool is_hebrew_code_point(char32_t c) noexcept {
    return c >= 0x0590 && c <= 0x05FF;
}

} // namespace


// ============================================================================
// Hex
// ============================================================================

void Fallback::hex_encode(BytesView bytes, std::string& out) {
    out.clear();
    out.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        std::format_to(std::back_inserter(out), "{:02x}", b);
    }
}

Error Fallback::hex_decode(std::string_view text, Bytes& out) {
    if (text.size() % 2 != 0) {
        return Error::FormatError;
    }
    for (char c : text) {
        if (!is_hex_digit(static_cast<unsigned char>(c))) {
            return Error::FormatError;
        }
    }

    Bytes decoded;
    decoded.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        std::uint8_t byte = 0;
        const char* first = text.data() + i;
        auto [ptr, ec] = std::from_chars(first, first + 2, byte, 16);
        if (ec != std::errc{} || ptr != first + 2) {
            return Error::FormatError;
        }
        decoded.push_back(byte);
    }
    out = std::move(decoded);
    return Error::None;
}


// ============================================================================
// Base64
// ============================================================================

void Fallback::base64_encode(BytesView bytes, std::string& out) {
    out.clear();
    out.reserve(((bytes.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const std::uint32_t group = (std::uint32_t(bytes[i]) << 16) |
                                    (std::uint32_t(bytes[i + 1]) << 8) |
                                     std::uint32_t(bytes[i + 2]);
        out.push_back(BASE64_ALPHABET[(group >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(group >> 12) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(group >> 6) & 0x3F]);
        out.push_back(BASE64_ALPHABET[group & 0x3F]);
    }

    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        const std::uint32_t group = std::uint32_t(bytes[i]) << 16;
        out.push_back(BASE64_ALPHABET[(group >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(group >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t group = (std::uint32_t(bytes[i]) << 16) |
                                    (std::uint32_t(bytes[i + 1]) << 8);
        out.push_back(BASE64_ALPHABET[(group >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(group >> 12) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(group >> 6) & 0x3F]);
        out.push_back('=');
    }
}

Error Fallback::base64_decode(std::string_view text, Bytes& out) {
    if (text.size() % 4 != 0) {
        return Error::FormatError;
    }

    // Up to two '=' are allowed, and only at the very end
    std::size_t padding = 0;
    if (!text.empty() && text.back() == '=') {
        padding = 1;
        if (text[text.size() - 2] == '=') {
            padding = 2;
        }
    }
    const std::size_t body = text.size() - padding;
    for (std::size_t i = 0; i < body; ++i) {
        if (BASE64_ALPHABET.find(text[i]) == std::string_view::npos) {
            return Error::FormatError;
        }
    }

    Bytes decoded;
    decoded.reserve((text.size() / 4) * 3);
    for (std::size_t i = 0; i < text.size(); i += 4) {
        std::uint32_t group = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            const char c = text[i + j];
            const std::size_t sextet = (c == '=') ? 0 : BASE64_ALPHABET.find(c);
            group = (group << 6) | static_cast<std::uint32_t>(sextet);
        }
        const bool last = (i + 4 == text.size());
        const std::size_t produced = last ? 3 - padding : 3;
        decoded.push_back(static_cast<std::uint8_t>(group >> 16));
        if (produced > 1) decoded.push_back(static_cast<std::uint8_t>(group >> 8));
        if (produced > 2) decoded.push_back(static_cast<std::uint8_t>(group));
    }
    out = std::move(decoded);
    return Error::None;
}


// ============================================================================
// Text classification
// ============================================================================

bool Fallback::is_ascii(std::string_view text) noexcept {
    return lcr::utf8::for_each(text, [](char32_t cp) { return cp < 0x80; });
}

bool Fallback::is_hex(std::string_view text) noexcept {
    if (text.empty()) {
        return false;
    }
    return lcr::utf8::for_each(text, [](char32_t cp) { return is_hex_digit(cp); });
}

bool Fallback::is_hebrew(std::string_view text) noexcept {
    const bool none = lcr::utf8::for_each(text, [](char32_t cp) {
        return !is_hebrew_code_point(cp);
    });
    return !none;
}

void Fallback::filter_ascii(std::string_view text, std::string& out) {
    out.clear();
    lcr::utf8::for_each(text, [&out](char32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        }
        return true;
    });
}

void Fallback::extract_digits(std::string_view text, std::string& out) {
    out.clear();
    lcr::utf8::for_each(text, [&out](char32_t cp) {
        if (cp >= '0' && cp <= '9') {
            out.push_back(static_cast<char>(cp));
        }
        return true;
    });
}

} // namespace twinkit::codec
