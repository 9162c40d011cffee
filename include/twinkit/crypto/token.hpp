#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "twinkit/error.hpp"
#include "twinkit/config/crypto.hpp"

namespace twinkit::crypto {

// Alphabet of a random token
enum class TokenBase : std::uint8_t {
    Binary,     // 01
    Octal,      // 0-7
    Hex,        // 0-9a-f
    Decimal,    // 0-9
    Base64      // A-Za-z0-9
};

[[nodiscard]]
inline constexpr std::string_view to_string(TokenBase b) noexcept {
    switch (b) {
        case TokenBase::Binary:  return "binary";
        case TokenBase::Octal:   return "octal";
        case TokenBase::Hex:     return "hex";
        case TokenBase::Decimal: return "decimal";
        case TokenBase::Base64:  return "base-64";
        default:                 return "unknown";
    }
}

[[nodiscard]]
inline constexpr bool parse(std::string_view s, TokenBase& out) noexcept {
    if (s == "binary")  { out = TokenBase::Binary;  return true; }
    if (s == "octal")   { out = TokenBase::Octal;   return true; }
    if (s == "hex")     { out = TokenBase::Hex;     return true; }
    if (s == "decimal") { out = TokenBase::Decimal; return true; }
    if (s == "base-64") { out = TokenBase::Base64;  return true; }
    return false;
}

// `size` characters drawn uniformly from the alphabet of `base`
[[nodiscard]] Error random_token(std::size_t size, TokenBase base, std::string& out);

// Same, with the base given by name; unknown names are a ValueError
[[nodiscard]] Error random_token(std::size_t size, std::string_view base, std::string& out);

// -----------------------------------------------------------------------------
// Random identifiers
// -----------------------------------------------------------------------------
//
// `length` characters drawn from A-Za-z0-9 (plus ASCII punctuation with
// `symbols`), then optionally hex or base64 encoded, then optionally folded
// to one letter case. Encoding makes the result longer than `length`.
// -----------------------------------------------------------------------------

enum class IdEncoding : std::uint8_t {
    Ascii,
    Hex,
    Base64
};

[[nodiscard]]
inline constexpr std::string_view to_string(IdEncoding e) noexcept {
    switch (e) {
        case IdEncoding::Ascii:  return "ascii";
        case IdEncoding::Hex:    return "hex";
        case IdEncoding::Base64: return "base64";
        default:                 return "unknown";
    }
}

enum class Casing : std::uint8_t {
    Upper,
    Lower
};

struct RandomIdOptions {
    bool symbols{false};
    IdEncoding encoding{IdEncoding::Ascii};
    std::optional<Casing> casing{};     // applied last, nullopt keeps the case
};

[[nodiscard]] Error random_id(std::size_t length, const RandomIdOptions& options, std::string& out);

// Letters and digits without the look-alikes 0, O, I and l
[[nodiscard]] Error secure_token(std::size_t length, std::string& out);

[[nodiscard]] inline Error secure_token(std::string& out) {
    return secure_token(config::crypto::SECURE_TOKEN_DEFAULT_LENGTH, out);
}

} // namespace twinkit::crypto
