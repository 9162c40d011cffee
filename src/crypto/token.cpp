#include "twinkit/crypto/token.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include <openssl/rand.h>

#include "twinkit/codec.hpp"

#include "lcr/log/logger.hpp"

namespace twinkit::crypto {

namespace {

constexpr std::string_view alphabet(TokenBase base) noexcept {
    switch (base) {
        case TokenBase::Binary:  return "01";
        case TokenBase::Octal:   return "01234567";
        case TokenBase::Hex:     return "0123456789abcdef";
        case TokenBase::Decimal: return "0123456789";
        case TokenBase::Base64:  return "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    }
    return {};
}

constexpr std::string_view ID_ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

constexpr std::string_view ID_ALPHABET_WITH_SYMBOLS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"
    "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";

constexpr std::string_view SECURE_ALPHABET =
    "ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz123456789";

// Uniform draw: bytes at or above the largest multiple of the alphabet size
// are rejected so every character is equally likely.
Error draw(std::string_view chars, std::size_t count, std::string& out) {
    const unsigned n = static_cast<unsigned>(chars.size());
    const unsigned limit = 256u - (256u % n);

    std::string result;
    result.reserve(count);
    std::array<std::uint8_t, 64> pool{};
    while (result.size() < count) {
        if (RAND_bytes(pool.data(), static_cast<int>(pool.size())) != 1) {
            TK_ERROR("[CRYPTO] Random source unavailable");
            return Error::ResourceError;
        }
        for (std::uint8_t b : pool) {
            if (result.size() == count) {
                break;
            }
            if (b < limit) {
                result.push_back(chars[b % n]);
            }
        }
    }
    out = std::move(result);
    return Error::None;
}

} // namespace

Error random_token(std::size_t size, TokenBase base, std::string& out) {
    const std::string_view chars = alphabet(base);
    if (chars.empty()) {
        return Error::ValueError;
    }
    return draw(chars, size, out);
}

Error random_token(std::size_t size, std::string_view base, std::string& out) {
    TokenBase parsed{};
    if (!parse(base, parsed)) {
        TK_DEBUG("[CRYPTO] Unknown token base '" << base << "'");
        return Error::ValueError;
    }
    return random_token(size, parsed, out);
}

Error random_id(std::size_t length, const RandomIdOptions& options, std::string& out) {
    std::string id;
    const Error err = draw(options.symbols ? ID_ALPHABET_WITH_SYMBOLS : ID_ALPHABET, length, id);
    if (err != Error::None) {
        return err;
    }

    switch (options.encoding) {
        case IdEncoding::Ascii:
            break;
        case IdEncoding::Hex:
            id = codec::hex_encode(std::string_view(id));
            break;
        case IdEncoding::Base64:
            id = codec::base64_encode(std::string_view(id));
            break;
    }

    if (options.casing) {
        const bool upper = (*options.casing == Casing::Upper);
        std::transform(id.begin(), id.end(), id.begin(), [upper](unsigned char c) {
            return static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
        });
    }

    out = std::move(id);
    return Error::None;
}

Error secure_token(std::size_t length, std::string& out) {
    if (length == 0) {
        length = config::crypto::SECURE_TOKEN_DEFAULT_LENGTH;
    }
    return draw(SECURE_ALPHABET, length, out);
}

} // namespace twinkit::crypto
