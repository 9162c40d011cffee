#pragma once

#include <cstddef>
#include <cstdint>


namespace twinkit::config::crypto {

// -----------------------------------------------------------------------------
// scrypt work factors for password derivation
// -----------------------------------------------------------------------------
inline constexpr static std::uint64_t SCRYPT_N     = 16384;
inline constexpr static std::uint64_t SCRYPT_R     = 8;
inline constexpr static std::uint64_t SCRYPT_P     = 1;
inline constexpr static std::size_t   SCRYPT_DKLEN = 32;

// Upper bound handed to OpenSSL (128 * N * r * p plus slack)
inline constexpr static std::uint64_t SCRYPT_MAXMEM = 64ull * 1024 * 1024;

// Random salt bytes per stored hash (hex encoded: twice as many chars)
inline constexpr static std::size_t SALT_BYTES = 16;

// Hex chars of the derived key at the start of a stored hash
inline constexpr static std::size_t DERIVED_HEX_LENGTH = SCRYPT_DKLEN * 2;

// -----------------------------------------------------------------------------
// Tokens
// -----------------------------------------------------------------------------
inline constexpr static std::size_t SECURE_TOKEN_DEFAULT_LENGTH = 24;

} // namespace twinkit::config::crypto
