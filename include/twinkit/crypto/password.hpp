#pragma once

#include <string>
#include <string_view>

#include "twinkit/error.hpp"

namespace twinkit::crypto {

// -----------------------------------------------------------------------------
// Password hashing (scrypt N=16384 r=8 p=1, 32-byte key)
// -----------------------------------------------------------------------------
//
// Stored form: hex(derived key) followed by the salt text it was derived with,
// i.e. 64 hex chars + 32 hex chars of random salt.
// -----------------------------------------------------------------------------

// Derives the key for an explicit salt, hex encoded
[[nodiscard]] Error encrypt_password(std::string_view password, std::string_view salt, std::string& out);

// Derives with a fresh random salt and appends the salt
[[nodiscard]] Error hash_password(std::string_view password, std::string& out);

// Constant-time check of `password` against a stored hash. Malformed stored
// values and derivation failures are reported as a mismatch.
[[nodiscard]] bool match_password(std::string_view password, std::string_view stored);

} // namespace twinkit::crypto
