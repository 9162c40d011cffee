#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "twinkit/error.hpp"
#include "twinkit/types.hpp"

namespace twinkit::crypto {

using Md5Digest = std::array<std::uint8_t, 16>;

// MD5 through OpenSSL EVP. ResourceError when the provider is unavailable
// (e.g. a FIPS-only configuration).
[[nodiscard]] Error md5(BytesView data, Md5Digest& out);

// Lowercase hex MD5 of the UTF-8 bytes of `text`
[[nodiscard]] Error md5_hex(std::string_view text, std::string& out);

} // namespace twinkit::crypto
