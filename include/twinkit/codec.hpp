#pragma once

#include <string>
#include <string_view>

#include "twinkit/error.hpp"
#include "twinkit/types.hpp"

namespace twinkit::codec {

/*
===============================================================================
Byte / text codecs
===============================================================================

Every call is served by the kernel table picked once per process by the
dispatcher (see twinkit/dispatch/dispatcher.hpp). Native and fallback tables
produce identical results for every input, malformed UTF-8 included.

Hex output is lowercase; hex input accepts both cases. Base64 uses the
standard alphabet with '=' padding and is strict on decode: the length must
be a multiple of 4, at most two '=' may appear and only at the very end, and
every other character must belong to the alphabet.
===============================================================================
*/

[[nodiscard]] std::string hex_encode(BytesView bytes);
[[nodiscard]] std::string hex_encode(std::string_view text);
[[nodiscard]] Error hex_decode(std::string_view text, Bytes& out);

[[nodiscard]] std::string base64_encode(BytesView bytes);
[[nodiscard]] std::string base64_encode(std::string_view text);
[[nodiscard]] Error base64_decode(std::string_view text, Bytes& out);

// True when `text` decodes strictly to a non-empty byte string
[[nodiscard]] bool is_base64(std::string_view text);

// True when every code point is below U+0080 (vacuously true for "")
[[nodiscard]] bool is_ascii(std::string_view text) noexcept;

// True when `text` is non-empty and made only of [0-9a-fA-F]
[[nodiscard]] bool is_hex(std::string_view text) noexcept;

// True when any code point lies in the Hebrew block U+0590..U+05FF
[[nodiscard]] bool is_hebrew(std::string_view text) noexcept;

// Keeps only code points below U+0080, in order
[[nodiscard]] std::string filter_ascii(std::string_view text);

// Keeps only ASCII '0'..'9', in order
[[nodiscard]] std::string extract_digits(std::string_view text);

} // namespace twinkit::codec
