#pragma once

#include <string>
#include <string_view>

#include "twinkit/error.hpp"
#include "twinkit/types.hpp"

namespace twinkit::codec {

// Reference kernels: readable, one character (or code point) at a time.
// Text predicates decode UTF-8 and classify code points.
struct Fallback {
    static constexpr std::string_view name = "fallback";

    static void  hex_encode(BytesView bytes, std::string& out);
    [[nodiscard]] static Error hex_decode(std::string_view text, Bytes& out);

    static void  base64_encode(BytesView bytes, std::string& out);
    [[nodiscard]] static Error base64_decode(std::string_view text, Bytes& out);

    [[nodiscard]] static bool is_ascii(std::string_view text) noexcept;
    [[nodiscard]] static bool is_hex(std::string_view text) noexcept;
    [[nodiscard]] static bool is_hebrew(std::string_view text) noexcept;
    static void  filter_ascii(std::string_view text, std::string& out);
    static void  extract_digits(std::string_view text, std::string& out);
};

} // namespace twinkit::codec
