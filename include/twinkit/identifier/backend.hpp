#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <concepts>

#include "twinkit/error.hpp"
#include "twinkit/identifier/uuid.hpp"

namespace twinkit::identifier {

// -----------------------------------------------------------------------------
// IdentifierBackend
// -----------------------------------------------------------------------------
//
//   layout_v7      48-bit big-endian Unix milliseconds, version 7 nibble,
//                  variant 0b10, remaining 74 bits from the entropy bytes
//                  (rand_a = low nibble of e[0] and e[1],
//                   rand_b = low 6 bits of e[2] and e[3..9])
//   format         canonical 8-4-4-4-12 text in the requested case
//   parse_unix_ms  strips '-', requires 32 digits, reads the leading 12 as
//                  the 48-bit millisecond timestamp
// -----------------------------------------------------------------------------

template<class B>
concept IdentifierBackend =
    requires(
        std::uint64_t unix_ms,
        const Entropy& entropy,
        const Uuid& id,
        Uuid& out_id,
        LetterCase casing,
        std::string& out_text,
        std::string_view text,
        std::uint64_t& out_ms
    )
{
    { B::name } -> std::convertible_to<std::string_view>;
    { B::layout_v7(unix_ms, entropy, out_id) } noexcept -> std::same_as<void>;
    { B::format(id, casing, out_text) } -> std::same_as<void>;
    { B::parse_unix_ms(text, out_ms) } -> std::same_as<Error>;
};

struct Kernels {
    std::string_view name;

    void  (*layout_v7)(std::uint64_t, const Entropy&, Uuid&) noexcept;
    void  (*format)(const Uuid&, LetterCase, std::string&);
    Error (*parse_unix_ms)(std::string_view, std::uint64_t&);
};

template<IdentifierBackend B>
[[nodiscard]] constexpr Kernels make_kernels() noexcept {
    return Kernels{ B::name, &B::layout_v7, &B::format, &B::parse_unix_ms };
}

// Reference kernels: 128-bit value built as two 64-bit halves
struct Fallback {
    static constexpr std::string_view name = "fallback";

    static void layout_v7(std::uint64_t unix_ms, const Entropy& entropy, Uuid& out) noexcept;
    static void format(const Uuid& id, LetterCase casing, std::string& out);
    [[nodiscard]] static Error parse_unix_ms(std::string_view text, std::uint64_t& out);
};

// Byte-level kernels: direct stores and lookup-table formatting
struct Native {
    static constexpr std::string_view name = "native";

    static void layout_v7(std::uint64_t unix_ms, const Entropy& entropy, Uuid& out) noexcept;
    static void format(const Uuid& id, LetterCase casing, std::string& out);
    [[nodiscard]] static Error parse_unix_ms(std::string_view text, std::uint64_t& out);
};

} // namespace twinkit::identifier
