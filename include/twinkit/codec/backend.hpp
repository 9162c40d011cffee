#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "twinkit/error.hpp"
#include "twinkit/types.hpp"

namespace twinkit::codec {

// -----------------------------------------------------------------------------
// CodecBackend
// -----------------------------------------------------------------------------
//
// Contract every codec kernel set satisfies. Backends are stateless structs
// of static functions; the dispatcher captures them into a Kernels table.
//
//   • Encoders append nothing: `out` is replaced
//   • Decoders validate the whole input before touching `out`
//   • Predicates are total and never allocate
//
// -----------------------------------------------------------------------------

template<class B>
concept CodecBackend =
    requires(
        BytesView bytes,
        std::string_view text,
        std::string& out_text,
        Bytes& out_bytes
    )
{
    { B::name } -> std::convertible_to<std::string_view>;

    // ---------------------------------------------------------------------
    // Hex
    // ---------------------------------------------------------------------
    { B::hex_encode(bytes, out_text) } -> std::same_as<void>;
    { B::hex_decode(text, out_bytes) } -> std::same_as<Error>;

    // ---------------------------------------------------------------------
    // Base64 (standard alphabet, padded)
    // ---------------------------------------------------------------------
    { B::base64_encode(bytes, out_text) } -> std::same_as<void>;
    { B::base64_decode(text, out_bytes) } -> std::same_as<Error>;

    // ---------------------------------------------------------------------
    // Text classification / filtering
    // ---------------------------------------------------------------------
    { B::is_ascii(text) } noexcept -> std::same_as<bool>;
    { B::is_hex(text) } noexcept -> std::same_as<bool>;
    { B::is_hebrew(text) } noexcept -> std::same_as<bool>;
    { B::filter_ascii(text, out_text) } -> std::same_as<void>;
    { B::extract_digits(text, out_text) } -> std::same_as<void>;
};


// -----------------------------------------------------------------------------
// Kernels: runtime table of one backend's entry points
// -----------------------------------------------------------------------------
struct Kernels {
    std::string_view name;

    void  (*hex_encode)(BytesView, std::string&);
    Error (*hex_decode)(std::string_view, Bytes&);
    void  (*base64_encode)(BytesView, std::string&);
    Error (*base64_decode)(std::string_view, Bytes&);
    bool  (*is_ascii)(std::string_view) noexcept;
    bool  (*is_hex)(std::string_view) noexcept;
    bool  (*is_hebrew)(std::string_view) noexcept;
    void  (*filter_ascii)(std::string_view, std::string&);
    void  (*extract_digits)(std::string_view, std::string&);
};

template<CodecBackend B>
[[nodiscard]] constexpr Kernels make_kernels() noexcept {
    return Kernels{
        B::name,
        &B::hex_encode,
        &B::hex_decode,
        &B::base64_encode,
        &B::base64_decode,
        &B::is_ascii,
        &B::is_hex,
        &B::is_hebrew,
        &B::filter_ascii,
        &B::extract_digits
    };
}

} // namespace twinkit::codec
