#pragma once

#include <string_view>
#include <concepts>

namespace twinkit::checksum {

// -----------------------------------------------------------------------------
// ChecksumBackend
// -----------------------------------------------------------------------------
//
// A national identifier is valid when it has at most 9 ASCII digits and, once
// left-padded with '0' to 9 digits, its Luhn-style weighted sum is a multiple
// of 10 (weights alternate 1,2 from the left; products above 9 lose 9).
// Empty input is invalid.
// -----------------------------------------------------------------------------

template<class B>
concept ChecksumBackend =
    requires(std::string_view text)
{
    { B::name } -> std::convertible_to<std::string_view>;
    { B::is_valid_national_id(text) } noexcept -> std::same_as<bool>;
};

struct Kernels {
    std::string_view name;
    bool (*is_valid_national_id)(std::string_view) noexcept;
};

template<ChecksumBackend B>
[[nodiscard]] constexpr Kernels make_kernels() noexcept {
    return Kernels{ B::name, &B::is_valid_national_id };
}

// Reference kernel: pads into a fixed buffer, then walks it
struct Fallback {
    static constexpr std::string_view name = "fallback";
    [[nodiscard]] static bool is_valid_national_id(std::string_view text) noexcept;
};

// Table kernel: no padding, weights derived from the distance to the end
struct Native {
    static constexpr std::string_view name = "native";
    [[nodiscard]] static bool is_valid_national_id(std::string_view text) noexcept;
};

} // namespace twinkit::checksum
