#pragma once

#include <array>
#include <cstdint>

#include "twinkit/config/identifier.hpp"

namespace twinkit::identifier {

// 128-bit identifier in network (big-endian) byte order
using Uuid = std::array<std::uint8_t, config::identifier::UUID_BYTES>;

// Random bytes consumed by one v7 layout
using Entropy = std::array<std::uint8_t, config::identifier::ENTROPY_BYTES>;

// Case of the hex digits in the canonical text form
enum class LetterCase : std::uint8_t {
    Lower,
    Upper
};

// Version nibble (high half of byte 6)
[[nodiscard]] inline constexpr std::uint8_t version(const Uuid& id) noexcept {
    return static_cast<std::uint8_t>(id[6] >> 4);
}

// Top two bits of byte 8 (0b10 for RFC 4122/9562 identifiers)
[[nodiscard]] inline constexpr std::uint8_t variant(const Uuid& id) noexcept {
    return static_cast<std::uint8_t>(id[8] >> 6);
}

} // namespace twinkit::identifier
