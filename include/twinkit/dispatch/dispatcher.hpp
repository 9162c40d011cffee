#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "twinkit/policy/backend.hpp"
#include "twinkit/codec/backend.hpp"
#include "twinkit/checksum/backend.hpp"
#include "twinkit/identifier/backend.hpp"

namespace twinkit::dispatch {

// -----------------------------------------------------------------------------
// Dual path dispatcher
// -----------------------------------------------------------------------------
//
// Each operation family owns two kernel tables. The active one is chosen the
// first time any family is used and never changes afterwards:
//
//   1. policy from TWINKIT_BACKEND (auto | native | fallback), default auto
//   2. native not compiled in          -> fallback
//   3. native disagrees with fallback  -> fallback (+ warning)
//      on the family's known-answer vectors
//
// Selection is published through a function-local static, so concurrent
// first calls are safe and later calls are plain loads.
// -----------------------------------------------------------------------------

enum class Family : std::uint8_t {
    Codec,
    Checksum,
    Identifier
};

enum class Path : std::uint8_t {
    Native,
    Fallback
};

[[nodiscard]]
inline constexpr std::string_view to_string(Family f) noexcept {
    switch (f) {
        case Family::Codec:      return "codec";
        case Family::Checksum:   return "checksum";
        case Family::Identifier: return "identifier";
        default:                 return "unknown";
    }
}

[[nodiscard]]
inline constexpr std::string_view to_string(Path p) noexcept {
    switch (p) {
        case Path::Native:   return "native";
        case Path::Fallback: return "fallback";
        default:             return "unknown";
    }
}

// True when the native kernels were compiled into this build
[[nodiscard]]
inline constexpr bool native_compiled() noexcept {
#if defined(TWINKIT_HAVE_NATIVE) && TWINKIT_HAVE_NATIVE
    return true;
#else
    return false;
#endif
}

struct Selection {
    policy::Backend policy{policy::Backend::Auto};
    Path codec{Path::Fallback};
    Path checksum{Path::Fallback};
    Path identifier{Path::Fallback};
    std::string cpu;   // detected CPU features, diagnostics only

    [[nodiscard]] Path path(Family f) const noexcept {
        switch (f) {
            case Family::Codec:      return codec;
            case Family::Checksum:   return checksum;
            case Family::Identifier: return identifier;
        }
        return Path::Fallback;
    }
};

// Runs the resolution steps 2-3 for an explicit policy. Does not touch the
// process-wide selection.
[[nodiscard]] Selection resolve(policy::Backend policy);

// Process-wide selection (resolved on first call)
[[nodiscard]] const Selection& selection();

[[nodiscard]] const codec::Kernels& codec() noexcept;
[[nodiscard]] const checksum::Kernels& checksum() noexcept;
[[nodiscard]] const identifier::Kernels& identifier() noexcept;

template<Family F>
[[nodiscard]] const auto& kernels() noexcept {
    if constexpr (F == Family::Codec) {
        return codec();
    } else if constexpr (F == Family::Checksum) {
        return checksum();
    } else {
        return identifier();
    }
}

} // namespace twinkit::dispatch
