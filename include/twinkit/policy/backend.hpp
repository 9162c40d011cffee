#pragma once

#include <cstdint>
#include <string_view>


namespace twinkit::policy {

// ============================================================================
// Backend Policy
// ============================================================================
//
// Chooses which kernel table serves the public API.
//
// Auto     -> native when compiled in and its self-test agrees with fallback
// Native   -> same as Auto, but a missing or failing native path is a warning
// Fallback -> always the readable reference kernels
// ============================================================================

enum class Backend : uint8_t {
    Auto,
    Native,
    Fallback
};

[[nodiscard]]
inline constexpr std::string_view to_string(Backend b) noexcept {
    switch (b) {
        case Backend::Auto:     return "auto";
        case Backend::Native:   return "native";
        case Backend::Fallback: return "fallback";
        default:                return "unknown";
    }
}

// Parses a policy name. Returns false (leaving `out` untouched) on unknown input.
[[nodiscard]]
inline constexpr bool parse(std::string_view s, Backend& out) noexcept {
    if (s == "auto")     { out = Backend::Auto;     return true; }
    if (s == "native")   { out = Backend::Native;   return true; }
    if (s == "fallback") { out = Backend::Fallback; return true; }
    return false;
}

} // namespace twinkit::policy
