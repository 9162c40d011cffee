#pragma once

#include <cstdint>
#include <string_view>

namespace twinkit {

// -----------------------------------------------------------------------------
// Error classification
// -----------------------------------------------------------------------------
//
// Every fallible operation returns one of these and writes its result into an
// out-parameter. Predicates never fail: malformed input simply yields false.
//
//   FormatError    input text is not valid for the requested encoding
//   ResourceError  the platform could not supply entropy or a clock reading
//   ValueError     argument of the wrong shape (non-container, unknown base,
//                  nesting beyond the depth limit)
// -----------------------------------------------------------------------------
enum class Error : uint8_t {
    None = 0,
    FormatError,
    ResourceError,
    ValueError
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
        case Error::None:           return "None";
        case Error::FormatError:    return "FormatError";
        case Error::ResourceError:  return "ResourceError";
        case Error::ValueError:     return "ValueError";
        default:                    return "Unknown";
    }
}

} // namespace twinkit
