#pragma once

#include <array>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "twinkit/checksum.hpp"
#include "twinkit/codec.hpp"


namespace twinkit::examples::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline constexpr std::array<std::string_view, 6> valid_log_levels = {
    "trace", "debug", "info", "warn", "error", "off"
};

inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        for (auto v : valid_log_levels) {
            if (value == v) {
                return {};
            }
        }
        return "Log level must be one of: trace, debug, info, warn, error, off";
    },
    "Log level validator"
);


// -------------------------------------------------------------
// Hex text validator
// -------------------------------------------------------------
inline auto hex_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty() || codec::is_hex(value)) {
            return {};
        }
        return "Value must contain only hex digits [0-9a-fA-F]";
    },
    "Hex validator"
);


// -------------------------------------------------------------
// Digits-only validator (national identifiers)
// -------------------------------------------------------------
inline auto digits_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (!value.empty() && codec::extract_digits(value).size() == value.size()) {
            return {};
        }
        return "Identifier must contain only ASCII digits";
    },
    "Digits validator"
);

} // namespace twinkit::examples::cli
