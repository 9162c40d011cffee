#pragma once

#include <cstddef>


namespace twinkit::config::identifier {

/*
===============================================================================
UUID layout constants
===============================================================================

Canonical text form is 8-4-4-4-12 hex digits separated by '-'. Version 7 keeps
the Unix epoch in milliseconds in the first 48 bits and fills the remaining
74 non-fixed bits from the entropy source.
===============================================================================
*/

inline constexpr static std::size_t UUID_BYTES           = 16;
inline constexpr static std::size_t UUID_TEXT_LENGTH     = 36;
inline constexpr static std::size_t UUID_HEX_DIGITS      = 32;

// Leading hex digits holding the millisecond timestamp
inline constexpr static std::size_t TIMESTAMP_HEX_DIGITS = 12;

// Random bytes consumed per v7 identifier (bytes 6..15)
inline constexpr static std::size_t ENTROPY_BYTES        = 10;

// Joins stable identifier parts before hashing
inline constexpr static char STABLE_UUID_SEPARATOR       = '|';

} // namespace twinkit::config::identifier
