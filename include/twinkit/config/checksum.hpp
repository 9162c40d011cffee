#pragma once

#include <cstddef>


namespace twinkit::config::checksum {

// Fixed width of a national identifier once left-padded with '0'.
// Longer inputs are rejected outright.
inline constexpr static std::size_t NATIONAL_ID_WIDTH = 9;

} // namespace twinkit::config::checksum
