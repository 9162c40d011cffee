#pragma once

#include <cstddef>


namespace twinkit::config::structure {

// Nesting levels a transformer descends before failing with ValueError.
// Bounds stack usage on hostile input.
inline constexpr static std::size_t MAX_DEPTH = 256;

// Keys starting with this character are merge candidates for their stripped
// counterpart during key case conversion
inline constexpr static char MERGE_PREFIX = '_';

// Separator used when flattening nested mappings into dotted keys
inline constexpr static char PATH_SEPARATOR = '.';

} // namespace twinkit::config::structure
