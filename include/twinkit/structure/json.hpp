#pragma once

#include <string>
#include <string_view>

#include "twinkit/error.hpp"
#include "twinkit/structure/value.hpp"

namespace twinkit::structure {

/*
================================================================================
JSON bridge
================================================================================

from_json  objects -> Mapping (document key order, duplicate keys: last wins),
           arrays -> List, integers -> Int (unsigned values above INT64_MAX
           become Float), strings/bool/null/doubles map directly.
           FormatError on malformed JSON, ValueError beyond the depth limit.

to_json    compact output. Tuple and Set are written as arrays, Bytes as a
           base64 string, non-finite floats as null.
================================================================================
*/

[[nodiscard]] Error from_json(std::string_view text, Value& out);

[[nodiscard]] Error to_json(const Value& value, std::string& out);

} // namespace twinkit::structure
