#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "twinkit/error.hpp"
#include "twinkit/structure/value.hpp"

namespace twinkit::structure {

// Caller supplied key rewrite (e.g. snake_case -> camelCase)
using KeyFn = std::function<std::string(std::string_view)>;

// True for Mapping, List, Tuple and Set; strings and bytes are scalars here
[[nodiscard]] bool is_structural_container(const Value& v) noexcept;

// -----------------------------------------------------------------------------
// sort_keys_recursively
// -----------------------------------------------------------------------------
// Reorders every mapping's keys ascending (byte-wise), descending through
// mappings and sequences. Sequence order and scalars are preserved.
// A scalar argument is a ValueError.
[[nodiscard]] Error sort_keys_recursively(const Value& in, Value& out);

// -----------------------------------------------------------------------------
// change_keys_case
// -----------------------------------------------------------------------------
// String / bytes argument: returns key_fn applied to it.
// Mapping: keys starting with '_' are first merged into their stripped twin
//   when the twin exists and is falsy (the '_' key itself is kept), then
//   every key is rewritten. Keys colliding after rewrite keep the position of
//   the first and the value of the last. With `deep`, container values are
//   converted too.
// List / Tuple / Set: container elements are converted (same container
//   kind out), scalar elements are left untouched.
// Other scalars are returned unchanged.
[[nodiscard]] Error change_keys_case(const Value& in, const KeyFn& key_fn, bool deep, Value& out);

// -----------------------------------------------------------------------------
// flatten_keys
// -----------------------------------------------------------------------------
// Collapses nested mappings into one level with dotted paths:
//   {"a": {"b": 1}}           -> {"a.b": 1}
//   {"a": [{"b": 1}, 2]}      -> {"a.[0].b": 1, "a[1]": 2}
// Sequences at the top level are flattened element-wise; a scalar argument
// is a ValueError.
[[nodiscard]] Error flatten_keys(const Value& in, Value& out);

// Rewrites keys deeply with key_fn, flattens, then sorts
[[nodiscard]] Error to_dot_case(const Value& in, const KeyFn& key_fn, Value& out);

} // namespace twinkit::structure
