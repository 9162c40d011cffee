#include "twinkit/structure/transform.hpp"
#include "twinkit/config/structure.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "lcr/log/logger.hpp"

namespace twinkit::structure {

using config::structure::MAX_DEPTH;
using config::structure::MERGE_PREFIX;
using config::structure::PATH_SEPARATOR;

namespace {

Error too_deep() {
    TK_DEBUG("[STRUCT] Nesting exceeds " << MAX_DEPTH << " levels");
    return Error::ValueError;
}

// Applies fn to every element of a sequence value, rebuilding the same kind
template <typename Fn>
Error map_sequence(const Value& in, Fn&& fn, Value& out) {
    auto convert = [&](const std::vector<Value>& items, std::vector<Value>& result) -> Error {
        result.reserve(items.size());
        for (const Value& item : items) {
            Value converted;
            const Error err = fn(item, converted);
            if (err != Error::None) {
                return err;
            }
            result.push_back(std::move(converted));
        }
        return Error::None;
    };

    std::vector<Value> items;
    switch (in.kind()) {
        case Kind::List: {
            const Error err = convert(in.get_if<List>()->items, items);
            if (err != Error::None) return err;
            out = List(std::move(items));
            return Error::None;
        }
        case Kind::Tuple: {
            const Error err = convert(in.get_if<Tuple>()->items, items);
            if (err != Error::None) return err;
            out = Tuple(std::move(items));
            return Error::None;
        }
        case Kind::Set: {
            const Error err = convert(in.get_if<Set>()->items(), items);
            if (err != Error::None) return err;
            Set result;
            for (Value& v : items) {
                result.insert(std::move(v));
            }
            out = std::move(result);
            return Error::None;
        }
        default:
            return Error::ValueError;
    }
}


// ============================================================================
// Sorting
// ============================================================================

Error sort_value(const Value& in, std::size_t depth, Value& out) {
    if (depth > MAX_DEPTH) {
        return too_deep();
    }

    if (const Mapping* m = in.get_if<Mapping>()) {
        std::vector<const Mapping::Entry*> order;
        order.reserve(m->size());
        for (const auto& entry : *m) {
            order.push_back(&entry);
        }
        std::sort(order.begin(), order.end(), [](const auto* a, const auto* b) {
            return a->first < b->first;
        });

        Mapping sorted;
        sorted.reserve(order.size());
        for (const auto* entry : order) {
            Value child;
            const Error err = sort_value(entry->second, depth + 1, child);
            if (err != Error::None) {
                return err;
            }
            sorted.set(entry->first, std::move(child));
        }
        out = std::move(sorted);
        return Error::None;
    }

    if (in.is_container()) {
        return map_sequence(in, [depth](const Value& item, Value& converted) {
            return sort_value(item, depth + 1, converted);
        }, out);
    }

    out = in;
    return Error::None;
}


// ============================================================================
// Key case conversion
// ============================================================================

Error change_value(const Value& in, const KeyFn& key_fn, bool deep, std::size_t depth, Value& out);

Error change_mapping(const Mapping& in, const KeyFn& key_fn, bool deep, std::size_t depth, Value& out) {
    // '_key' fills 'key' when 'key' exists but is falsy
    Mapping merged = in;
    for (const auto& [key, value] : in) {
        if (key.empty() || key.front() != MERGE_PREFIX) {
            continue;
        }
        const std::size_t start = key.find_first_not_of(MERGE_PREFIX);
        const std::string_view stripped = (start == std::string::npos)
            ? std::string_view{}
            : std::string_view(key).substr(start);
        Value* target = merged.find(stripped);
        if (target != nullptr && !target->truthy()) {
            *target = value;
        }
    }

    Mapping result;
    result.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        std::string new_key = key_fn(key);
        if (deep && value.is_container()) {
            Value child;
            const Error err = change_value(value, key_fn, deep, depth + 1, child);
            if (err != Error::None) {
                return err;
            }
            result.set(std::move(new_key), std::move(child));
        } else {
            result.set(std::move(new_key), value);
        }
    }
    out = std::move(result);
    return Error::None;
}

Error change_value(const Value& in, const KeyFn& key_fn, bool deep, std::size_t depth, Value& out) {
    if (depth > MAX_DEPTH) {
        return too_deep();
    }

    switch (in.kind()) {
        case Kind::String:
            out = Value(key_fn(*in.get_if<std::string>()));
            return Error::None;
        case Kind::Bytes: {
            const ByteString& raw = *in.get_if<ByteString>();
            const std::string_view text(reinterpret_cast<const char*>(raw.data()), raw.size());
            out = Value(key_fn(text));
            return Error::None;
        }
        case Kind::Mapping:
            return change_mapping(*in.get_if<Mapping>(), key_fn, deep, depth, out);
        case Kind::List:
        case Kind::Tuple:
        case Kind::Set:
            return map_sequence(in, [&](const Value& item, Value& converted) -> Error {
                if (!item.is_container()) {
                    converted = item;
                    return Error::None;
                }
                return change_value(item, key_fn, deep, depth + 1, converted);
            }, out);
        default:
            out = in;
            return Error::None;
    }
}


// ============================================================================
// Flattening
// ============================================================================

Error flatten_into(const Mapping& in, const std::string& prefix, std::size_t depth, Mapping& out);

Error flatten_value(const Value& in, const std::string& prefix, std::size_t depth, Value& out) {
    if (depth > MAX_DEPTH) {
        return too_deep();
    }
    if (const Mapping* m = in.get_if<Mapping>()) {
        Mapping flat;
        const Error err = flatten_into(*m, prefix, depth, flat);
        if (err != Error::None) {
            return err;
        }
        out = std::move(flat);
        return Error::None;
    }
    if (!in.is_container()) {
        return Error::ValueError;
    }
    return map_sequence(in, [&](const Value& item, Value& converted) -> Error {
        if (!item.is_container()) {
            converted = item;
            return Error::None;
        }
        return flatten_value(item, prefix, depth + 1, converted);
    }, out);
}

Error flatten_into(const Mapping& in, const std::string& prefix, std::size_t depth, Mapping& out) {
    if (depth > MAX_DEPTH) {
        return too_deep();
    }
    for (const auto& [key, value] : in) {
        const std::string path = prefix.empty() ? key : prefix + PATH_SEPARATOR + key;

        if (const Mapping* child = value.get_if<Mapping>()) {
            const Error err = flatten_into(*child, path, depth + 1, out);
            if (err != Error::None) {
                return err;
            }
        } else if (const List* list = value.get_if<List>()) {
            for (std::size_t i = 0; i < list->items.size(); ++i) {
                const Value& item = list->items[i];
                const std::string index = std::to_string(i);
                if (const Mapping* element = item.get_if<Mapping>()) {
                    const std::string element_path = path + PATH_SEPARATOR + "[" + index + "]";
                    const Error err = flatten_into(*element, element_path, depth + 1, out);
                    if (err != Error::None) {
                        return err;
                    }
                } else {
                    out.set(path + "[" + index + "]", item);
                }
            }
        } else {
            out.set(path, value);
        }
    }
    return Error::None;
}

} // namespace


bool is_structural_container(const Value& v) noexcept {
    return v.is_container();
}

Error sort_keys_recursively(const Value& in, Value& out) {
    if (!in.is_container()) {
        TK_DEBUG("[STRUCT] sort_keys_recursively on a " << to_string(in.kind()));
        return Error::ValueError;
    }
    return sort_value(in, 0, out);
}

Error change_keys_case(const Value& in, const KeyFn& key_fn, bool deep, Value& out) {
    if (!key_fn) {
        return Error::ValueError;
    }
    return change_value(in, key_fn, deep, 0, out);
}

Error flatten_keys(const Value& in, Value& out) {
    return flatten_value(in, std::string{}, 0, out);
}

Error to_dot_case(const Value& in, const KeyFn& key_fn, Value& out) {
    Value rewritten;
    Error err = change_keys_case(in, key_fn, true, rewritten);
    if (err != Error::None) {
        return err;
    }
    Value flat;
    err = flatten_keys(rewritten, flat);
    if (err != Error::None) {
        return err;
    }
    return sort_keys_recursively(flat, out);
}

} // namespace twinkit::structure
