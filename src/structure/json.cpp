#include "twinkit/structure/json.hpp"
#include "twinkit/config/structure.hpp"
#include "twinkit/codec.hpp"

#include <cmath>
#include <format>
#include <iterator>

#include "simdjson.h"

#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"

namespace twinkit::structure {

using config::structure::MAX_DEPTH;

namespace {

// ============================================================================
// simdjson DOM -> Value
// ============================================================================

Error convert(const simdjson::dom::element& el, std::size_t depth, Value& out) {
    if (depth > MAX_DEPTH) {
        return Error::ValueError;
    }

    switch (el.type()) {
        case simdjson::dom::element_type::OBJECT: {
            simdjson::dom::object obj;
            if (el.get(obj)) {
                return Error::FormatError;
            }
            Mapping m;
            for (auto field : obj) {
                Value child;
                const Error err = convert(field.value, depth + 1, child);
                if (err != Error::None) {
                    return err;
                }
                m.set(std::string(field.key), std::move(child));
            }
            out = std::move(m);
            return Error::None;
        }
        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array arr;
            if (el.get(arr)) {
                return Error::FormatError;
            }
            List list;
            for (simdjson::dom::element item : arr) {
                Value child;
                const Error err = convert(item, depth + 1, child);
                if (err != Error::None) {
                    return err;
                }
                list.items.push_back(std::move(child));
            }
            out = std::move(list);
            return Error::None;
        }
        case simdjson::dom::element_type::INT64: {
            int64_t v = 0;
            if (el.get(v)) return Error::FormatError;
            out = Value(std::int64_t{v});
            return Error::None;
        }
        case simdjson::dom::element_type::UINT64: {
            // only reached above INT64_MAX
            uint64_t v = 0;
            if (el.get(v)) return Error::FormatError;
            out = Value(static_cast<double>(v));
            return Error::None;
        }
        case simdjson::dom::element_type::DOUBLE: {
            double v = 0;
            if (el.get(v)) return Error::FormatError;
            out = Value(v);
            return Error::None;
        }
        case simdjson::dom::element_type::STRING: {
            std::string_view v;
            if (el.get(v)) return Error::FormatError;
            out = Value(std::string(v));
            return Error::None;
        }
        case simdjson::dom::element_type::BOOL: {
            bool v = false;
            if (el.get(v)) return Error::FormatError;
            out = Value(v);
            return Error::None;
        }
        case simdjson::dom::element_type::NULL_VALUE:
            out = Value(nullptr);
            return Error::None;
    }
    return Error::FormatError;
}


// ============================================================================
// Value -> JSON text
// ============================================================================

Error write(const Value& v, std::size_t depth, std::string& out);

Error write_items(const std::vector<Value>& items, std::size_t depth, std::string& out) {
    out.push_back('[');
    bool first = true;
    for (const Value& item : items) {
        if (!first) out.push_back(',');
        first = false;
        const Error err = write(item, depth + 1, out);
        if (err != Error::None) {
            return err;
        }
    }
    out.push_back(']');
    return Error::None;
}

void write_double(double d, std::string& out) {
    if (!std::isfinite(d)) {
        out += "null";
        return;
    }
    const std::size_t start = out.size();
    std::format_to(std::back_inserter(out), "{}", d);
    // keep floats distinguishable from integers on the way back in
    if (out.find_first_of(".eE", start) == std::string::npos) {
        out += ".0";
    }
}

Error write(const Value& v, std::size_t depth, std::string& out) {
    if (depth > MAX_DEPTH) {
        return Error::ValueError;
    }

    switch (v.kind()) {
        case Kind::Null:
            out += "null";
            return Error::None;
        case Kind::Bool:
            out += *v.get_if<bool>() ? "true" : "false";
            return Error::None;
        case Kind::Int:
            lcr::json::append(out, *v.get_if<std::int64_t>());
            return Error::None;
        case Kind::Float:
            write_double(*v.get_if<double>(), out);
            return Error::None;
        case Kind::String:
            lcr::json::append_escaped(out, *v.get_if<std::string>());
            return Error::None;
        case Kind::Bytes:
            lcr::json::append_escaped(out, codec::base64_encode(BytesView(*v.get_if<ByteString>())));
            return Error::None;
        case Kind::Mapping: {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, child] : *v.get_if<Mapping>()) {
                if (!first) out.push_back(',');
                first = false;
                lcr::json::append_escaped(out, key);
                out.push_back(':');
                const Error err = write(child, depth + 1, out);
                if (err != Error::None) {
                    return err;
                }
            }
            out.push_back('}');
            return Error::None;
        }
        case Kind::List:
            return write_items(v.get_if<List>()->items, depth, out);
        case Kind::Tuple:
            return write_items(v.get_if<Tuple>()->items, depth, out);
        case Kind::Set:
            return write_items(v.get_if<Set>()->items(), depth, out);
    }
    return Error::ValueError;
}

} // namespace


Error from_json(std::string_view text, Value& out) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    auto error = parser.parse(text.data(), text.size()).get(root);
    if (error) {
        TK_DEBUG("[JSON] Parse error: " << simdjson::error_message(error));
        return Error::FormatError;
    }
    Value result;
    const Error err = convert(root, 0, result);
    if (err != Error::None) {
        return err;
    }
    out = std::move(result);
    return Error::None;
}

Error to_json(const Value& value, std::string& out) {
    std::string text;
    const Error err = write(value, 0, text);
    if (err != Error::None) {
        return err;
    }
    out = std::move(text);
    return Error::None;
}

} // namespace twinkit::structure
