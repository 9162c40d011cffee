#pragma once

#include <string>
#include <string_view>
#include <cstdint>


namespace lcr {
namespace json {


// Appends `s` as a quoted JSON string. Control characters are written as
// \u00XX; bytes >= 0x80 are copied through (input is UTF-8).
inline void append_escaped(std::string& out, std::string_view s) {
    static constexpr char HEX[] = "0123456789abcdef";
    out.reserve(out.size() + s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default: {
                const auto u = static_cast<unsigned char>(c);
                if (u < 0x20) {
                    out += "\\u00";
                    out.push_back(HEX[u >> 4]);
                    out.push_back(HEX[u & 0x0F]);
                } else {
                    out.push_back(c);
                }
            }
        }
    }
    out.push_back('"');
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value)
{
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

inline void append(std::string& out, std::int64_t value)
{
    if (value < 0) {
        out.push_back('-');
        // two's complement negation without overflow on INT64_MIN
        append(out, static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(value));
        return;
    }
    append(out, static_cast<std::uint64_t>(value));
}

} // namespace json
} // namespace lcr
