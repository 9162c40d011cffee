#include "twinkit/codec.hpp"
#include "twinkit/dispatch/dispatcher.hpp"

namespace twinkit::codec {

std::string hex_encode(BytesView bytes) {
    std::string out;
    dispatch::codec().hex_encode(bytes, out);
    return out;
}

std::string hex_encode(std::string_view text) {
    return hex_encode(as_bytes(text));
}

Error hex_decode(std::string_view text, Bytes& out) {
    return dispatch::codec().hex_decode(text, out);
}

std::string base64_encode(BytesView bytes) {
    std::string out;
    dispatch::codec().base64_encode(bytes, out);
    return out;
}

std::string base64_encode(std::string_view text) {
    return base64_encode(as_bytes(text));
}

Error base64_decode(std::string_view text, Bytes& out) {
    return dispatch::codec().base64_decode(text, out);
}

bool is_base64(std::string_view text) {
    Bytes decoded;
    return base64_decode(text, decoded) == Error::None && !decoded.empty();
}

bool is_ascii(std::string_view text) noexcept {
    return dispatch::codec().is_ascii(text);
}

bool is_hex(std::string_view text) noexcept {
    return dispatch::codec().is_hex(text);
}

bool is_hebrew(std::string_view text) noexcept {
    return dispatch::codec().is_hebrew(text);
}

std::string filter_ascii(std::string_view text) {
    std::string out;
    dispatch::codec().filter_ascii(text, out);
    return out;
}

std::string extract_digits(std::string_view text) {
    std::string out;
    dispatch::codec().extract_digits(text, out);
    return out;
}

} // namespace twinkit::codec
