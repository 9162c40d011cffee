#include <iostream>
#include <string>

#include "twinkit/codec/backend.hpp"
#include "twinkit/codec/fallback.hpp"
#include "twinkit/codec/native.hpp"
#include "common/test_check.hpp"

using namespace twinkit;

/*
================================================================================
Codec Kernels: Unit Tests
================================================================================

Every test runs against each compiled backend. The same expectations apply to
both: a backend passing here is a drop-in replacement for the other.

Covered:
  • hex encode/decode, odd length and bad digits
  • base64 encode/decode, strict padding placement
  • decode failures leave the output untouched
  • ASCII / hex / Hebrew predicates on valid and malformed UTF-8
  • ASCII filtering and digit extraction
================================================================================
*/

static Bytes bytes_of(std::string_view s) {
    return Bytes(s.begin(), s.end());
}

template <codec::CodecBackend B>
void test_hex() {
    std::cout << "[TEST] hex (" << B::name << ")..." << std::endl;

    std::string text;
    B::hex_encode(as_bytes("ab"), text);
    TEST_CHECK_EQ(text, std::string("6162"));

    B::hex_encode(BytesView{}, text);
    TEST_CHECK(text.empty());

    const Bytes raw{0x00, 0x0f, 0x7f, 0x80, 0xff};
    B::hex_encode(raw, text);
    TEST_CHECK_EQ(text, std::string("000f7f80ff"));

    Bytes out;
    TEST_CHECK(B::hex_decode("6162", out) == Error::None);
    TEST_CHECK(out == bytes_of("ab"));

    TEST_CHECK(B::hex_decode("000F7f80FF", out) == Error::None);
    TEST_CHECK(out == raw);

    TEST_CHECK(B::hex_decode("", out) == Error::None);
    TEST_CHECK(out.empty());

    std::cout << "[TEST] OK\n";
}

template <codec::CodecBackend B>
void test_hex_rejects_malformed() {
    std::cout << "[TEST] hex malformed input (" << B::name << ")..." << std::endl;

    const Bytes sentinel{0x01};
    Bytes out = sentinel;

    TEST_CHECK(B::hex_decode("abc", out) == Error::FormatError);
    TEST_CHECK(B::hex_decode("61g2", out) == Error::FormatError);
    TEST_CHECK(B::hex_decode("0x1F", out) == Error::FormatError);
    TEST_CHECK(B::hex_decode("61 2", out) == Error::FormatError);
    TEST_CHECK(B::hex_decode("\xD7\xA9", out) == Error::FormatError);

    // output only written on success
    TEST_CHECK(out == sentinel);

    std::cout << "[TEST] OK\n";
}

template <codec::CodecBackend B>
void test_base64() {
    std::cout << "[TEST] base64 (" << B::name << ")..." << std::endl;

    struct Vector { std::string_view plain; std::string_view encoded; };
    constexpr Vector vectors[] = {
        {"", ""},
        {"f", "Zg=="},
        {"fo", "Zm8="},
        {"foo", "Zm9v"},
        {"foob", "Zm9vYg=="},
        {"hello", "aGVsbG8="},
        {"foobar", "Zm9vYmFy"},
        {"\xD7\xA9\xD7\x9C\xD7\x95\xD7\x9D", "16nXnNeV150="},
    };

    for (const auto& v : vectors) {
        std::string text;
        B::base64_encode(as_bytes(v.plain), text);
        TEST_CHECK_EQ(text, std::string(v.encoded));

        Bytes out;
        TEST_CHECK(B::base64_decode(v.encoded, out) == Error::None);
        TEST_CHECK(out == bytes_of(v.plain));
    }

    // all byte values survive
    Bytes all(256);
    for (std::size_t i = 0; i < all.size(); ++i) {
        all[i] = static_cast<std::uint8_t>(i);
    }
    std::string text;
    B::base64_encode(all, text);
    Bytes back;
    TEST_CHECK(B::base64_decode(text, back) == Error::None);
    TEST_CHECK(back == all);

    std::cout << "[TEST] OK\n";
}

template <codec::CodecBackend B>
void test_base64_strict() {
    std::cout << "[TEST] base64 strict decoding (" << B::name << ")..." << std::endl;

    const Bytes sentinel{0x2a};
    Bytes out = sentinel;

    TEST_CHECK(B::base64_decode("abc", out) == Error::FormatError);        // length
    TEST_CHECK(B::base64_decode("Zm9v=g==", out) == Error::FormatError);   // pad inside
    TEST_CHECK(B::base64_decode("Z===", out) == Error::FormatError);       // three pads
    TEST_CHECK(B::base64_decode("====", out) == Error::FormatError);
    TEST_CHECK(B::base64_decode("Zm9-", out) == Error::FormatError);       // url alphabet
    TEST_CHECK(B::base64_decode("Zm9v\nYmF", out) == Error::FormatError);  // whitespace
    TEST_CHECK(B::base64_decode("Zg=a", out) == Error::FormatError);
    TEST_CHECK(out == sentinel);

    std::cout << "[TEST] OK\n";
}

template <codec::CodecBackend B>
void test_ascii_and_hex_predicates() {
    std::cout << "[TEST] ascii / hex predicates (" << B::name << ")..." << std::endl;

    TEST_CHECK(B::is_ascii(""));
    TEST_CHECK(B::is_ascii("hello world, plain and long enough for words"));
    TEST_CHECK(!B::is_ascii("h\xC3\xA9llo"));
    TEST_CHECK(!B::is_ascii("abcdefgh\xC3\xA9"));
    TEST_CHECK(!B::is_ascii("\xC0\x80"));      // overlong NUL is not ASCII

    TEST_CHECK(B::is_hex("6162"));
    TEST_CHECK(B::is_hex("ABCdef0123456789"));
    TEST_CHECK(!B::is_hex(""));
    TEST_CHECK(!B::is_hex("61g2"));
    TEST_CHECK(!B::is_hex("0x1F"));
    TEST_CHECK(!B::is_hex("\xD9\xA3"));        // Arabic-Indic three

    std::cout << "[TEST] OK\n";
}

template <codec::CodecBackend B>
void test_hebrew_predicate() {
    std::cout << "[TEST] hebrew predicate (" << B::name << ")..." << std::endl;

    TEST_CHECK(B::is_hebrew("\xD7\xA9\xD7\x9C\xD7\x95\xD7\x9D"));
    TEST_CHECK(B::is_hebrew("name: \xD7\x93\xD7\x95\xD7\x93"));
    TEST_CHECK(B::is_hebrew("\xD6\x90"));                 // U+0590, first in block
    TEST_CHECK(B::is_hebrew("\xD7\xBF"));                 // U+05FF, last in block
    TEST_CHECK(B::is_hebrew("\xE0\xD6\x90"));             // after a broken lead byte
    TEST_CHECK(!B::is_hebrew(""));
    TEST_CHECK(!B::is_hebrew("shalom"));
    TEST_CHECK(!B::is_hebrew("\xD6\x8F"));                // U+058F, Armenian
    TEST_CHECK(!B::is_hebrew("\xD8\x80"));                // U+0600, Arabic
    TEST_CHECK(!B::is_hebrew("\xD6"));                    // truncated

    std::cout << "[TEST] OK\n";
}

template <codec::CodecBackend B>
void test_filters() {
    std::cout << "[TEST] filter_ascii / extract_digits (" << B::name << ")..." << std::endl;

    std::string out;
    B::filter_ascii("h\xC3\xA9llo w\xC3\xB6rld", out);
    TEST_CHECK_EQ(out, std::string("hllo wrld"));

    B::filter_ascii("a\xC0\x80" "b", out);
    TEST_CHECK_EQ(out, std::string("ab"));

    B::filter_ascii("plain ascii passes through untouched", out);
    TEST_CHECK_EQ(out, std::string("plain ascii passes through untouched"));

    B::extract_digits("a1b2c3", out);
    TEST_CHECK_EQ(out, std::string("123"));

    B::extract_digits("phone: +972-54-123", out);
    TEST_CHECK_EQ(out, std::string("97254123"));

    // only ASCII digits count
    B::extract_digits("\xD9\xA3" "7", out);
    TEST_CHECK_EQ(out, std::string("7"));

    B::extract_digits("", out);
    TEST_CHECK(out.empty());

    std::cout << "[TEST] OK\n";
}

template <codec::CodecBackend B>
void run_suite() {
    test_hex<B>();
    test_hex_rejects_malformed<B>();
    test_base64<B>();
    test_base64_strict<B>();
    test_ascii_and_hex_predicates<B>();
    test_hebrew_predicate<B>();
    test_filters<B>();
}

int main() {
    run_suite<codec::Fallback>();
#if defined(TWINKIT_HAVE_NATIVE) && TWINKIT_HAVE_NATIVE
    run_suite<codec::Native>();
#endif

    std::cout << "\n[TEST] ALL CODEC BACKEND TESTS PASSED!" << std::endl;
    return 0;
}
