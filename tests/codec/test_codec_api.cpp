#include <iostream>
#include <string>

#include "twinkit/codec.hpp"
#include "common/test_check.hpp"

using namespace twinkit;

// Public entry points, served by whichever kernels the dispatcher selected

void test_hex_fixture() {
    std::cout << "[TEST] hex fixture through public API..." << std::endl;

    TEST_CHECK_EQ(codec::hex_encode(std::string_view("ab")), std::string("6162"));

    Bytes out;
    TEST_CHECK(codec::hex_decode("6162", out) == Error::None);
    TEST_CHECK(as_text(out) == "ab");

    TEST_CHECK(codec::is_hex("6162"));
    TEST_CHECK(!codec::is_hex("61g2"));

    std::cout << "[TEST] OK\n";
}

void test_base64_round_trip_utf8() {
    std::cout << "[TEST] base64 of UTF-8 text..." << std::endl;

    const std::string_view shalom = "\xD7\xA9\xD7\x9C\xD7\x95\xD7\x9D";
    const std::string encoded = codec::base64_encode(shalom);
    TEST_CHECK_EQ(encoded, std::string("16nXnNeV150="));

    Bytes out;
    TEST_CHECK(codec::base64_decode(encoded, out) == Error::None);
    TEST_CHECK(as_text(out) == shalom);

    std::cout << "[TEST] OK\n";
}

void test_is_base64() {
    std::cout << "[TEST] is_base64..." << std::endl;

    TEST_CHECK(codec::is_base64("aGVsbG8="));
    TEST_CHECK(codec::is_base64("Zm9vYmFy"));
    TEST_CHECK(!codec::is_base64(""));          // decodes to nothing
    TEST_CHECK(!codec::is_base64("aGVsbG8"));
    TEST_CHECK(!codec::is_base64("aGVs bG8="));
    TEST_CHECK(!codec::is_base64("not base64!"));

    std::cout << "[TEST] OK\n";
}

void test_text_helpers() {
    std::cout << "[TEST] text helpers..." << std::endl;

    TEST_CHECK(codec::is_ascii("plain"));
    TEST_CHECK(!codec::is_ascii("caf\xC3\xA9"));
    TEST_CHECK(codec::is_hebrew("id \xD7\x90"));
    TEST_CHECK(!codec::is_hebrew("id A"));
    TEST_CHECK_EQ(codec::filter_ascii("caf\xC3\xA9!"), std::string("caf!"));
    TEST_CHECK_EQ(codec::extract_digits("05-123 4567"), std::string("051234567"));

    std::cout << "[TEST] OK\n";
}

int main() {
    test_hex_fixture();
    test_base64_round_trip_utf8();
    test_is_base64();
    test_text_helpers();

    std::cout << "\n[TEST] ALL CODEC API TESTS PASSED!" << std::endl;
    return 0;
}
