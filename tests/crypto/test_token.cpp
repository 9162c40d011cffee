#include <algorithm>
#include <cstdint>
#include <iostream>
#include <set>
#include <string>

#include "twinkit/codec.hpp"
#include "twinkit/crypto/token.hpp"
#include "common/test_check.hpp"

using namespace twinkit;
using namespace twinkit::crypto;

static bool only_from(const std::string& s, std::string_view alphabet) {
    return std::all_of(s.begin(), s.end(), [&](char c) {
        return alphabet.find(c) != std::string_view::npos;
    });
}

void test_bases() {
    std::cout << "[TEST] random_token alphabets..." << std::endl;

    std::string t;
    TEST_CHECK(random_token(64, TokenBase::Binary, t) == Error::None);
    TEST_CHECK(t.size() == 64 && only_from(t, "01"));

    TEST_CHECK(random_token(64, TokenBase::Octal, t) == Error::None);
    TEST_CHECK(t.size() == 64 && only_from(t, "01234567"));

    TEST_CHECK(random_token(64, TokenBase::Hex, t) == Error::None);
    TEST_CHECK(t.size() == 64 && only_from(t, "0123456789abcdef"));

    TEST_CHECK(random_token(64, TokenBase::Decimal, t) == Error::None);
    TEST_CHECK(t.size() == 64 && only_from(t, "0123456789"));

    TEST_CHECK(random_token(200, TokenBase::Base64, t) == Error::None);
    TEST_CHECK(t.size() == 200);
    TEST_CHECK(only_from(t, "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"));

    TEST_CHECK(random_token(0, TokenBase::Hex, t) == Error::None);
    TEST_CHECK(t.empty());

    std::cout << "[TEST] OK\n";
}

void test_named_bases() {
    std::cout << "[TEST] random_token by base name..." << std::endl;

    std::string t;
    TEST_CHECK(random_token(16, "hex", t) == Error::None);
    TEST_CHECK(t.size() == 16);

    TEST_CHECK(random_token(16, "base-64", t) == Error::None);
    TEST_CHECK(t.size() == 16);

    t = "kept";
    TEST_CHECK(random_token(16, "base32", t) == Error::ValueError);
    TEST_CHECK(t == "kept");

    TokenBase b{};
    TEST_CHECK(parse(to_string(TokenBase::Octal), b) && b == TokenBase::Octal);

    std::cout << "[TEST] OK\n";
}

void test_secure_token() {
    std::cout << "[TEST] secure_token..." << std::endl;

    std::string t;
    TEST_CHECK(secure_token(t) == Error::None);
    TEST_CHECK(t.size() == config::crypto::SECURE_TOKEN_DEFAULT_LENGTH);
    TEST_CHECK(secure_token(0, t) == Error::None);
    TEST_CHECK(t.size() == config::crypto::SECURE_TOKEN_DEFAULT_LENGTH);

    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        TEST_CHECK(secure_token(32, t) == Error::None);
        TEST_CHECK(t.size() == 32);
        TEST_CHECK(t.find_first_of("0OIl") == std::string::npos);
        TEST_CHECK(seen.insert(t).second);
    }

    std::cout << "[TEST] OK\n";
}

static bool is_ascii_text(const Bytes& b) {
    return std::all_of(b.begin(), b.end(), [](std::uint8_t c) { return c < 0x80; });
}

void test_random_id_ascii() {
    std::cout << "[TEST] random_id plain ascii..." << std::endl;

    constexpr std::string_view letters_digits =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    constexpr std::string_view punctuation = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";

    std::string id;
    TEST_CHECK(random_id(40, {}, id) == Error::None);
    TEST_CHECK(id.size() == 40);
    TEST_CHECK(only_from(id, letters_digits));

    TEST_CHECK(random_id(0, {}, id) == Error::None);
    TEST_CHECK(id.empty());

    RandomIdOptions with_symbols;
    with_symbols.symbols = true;
    TEST_CHECK(random_id(2000, with_symbols, id) == Error::None);
    TEST_CHECK(id.size() == 2000);
    TEST_CHECK(id.find_first_of(punctuation) != std::string::npos);
    TEST_CHECK(id.find_first_of(letters_digits) != std::string::npos);
    TEST_CHECK(codec::is_ascii(id));

    std::cout << "[TEST] OK\n";
}

void test_random_id_encodings() {
    std::cout << "[TEST] random_id hex / base64 encodings..." << std::endl;

    RandomIdOptions hex;
    hex.encoding = IdEncoding::Hex;
    std::string id;
    TEST_CHECK(random_id(16, hex, id) == Error::None);
    TEST_CHECK(id.size() == 32);
    TEST_CHECK(codec::is_hex(id));
    Bytes raw;
    TEST_CHECK(codec::hex_decode(id, raw) == Error::None);
    TEST_CHECK(raw.size() == 16);
    TEST_CHECK(is_ascii_text(raw));

    RandomIdOptions b64;
    b64.encoding = IdEncoding::Base64;
    b64.symbols = true;
    TEST_CHECK(random_id(10, b64, id) == Error::None);
    TEST_CHECK(id.size() == 16);
    raw.clear();
    TEST_CHECK(codec::base64_decode(id, raw) == Error::None);
    TEST_CHECK(raw.size() == 10);
    TEST_CHECK(is_ascii_text(raw));

    TEST_CHECK(to_string(IdEncoding::Base64) == "base64");

    std::cout << "[TEST] OK\n";
}

void test_random_id_casing() {
    std::cout << "[TEST] random_id letter case..." << std::endl;

    RandomIdOptions upper;
    upper.casing = Casing::Upper;
    std::string id;
    TEST_CHECK(random_id(200, upper, id) == Error::None);
    TEST_CHECK(id.size() == 200);
    TEST_CHECK(std::none_of(id.begin(), id.end(), [](char c) { return c >= 'a' && c <= 'z'; }));

    RandomIdOptions lower;
    lower.casing = Casing::Lower;
    TEST_CHECK(random_id(200, lower, id) == Error::None);
    TEST_CHECK(std::none_of(id.begin(), id.end(), [](char c) { return c >= 'A' && c <= 'Z'; }));

    // upper-cased hex still decodes
    RandomIdOptions hex_upper;
    hex_upper.encoding = IdEncoding::Hex;
    hex_upper.casing = Casing::Upper;
    TEST_CHECK(random_id(8, hex_upper, id) == Error::None);
    TEST_CHECK(only_from(id, "0123456789ABCDEF"));
    Bytes raw;
    TEST_CHECK(codec::hex_decode(id, raw) == Error::None);
    TEST_CHECK(raw.size() == 8 && is_ascii_text(raw));

    std::cout << "[TEST] OK\n";
}

int main() {
    test_bases();
    test_named_bases();
    test_secure_token();
    test_random_id_ascii();
    test_random_id_encodings();
    test_random_id_casing();

    std::cout << "\n[TEST] ALL TOKEN TESTS PASSED!" << std::endl;
    return 0;
}
