#include <cstdint>
#include <iostream>
#include <string>

#include "twinkit/identifier/backend.hpp"
#include "common/test_check.hpp"

using namespace twinkit;
using namespace twinkit::identifier;

/*
================================================================================
Identifier Kernels: Unit Tests
================================================================================

Fixed inputs, exact expected bytes. Both kernels must produce the RFC 9562
version 7 layout: 48-bit big-endian milliseconds, version nibble 7, variant
bits 10, entropy in the remaining positions.
================================================================================
*/

static Entropy ramp() {
    Entropy e{};
    for (std::size_t i = 0; i < e.size(); ++i) {
        e[i] = static_cast<std::uint8_t>(0x11 * (i + 1));   // 11 22 33 ... aa
    }
    return e;
}

template <IdentifierBackend B>
void test_layout_exact_bytes() {
    std::cout << "[TEST] v7 layout exact bytes (" << B::name << ")..." << std::endl;

    Uuid id{};
    B::layout_v7(0x01890a5dac96ull, ramp(), id);

    const Uuid expected{
        0x01, 0x89, 0x0a, 0x5d, 0xac, 0x96,     // unix ms
        0x71, 0x22,                             // ver 7 | rand_a
        0xb3, 0x44, 0x55, 0x66, 0x77, 0x88, 0x99, 0xaa  // var 10 | rand_b
    };
    TEST_CHECK(id == expected);
    TEST_CHECK(version(id) == 7);
    TEST_CHECK(variant(id) == 2);

    std::cout << "[TEST] OK\n";
}

template <IdentifierBackend B>
void test_layout_fixed_bits_override_entropy() {
    std::cout << "[TEST] version/variant bits are forced (" << B::name << ")..." << std::endl;

    Entropy ones{};
    ones.fill(0xFF);
    Entropy zeros{};

    Uuid a{}, b{};
    B::layout_v7(0, ones, a);
    B::layout_v7(0, zeros, b);

    TEST_CHECK(a[6] == 0x7F);
    TEST_CHECK(a[7] == 0xFF);
    TEST_CHECK(a[8] == 0xBF);
    TEST_CHECK(b[6] == 0x70);
    TEST_CHECK(b[7] == 0x00);
    TEST_CHECK(b[8] == 0x80);
    TEST_CHECK(version(a) == 7 && version(b) == 7);
    TEST_CHECK(variant(a) == 2 && variant(b) == 2);

    // only the low 48 bits of the clock are kept
    Uuid c{};
    B::layout_v7(0xABCD000000000001ull, zeros, c);
    for (int i = 0; i < 5; ++i) {
        TEST_CHECK(c[i] == 0);
    }
    TEST_CHECK(c[5] == 0x01);

    std::cout << "[TEST] OK\n";
}

template <IdentifierBackend B>
void test_format() {
    std::cout << "[TEST] canonical text (" << B::name << ")..." << std::endl;

    Uuid id{};
    B::layout_v7(0x01890a5dac96ull, ramp(), id);

    std::string text;
    B::format(id, LetterCase::Lower, text);
    TEST_CHECK_EQ(text, std::string("01890a5d-ac96-7122-b344-5566778899aa"));

    B::format(id, LetterCase::Upper, text);
    TEST_CHECK_EQ(text, std::string("01890A5D-AC96-7122-B344-5566778899AA"));

    std::cout << "[TEST] OK\n";
}

template <IdentifierBackend B>
void test_parse_unix_ms() {
    std::cout << "[TEST] timestamp extraction (" << B::name << ")..." << std::endl;

    std::uint64_t ms = 0;
    TEST_CHECK(B::parse_unix_ms("01890a5d-ac96-7122-b344-5566778899aa", ms) == Error::None);
    TEST_CHECK(ms == 0x01890a5dac96ull);

    ms = 0;
    TEST_CHECK(B::parse_unix_ms("01890A5DAC967122B3445566778899AA", ms) == Error::None);
    TEST_CHECK(ms == 0x01890a5dac96ull);

    // every timestamp byte at its extremes
    ms = 0;
    TEST_CHECK(B::parse_unix_ms("ffffffff-ffff-7000-8000-000000000000", ms) == Error::None);
    TEST_CHECK(ms == 0xFFFFFFFFFFFFull);
    TEST_CHECK(B::parse_unix_ms("00000000-0001-7fff-bfff-ffffffffffff", ms) == Error::None);
    TEST_CHECK(ms == 1);
    TEST_CHECK(B::parse_unix_ms("80000000-0000-7000-8000-000000000000", ms) == Error::None);
    TEST_CHECK(ms == 0x800000000000ull);

    const std::uint64_t untouched = 42;
    ms = untouched;
    TEST_CHECK(B::parse_unix_ms("", ms) == Error::FormatError);
    TEST_CHECK(B::parse_unix_ms("01890a5d-ac96-7122-b344-5566778899a", ms) == Error::FormatError);
    TEST_CHECK(B::parse_unix_ms("01890a5d-ac96-7122-b344-5566778899aab", ms) == Error::FormatError);
    TEST_CHECK(B::parse_unix_ms("0189xa5d-ac96-7122-b344-5566778899aa", ms) == Error::FormatError);
    TEST_CHECK(B::parse_unix_ms("+1890a5d-ac96-7122-b344-5566778899aa", ms) == Error::FormatError);
    TEST_CHECK(ms == untouched);

    std::cout << "[TEST] OK\n";
}

template <IdentifierBackend B>
void run_suite() {
    test_layout_exact_bytes<B>();
    test_layout_fixed_bits_override_entropy<B>();
    test_format<B>();
    test_parse_unix_ms<B>();
}

int main() {
    run_suite<Fallback>();
#if defined(TWINKIT_HAVE_NATIVE) && TWINKIT_HAVE_NATIVE
    run_suite<Native>();
#endif

    std::cout << "\n[TEST] ALL IDENTIFIER KERNEL TESTS PASSED!" << std::endl;
    return 0;
}
