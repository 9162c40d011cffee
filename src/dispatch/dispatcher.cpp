#include "twinkit/dispatch/dispatcher.hpp"
#include "twinkit/config/dispatch.hpp"
#include "twinkit/codec/fallback.hpp"
#include "twinkit/codec/native.hpp"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>

#include "lcr/log/logger.hpp"
#include "lcr/system/cpu_features.hpp"

namespace twinkit::dispatch {

namespace {

// ============================================================================
// Kernel tables
// ============================================================================

constexpr codec::Kernels      CODEC_FALLBACK      = codec::make_kernels<codec::Fallback>();
constexpr checksum::Kernels   CHECKSUM_FALLBACK   = checksum::make_kernels<checksum::Fallback>();
constexpr identifier::Kernels IDENTIFIER_FALLBACK = identifier::make_kernels<identifier::Fallback>();

#if defined(TWINKIT_HAVE_NATIVE) && TWINKIT_HAVE_NATIVE
constexpr codec::Kernels      CODEC_NATIVE        = codec::make_kernels<codec::Native>();
constexpr checksum::Kernels   CHECKSUM_NATIVE     = checksum::make_kernels<checksum::Native>();
constexpr identifier::Kernels IDENTIFIER_NATIVE   = identifier::make_kernels<identifier::Native>();
#endif


// ============================================================================
// Known-answer self tests: native output must equal fallback output
// ============================================================================

constexpr std::string_view TEXT_VECTORS[] = {
    "",
    "hello",
    "abc123def",
    "0x1F",
    "ABCDEFabcdef0123",
    "\xD7\xA9\xD7\x9C\xD7\x95\xD7\x9D",          // shalom
    "\xD6\x90",                                  // U+0590
    "\xD6\x8F",                                  // U+058F
    "a\xC0\x80" "b",                             // overlong NUL
    "\xE0\xD6\x90",                              // truncated lead before Hebrew
    "\xD9\xA3" "7",                              // Arabic-Indic three
    "plain ascii text longer than one word",
};

constexpr std::string_view HEX_VECTORS[] = {
    "", "6162", "61g2", "ABCDEF", "abc", "00ff7F80", "zz",
};

constexpr std::string_view BASE64_VECTORS[] = {
    "", "aGVsbG8=", "Zg==", "Zm8=", "Zm9v", "Zm9vYmFy", "Zm9v=g==",
    "Z===", "====", "abc", "16nXnNeV150=", "Zm9v\nYmFy", "Zm9-",
};

bool codec_agrees(const codec::Kernels& native, const codec::Kernels& fallback) {
    std::array<std::uint8_t, 256> all{};
    for (std::size_t i = 0; i < all.size(); ++i) {
        all[i] = static_cast<std::uint8_t>(i);
    }

    std::string a, b;
    for (std::size_t len : {0, 1, 2, 3, 4, 5, 255, 256}) {
        const BytesView view(all.data(), len);
        native.hex_encode(view, a);
        fallback.hex_encode(view, b);
        if (a != b) return false;
        native.base64_encode(view, a);
        fallback.base64_encode(view, b);
        if (a != b) return false;
    }

    Bytes x, y;
    for (std::string_view v : HEX_VECTORS) {
        x.clear();
        y.clear();
        if (native.hex_decode(v, x) != fallback.hex_decode(v, y) || x != y) return false;
    }
    for (std::string_view v : BASE64_VECTORS) {
        x.clear();
        y.clear();
        if (native.base64_decode(v, x) != fallback.base64_decode(v, y) || x != y) return false;
    }

    for (std::string_view v : TEXT_VECTORS) {
        if (native.is_ascii(v)  != fallback.is_ascii(v))  return false;
        if (native.is_hex(v)    != fallback.is_hex(v))    return false;
        if (native.is_hebrew(v) != fallback.is_hebrew(v)) return false;
        native.filter_ascii(v, a);
        fallback.filter_ascii(v, b);
        if (a != b) return false;
        native.extract_digits(v, a);
        fallback.extract_digits(v, b);
        if (a != b) return false;
    }
    return true;
}

bool checksum_agrees(const checksum::Kernels& native, const checksum::Kernels& fallback) {
    constexpr std::string_view vectors[] = {
        "", "0", "9", "18", "000000018", "123456782", "123456789",
        "12a456789", "1234567890", " 18", "-18",
    };
    for (std::string_view v : vectors) {
        if (native.is_valid_national_id(v) != fallback.is_valid_national_id(v)) return false;
    }
    return true;
}

bool identifier_agrees(const identifier::Kernels& native, const identifier::Kernels& fallback) {
    identifier::Entropy zeros{};
    identifier::Entropy ones{};
    identifier::Entropy ramp{};
    ones.fill(0xFF);
    for (std::size_t i = 0; i < ramp.size(); ++i) {
        ramp[i] = static_cast<std::uint8_t>(0x11 * (i + 1));
    }

    constexpr std::uint64_t stamps[] = {
        0, 0x01890a5dac96ull, 0xFFFFFFFFFFFFull, 0x1234FFFFFFFFFFFFull,
    };

    std::string a, b;
    for (std::uint64_t ms : stamps) {
        for (const auto* e : {&zeros, &ones, &ramp}) {
            identifier::Uuid u{}, v{};
            native.layout_v7(ms, *e, u);
            fallback.layout_v7(ms, *e, v);
            if (u != v) return false;
            for (auto casing : {identifier::LetterCase::Lower, identifier::LetterCase::Upper}) {
                native.format(u, casing, a);
                fallback.format(u, casing, b);
                if (a != b) return false;
            }
        }
    }

    constexpr std::string_view vectors[] = {
        "",
        "01890a5d-ac96-7abc-8def-0123456789ab",
        "01890A5DAC967ABC8DEF0123456789AB",
        "01890a5d-ac96-7abc-8def-0123456789a",
        "0189xa5d-ac96-7abc-8def-0123456789ab",
        "01890a5d-ac96-7abc-8def-0123456789zz",
        "----01890a5dac967abc8def0123456789ab",
        "+1890a5d-ac96-7abc-8def-0123456789ab",
    };
    for (std::string_view v : vectors) {
        std::uint64_t p = 0, q = 0;
        const Error ep = native.parse_unix_ms(v, p);
        const Error eq = fallback.parse_unix_ms(v, q);
        if (ep != eq) return false;
        if (ep == Error::None && p != q) return false;
    }
    return true;
}


// ============================================================================
// Resolution
// ============================================================================

struct Active {
    Selection selection;
    const codec::Kernels* codec{&CODEC_FALLBACK};
    const checksum::Kernels* checksum{&CHECKSUM_FALLBACK};
    const identifier::Kernels* identifier{&IDENTIFIER_FALLBACK};
};

policy::Backend policy_from_env() {
    const char* raw = std::getenv(config::dispatch::BACKEND_ENV);
    policy::Backend result = policy::Backend::Auto;
    if (raw == nullptr || *raw == '\0') {
        return result;
    }
    if (!policy::parse(raw, result)) {
        TK_WARN("[DISPATCH] Ignoring " << config::dispatch::BACKEND_ENV << "='" << raw
                << "' (expected auto|native|fallback)");
    }
    return result;
}

// Picks the native table when allowed and its self-test passes
template <typename K>
Path choose(Family family, policy::Backend policy, const K* native, const K& fallback,
            bool (*agrees)(const K&, const K&)) {
    if (policy == policy::Backend::Fallback) {
        return Path::Fallback;
    }
    if (native == nullptr) {
        if (policy == policy::Backend::Native) {
            TK_WARN("[DISPATCH] Native " << to_string(family) << " kernels not compiled in, using fallback");
        }
        return Path::Fallback;
    }
    if (!agrees(*native, fallback)) {
        TK_WARN("[DISPATCH] Native " << to_string(family)
                << " kernels failed the known-answer self-test, using fallback");
        return Path::Fallback;
    }
    return Path::Native;
}

Active make_active(policy::Backend policy) {
    Active active;
    active.selection.policy = policy;
    active.selection.cpu = lcr::system::to_string(lcr::system::detect_cpu_features());

#if defined(TWINKIT_HAVE_NATIVE) && TWINKIT_HAVE_NATIVE
    const codec::Kernels*      codec_native      = &CODEC_NATIVE;
    const checksum::Kernels*   checksum_native   = &CHECKSUM_NATIVE;
    const identifier::Kernels* identifier_native = &IDENTIFIER_NATIVE;
#else
    const codec::Kernels*      codec_native      = nullptr;
    const checksum::Kernels*   checksum_native   = nullptr;
    const identifier::Kernels* identifier_native = nullptr;
#endif

    active.selection.codec = choose(Family::Codec, policy, codec_native, CODEC_FALLBACK, &codec_agrees);
    active.selection.checksum = choose(Family::Checksum, policy, checksum_native, CHECKSUM_FALLBACK, &checksum_agrees);
    active.selection.identifier = choose(Family::Identifier, policy, identifier_native, IDENTIFIER_FALLBACK, &identifier_agrees);

    if (active.selection.codec == Path::Native)      active.codec      = codec_native;
    if (active.selection.checksum == Path::Native)   active.checksum   = checksum_native;
    if (active.selection.identifier == Path::Native) active.identifier = identifier_native;

    return active;
}

const Active& active() {
    static const Active instance = [] {
        Active a = make_active(policy_from_env());
        TK_DEBUG("[DISPATCH] policy=" << policy::to_string(a.selection.policy)
                 << " codec=" << to_string(a.selection.codec)
                 << " checksum=" << to_string(a.selection.checksum)
                 << " identifier=" << to_string(a.selection.identifier)
                 << " cpu=" << a.selection.cpu);
        return a;
    }();
    return instance;
}

} // namespace


Selection resolve(policy::Backend policy) {
    return make_active(policy).selection;
}

const Selection& selection() {
    return active().selection;
}

const codec::Kernels& codec() noexcept {
    return *active().codec;
}

const checksum::Kernels& checksum() noexcept {
    return *active().checksum;
}

const identifier::Kernels& identifier() noexcept {
    return *active().identifier;
}

} // namespace twinkit::dispatch
