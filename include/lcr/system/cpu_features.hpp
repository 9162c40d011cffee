#pragma once

#include <string>

namespace lcr {
namespace system {

// -----------------------------------------------------------------------------
// Runtime CPU feature probe (diagnostics for backend selection)
// -----------------------------------------------------------------------------

struct CpuFeatures {
    bool sse42{false};
    bool avx2{false};
    bool bmi2{false};
    bool neon{false};
};

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
  #define LCR_ARCH_X86 1
#endif

#if defined(__ARM_NEON) || defined(__ARM_NEON__) || defined(__aarch64__)
  #define LCR_ARCH_ARM 1
#endif

[[nodiscard]] inline CpuFeatures detect_cpu_features() noexcept {
    CpuFeatures f{};
#if defined(LCR_ARCH_X86) && (defined(__GNUC__) || defined(__clang__))
    __builtin_cpu_init();
    f.sse42 = __builtin_cpu_supports("sse4.2") != 0;
    f.avx2  = __builtin_cpu_supports("avx2") != 0;
    f.bmi2  = __builtin_cpu_supports("bmi2") != 0;
#endif
#if defined(LCR_ARCH_ARM)
    f.neon = true;
#endif
    return f;
}

[[nodiscard]] inline std::string to_string(const CpuFeatures& f) {
    std::string s;
    if (f.sse42) s += "SSE4.2 ";
    if (f.avx2)  s += "AVX2 ";
    if (f.bmi2)  s += "BMI2 ";
    if (f.neon)  s += "NEON ";
    if (s.empty()) return "generic";
    s.pop_back();
    return s;
}

} // namespace system
} // namespace lcr
