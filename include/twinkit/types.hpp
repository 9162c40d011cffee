#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace twinkit {

// ============================================================================
// Byte containers
// ============================================================================
using Bytes     = std::vector<std::uint8_t>;
using BytesView = std::span<const std::uint8_t>;

// Views the UTF-8 code units of `text` as raw bytes
[[nodiscard]] inline BytesView as_bytes(std::string_view text) noexcept {
    return BytesView(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

// Views raw bytes as text (no validation)
[[nodiscard]] inline std::string_view as_text(BytesView bytes) noexcept {
    return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}


// ============================================================================
// Timestamp type (UTC, millisecond precision)
// ============================================================================
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

// ============================================================================
// RFC3339 Formatter (always UTC)
//
// Produces:
//   YYYY-MM-DDTHH:MM:SS.sssZ
// ============================================================================
[[nodiscard]] inline std::string to_string(const Timestamp& ts) {
    using namespace std::chrono;

    sys_days d = floor<days>(ts);
    year_month_day ymd{d};

    auto tod = ts - d;
    auto h = floor<hours>(tod);
    auto m = floor<minutes>(tod - h);
    auto s = floor<seconds>(tod - h - m);
    auto ms = (tod - h - m - s).count();

    char buf[64];
    std::snprintf(buf, sizeof(buf),
                  "%04d-%02u-%02uT%02d:%02d:%02d.%03lldZ",
                  int(ymd.year()), unsigned(ymd.month()), unsigned(ymd.day()),
                  int(h.count()), int(m.count()), int(s.count()),
                  static_cast<long long>(ms));

    return std::string(buf);
}

} // namespace twinkit
