#pragma once

#include <string_view>

namespace twinkit::checksum {

// Validates an Israeli-style national identifier (see ChecksumBackend).
// Never fails: any malformed input yields false.
[[nodiscard]] bool is_valid_national_id(std::string_view text) noexcept;

} // namespace twinkit::checksum
