#include "twinkit/checksum/backend.hpp"
#include "twinkit/config/checksum.hpp"

#include <array>

namespace twinkit::checksum {

using config::checksum::NATIONAL_ID_WIDTH;

bool Fallback::is_valid_national_id(std::string_view text) noexcept {
    if (text.empty() || text.size() > NATIONAL_ID_WIDTH) {
        return false;
    }

    // zero fill to the fixed width
    std::array<char, NATIONAL_ID_WIDTH> padded;
    padded.fill('0');
    const std::size_t offset = NATIONAL_ID_WIDTH - text.size();
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c < '0' || c > '9') {
            return false;
        }
        padded[offset + i] = c;
    }

    int total = 0;
    for (std::size_t i = 0; i < NATIONAL_ID_WIDTH; ++i) {
        const int digit = padded[i] - '0';
        int step = digit * (static_cast<int>(i % 2) + 1);
        if (step > 9) {
            step -= 9;
        }
        total += step;
    }
    return total % 10 == 0;
}

} // namespace twinkit::checksum
