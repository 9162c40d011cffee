#include "twinkit/checksum/backend.hpp"
#include "twinkit/config/checksum.hpp"

#include <cstdint>

namespace twinkit::checksum {

using config::checksum::NATIONAL_ID_WIDTH;

namespace {

// digit * 2, minus 9 when above 9
constexpr std::uint8_t DOUBLED[10] = {0, 2, 4, 6, 8, 1, 3, 5, 7, 9};

} // namespace

// Leading zeros contribute nothing, so the padding is implicit: the weight of
// a digit depends only on its padded position, i.e. on the distance to the
// last digit (the last padded position, index 8, has weight 1).
bool Native::is_valid_national_id(std::string_view text) noexcept {
    const std::size_t n = text.size();
    if (n == 0 || n > NATIONAL_ID_WIDTH) {
        return false;
    }

    unsigned total = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const unsigned digit = static_cast<unsigned char>(text[i]) - unsigned('0');
        if (digit > 9) {
            return false;
        }
        const bool doubled = ((n - 1 - i) & 1u) != 0;
        total += doubled ? DOUBLED[digit] : digit;
    }
    return total % 10 == 0;
}

} // namespace twinkit::checksum
