#include "twinkit/identifier/sources.hpp"

#include <chrono>
#include <climits>

#include <openssl/rand.h>

namespace twinkit::identifier {

std::uint64_t SystemClock::now_ms() const noexcept {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

bool OsEntropy::fill(std::span<std::uint8_t> buffer) noexcept {
    if (buffer.size() > static_cast<std::size_t>(INT_MAX)) {
        return false;
    }
    return RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) == 1;
}

} // namespace twinkit::identifier
