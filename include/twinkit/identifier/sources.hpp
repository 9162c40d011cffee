#pragma once

#include <cstdint>
#include <span>
#include <concepts>

namespace twinkit::identifier {

// -----------------------------------------------------------------------------
// Collaborator seams for identifier generation
// -----------------------------------------------------------------------------
//
// ClockSource    now_ms() returns Unix epoch milliseconds
// EntropySource  fill() writes cryptographically secure random bytes and
//                returns false when the platform could not supply them
//
// Tests substitute deterministic implementations.
// -----------------------------------------------------------------------------

template<class C>
concept ClockSource =
    requires(C& clock)
{
    { clock.now_ms() } noexcept -> std::convertible_to<std::uint64_t>;
};

template<class E>
concept EntropySource =
    requires(E& entropy, std::span<std::uint8_t> buffer)
{
    { entropy.fill(buffer) } noexcept -> std::same_as<bool>;
};


// Wall clock (std::chrono::system_clock)
struct SystemClock {
    [[nodiscard]] std::uint64_t now_ms() const noexcept;
};

// Operating system CSPRNG through OpenSSL RAND_bytes
struct OsEntropy {
    [[nodiscard]] bool fill(std::span<std::uint8_t> buffer) noexcept;
};

static_assert(ClockSource<SystemClock>);
static_assert(EntropySource<OsEntropy>);

} // namespace twinkit::identifier
