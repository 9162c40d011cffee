#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "twinkit/error.hpp"
#include "twinkit/types.hpp"
#include "twinkit/identifier/uuid.hpp"
#include "twinkit/identifier/sources.hpp"
#include "lcr/log/logger.hpp"

namespace twinkit::identifier {

/*
===============================================================================
Identifiers
===============================================================================

uuidv7        time-ordered identifier (RFC 9562 version 7), lowercase text.
              Identifiers from distinct milliseconds sort by creation time;
              no ordering is promised within one millisecond.

uuidv7_to_timestamp
              inverse of the time part. Empty text yields "no value"
              (std::nullopt) rather than an error.

stable_uuid   deterministic identifier: MD5 of the parts joined with '|',
              rendered uppercase. No parts yields "".
===============================================================================
*/

// Lays out a v7 identifier from explicit inputs (dispatched kernel)
[[nodiscard]] Uuid layout_v7(std::uint64_t unix_ms, const Entropy& entropy) noexcept;

// Canonical 8-4-4-4-12 text
[[nodiscard]] std::string to_string(const Uuid& id, LetterCase casing = LetterCase::Lower);


template<ClockSource C, EntropySource E>
[[nodiscard]] Error uuidv7(C& clock, E& entropy, Uuid& out) {
    Entropy random{};
    if (!entropy.fill(std::span<std::uint8_t>(random))) {
        TK_ERROR("[UUID] entropy source failed to supply " << random.size() << " bytes");
        return Error::ResourceError;
    }
    out = layout_v7(static_cast<std::uint64_t>(clock.now_ms()), random);
    return Error::None;
}

template<ClockSource C, EntropySource E>
[[nodiscard]] Error uuidv7(C& clock, E& entropy, std::string& out) {
    Uuid id{};
    const Error err = uuidv7(clock, entropy, id);
    if (err != Error::None) {
        return err;
    }
    out = to_string(id, LetterCase::Lower);
    return Error::None;
}

// System clock + OS entropy
[[nodiscard]] Error uuidv7(std::string& out);

[[nodiscard]] Error uuidv7_to_timestamp(std::string_view text, std::optional<Timestamp>& out);

[[nodiscard]] Error stable_uuid(const std::vector<std::string>& parts, std::string& out);
[[nodiscard]] Error stable_uuid(std::initializer_list<std::string_view> parts, std::string& out);

} // namespace twinkit::identifier
