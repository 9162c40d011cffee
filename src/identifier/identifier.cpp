#include "twinkit/identifier.hpp"
#include "twinkit/config/identifier.hpp"
#include "twinkit/crypto/digest.hpp"
#include "twinkit/dispatch/dispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>

namespace twinkit::identifier {

namespace {

template <typename Range>
Error stable_uuid_of(const Range& parts, std::string& out) {
    if (std::empty(parts)) {
        out.clear();
        return Error::None;
    }

    std::string joined;
    bool first = true;
    for (const auto& part : parts) {
        if (!first) {
            joined.push_back(config::identifier::STABLE_UUID_SEPARATOR);
        }
        joined.append(part.data(), part.size());
        first = false;
    }

    crypto::Md5Digest digest{};
    const Error err = crypto::md5(as_bytes(joined), digest);
    if (err != Error::None) {
        return err;
    }

    Uuid id{};
    static_assert(sizeof(digest) == sizeof(id));
    std::copy(digest.begin(), digest.end(), id.begin());
    dispatch::identifier().format(id, LetterCase::Upper, out);
    return Error::None;
}

} // namespace


Uuid layout_v7(std::uint64_t unix_ms, const Entropy& entropy) noexcept {
    Uuid id{};
    dispatch::identifier().layout_v7(unix_ms, entropy, id);
    return id;
}

std::string to_string(const Uuid& id, LetterCase casing) {
    std::string out;
    dispatch::identifier().format(id, casing, out);
    return out;
}

Error uuidv7(std::string& out) {
    SystemClock clock;
    OsEntropy entropy;
    return uuidv7(clock, entropy, out);
}

Error uuidv7_to_timestamp(std::string_view text, std::optional<Timestamp>& out) {
    if (text.empty()) {
        out.reset();
        return Error::None;
    }
    std::uint64_t unix_ms = 0;
    const Error err = dispatch::identifier().parse_unix_ms(text, unix_ms);
    if (err != Error::None) {
        TK_DEBUG("[UUID] cannot extract timestamp from '" << text << "': " << twinkit::to_string(err));
        return err;
    }
    out = Timestamp{std::chrono::milliseconds{static_cast<std::int64_t>(unix_ms)}};
    return Error::None;
}

Error stable_uuid(const std::vector<std::string>& parts, std::string& out) {
    return stable_uuid_of(parts, out);
}

Error stable_uuid(std::initializer_list<std::string_view> parts, std::string& out) {
    return stable_uuid_of(parts, out);
}

} // namespace twinkit::identifier
