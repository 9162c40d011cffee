#include "twinkit/checksum.hpp"
#include "twinkit/dispatch/dispatcher.hpp"

namespace twinkit::checksum {

bool is_valid_national_id(std::string_view text) noexcept {
    return dispatch::checksum().is_valid_national_id(text);
}

} // namespace twinkit::checksum
